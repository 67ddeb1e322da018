/**
 * @file Error.hh
 *
 * Licensed under the MIT License <https://opensource.org/licenses/MIT>.
 * SPDX-License-Identifier: MIT
 * Copyright (c) 2022 Zachary Parker
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef __MESHWIRE_UTIL_ERROR_HH__
#define __MESHWIRE_UTIL_ERROR_HH__

#include <stdexcept>
#include <string>
#include <system_error>

namespace meshwire {

/**
 * The byte stream is corrupt or out of sequence.
 *
 * Fatal for the stream it was raised on; the connection should be torn down.
 */
class ProtocolError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * A structured value could not be encoded to, or decoded from, bytes.
 *
 * Fatal for the single message being produced or reassembled.
 */
class EncodingError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * I/O failure on spooled storage.
 */
class StorageError : public std::system_error
{
public:
    StorageError(int err, const std::string &what):
        std::system_error(err, std::system_category(), what)
    {
    }
};

}

#endif
