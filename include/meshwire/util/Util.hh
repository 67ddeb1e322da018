/**
 * @file Util.hh
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

#ifndef __MESHWIRE_UTIL_HH__
#define __MESHWIRE_UTIL_HH__

#include <cstdint>
#include <string>
#include <utility>

#include "ScopedFd.hh"

namespace meshwire::util {

/**
 * Create and open a unique file <dir>/<prefix>XXXXXX<suffix>.
 *
 * @return The open descriptor and the generated path.
 */
std::pair<ScopedFd, std::string> makeTempFile(
    std::string prefix,
    std::string suffix,
    int flags,
    std::string dir = { });

/**
 * Read up to dlen bytes at the current file position, retrying short reads.
 *
 * @return bytes read; less than dlen only at end of file.
 */
size_t readChunk(int fd, void *data, size_t dlen);

/**
 * Write dlen bytes at the current file position, retrying short writes.
 *
 * @return bytes written; less than dlen only if the descriptor stops
 * accepting data.
 */
size_t writeChunk(int fd, const void *data, size_t dlen);

size_t seekFd(int fd, size_t offset);
size_t tellFd(int fd);

}

#endif
