/**
 * @file ScopedTempFile.hh
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

#ifndef __MESHWIRE_UTIL_SCOPED_TEMP_FILE_HH__
#define __MESHWIRE_UTIL_SCOPED_TEMP_FILE_HH__

#include <string>

#include <fcntl.h>

#include "ScopedFd.hh"

namespace meshwire::util {

/**
 * A uniquely named file that is unlinked when the object goes away.
 *
 * keep() detaches the path so the file outlives the object.
 */
class ScopedTempFile
{
public:
    ScopedTempFile() = default;

    /**
     * Create a temporary file named <dir>/<prefix>XXXXXX<suffix>.
     *
     * @param prefix File name prefix.
     * @param suffix File name suffix.
     * @param flags Extra open(2) flags, in addition to O_RDWR | O_CREAT | O_EXCL.
     * @param dir Directory to create the file in, the system temp dir if empty.
     */
    ScopedTempFile(std::string prefix, std::string suffix, int flags = O_CLOEXEC, std::string dir = { });
    ~ScopedTempFile() noexcept;

    ScopedTempFile(const ScopedTempFile &) = delete;
    ScopedTempFile &operator=(const ScopedTempFile &) = delete;

    ScopedTempFile(ScopedTempFile &&o) noexcept;
    ScopedTempFile &operator=(ScopedTempFile &&o) noexcept;

    int fd() const noexcept;
    const std::string &path() const noexcept { return path_; }

    void keep() noexcept;
    bool kept() const noexcept { return kept_; }

    int close() noexcept;

private:
    int unlink() noexcept;

    ScopedFd fd_;
    std::string path_;
    bool kept_{ };
};

}

#endif
