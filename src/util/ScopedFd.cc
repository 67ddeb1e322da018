/**
 * @file ScopedFd.cc
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

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>

#include <spdlog/spdlog.h>

#include <meshwire/util/Error.hh>
#include <meshwire/util/ScopedFd.hh>

namespace meshwire::util {

ScopedFd ScopedFd::open(const std::string &path, int flags, mode_t mode)
{
    auto fd = ScopedFd{::open(path.c_str(), flags | O_CLOEXEC, mode)};

    if (fd.get() < 0)
        throw StorageError(errno, fmt::format("open '{}'", path));

    return fd;
}

size_t ScopedFd::fileSize() const
{
    struct stat st{ };

    if (::fstat(fd_, &st))
        throw StorageError(errno, "fstat");

    return static_cast<size_t>(st.st_size);
}

}
