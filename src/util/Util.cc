/**
 * @file Util.cc
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
#include <filesystem>
#include <limits>

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <meshwire/util/Error.hh>
#include <meshwire/util/Util.hh>

namespace meshwire::util {

std::pair<ScopedFd, std::string> makeTempFile(
    std::string prefix,
    std::string suffix,
    int flags,
    std::string dir)
{
    namespace fs = std::filesystem;

    auto root = dir.empty() ? fs::temp_directory_path() : fs::path(dir);

    auto path = (root / (prefix + "XXXXXX" + suffix)).native();

    auto fd = ScopedFd{::mkostemps(path.data(), static_cast<int>(suffix.size()), flags)};

    if (fd.get() < 0)
        throw StorageError(errno, fmt::format("mkostemps '{}'", path));

    spdlog::trace("created temp file '{}'", path);

    return {std::move(fd), std::move(path)};
}

size_t readChunk(int fd, void *data, size_t dlen)
{
    auto buf = reinterpret_cast<uint8_t *>(data);

    for (size_t offset = 0; offset < dlen; )
    {
        auto len = ::read(fd, buf + offset, dlen - offset);

        if (len < 0)
        {
            if (errno == EINTR)
                continue;

            throw StorageError(errno, "read");
        }

        if (!len)
            return offset;

        offset += static_cast<size_t>(len);
    }

    return dlen;
}

size_t writeChunk(int fd, const void *data, size_t dlen)
{
    auto buf = reinterpret_cast<const uint8_t *>(data);
    auto written = size_t{ };

    while (written < dlen)
    {
        const auto len = ::write(fd, buf + written, dlen - written);

        if (len < 0)
        {
            if (errno == EINTR)
                continue;

            throw StorageError(errno, "write");
        }

        if (!len)
            break;

        written += static_cast<size_t>(len);
    }

    return written;
}

size_t seekFd(int fd, size_t offset)
{
    if (offset > static_cast<size_t>(std::numeric_limits<off_t>::max()))
        throw StorageError(EOVERFLOW, "seek offset is out of off_t range");

    const auto pos = ::lseek(fd, static_cast<off_t>(offset), SEEK_SET);

    if (pos < 0)
        throw StorageError(errno, "lseek");

    return static_cast<size_t>(pos);
}

size_t tellFd(int fd)
{
    const auto pos = ::lseek(fd, 0, SEEK_CUR);

    if (pos < 0)
        throw StorageError(errno, "lseek");

    return static_cast<size_t>(pos);
}

}
