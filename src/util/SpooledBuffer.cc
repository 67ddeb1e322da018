/**
 * @file SpooledBuffer.cc
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

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <meshwire/util/Error.hh>
#include <meshwire/util/ScopedTempFile.hh>
#include <meshwire/util/SpooledBuffer.hh>
#include <meshwire/util/Util.hh>
#include <meshwire/util/UtilJson.hh>

namespace meshwire::util {

namespace {

/**
 * File backed store.
 *
 * Small writes are coalesced in memory and written out before any read,
 * seek or flush, so feeding a stream a byte at a time doesn't cost one
 * syscall per byte.
 */
class FileStore : public SpooledBuffer::Store
{
public:
    static constexpr size_t WriteBehindSize = size_t{1} << 16;

    explicit FileStore(ScopedTempFile file, bool persistent):
        file_(std::move(file)),
        fd_(file_.fd()),
        path_(file_.path()),
        writable_(true)
    {
        if (persistent)
            file_.keep();
    }

    FileStore(ScopedFd fd, std::string path, bool writable):
        owned_(std::move(fd)),
        fd_(owned_.get()),
        path_(std::move(path)),
        writable_(writable)
    {
    }

    ~FileStore() noexcept override
    {
        if (pending_.empty() || !file_.kept())
            return;

        try {
            drain();
        } catch (const StorageError &ex) {
            spdlog::error("spooled buffer '{}': lost {} buffered bytes: {}"
                , path_
                , pending_.size()
                , ex.what());
        }
    }

    size_t write(const void *data, size_t len) override
    {
        if (!writable_)
            throw StorageError(EBADF, fmt::format("spooled buffer '{}' is read-only", path_));

        if (pending_.size() + len > WriteBehindSize)
            drain();

        if (len >= WriteBehindSize)
            return writeChunk(fd_, data, len);

        auto p = reinterpret_cast<const uint8_t *>(data);
        pending_.insert(pending_.end(), p, p + len);

        return len;
    }

    size_t read(void *data, size_t len) override
    {
        drain();

        return readChunk(fd_, data, len);
    }

    void seek(size_t offset) override
    {
        drain();
        seekFd(fd_, offset);
    }

    size_t tell() override
    {
        return tellFd(fd_) + pending_.size();
    }

    void flush() override
    {
        drain();

        if (writable_ && ::fdatasync(fd_))
            throw StorageError(errno, fmt::format("fdatasync '{}'", path_));
    }

    std::string name() const override
    {
        return path_;
    }

private:
    void drain()
    {
        if (pending_.empty())
            return;

        const auto len = writeChunk(fd_, pending_.data(), pending_.size());

        if (len != pending_.size())
        {
            throw StorageError(ENOSPC, fmt::format(
                "short write to '{}': {}/{}"
                , path_
                , len
                , pending_.size()));
        }

        pending_.clear();
    }

    ScopedTempFile file_;
    ScopedFd owned_;
    int fd_{-1};
    std::string path_;
    bool writable_{ };
    std::vector<uint8_t> pending_;
};

class MemoryStore : public SpooledBuffer::Store
{
public:
    explicit MemoryStore(std::vector<uint8_t> buf):
        buf_(std::move(buf))
    {
    }

    size_t write(const void *data, size_t len) override
    {
        if (pos_ + len > buf_.size())
            buf_.resize(pos_ + len);

        std::memcpy(buf_.data() + pos_, data, len);
        pos_ += len;

        return len;
    }

    size_t read(void *data, size_t len) override
    {
        if (pos_ >= buf_.size())
            return 0;

        len = std::min(len, buf_.size() - pos_);

        std::memcpy(data, buf_.data() + pos_, len);
        pos_ += len;

        return len;
    }

    void seek(size_t offset) override
    {
        pos_ = offset;
    }

    size_t tell() override
    {
        return pos_;
    }

    void flush() override
    {
    }

    std::string name() const override
    {
        return { };
    }

private:
    std::vector<uint8_t> buf_;
    size_t pos_{ };
};

}

SpooledBuffer::SpooledBuffer(std::unique_ptr<Store> store, size_t length, Options opts):
    store_(std::move(store)),
    length_(length),
    opts_(std::move(opts))
{
}

SpooledBuffer::~SpooledBuffer() noexcept = default;

SpooledBuffer SpooledBuffer::fromTemp(const Options &opts)
{
    auto file = ScopedTempFile{"meshwire_", ".spool", O_CLOEXEC, opts.dir};

    spdlog::trace("spooling to '{}'{}"
        , file.path()
        , opts.persistent ? " (persistent)" : "");

    return {std::make_unique<FileStore>(std::move(file), opts.persistent), 0, opts};
}

SpooledBuffer SpooledBuffer::fromData(std::span<const uint8_t> data, const Options &opts)
{
    auto buf = fromTemp(opts);

    buf.write(data);

    return buf;
}

SpooledBuffer SpooledBuffer::fromData(std::string_view data, const Options &opts)
{
    return fromData(std::span{reinterpret_cast<const uint8_t *>(data.data()), data.size()}, opts);
}

SpooledBuffer SpooledBuffer::fromJson(const nlohmann::json &value, const Options &opts)
{
    const auto data = encodeJson(value);

    return fromData(data, opts);
}

SpooledBuffer SpooledBuffer::fromPath(const std::string &path, const Options &opts)
{
    auto fd = ScopedFd::open(path, O_RDONLY);
    const auto size = fd.fileSize();

    return {std::make_unique<FileStore>(std::move(fd), path, false), size, opts};
}

SpooledBuffer SpooledBuffer::fromBuffer(std::vector<uint8_t> buf, const Options &opts)
{
    const auto size = buf.size();

    return {std::make_unique<MemoryStore>(std::move(buf)), size, opts};
}

size_t SpooledBuffer::write(const void *data, size_t len)
{
    const auto written = store_->write(data, len);

    length_ += written;

    return written;
}

void SpooledBuffer::seek(size_t offset)
{
    store_->seek(offset);
}

size_t SpooledBuffer::tell()
{
    return store_->tell();
}

size_t SpooledBuffer::read(void *data, size_t len)
{
    return store_->read(data, len);
}

std::vector<uint8_t> SpooledBuffer::read(size_t size)
{
    auto data = std::vector<uint8_t>(size);

    data.resize(read(data.data(), data.size()));

    return data;
}

std::vector<uint8_t> SpooledBuffer::readAll()
{
    const auto pos = tell();

    seek(0);

    auto data = std::vector<uint8_t>{ };

    while (true)
    {
        auto chunk = read(chunkSize());

        if (chunk.empty())
            break;

        data.insert(data.end(), chunk.begin(), chunk.end());
    }

    seek(pos);

    return data;
}

void SpooledBuffer::flush()
{
    store_->flush();
}

size_t SpooledBuffer::chunkSize() const noexcept
{
    return std::min(opts_.maxChunk, std::max(opts_.minChunk, length_ / 1024));
}

std::string SpooledBuffer::name() const
{
    return store_->name();
}

}
