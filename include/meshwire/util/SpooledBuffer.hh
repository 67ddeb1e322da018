/**
 * @file SpooledBuffer.hh
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

#ifndef __MESHWIRE_UTIL_SPOOLED_BUFFER_HH__
#define __MESHWIRE_UTIL_SPOOLED_BUFFER_HH__

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace meshwire::util {

struct SpooledBufferOptions
{
    static constexpr size_t DefaultMinChunk = size_t{1} << 12;
    static constexpr size_t DefaultMaxChunk = size_t{1} << 20;

    // directory for temp files, the system temp dir if empty.
    std::string dir{ };
    bool persistent{ };
    size_t minChunk{DefaultMinChunk};
    size_t maxChunk{DefaultMaxChunk};
};

/**
 * Sequential byte container spooled to a file so its size isn't bounded by
 * memory.
 *
 * Temp-file backed buffers remove their file when destroyed unless created
 * with Options::persistent.
 */
class SpooledBuffer
{
public:
    using Options = SpooledBufferOptions;

    static constexpr size_t DefaultMinChunk = Options::DefaultMinChunk;
    static constexpr size_t DefaultMaxChunk = Options::DefaultMaxChunk;

    /**
     * Backing storage, read and written at a shared position.
     */
    class Store
    {
    public:
        virtual ~Store() = default;

        virtual size_t write(const void *data, size_t len) = 0;
        virtual size_t read(void *data, size_t len) = 0;
        virtual void seek(size_t offset) = 0;
        virtual size_t tell() = 0;
        virtual void flush() = 0;
        virtual std::string name() const = 0;
    };

    SpooledBuffer(std::unique_ptr<Store> store, size_t length, Options opts = { });

    SpooledBuffer(SpooledBuffer &&) noexcept = default;
    SpooledBuffer &operator=(SpooledBuffer &&) noexcept = default;

    SpooledBuffer(const SpooledBuffer &) = delete;
    SpooledBuffer &operator=(const SpooledBuffer &) = delete;

    ~SpooledBuffer() noexcept;

    static SpooledBuffer fromTemp(const Options &opts = { });
    static SpooledBuffer fromData(std::span<const uint8_t> data, const Options &opts = { });
    static SpooledBuffer fromData(std::string_view data, const Options &opts = { });

    /**
     * @throws EncodingError if the value can't be encoded.
     */
    static SpooledBuffer fromJson(const nlohmann::json &value, const Options &opts = { });

    /**
     * Open an existing file read-only.
     */
    static SpooledBuffer fromPath(const std::string &path, const Options &opts = { });

    /**
     * Wrap an in-memory byte vector; nothing is spooled to disk.
     */
    static SpooledBuffer fromBuffer(std::vector<uint8_t> buf, const Options &opts = { });

    size_t write(const void *data, size_t len);

    size_t write(std::span<const uint8_t> data)
    {
        return write(data.data(), data.size());
    }

    void seek(size_t offset);
    size_t tell();

    size_t read(void *data, size_t len);

    /**
     * Read up to size bytes; an empty result means end of data.
     */
    std::vector<uint8_t> read(size_t size);

    /**
     * Read the whole buffer, leaving the position where it was.
     */
    std::vector<uint8_t> readAll();

    void flush();

    size_t size() const noexcept { return length_; }

    /**
     * Read granularity for streaming the buffer out: length / 1024, clamped
     * to the configured chunk bounds.
     */
    size_t chunkSize() const noexcept;

    std::string name() const;

    const Options &options() const noexcept { return opts_; }

private:
    std::unique_ptr<Store> store_;
    size_t length_{ };
    Options opts_;
};

}

#endif
