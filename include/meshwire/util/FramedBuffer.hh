/**
 * @file FramedBuffer.hh
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

#ifndef __MESHWIRE_UTIL_FRAMED_BUFFER_HH__
#define __MESHWIRE_UTIL_FRAMED_BUFFER_HH__

#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

#include "Frame.hh"
#include "FramedMessage.hh"
#include "SpooledBuffer.hh"
#include "WaitQueue.hh"

namespace meshwire::util {

/**
 * Reassembles framed messages from a byte stream split at arbitrary points.
 *
 * Frame bodies are spooled to disk, so payload size doesn't bound memory
 * use. Only one message is reassembled at a time: a header frame must be
 * followed by the payload frame of the same message before anything else.
 *
 * put() is called by the single stream reader; completed messages are
 * handed out FIFO through get()/tryGet(), which may be called from any
 * number of consumer threads.
 */
class FramedBuffer
{
public:
    using Queue = WaitQueue<FramedMessage>;

    explicit FramedBuffer(SpooledBuffer::Options opts = { });
    ~FramedBuffer() noexcept;

    FramedBuffer(const FramedBuffer &) = delete;
    FramedBuffer &operator=(const FramedBuffer &) = delete;

    /**
     * Consume the next bytes of the stream.
     *
     * @throws ProtocolError if the stream is corrupt; the buffer is unusable
     * afterwards.
     * @throws EncodingError if a header could not be decoded. The rest of
     * data has still been consumed and the buffer stays usable.
     * @throws StorageError on spool I/O failure.
     */
    void put(std::span<const uint8_t> data);

    void put(const void *data, size_t len)
    {
        put(std::span{reinterpret_cast<const uint8_t *>(data), len});
    }

    /**
     * Wait for the next completed message.
     *
     * @return nothing if cancelled.
     */
    std::optional<FramedMessage> get()
    {
        return queue_.get();
    }

    /**
     * @return nothing on timeout or cancellation.
     */
    template <typename Rep, typename Period>
    std::optional<FramedMessage> get(const std::chrono::duration<Rep, Period> &tmo)
    {
        return queue_.get(tmo);
    }

    /**
     * @return nothing if no message is ready.
     */
    std::optional<FramedMessage> tryGet()
    {
        return queue_.tryGet();
    }

    /**
     * Release any waiting consumers. The reassembly state is unaffected.
     */
    void cancel() noexcept;

    /**
     * Cancel consumers and drop the partially received message.
     */
    void close() noexcept;

    bool failed() const noexcept { return failed_; }
    bool closed() const noexcept { return closed_; }

    /**
     * Body bytes still expected for the current frame.
     */
    size_t remaining() const noexcept { return toRead_; }

    size_t readyCount() const { return queue_.size(); }

private:
    std::span<const uint8_t> handleFrame(std::span<const uint8_t> data);
    std::span<const uint8_t> consume(std::span<const uint8_t> data);
    void checkSequence(const wire::Frame &frame) const;
    void finish();

    SpooledBuffer::Options opts_;

    std::vector<uint8_t> frameBuf_;
    std::optional<wire::Frame> frame_;
    size_t toRead_{ };
    std::shared_ptr<SpooledBuffer> buf_;

    std::optional<nlohmann::json> header_;
    wire::MessageId headerId_{ };
    std::optional<wire::MessageId> discardId_;

    bool failed_{ };
    bool closed_{ };

    Queue queue_;
};

}

#endif
