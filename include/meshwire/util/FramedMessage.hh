/**
 * @file FramedMessage.hh
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

#ifndef __MESHWIRE_UTIL_FRAMED_MESSAGE_HH__
#define __MESHWIRE_UTIL_FRAMED_MESSAGE_HH__

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

#include "Frame.hh"
#include "SpooledBuffer.hh"

namespace meshwire::util {

/**
 * A header value and optional payload, serialized as framed chunks.
 *
 * With a payload the message is dual-part:
 *
 *   Frame(Header) <json header> Frame(Payload) <payload bytes>
 *
 * without one it is a single-part command:
 *
 *   Frame(Command) <json header>
 *
 * A null header is sent as the JSON literal null.
 */
class FramedMessage
{
public:
    using Chunk = std::vector<uint8_t>;
    using Sink = std::function<void(std::span<const uint8_t>)>;
    using PayloadPtr = std::shared_ptr<SpooledBuffer>;

    /**
     * Lazy, single pass chunk sequence for one message.
     */
    class Producer
    {
    public:
        /**
         * @return the next chunk to transmit, or nothing when the message is
         * exhausted.
         */
        std::optional<Chunk> next();

    private:
        friend class FramedMessage;

        enum class Stage
        {
            HeaderFrame,
            HeaderBody,
            PayloadFrame,
            PayloadBody,
            Done
        };

        Producer(wire::MessageId id, Chunk headerBytes, PayloadPtr payload);

        wire::MessageId id_{ };
        Chunk headerBytes_;
        PayloadPtr payload_;
        Stage stage_{Stage::HeaderFrame};
    };

    FramedMessage() = default;

    explicit FramedMessage(
        nlohmann::json header,
        PayloadPtr payload = { },
        std::optional<wire::MessageId> id = std::nullopt);

    wire::MessageId id() const noexcept { return id_; }
    const nlohmann::json &header() const noexcept { return header_; }
    const PayloadPtr &payload() const noexcept { return payload_; }

    bool dualPart() const noexcept { return static_cast<bool>(payload_); }

    /**
     * Start a serialization pass.
     *
     * The payload is rewound once, when its frame has been emitted, and
     * read through exactly once.
     *
     * @throws EncodingError if the header can't be encoded.
     */
    Producer produce() const;

    /**
     * Serialize to a sink, one chunk per call.
     */
    void produce(const Sink &sink) const;

    /**
     * Materialize the full serialized message in memory.
     */
    std::vector<uint8_t> serialize() const;

private:
    wire::MessageId id_{ };
    nlohmann::json header_;
    PayloadPtr payload_;
};

}

#endif
