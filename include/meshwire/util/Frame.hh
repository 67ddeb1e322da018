/**
 * @file Frame.hh
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

#ifndef __MESHWIRE_UTIL_FRAME_HH__
#define __MESHWIRE_UTIL_FRAME_HH__

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace meshwire::wire {

/**
 * 128-bit message identifier, normally a random v4 uuid.
 */
__extension__ typedef unsigned __int128 MessageId;

/**
 * Header preceding every chunk of a message stream.
 *
 * Wire layout, big-endian, no padding:
 *
 *   kind:u8 version:u8 sequenceId:u32 length:u32 msgIdHi:u64 msgIdLo:u64
 *
 * length is the exact number of body bytes between this frame and the next.
 */
struct Frame
{
    enum class Kind : uint8_t
    {
        Header = 0,
        Payload = 1,
        Command = 2
    };

    static constexpr size_t Size = 26u;
    static constexpr uint8_t CurrentVersion = 1u;

    // reserved, always 1.
    static constexpr uint32_t DefaultSequenceId = 1u;

    using Bytes = std::array<uint8_t, Size>;

    Kind kind{Kind::Payload};
    uint8_t version{CurrentVersion};
    uint32_t sequenceId{DefaultSequenceId};
    uint32_t length{ };
    MessageId msgId{ };

    bool operator==(const Frame &) const = default;

    Bytes serialize() const noexcept;

    /**
     * Parse a frame from the start of data.
     *
     * @return the frame, or nothing if fewer than Size bytes are available.
     * @throws ProtocolError if the kind field is not a known Kind.
     */
    static std::optional<Frame> deserialize(std::span<const uint8_t> data);

    /**
     * Parse a frame and return it along with the bytes following it.
     */
    static std::optional<std::pair<Frame, std::span<const uint8_t>>> fromData(std::span<const uint8_t> data);

    /**
     * Build the frame describing a body of bodySize bytes.
     *
     * A fresh id is generated if msgId is not given.
     */
    static Frame wrap(size_t bodySize, Kind kind = Kind::Payload, std::optional<MessageId> msgId = std::nullopt);

    static Frame wrap(std::span<const uint8_t> body, Kind kind = Kind::Payload, std::optional<MessageId> msgId = std::nullopt)
    {
        return wrap(body.size(), kind, msgId);
    }
};

std::string_view kindName(Frame::Kind kind) noexcept;

std::pair<uint64_t, uint64_t> splitId(MessageId id) noexcept;
MessageId joinId(uint64_t hi, uint64_t lo) noexcept;

MessageId makeMessageId();

/**
 * Render as 8-4-4-4-12 lowercase hex.
 */
std::string formatId(MessageId id);

/**
 * Parse 32 hex digits, dashes allowed anywhere.
 */
std::optional<MessageId> parseId(std::string_view str);

}

#endif
