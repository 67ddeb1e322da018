/**
 * @file Frame.cc
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
#include <array>
#include <functional>
#include <limits>
#include <random>

#include <spdlog/spdlog.h>

#include <meshwire/util/Error.hh>
#include <meshwire/util/Frame.hh>

namespace meshwire::wire {

namespace {

template <typename T>
uint8_t *putBe(uint8_t *p, T value) noexcept
{
    for (size_t i = sizeof(T); i > 0; --i)
    {
        p[i - 1] = static_cast<uint8_t>(value & 0xff);
        value >>= 8;
    }

    return p + sizeof(T);
}

template <typename T>
const uint8_t *getBe(const uint8_t *p, T &value) noexcept
{
    value = 0;

    for (size_t i = 0; i < sizeof(T); ++i)
        value = static_cast<T>((value << 8) | p[i]);

    return p + sizeof(T);
}

// seeded from 16 random_device words per thread.
std::mt19937_64 &idEngine()
{
    thread_local auto rng = [] {
            auto rd = std::random_device{ };
            auto words = std::array<std::random_device::result_type, 16>{ };

            std::generate(words.begin(), words.end(), std::ref(rd));

            auto seq = std::seed_seq(words.begin(), words.end());

            return std::mt19937_64{seq};
        }();

    return rng;
}

Frame::Kind toKind(uint8_t raw)
{
    switch (raw)
    {
        case static_cast<uint8_t>(Frame::Kind::Header):
        case static_cast<uint8_t>(Frame::Kind::Payload):
        case static_cast<uint8_t>(Frame::Kind::Command):
            return static_cast<Frame::Kind>(raw);
        default:
            break;
    }

    throw ProtocolError(fmt::format("unknown frame kind: {}", raw));
}

}

Frame::Bytes Frame::serialize() const noexcept
{
    auto bytes = Bytes{ };
    const auto [hi, lo] = splitId(msgId);

    auto p = bytes.data();
    p = putBe(p, static_cast<uint8_t>(kind));
    p = putBe(p, version);
    p = putBe(p, sequenceId);
    p = putBe(p, length);
    p = putBe(p, hi);
    putBe(p, lo);

    return bytes;
}

std::optional<Frame> Frame::deserialize(std::span<const uint8_t> data)
{
    if (data.size() < Size)
        return { };

    auto frame = Frame{ };
    auto rawKind = uint8_t{ };
    auto hi = uint64_t{ };
    auto lo = uint64_t{ };

    auto p = data.data();
    p = getBe(p, rawKind);
    p = getBe(p, frame.version);
    p = getBe(p, frame.sequenceId);
    p = getBe(p, frame.length);
    p = getBe(p, hi);
    getBe(p, lo);

    frame.kind = toKind(rawKind);
    frame.msgId = joinId(hi, lo);

    return frame;
}

std::optional<std::pair<Frame, std::span<const uint8_t>>> Frame::fromData(std::span<const uint8_t> data)
{
    auto frame = deserialize(data);

    if (!frame)
        return { };

    return std::make_pair(*frame, data.subspan(Size));
}

Frame Frame::wrap(size_t bodySize, Kind kind, std::optional<MessageId> msgId)
{
    if (bodySize > std::numeric_limits<uint32_t>::max())
    {
        throw ProtocolError(fmt::format(
            "frame body of {} bytes exceeds the maximum of {}"
            , bodySize
            , std::numeric_limits<uint32_t>::max()));
    }

    auto frame = Frame{ };
    frame.kind = kind;
    frame.length = static_cast<uint32_t>(bodySize);
    frame.msgId = msgId ? *msgId : makeMessageId();

    return frame;
}

std::string_view kindName(Frame::Kind kind) noexcept
{
    switch (kind)
    {
        case Frame::Kind::Header:
            return "header";
        case Frame::Kind::Payload:
            return "payload";
        case Frame::Kind::Command:
            return "command";
    }

    return "unknown";
}

std::pair<uint64_t, uint64_t> splitId(MessageId id) noexcept
{
    return {
        static_cast<uint64_t>(id >> 64),
        static_cast<uint64_t>(id)
    };
}

MessageId joinId(uint64_t hi, uint64_t lo) noexcept
{
    return (static_cast<MessageId>(hi) << 64) | lo;
}

MessageId makeMessageId()
{
    auto &rng = idEngine();

    auto hi = rng();
    auto lo = rng();

    // version 4, variant 1.
    hi = (hi & ~uint64_t{0xf000}) | 0x4000;
    lo = (lo & ~(uint64_t{0x3} << 62)) | (uint64_t{0x2} << 62);

    return joinId(hi, lo);
}

std::string formatId(MessageId id)
{
    const auto [hi, lo] = splitId(id);

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}"
        , hi >> 32
        , (hi >> 16) & 0xffff
        , hi & 0xffff
        , lo >> 48
        , lo & 0xffff'ffff'ffff);
}

std::optional<MessageId> parseId(std::string_view str)
{
    auto id = MessageId{ };
    auto digits = 0u;

    for (auto c : str)
    {
        if (c == '-')
            continue;

        auto nibble = 0u;

        if (c >= '0' && c <= '9')
            nibble = static_cast<unsigned>(c - '0');
        else if (c >= 'a' && c <= 'f')
            nibble = static_cast<unsigned>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F')
            nibble = static_cast<unsigned>(c - 'A' + 10);
        else
            return { };

        if (++digits > 32)
            return { };

        id = (id << 4) | nibble;
    }

    if (digits != 32)
        return { };

    return id;
}

}
