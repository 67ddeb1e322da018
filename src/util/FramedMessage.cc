/**
 * @file FramedMessage.cc
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

#include <spdlog/spdlog.h>

#include <meshwire/util/FramedMessage.hh>
#include <meshwire/util/UtilJson.hh>

namespace meshwire::util {

namespace {

FramedMessage::Chunk frameChunk(const wire::Frame &frame)
{
    const auto bytes = frame.serialize();

    return {bytes.begin(), bytes.end()};
}

}

FramedMessage::Producer::Producer(wire::MessageId id, Chunk headerBytes, PayloadPtr payload):
    id_(id),
    headerBytes_(std::move(headerBytes)),
    payload_(std::move(payload))
{
}

std::optional<FramedMessage::Chunk> FramedMessage::Producer::next()
{
    using wire::Frame;

    switch (stage_)
    {
        case Stage::HeaderFrame:
        {
            stage_ = Stage::HeaderBody;

            const auto kind = payload_ ? Frame::Kind::Header : Frame::Kind::Command;

            return frameChunk(Frame::wrap(headerBytes_, kind, id_));
        }

        case Stage::HeaderBody:
            stage_ = payload_ ? Stage::PayloadFrame : Stage::Done;
            return std::move(headerBytes_);

        case Stage::PayloadFrame:
        {
            stage_ = Stage::PayloadBody;

            auto frame = frameChunk(Frame::wrap(payload_->size(), Frame::Kind::Payload, id_));

            payload_->seek(0);

            return frame;
        }

        case Stage::PayloadBody:
        {
            auto chunk = payload_->read(payload_->chunkSize());

            if (!chunk.empty())
                return chunk;

            stage_ = Stage::Done;
            break;
        }

        case Stage::Done:
            break;
    }

    return { };
}

FramedMessage::FramedMessage(nlohmann::json header, PayloadPtr payload, std::optional<wire::MessageId> id):
    id_(id ? *id : wire::makeMessageId()),
    header_(std::move(header)),
    payload_(std::move(payload))
{
}

FramedMessage::Producer FramedMessage::produce() const
{
    auto headerBytes = encodeJson(header_);

    spdlog::trace("produce message {}: {} header bytes, {} payload bytes"
        , wire::formatId(id_)
        , headerBytes.size()
        , payload_ ? payload_->size() : 0u);

    return {id_, std::move(headerBytes), payload_};
}

void FramedMessage::produce(const Sink &sink) const
{
    auto producer = produce();

    while (auto chunk = producer.next())
        sink(*chunk);
}

std::vector<uint8_t> FramedMessage::serialize() const
{
    auto data = std::vector<uint8_t>{ };

    produce([&data](std::span<const uint8_t> chunk) {
            data.insert(data.end(), chunk.begin(), chunk.end());
        });

    return data;
}

}
