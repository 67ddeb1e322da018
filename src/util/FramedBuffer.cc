/**
 * @file FramedBuffer.cc
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
#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include <meshwire/util/Error.hh>
#include <meshwire/util/FramedBuffer.hh>
#include <meshwire/util/UtilJson.hh>

namespace meshwire::util {

using wire::Frame;

FramedBuffer::FramedBuffer(SpooledBuffer::Options opts):
    opts_(std::move(opts))
{
    frameBuf_.reserve(Frame::Size);
}

FramedBuffer::~FramedBuffer() noexcept
{
    close();
}

void FramedBuffer::put(std::span<const uint8_t> data)
{
    if (closed_)
        throw std::logic_error("framed buffer: put after close");

    if (failed_)
        throw ProtocolError("framed buffer: stream already failed");

    auto encodingError = std::exception_ptr{ };

    try {
        do
        {
            if (!frame_)
            {
                data = handleFrame(data);

                // wait for the rest of the frame.
                if (!frame_)
                    break;
            }

            data = consume(data);

            if (toRead_)
                continue;

            try {
                finish();
            } catch (const EncodingError &ex) {
                // the body was fully consumed, so the stream is still in
                // sync; carry on with whatever follows it.
                spdlog::warn("framed buffer: {}", ex.what());

                if (!encodingError)
                    encodingError = std::current_exception();
            }
        } while (!data.empty());
    } catch (const ProtocolError &ex) {
        spdlog::error("framed buffer: {}", ex.what());
        failed_ = true;
        throw;
    }

    if (encodingError)
        std::rethrow_exception(encodingError);
}

std::span<const uint8_t> FramedBuffer::handleFrame(std::span<const uint8_t> data)
{
    const auto take = std::min(Frame::Size - frameBuf_.size(), data.size());

    frameBuf_.insert(frameBuf_.end(), data.begin(), data.begin() + static_cast<ptrdiff_t>(take));
    data = data.subspan(take);

    auto frame = Frame::deserialize(frameBuf_);

    if (!frame)
        return data;

    frameBuf_.clear();

    spdlog::trace("frame {} v{} seq {} len {} id {}"
        , wire::kindName(frame->kind)
        , frame->version
        , frame->sequenceId
        , frame->length
        , wire::formatId(frame->msgId));

    checkSequence(*frame);

    if (!buf_)
        buf_ = std::make_shared<SpooledBuffer>(SpooledBuffer::fromTemp(opts_));

    frame_ = frame;
    toRead_ = frame->length;

    return data;
}

void FramedBuffer::checkSequence(const Frame &frame) const
{
    if (frame.kind == Frame::Kind::Payload)
    {
        if (header_)
        {
            if (frame.msgId != headerId_)
            {
                throw ProtocolError(fmt::format(
                    "payload frame for message {} follows header of message {}"
                    , wire::formatId(frame.msgId)
                    , wire::formatId(headerId_)));
            }
        }
        else if (!discardId_ || *discardId_ != frame.msgId)
        {
            throw ProtocolError(fmt::format(
                "payload frame for message {} without a header"
                , wire::formatId(frame.msgId)));
        }

        return;
    }

    if (header_)
    {
        throw ProtocolError(fmt::format(
            "{} frame for message {} while awaiting payload of message {}"
            , wire::kindName(frame.kind)
            , wire::formatId(frame.msgId)
            , wire::formatId(headerId_)));
    }
}

std::span<const uint8_t> FramedBuffer::consume(std::span<const uint8_t> data)
{
    const auto take = std::min(toRead_, data.size());

    if (!take)
        return data;

    const auto written = buf_->write(data.first(take));

    if (written != take)
    {
        throw StorageError(ENOSPC, fmt::format(
            "short write to spooled buffer '{}': {}/{}"
            , buf_->name()
            , written
            , take));
    }

    toRead_ -= written;

    return data.subspan(take);
}

void FramedBuffer::finish()
{
    const auto frame = *frame_;
    auto buf = std::move(buf_);

    frame_.reset();
    toRead_ = 0;

    if (frame.kind != Frame::Kind::Payload)
        discardId_.reset();

    switch (frame.kind)
    {
        case Frame::Kind::Header:
            buf->seek(0);

            try {
                header_ = decodeJson(*buf);
            } catch (const EncodingError &) {
                discardId_ = frame.msgId;
                throw;
            }

            headerId_ = frame.msgId;
            break;

        case Frame::Kind::Payload:
            if (!header_)
            {
                spdlog::warn("discarding {} byte payload of message {}: header was not decoded"
                    , buf->size()
                    , wire::formatId(frame.msgId));

                discardId_.reset();
                break;
            }

            // hand out the payload rewound, ready to read.
            buf->seek(0);

            spdlog::debug("message {} complete: {} payload bytes"
                , wire::formatId(frame.msgId)
                , buf->size());

            queue_.put(FramedMessage{std::move(*header_), std::move(buf), frame.msgId});
            header_.reset();
            break;

        case Frame::Kind::Command:
        {
            buf->seek(0);

            auto header = decodeJson(*buf);

            spdlog::debug("command {} complete", wire::formatId(frame.msgId));

            queue_.put(FramedMessage{std::move(header), { }, frame.msgId});
            break;
        }

        default:
            throw ProtocolError(fmt::format("unknown frame kind: {}", static_cast<unsigned>(frame.kind)));
    }
}

void FramedBuffer::cancel() noexcept
{
    queue_.cancel();
}

void FramedBuffer::close() noexcept
{
    if (closed_)
        return;

    closed_ = true;

    cancel();

    if (frame_ || !frameBuf_.empty() || header_)
    {
        spdlog::debug("framed buffer closed with a partial message ({} body bytes outstanding)"
            , toRead_);
    }

    frame_.reset();
    frameBuf_.clear();
    toRead_ = 0;
    buf_.reset();
    header_.reset();
    discardId_.reset();
}

}
