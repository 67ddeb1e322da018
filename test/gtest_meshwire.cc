/**
 * @file gtest_meshwire.cc
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

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <future>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include <sys/eventfd.h>

#include <spdlog/spdlog.h>

#include <meshwire/util/Error.hh>
#include <meshwire/util/Frame.hh>
#include <meshwire/util/ScopedTempFile.hh>
#include <meshwire/util/SpooledBuffer.hh>
#include <meshwire/util/Util.hh>
#include <meshwire/util/UtilJson.hh>
#include <meshwire/util/WaitQueue.hh>

using namespace meshwire;
using namespace meshwire::util;
using wire::Frame;
using wire::MessageId;

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> bytes(std::string_view s)
{
    return {s.begin(), s.end()};
}

MessageId randomId(std::mt19937_64 &rng)
{
    return wire::joinId(rng(), rng());
}

}

////////////////////////////////////////////////////////////////////////////////
// ScopedFd

namespace {

bool fdOpened(int fd)
{
    return fs::exists(fmt::format("/proc/self/fd/{}", fd));
}

}

TEST(scoped_fd, dtor)
{
    int rawFd{-1};

    {
        auto fd = ScopedFd{::eventfd(0, EFD_CLOEXEC)};
        ASSERT_NE(fd.get(), -1);

        rawFd = fd.get();
        EXPECT_TRUE(fdOpened(rawFd));
    }

    EXPECT_FALSE(fdOpened(rawFd));
}

TEST(scoped_fd, open_missing)
{
    EXPECT_THROW(ScopedFd::open("/nonexistent/meshwire/file", O_RDONLY), StorageError);
}

TEST(scoped_fd, file_size)
{
    auto f = ScopedTempFile("meshwire_gtest_", ".tmp");

    ASSERT_EQ(writeChunk(f.fd(), "hello", 5), 5u);

    auto fd = ScopedFd::open(f.path(), O_RDONLY);
    EXPECT_TRUE(fd);
    EXPECT_EQ(fd.fileSize(), 5u);
}

////////////////////////////////////////////////////////////////////////////////
// ScopedTempFile

TEST(scoped_temp_file, create)
{
    auto path = []{
            auto f = ScopedTempFile("foo", "bar");
            EXPECT_TRUE(fs::exists(f.path()));
            EXPECT_TRUE(f.path().ends_with("bar"));
            return f.path();
        }();

    EXPECT_FALSE(fs::exists(path));
}

TEST(scoped_temp_file, keep)
{
    auto path = []{
            auto f = ScopedTempFile("foo", "bar");
            f.keep();
            return f.path();
        }();

    EXPECT_TRUE(fs::exists(path));
    fs::remove(path);
}

TEST(scoped_temp_file, move)
{
    auto f = ScopedTempFile("foo", "bar");
    const auto path = f.path();

    auto g = std::move(f);
    EXPECT_EQ(g.path(), path);
    EXPECT_TRUE(f.path().empty());
    EXPECT_TRUE(fs::exists(path));

    g.close();
    EXPECT_FALSE(fs::exists(path));
}

TEST(scoped_temp_file, missing_dir)
{
    EXPECT_THROW(ScopedTempFile("foo", "bar", O_CLOEXEC, "/nonexistent/meshwire"), StorageError);
}

////////////////////////////////////////////////////////////////////////////////
// WaitQueue

TEST(wait_q, put_get)
{
    auto q = WaitQueue<int>{ };
    q.put(42);

    auto v = q.get();
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, 42);
}

TEST(wait_q, fifo)
{
    auto q = WaitQueue<int>{ };

    for (int i = 0; i < 5; ++i)
        q.put(i);

    EXPECT_EQ(q.size(), 5u);

    for (int i = 0; i < 5; ++i)
    {
        auto v = q.tryGet();
        ASSERT_TRUE(v);
        EXPECT_EQ(*v, i);
    }

    EXPECT_TRUE(q.empty());
}

TEST(wait_q, try_get_empty)
{
    auto q = WaitQueue<int>{ };

    EXPECT_FALSE(q.tryGet());
}

TEST(wait_q, get_tmo)
{
    using namespace std::chrono_literals;

    auto q = WaitQueue<int>{ };

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.get(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(wait_q, get_wakeup)
{
    using namespace std::chrono_literals;

    auto q = WaitQueue<int>{ };

    auto fut = std::async(std::launch::async, [&] { return q.get(5s); });

    EXPECT_EQ(fut.wait_for(10ms), std::future_status::timeout);

    q.put(7);

    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);

    auto v = fut.get();
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, 7);
}

TEST(wait_q, cancel)
{
    using namespace std::chrono_literals;

    auto q = WaitQueue<int>{ };

    auto fut = std::async(std::launch::async, [&] { return q.get(); });

    EXPECT_EQ(fut.wait_for(10ms), std::future_status::timeout);

    q.cancel();

    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);
    EXPECT_FALSE(fut.get());
    EXPECT_TRUE(q.done());

    // queued items survive a cancel.
    q.put(1);
    q.resume();

    auto v = q.get(10ms);
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, 1);
}

TEST(wait_q, resume)
{
    using namespace std::chrono_literals;

    auto q = WaitQueue<int>{ };

    q.cancel();
    EXPECT_FALSE(q.get(10ms));

    q.resume();
    EXPECT_FALSE(q.done());

    // a waiter blocked after resume gets the next item.
    auto fut = std::async(std::launch::async, [&] { return q.get(5s); });
    EXPECT_EQ(fut.wait_for(10ms), std::future_status::timeout);

    q.put(7);

    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);

    auto v = fut.get();
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, 7);
}

////////////////////////////////////////////////////////////////////////////////
// Frame

TEST(frame, size)
{
    auto f = Frame{ };
    EXPECT_EQ(f.serialize().size(), 26u);
    EXPECT_EQ(Frame::Size, 26u);
}

TEST(frame, layout)
{
    auto f = Frame{ };
    f.kind = Frame::Kind::Command;
    f.version = 1;
    f.sequenceId = 0x01020304;
    f.length = 0x0a0b0c0d;
    f.msgId = wire::joinId(0x1112131415161718, 0x2122232425262728);

    const auto b = f.serialize();

    const auto expected = Frame::Bytes{
        0x02,
        0x01,
        0x01, 0x02, 0x03, 0x04,
        0x0a, 0x0b, 0x0c, 0x0d,
        0x11, 0x12, 0x13, 0x14, 0x15, 0x16, 0x17, 0x18,
        0x21, 0x22, 0x23, 0x24, 0x25, 0x26, 0x27, 0x28
    };

    EXPECT_EQ(b, expected);
}

TEST(frame, round_trip)
{
    auto rng = std::mt19937_64{42};

    for (auto kind : {Frame::Kind::Header, Frame::Kind::Payload, Frame::Kind::Command})
    {
        for (int i = 0; i < 16; ++i)
        {
            auto f = Frame{ };
            f.kind = kind;
            f.version = static_cast<uint8_t>(rng());
            f.sequenceId = static_cast<uint32_t>(rng());
            f.length = static_cast<uint32_t>(rng());
            f.msgId = randomId(rng);

            const auto b = f.serialize();
            const auto g = Frame::deserialize(b);

            ASSERT_TRUE(g);
            EXPECT_TRUE(*g == f);
        }
    }
}

TEST(frame, insufficient_data)
{
    const auto b = Frame::wrap(10).serialize();

    for (size_t len = 0; len < Frame::Size; ++len)
        EXPECT_FALSE(Frame::deserialize(std::span{b.data(), len}));
}

TEST(frame, from_data_remainder)
{
    const auto f = Frame::wrap(3, Frame::Kind::Command);
    const auto fb = f.serialize();

    auto data = std::vector<uint8_t>(fb.begin(), fb.end());
    data.push_back('a');
    data.push_back('b');
    data.push_back('c');

    const auto parsed = Frame::fromData(data);

    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed->first == f);
    ASSERT_EQ(parsed->second.size(), 3u);
    EXPECT_EQ(parsed->second[0], 'a');
    EXPECT_EQ(parsed->second[2], 'c');
}

TEST(frame, unknown_kind)
{
    auto b = Frame::wrap(0).serialize();

    b[0] = 3;
    EXPECT_THROW(Frame::deserialize(b), ProtocolError);

    b[0] = 0xff;
    EXPECT_THROW(Frame::deserialize(b), ProtocolError);
}

TEST(frame, wrap)
{
    const auto body = bytes("{\"type\": \"ping\"}");
    const auto id = wire::joinId(1, 2);

    const auto f = Frame::wrap(body, Frame::Kind::Header, id);

    EXPECT_EQ(f.kind, Frame::Kind::Header);
    EXPECT_EQ(f.version, 1u);
    EXPECT_EQ(f.sequenceId, 1u);
    EXPECT_EQ(f.length, body.size());
    EXPECT_TRUE(f.msgId == id);

    const auto g = Frame::wrap(body);
    EXPECT_EQ(g.kind, Frame::Kind::Payload);
    EXPECT_FALSE(g.msgId == 0);
}

TEST(frame, wrap_zero_id)
{
    // an explicit zero id is kept, not replaced.
    const auto f = Frame::wrap(1, Frame::Kind::Payload, MessageId{0});
    EXPECT_TRUE(f.msgId == 0);
}

TEST(frame, wrap_oversize)
{
    const auto size = size_t{std::numeric_limits<uint32_t>::max()} + 1;

    EXPECT_THROW(Frame::wrap(size), ProtocolError);
}

TEST(frame, split_join)
{
    auto rng = std::mt19937_64{7};

    for (int i = 0; i < 64; ++i)
    {
        const auto v = randomId(rng);
        const auto [hi, lo] = wire::splitId(v);

        EXPECT_TRUE(wire::joinId(hi, lo) == v);
    }

    const auto max = ~MessageId{0};
    const auto [hi, lo] = wire::splitId(max);
    EXPECT_EQ(hi, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(lo, std::numeric_limits<uint64_t>::max());
    EXPECT_TRUE(wire::joinId(hi, lo) == max);

    const auto [zhi, zlo] = wire::splitId(0);
    EXPECT_EQ(zhi, 0u);
    EXPECT_EQ(zlo, 0u);
}

TEST(frame, make_id)
{
    const auto a = wire::makeMessageId();
    const auto b = wire::makeMessageId();

    EXPECT_FALSE(a == b);

    // v4 uuid: version nibble 4, variant bits 10.
    const auto [hi, lo] = wire::splitId(a);
    EXPECT_EQ((hi >> 12) & 0xf, 4u);
    EXPECT_EQ(lo >> 62, 2u);
}

TEST(frame, make_id_per_thread)
{
    constexpr auto threads = 32;

    auto futs = std::vector<std::future<wire::MessageId>>{ };

    for (auto i = 0; i < threads; ++i)
        futs.push_back(std::async(std::launch::async, [] { return wire::makeMessageId(); }));

    auto ids = std::vector<wire::MessageId>{ };

    for (auto &f : futs)
        ids.push_back(f.get());

    // each fresh thread starts its own id sequence.
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(std::adjacent_find(ids.begin(), ids.end()), ids.end());
}

TEST(frame, format_parse_id)
{
    const auto id = wire::joinId(0x0123456789abcdef, 0xfedcba9876543210);

    const auto str = wire::formatId(id);
    EXPECT_EQ(str, "01234567-89ab-cdef-fedc-ba9876543210");

    const auto parsed = wire::parseId(str);
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(*parsed == id);

    const auto undashed = wire::parseId("0123456789ABCDEFFEDCBA9876543210");
    ASSERT_TRUE(undashed);
    EXPECT_TRUE(*undashed == id);

    EXPECT_FALSE(wire::parseId(""));
    EXPECT_FALSE(wire::parseId("0123"));
    EXPECT_FALSE(wire::parseId("0123456789abcdeffedcba98765432100"));
    EXPECT_FALSE(wire::parseId("0123456789abcdeffedcba987654321g"));
}

////////////////////////////////////////////////////////////////////////////////
// Json

TEST(json, encode_decode)
{
    const auto j = nlohmann::json{{"type", "ping"}, {"n", 3}};

    const auto data = encodeJson(j);
    EXPECT_EQ(decodeJson(data), j);
}

TEST(json, encode_invalid_utf8)
{
    const auto j = nlohmann::json{{"type", std::string("\xff\xfe")}};

    EXPECT_THROW(encodeJson(j), EncodingError);
}

TEST(json, decode_invalid)
{
    EXPECT_THROW(decodeJson(bytes("{\"type\": ")), EncodingError);
    EXPECT_THROW(decodeJson(bytes("")), EncodingError);
}

TEST(json, decode_buffer_position)
{
    auto buf = SpooledBuffer::fromData(std::string_view{"xx[1, 2, 3]"});

    buf.seek(2);
    EXPECT_EQ(decodeJson(buf), nlohmann::json::array({1, 2, 3}));
}

////////////////////////////////////////////////////////////////////////////////
// SpooledBuffer

TEST(spooled_buffer, temp_empty)
{
    auto buf = SpooledBuffer::fromTemp();

    EXPECT_EQ(buf.size(), 0u);
    EXPECT_FALSE(buf.name().empty());
    EXPECT_TRUE(fs::exists(buf.name()));
    EXPECT_TRUE(buf.read(16).empty());
    EXPECT_EQ(buf.chunkSize(), SpooledBuffer::DefaultMinChunk);
}

TEST(spooled_buffer, temp_removed)
{
    auto path = []{
            auto buf = SpooledBuffer::fromData(std::string_view{"abc"});
            EXPECT_TRUE(fs::exists(buf.name()));
            return buf.name();
        }();

    EXPECT_FALSE(fs::exists(path));
}

TEST(spooled_buffer, temp_persistent)
{
    auto opts = SpooledBuffer::Options{ };
    opts.persistent = true;

    auto path = [&opts]{
            auto buf = SpooledBuffer::fromData(std::string_view{"abc"}, opts);
            return buf.name();
        }();

    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::file_size(path), 3u);
    fs::remove(path);
}

TEST(spooled_buffer, temp_dir)
{
    const auto dir = fs::temp_directory_path() / "meshwire_gtest_spool";
    fs::create_directories(dir);

    auto opts = SpooledBuffer::Options{ };
    opts.dir = dir.native();

    {
        auto buf = SpooledBuffer::fromTemp(opts);
        EXPECT_EQ(fs::path(buf.name()).parent_path(), dir);
    }

    fs::remove_all(dir);
}

TEST(spooled_buffer, write_read)
{
    auto buf = SpooledBuffer::fromTemp();

    EXPECT_EQ(buf.write(bytes("hello ")), 6u);
    EXPECT_EQ(buf.write(bytes("world")), 5u);
    EXPECT_EQ(buf.size(), 11u);

    buf.seek(0);
    EXPECT_EQ(buf.read(5), bytes("hello"));
    EXPECT_EQ(buf.read(100), bytes(" world"));
    EXPECT_TRUE(buf.read(100).empty());

    buf.seek(6);
    EXPECT_EQ(buf.read(5), bytes("world"));
}

TEST(spooled_buffer, from_data_text)
{
    auto buf = SpooledBuffer::fromData(std::string_view{"text"});

    EXPECT_EQ(buf.size(), 4u);
    EXPECT_EQ(buf.readAll(), bytes("text"));
}

TEST(spooled_buffer, read_all_keeps_position)
{
    auto buf = SpooledBuffer::fromData(std::string_view{"0123456789"});

    buf.seek(4);
    EXPECT_EQ(buf.readAll(), bytes("0123456789"));
    EXPECT_EQ(buf.tell(), 4u);
    EXPECT_EQ(buf.read(2), bytes("45"));
}

TEST(spooled_buffer, tell_includes_unwritten)
{
    auto buf = SpooledBuffer::fromTemp();

    buf.write(bytes("abc"));
    EXPECT_EQ(buf.tell(), 3u);

    buf.flush();
    EXPECT_EQ(fs::file_size(buf.name()), 3u);
}

TEST(spooled_buffer, large_write)
{
    auto rng = std::mt19937_64{1};
    auto data = std::vector<uint8_t>(3 * 65536 + 17);

    for (auto &b : data)
        b = static_cast<uint8_t>(rng());

    auto buf = SpooledBuffer::fromTemp();

    // mix of coalesced and direct writes.
    buf.write(std::span{data}.first(10));
    buf.write(std::span{data}.subspan(10, 2 * 65536));
    buf.write(std::span{data}.subspan(10 + 2 * 65536));

    EXPECT_EQ(buf.size(), data.size());
    EXPECT_EQ(buf.readAll(), data);
}

TEST(spooled_buffer, from_json)
{
    const auto j = nlohmann::json{{"type", "work"}};

    auto buf = SpooledBuffer::fromJson(j);

    EXPECT_EQ(buf.size(), encodeJson(j).size());

    buf.seek(0);
    EXPECT_EQ(decodeJson(buf), j);
}

TEST(spooled_buffer, from_json_invalid)
{
    const auto j = nlohmann::json{{"bad", std::string("\xc3\x28")}};

    EXPECT_THROW(SpooledBuffer::fromJson(j), EncodingError);
}

TEST(spooled_buffer, from_path)
{
    auto f = ScopedTempFile("meshwire_gtest_", ".tmp");
    ASSERT_EQ(writeChunk(f.fd(), "payload", 7), 7u);

    auto buf = SpooledBuffer::fromPath(f.path());

    EXPECT_EQ(buf.size(), 7u);
    EXPECT_EQ(buf.name(), f.path());
    EXPECT_EQ(buf.read(100), bytes("payload"));

    // opened read-only.
    EXPECT_THROW(buf.write(bytes("x")), StorageError);
    EXPECT_EQ(buf.size(), 7u);
}

TEST(spooled_buffer, from_path_missing)
{
    EXPECT_THROW(SpooledBuffer::fromPath("/nonexistent/meshwire/payload"), StorageError);
}

TEST(spooled_buffer, from_buffer)
{
    auto buf = SpooledBuffer::fromBuffer(bytes("memory"));

    EXPECT_EQ(buf.size(), 6u);
    EXPECT_TRUE(buf.name().empty());

    EXPECT_EQ(buf.read(3), bytes("mem"));

    buf.seek(6);
    buf.write(bytes("!"));
    EXPECT_EQ(buf.size(), 7u);
    EXPECT_EQ(buf.readAll(), bytes("memory!"));
}

TEST(spooled_buffer, chunk_size)
{
    constexpr auto minChunk = SpooledBuffer::DefaultMinChunk;

    const auto chunkFor = [](size_t length) {
            return SpooledBuffer::fromBuffer(std::vector<uint8_t>(length)).chunkSize();
        };

    const auto clamped = [](size_t length) {
            return std::clamp(length / 1024, SpooledBuffer::DefaultMinChunk, SpooledBuffer::DefaultMaxChunk);
        };

    EXPECT_EQ(chunkFor(0), minChunk);
    EXPECT_EQ(chunkFor(minChunk * 1024 - 1), minChunk);
    EXPECT_EQ(chunkFor(minChunk * 1024 + 5000), clamped(minChunk * 1024 + 5000));
    EXPECT_EQ(chunkFor(2'000'000 * 4), clamped(2'000'000 * 4));
    EXPECT_EQ(chunkFor(2'000'000), clamped(2'000'000));
    EXPECT_EQ(chunkFor(2'000'000), minChunk);
}

TEST(spooled_buffer, chunk_size_max)
{
    // avoid allocating a gigabyte: the chunk size only looks at the length.
    auto buf = SpooledBuffer{nullptr, SpooledBuffer::DefaultMaxChunk * 1024};
    EXPECT_EQ(buf.chunkSize(), SpooledBuffer::DefaultMaxChunk);

    auto bigger = SpooledBuffer{nullptr, SpooledBuffer::DefaultMaxChunk * 4096};
    EXPECT_EQ(bigger.chunkSize(), SpooledBuffer::DefaultMaxChunk);
}

TEST(spooled_buffer, default_options)
{
    const auto opts = SpooledBuffer::Options{ };

    EXPECT_TRUE(opts.dir.empty());
    EXPECT_FALSE(opts.persistent);
    EXPECT_EQ(opts.minChunk, SpooledBuffer::DefaultMinChunk);
    EXPECT_EQ(opts.maxChunk, SpooledBuffer::DefaultMaxChunk);

    // every factory defaults its options.
    auto buf = SpooledBuffer::fromTemp();
    EXPECT_EQ(buf.options().minChunk, SpooledBuffer::DefaultMinChunk);
    EXPECT_EQ(buf.options().maxChunk, SpooledBuffer::DefaultMaxChunk);
    EXPECT_FALSE(buf.options().persistent);
    EXPECT_EQ(buf.chunkSize(), SpooledBuffer::DefaultMinChunk);

    EXPECT_EQ(SpooledBuffer::fromBuffer({ }).chunkSize(), SpooledBuffer::DefaultMinChunk);
}

TEST(spooled_buffer, chunk_size_options)
{
    auto opts = SpooledBuffer::Options{ };
    opts.minChunk = 16;
    opts.maxChunk = 64;

    EXPECT_EQ(SpooledBuffer::fromBuffer(std::vector<uint8_t>(100), opts).chunkSize(), 16u);
    EXPECT_EQ(SpooledBuffer::fromBuffer(std::vector<uint8_t>(40 * 1024), opts).chunkSize(), 40u);
    EXPECT_EQ(SpooledBuffer::fromBuffer(std::vector<uint8_t>(100 * 1024), opts).chunkSize(), 64u);
}

TEST(spooled_buffer, move)
{
    auto a = SpooledBuffer::fromData(std::string_view{"moved"});
    const auto path = a.name();

    auto b = std::move(a);
    EXPECT_EQ(b.name(), path);
    EXPECT_EQ(b.readAll(), bytes("moved"));
    EXPECT_TRUE(fs::exists(path));
}
