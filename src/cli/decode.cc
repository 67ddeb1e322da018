/**
 * @file decode.cc
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
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <getopt.h>
#include <libgen.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <meshwire/util/Error.hh>
#include <meshwire/util/FramedBuffer.hh>
#include <meshwire/util/ScopedFd.hh>
#include <meshwire/util/Util.hh>

#include "Cmd.hh"

namespace meshwire::cmd {
namespace {

struct Options
{
    std::string inPath;
    std::string payloadDir;
    size_t chunkSize{size_t{1} << 16};
    util::SpooledBuffer::Options spool;
};

Options parseOptions(int argc, char **argv)
{
    static constexpr const char *shortOpts = "c:d:hi:s:";
    static constexpr struct option longOpts[] = {
        {"chunk", required_argument, nullptr, 'c'},
        {"payload-dir", required_argument, nullptr, 'd'},
        {"help", no_argument, nullptr, 'h'},
        {"input", required_argument, nullptr, 'i'},
        {"spool-dir", required_argument, nullptr, 's'},
        {nullptr, 0, nullptr, 0}
    };

    auto subArgc = argc - 1;
    auto subArgv = argv + 1;

    const auto usage = [argv] {
            std::cout << fmt::format(
                "usage: {} decode OPTIONS\n"
                "  OPTIONS:\n"
                "   -c | --chunk <bytes>\n"
                "       read size used to feed the reassembler (default: 65536).\n"
                "   -d | --payload-dir <path>\n"
                "       keep each payload as <path>/<message id>.payload.\n"
                "   -h | --help\n"
                "       show this help\n"
                "   -i | --input <path>\n"
                "       read the framed stream from a file instead of stdin.\n"
                "   -s | --spool-dir <path>\n"
                "       directory for in-flight message bodies (default: system temp dir).\n"
                , ::basename(argv[0]));
        };

    auto opts = Options{ };

    for (int c = 0; (c = getopt_long(subArgc, subArgv, shortOpts, longOpts, 0)) >= 0; )
    {
        switch (c)
        {
            case 'c':
                opts.chunkSize = std::strtoul(optarg, nullptr, 0);
                if (!opts.chunkSize)
                {
                    spdlog::error("invalid chunk size '{}'", optarg);
                    std::exit(1);
                }
                break;
            case 'd':
                opts.payloadDir = optarg;
                break;
            case 'h':
                usage();
                std::exit(0);
            case 'i':
                opts.inPath = optarg;
                break;
            case 's':
                opts.spool.dir = optarg;
                break;
            case '?':
                usage();
                std::exit(1);
            default:
                break;
        }
    }

    if (optind < subArgc)
    {
        spdlog::error("trailing args..");
        std::exit(1);
    }

    return opts;
}

void savePayload(util::SpooledBuffer &payload, const std::string &path)
{
    auto fd = util::ScopedFd::open(path, O_WRONLY | O_CREAT | O_TRUNC);

    payload.seek(0);

    while (true)
    {
        const auto chunk = payload.read(payload.chunkSize());

        if (chunk.empty())
            break;

        if (util::writeChunk(fd.get(), chunk.data(), chunk.size()) != chunk.size())
            throw StorageError(ENOSPC, fmt::format("short write to '{}'", path));
    }

    payload.seek(0);
}

void report(const util::FramedMessage &msg, const Options &opts)
{
    namespace fs = std::filesystem;

    auto j = nlohmann::json{
        {"id", wire::formatId(msg.id())},
        {"header", msg.header()}
    };

    if (const auto &payload = msg.payload())
    {
        j["payload_size"] = payload->size();

        if (!opts.payloadDir.empty())
        {
            const auto path = (fs::path(opts.payloadDir) / (wire::formatId(msg.id()) + ".payload")).native();

            savePayload(*payload, path);

            j["payload_path"] = path;
        }
    }

    std::cout << j.dump() << "\n";
}

}

int decode(int argc, char **argv)
{
    const auto opts = parseOptions(argc, argv);

    auto in = util::ScopedFd{ };

    if (!opts.inPath.empty())
        in = util::ScopedFd::open(opts.inPath, O_RDONLY);

    const auto fd = in ? in.get() : STDIN_FILENO;

    auto framed = util::FramedBuffer{opts.spool};
    auto buf = std::vector<uint8_t>(opts.chunkSize);
    auto count = size_t{ };
    auto errors = size_t{ };

    const auto drain = [&] {
            while (auto msg = framed.tryGet())
            {
                report(*msg, opts);
                ++count;
            }
        };

    while (true)
    {
        const auto len = util::readChunk(fd, buf.data(), buf.size());

        if (!len)
            break;

        try {
            framed.put(buf.data(), len);
        } catch (const EncodingError &ex) {
            spdlog::error("dropped message: {}", ex.what());
            ++errors;
        } catch (const ProtocolError &) {
            // messages completed ahead of the corruption are still valid.
            drain();
            spdlog::info("decoded {} messages before the stream failed", count);
            throw;
        }

        drain();
    }

    if (framed.remaining())
        spdlog::warn("stream ended with {} body bytes outstanding", framed.remaining());

    spdlog::info("decoded {} messages ({} dropped)", count, errors);

    return errors ? 1 : 0;
}

}
