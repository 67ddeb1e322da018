/**
 * @file encode.cc
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
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <fcntl.h>
#include <getopt.h>
#include <libgen.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <meshwire/util/Error.hh>
#include <meshwire/util/FramedMessage.hh>
#include <meshwire/util/ScopedFd.hh>
#include <meshwire/util/SpooledBuffer.hh>
#include <meshwire/util/Util.hh>

#include "Cmd.hh"

namespace meshwire::cmd {
namespace {

struct Options
{
    std::string header{"null"};
    std::string payloadPath;
    std::string outPath;
    std::optional<wire::MessageId> id;
};

Options parseOptions(int argc, char **argv)
{
    static constexpr const char *shortOpts = "hH:i:o:p:";
    static constexpr struct option longOpts[] = {
        {"header", required_argument, nullptr, 'H'},
        {"help", no_argument, nullptr, 'h'},
        {"id", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"payload", required_argument, nullptr, 'p'},
        {nullptr, 0, nullptr, 0}
    };

    auto subArgc = argc - 1;
    auto subArgv = argv + 1;

    const auto usage = [argv] {
            std::cout << fmt::format(
                "usage: {} encode OPTIONS\n"
                "  OPTIONS:\n"
                "   -h | --help\n"
                "       show this help\n"
                "   -H | --header <json>\n"
                "       message header, as JSON text (default: null).\n"
                "   -i | --id <uuid>\n"
                "       message id, 32 hex digits (default: random).\n"
                "   -o | --output <path>\n"
                "       write the framed stream to a file instead of stdout.\n"
                "   -p | --payload <path>\n"
                "       send the file as the message payload.\n"
                "       without a payload the message is sent as a command.\n"
                , ::basename(argv[0]));
        };

    auto opts = Options{ };

    for (int c = 0; (c = getopt_long(subArgc, subArgv, shortOpts, longOpts, 0)) >= 0; )
    {
        switch (c)
        {
            case 'h':
                usage();
                std::exit(0);
            case 'H':
                opts.header = optarg;
                break;
            case 'i':
                opts.id = wire::parseId(optarg);
                if (!opts.id)
                {
                    spdlog::error("invalid message id '{}'", optarg);
                    std::exit(1);
                }
                break;
            case 'o':
                opts.outPath = optarg;
                break;
            case 'p':
                opts.payloadPath = optarg;
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

}

int encode(int argc, char **argv)
{
    const auto opts = parseOptions(argc, argv);

    auto header = nlohmann::json::parse(opts.header, nullptr, false);

    if (header.is_discarded())
    {
        spdlog::error("header is not valid json: {}", opts.header);
        return 1;
    }

    auto payload = util::FramedMessage::PayloadPtr{ };

    if (!opts.payloadPath.empty())
        payload = std::make_shared<util::SpooledBuffer>(util::SpooledBuffer::fromPath(opts.payloadPath));

    auto out = util::ScopedFd{ };

    if (!opts.outPath.empty())
        out = util::ScopedFd::open(opts.outPath, O_WRONLY | O_CREAT | O_TRUNC);

    const auto fd = out ? out.get() : STDOUT_FILENO;

    const auto msg = util::FramedMessage{std::move(header), std::move(payload), opts.id};

    auto total = size_t{ };

    msg.produce([fd, &total](std::span<const uint8_t> chunk) {
            const auto len = util::writeChunk(fd, chunk.data(), chunk.size());

            if (len != chunk.size())
                throw StorageError(EPIPE, fmt::format("short write: {}/{}", len, chunk.size()));

            total += len;
        });

    spdlog::info("encoded {} message {}: {} bytes"
        , msg.dualPart() ? "dual-part" : "command"
        , wire::formatId(msg.id())
        , total);

    return 0;
}

}
