/**
 * @file meshwire.cc
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

#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

#include <libgen.h>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "Cmd.hh"

namespace {

int dispatchSubcommand(int argc, char **argv)
{
    using Cmd = std::function<int(int, char **)>;
    using namespace meshwire;

    const auto subProgs = std::map<std::string, Cmd>{
        {"decode", cmd::decode},
        {"encode", cmd::encode},
    };

    const auto usage = [argv, &subProgs] {
            std::cout << fmt::format("usage: {} <subcmd> [options...]\n"
                , ::basename(argv[0]));
            std::cout << "  subcmds:\n";
            for (const auto &[name, _] : subProgs)
                std::cout << "    " << name << "\n";
        };

    if (argc < 2)
    {
        usage();
        return 1;
    }

    auto subProg = std::string{argv[1]};

    auto cmd = subProgs.find(subProg);
    if (cmd == end(subProgs))
    {
        usage();
        return 1;
    }

    return cmd->second(argc, argv);
}

}

int main(int argc, char **argv)
{
    // stdout carries the encoded stream / decoded messages.
    spdlog::set_default_logger(spdlog::stderr_color_mt("meshwire"));
    spdlog::cfg::load_env_levels();

    try {
        return dispatchSubcommand(argc, argv);
    } catch (const std::exception &ex) {
        spdlog::error("exception: {}", ex.what());
        return 1;
    }
}
