/**
 * @file UtilJson.cc
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

#include <meshwire/util/Error.hh>
#include <meshwire/util/SpooledBuffer.hh>
#include <meshwire/util/UtilJson.hh>

namespace meshwire::util {

std::vector<uint8_t> encodeJson(const nlohmann::json &value)
{
    auto text = std::string{ };

    try {
        text = value.dump();
    } catch (const nlohmann::json::exception &ex) {
        throw EncodingError(fmt::format("failed to encode value as json: {}", ex.what()));
    }

    return {text.begin(), text.end()};
}

nlohmann::json decodeJson(std::span<const uint8_t> data)
{
    try {
        return nlohmann::json::parse(data.begin(), data.end());
    } catch (const nlohmann::json::exception &ex) {
        throw EncodingError(fmt::format("failed to decode {} bytes of json: {}"
            , data.size()
            , ex.what()));
    }
}

nlohmann::json decodeJson(SpooledBuffer &buf)
{
    auto data = std::vector<uint8_t>{ };

    while (true)
    {
        auto chunk = buf.read(buf.chunkSize());

        if (chunk.empty())
            break;

        data.insert(data.end(), chunk.begin(), chunk.end());
    }

    return decodeJson(data);
}

}
