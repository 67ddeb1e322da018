/**
 * @file MessageStore.hh
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

#ifndef __MESHWIRE_UTIL_MESSAGE_STORE_HH__
#define __MESHWIRE_UTIL_MESSAGE_STORE_HH__

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "FramedMessage.hh"

namespace meshwire::util {

/**
 * Per-destination store-and-forward queue for messages whose peer is
 * unreachable. Persistence, eviction and retry are up to the implementation.
 */
class MessageStore
{
public:
    explicit MessageStore(std::string nodeId, nlohmann::json config = { }):
        nodeId_(std::move(nodeId)),
        config_(std::move(config))
    {
    }

    virtual ~MessageStore() = default;

    const std::string &nodeId() const noexcept { return nodeId_; }
    const nlohmann::json &config() const noexcept { return config_; }

    virtual void push(FramedMessage msg) = 0;

    /**
     * @return the oldest stored message, or nothing if the store is empty.
     */
    virtual std::optional<FramedMessage> pop() = 0;

    virtual void flush() = 0;

private:
    std::string nodeId_;
    nlohmann::json config_;
};

class MessageStoreManager
{
public:
    virtual ~MessageStoreManager() = default;

    virtual std::shared_ptr<MessageStore> storeForNode(const std::string &nodeId, const nlohmann::json &config) = 0;
};

}

#endif
