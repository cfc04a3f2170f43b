/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements. See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership. The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License. You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied. See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#ifndef LARKRPC_ENGINES_HPP_
#define LARKRPC_ENGINES_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/noncopyable.hpp"

namespace lark {
namespace rpc {
namespace detail {

// io_service pool, one thread per io_service, handed out round robin
class engines final : safe_noncopyable {
public:
    explicit engines(std::size_t count = std::thread::hardware_concurrency()) {
        if (count == 0) {
            count = 1;
        }
        for (std::size_t i{0}; i < count; ++i) {
            auto engine = std::make_unique<boost::asio::io_service>();
            works_.emplace_back(std::make_unique<boost::asio::io_service::work>(*engine));
            engines_.emplace_back(std::move(engine));
        }
    }

    ~engines() {
        stop();
    }

    boost::asio::io_service& get() noexcept {
        return *engines_[index_++ % engines_.size()];
    }

    std::size_t size() const noexcept {
        return engines_.size();
    }

    // runs every engine on its own thread and returns
    void start() {
        std::unique_lock<std::mutex> lock{threads_mutex_};
        if (!threads_.empty()) {
            return;
        }
        for (auto& engine : engines_) {
            threads_.emplace_back([&engine]() { engine->run(); });
        }
    }

    // blocks until stop()
    void run() {
        start();
        join();
    }

    void stop() {
        works_.clear();
        for (auto& engine : engines_) {
            engine->stop();
        }
        join();
    }

private:
    void join() {
        std::vector<std::thread> threads;
        SCOPE_BLOCK {
            std::unique_lock<std::mutex> lock{threads_mutex_};
            threads.swap(threads_);
        }
        for (auto& thread : threads) {
            if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
                thread.join();
            } else if (thread.joinable()) {
                thread.detach();
            }
        }
    }

    std::vector<std::unique_ptr<boost::asio::io_service>> engines_;
    std::vector<std::unique_ptr<boost::asio::io_service::work>> works_;
    std::vector<std::thread> threads_;
    std::mutex threads_mutex_;
    std::atomic<std::size_t> index_{0};
};

} // namespace detail
} // namespace rpc
} // namespace lark

#endif // LARKRPC_ENGINES_HPP_
