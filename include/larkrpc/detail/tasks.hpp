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

#ifndef LARKRPC_TASKS_HPP_
#define LARKRPC_TASKS_HPP_

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/noncopyable.hpp"

namespace lark {
namespace rpc {
namespace detail {

// One thread per task, nothing caps how many run at once. wait() blocks
// until every spawned task has returned and released what it captured.
class tasks final : safe_noncopyable {
public:
    tasks() = default;

    ~tasks() {
        wait();
    }

    void spawn(std::function<void()> task) {
        SCOPE_BLOCK {
            std::unique_lock<std::mutex> lock{mutex_};
            ++running_;
        }
        try {
            std::thread{[this, task = std::move(task)]() mutable {
                SCOPE_BLOCK {
                    auto t = std::move(task);
                    t();
                }
                finish();
            }}.detach();
        } catch (...) {
            finish();
            throw;
        }
    }

    void wait() {
        std::unique_lock<std::mutex> lock{mutex_};
        idle_.wait(lock, [this]() { return running_ == 0; });
    }

private:
    void finish() {
        std::unique_lock<std::mutex> lock{mutex_};
        if (--running_ == 0) {
            idle_.notify_all();
        }
    }

    std::mutex mutex_;
    std::condition_variable idle_;
    std::size_t running_{0};
};

} // namespace detail
} // namespace rpc
} // namespace lark

#endif // LARKRPC_TASKS_HPP_
