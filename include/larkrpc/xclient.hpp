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

#ifndef LARKRPC_XCLIENT_HPP_
#define LARKRPC_XCLIENT_HPP_

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "larkrpc/client.hpp"
#include "larkrpc/discovery.hpp"
#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/noncopyable.hpp"
#include "larkrpc/detail/protocol.hpp"

namespace lark {
namespace rpc {

// client over a discovery: one connection per server address, reused across calls
class xclient final : safe_noncopyable {
public:
    xclient(std::shared_ptr<discovery> d, select_mode mode, option opt = default_option())
        : discovery_{std::move(d)}, mode_{mode}, option_{std::move(opt)} {
    }

    ~xclient() {
        close();
    }

    void close() {
        std::unique_lock<std::mutex> lock{clients_mutex_};
        for (auto& c : clients_) {
            c.second->close();
        }
        clients_.clear();
    }

    // failures to select or dial a server surface as invoke_exception too
    template <typename _Reply, typename _Arg>
    void call(const std::string& service_method, const _Arg& args, _Reply& reply,
              std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) {
        boost::system::error_code code;
        const auto address = discovery_->get(mode_, code);
        if (code) {
            throw invoke_exception{"rpc discovery: " + code.message()};
        }
        dial(address)->call(service_method, args, reply, timeout);
    }

    // Calls every known server concurrently. The first failure is thrown as soon as it
    // arrives; otherwise reply (if given) holds the first success.
    template <typename _Reply, typename _Arg>
    void broadcast(const std::string& service_method, const _Arg& args, _Reply* reply,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) {
        boost::system::error_code code;
        const auto servers = discovery_->get_all(code);
        if (code) {
            throw invoke_exception{"rpc discovery: " + code.message()};
        }

        struct state final {
            std::mutex mutex;
            std::condition_variable done;
            std::size_t remaining{0};
            std::string error;
            bool replied{false};
            _Reply reply{};
        };
        auto s = std::make_shared<state>();
        s->remaining = servers.size();

        const auto complete = [s](const std::string& error, _Reply&& r) {
            std::unique_lock<std::mutex> lock{s->mutex};
            if (!error.empty()) {
                if (s->error.empty()) {
                    s->error = error;
                }
            } else if (!s->replied) {
                s->reply = std::move(r);
                s->replied = true;
            }
            if (--s->remaining == 0 || !s->error.empty()) {
                s->done.notify_all();
            }
        };

        for (const auto& address : servers) {
            std::shared_ptr<client> c;
            try {
                c = dial(address);
            } catch (const invoke_exception& e) {
                complete(e.what(), _Reply{});
                continue;
            }
            c->async_call<_Reply>(service_method, args, complete);
        }

        std::unique_lock<std::mutex> lock{s->mutex};
        const auto finished = [&s]() { return s->remaining == 0 || !s->error.empty(); };
        if (timeout.count() > 0) {
            if (!s->done.wait_for(lock, timeout, finished)) {
                throw invoke_exception{"rpc client: call failed: deadline exceeded after " +
                                       detail::utils::format_duration(timeout)};
            }
        } else {
            s->done.wait(lock, finished);
        }

        if (!s->error.empty()) {
            throw invoke_exception{s->error};
        }
        if (reply != nullptr && s->replied) {
            *reply = std::move(s->reply);
        }
    }

private:
    // throws invoke_exception when the address cannot be dialed
    std::shared_ptr<client> dial(const std::string& address) {
        std::unique_lock<std::mutex> lock{clients_mutex_};
        auto it = clients_.find(address);
        if (it != clients_.end()) {
            if (it->second->available()) {
                return it->second;
            }
            it->second->close();
            clients_.erase(it);
        }

        boost::system::error_code code;
        auto c = client::dial(address, code, option_);
        if (code || !c) {
            throw invoke_exception{"rpc client: dial " + address + ": " + code.message()};
        }
        clients_.emplace(address, c);
        return c;
    }

    std::shared_ptr<discovery> discovery_;
    select_mode mode_;
    option option_;
    std::map<std::string, std::shared_ptr<client>> clients_;
    std::mutex clients_mutex_;
};

} // namespace rpc
} // namespace lark

#endif // LARKRPC_XCLIENT_HPP_
