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

#ifndef LARKRPC_DISCOVERY_HPP_
#define LARKRPC_DISCOVERY_HPP_

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>

#include "larkrpc/registry.hpp"
#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/http.hpp"
#include "larkrpc/detail/log.hpp"
#include "larkrpc/detail/noncopyable.hpp"

namespace lark {
namespace rpc {

enum class select_mode { random, round_robin };

class discovery : safe_noncopyable {
public:
    virtual ~discovery() = default;

    // pulls the server list from wherever it lives
    virtual boost::system::error_code refresh() = 0;
    virtual boost::system::error_code update(std::vector<std::string> servers) = 0;
    virtual std::string get(select_mode mode, boost::system::error_code& ec) = 0;
    virtual std::vector<std::string> get_all(boost::system::error_code& ec) = 0;

    std::string get(select_mode mode) {
        boost::system::error_code code;
        auto server = get(mode, code);
        if (code) {
            throw boost::system::system_error{code, "rpc discovery"};
        }
        return server;
    }

    std::vector<std::string> get_all() {
        boost::system::error_code code;
        auto servers = get_all(code);
        if (code) {
            throw boost::system::system_error{code, "rpc discovery"};
        }
        return servers;
    }
};

// a fixed list of servers, replaced only through update()
class multi_servers_discovery : public discovery {
public:
    explicit multi_servers_discovery(std::vector<std::string> servers = {})
        : servers_{std::move(servers)},
          generator_{static_cast<std::mt19937::result_type>(
              std::chrono::system_clock::now().time_since_epoch().count())} {
        index_ = std::uniform_int_distribution<std::size_t>{0, std::numeric_limits<std::int32_t>::max() - 1}(
            generator_);
    }

    using discovery::get;
    using discovery::get_all;

    boost::system::error_code refresh() override {
        return {};
    }

    boost::system::error_code update(std::vector<std::string> servers) override {
        std::unique_lock<std::shared_mutex> lock{servers_mutex_};
        servers_ = std::move(servers);
        return {};
    }

    std::string get(select_mode mode, boost::system::error_code& ec) override {
        std::unique_lock<std::shared_mutex> lock{servers_mutex_};
        const auto n = servers_.size();
        if (n == 0) {
            ec = errc::no_available_servers;
            return {};
        }

        ec = {};
        switch (mode) {
        case select_mode::random:
            return servers_[std::uniform_int_distribution<std::size_t>{0, n - 1}(generator_)];
        case select_mode::round_robin: {
            // the list may have shrunk since the last call
            const auto& server = servers_[index_ % n];
            index_ = (index_ + 1) % n;
            return server;
        }
        default:
            ec = errc::unsupported_select_mode;
            return {};
        }
    }

    std::vector<std::string> get_all(boost::system::error_code& ec) override {
        std::shared_lock<std::shared_mutex> lock{servers_mutex_};
        ec = {};
        return servers_;
    }

protected:
    std::vector<std::string> servers_;
    std::mt19937 generator_;
    std::size_t index_{0};
    std::shared_mutex servers_mutex_;
};

// refreshes the list from a registry once it is older than timeout
class registry_discovery final : public multi_servers_discovery {
public:
    explicit registry_discovery(std::string registry_url,
                                std::chrono::milliseconds timeout = std::chrono::seconds{10})
        : registry_url_{std::move(registry_url)}, timeout_{timeout} {
    }

    using discovery::get;
    using discovery::get_all;

    boost::system::error_code refresh() override {
        std::unique_lock<std::shared_mutex> lock{servers_mutex_};
        if (refreshed_ && last_update_ + timeout_ > std::chrono::steady_clock::now()) {
            return {};
        }

        detail::logger()->info("rpc registry: refresh servers from registry {}", registry_url_);
        boost::system::error_code code;
        const auto response = detail::http_request(detail::http::verb::get, registry_url_, {}, code);
        if (!code && response.result() != detail::http::status::ok) {
            code = errc::registry_error;
        }
        if (code) {
            detail::logger()->error("rpc registry: refresh error: {}", code.message());
            return code;
        }

        std::vector<std::string> servers;
        const auto field = detail::to_string(response[servers_field]);
        boost::algorithm::split(servers, field, boost::algorithm::is_any_of(","));
        for (auto& server : servers) {
            boost::algorithm::trim(server);
        }
        servers.erase(std::remove(servers.begin(), servers.end(), std::string{}), servers.end());

        servers_ = std::move(servers);
        last_update_ = std::chrono::steady_clock::now();
        refreshed_ = true;
        return {};
    }

    boost::system::error_code update(std::vector<std::string> servers) override {
        std::unique_lock<std::shared_mutex> lock{servers_mutex_};
        servers_ = std::move(servers);
        last_update_ = std::chrono::steady_clock::now();
        refreshed_ = true;
        return {};
    }

    std::string get(select_mode mode, boost::system::error_code& ec) override {
        ec = refresh();
        if (ec) {
            return {};
        }
        return multi_servers_discovery::get(mode, ec);
    }

    std::vector<std::string> get_all(boost::system::error_code& ec) override {
        ec = refresh();
        if (ec) {
            return {};
        }
        return multi_servers_discovery::get_all(ec);
    }

private:
    std::string registry_url_;
    std::chrono::milliseconds timeout_;
    std::chrono::steady_clock::time_point last_update_;
    bool refreshed_{false};
};

} // namespace rpc
} // namespace lark

#endif // LARKRPC_DISCOVERY_HPP_
