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

#ifndef LARKRPC_DISPATCHER_HPP_
#define LARKRPC_DISPATCHER_HPP_

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/noncopyable.hpp"
#include "larkrpc/service.hpp"

namespace lark {
namespace rpc {
namespace detail {

// service name -> service, written at registration, read on every request
class dispatcher final : safe_noncopyable {
public:
    struct target final {
        std::shared_ptr<const service> svc;
        const method_type* method{nullptr};
    };

    dispatcher() noexcept = default;

    boost::system::error_code add(std::shared_ptr<const service> svc) {
        std::unique_lock<std::shared_mutex> lock{services_mutex_};
        if (!services_.emplace(svc->name(), svc).second) {
            return errc::duplicate_service;
        }
        return {};
    }

    // ec is set and message describes the failure for the response header
    target find(const std::string& service_method, boost::system::error_code& ec, std::string& message) const {
        std::string service_name;
        std::string method_name;
        if (!utils::split_service_method(service_method, service_name, method_name)) {
            ec = errc::ill_formed_method;
            message = "rpc server: service/method request ill-formed: " + service_method;
            return {};
        }

        target t;
        SCOPE_BLOCK {
            std::shared_lock<std::shared_mutex> lock{services_mutex_};
            const auto it = services_.find(service_name);
            if (it == services_.end()) {
                ec = errc::service_not_found;
                message = "rpc server: can't find service " + service_name;
                return {};
            }
            t.svc = it->second;
        }

        t.method = t.svc->find_method(method_name);
        if (t.method == nullptr) {
            ec = errc::method_not_found;
            message = "rpc server: can't find method " + method_name;
            return {};
        }
        ec = {};
        return t;
    }

private:
    std::unordered_map<std::string, std::shared_ptr<const service>> services_;
    mutable std::shared_mutex services_mutex_;
};

} // namespace detail
} // namespace rpc
} // namespace lark

#endif // LARKRPC_DISPATCHER_HPP_
