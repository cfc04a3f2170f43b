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

#ifndef LARKRPC_LOG_HPP_
#define LARKRPC_LOG_HPP_

#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lark {
namespace rpc {
namespace detail {

constexpr const char* logger_name{"larkrpc"};

inline std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = []() {
        if (auto existing = spdlog::get(logger_name)) {
            return existing;
        }
        return spdlog::stderr_color_mt(logger_name);
    }();
    return instance;
}

} // namespace detail

inline void set_log_level(spdlog::level::level_enum level) {
    detail::logger()->set_level(level);
}

} // namespace rpc
} // namespace lark

#endif // LARKRPC_LOG_HPP_
