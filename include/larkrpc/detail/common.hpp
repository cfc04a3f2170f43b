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

#ifndef LARKRPC_COMMON_HPP_
#define LARKRPC_COMMON_HPP_

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include "larkrpc/detail/noncopyable.hpp"

namespace lark {
namespace rpc {

#define SCOPE_BLOCK

enum class errc {
    success = 0,
    unsupported_codec,
    invalid_magic,
    ill_formed_method,
    service_not_found,
    method_not_found,
    malformed_message,
    invalid_body,
    handle_timeout,
    duplicate_service,
    no_available_servers,
    unsupported_select_mode,
    unsupported_protocol,
    invalid_address,
    connect_timeout,
    shutdown,
    registry_error,
};

namespace detail {

inline const char* code_to_msg(errc code) noexcept {
    switch (code) {
    case errc::success:
        return "success";
    case errc::unsupported_codec:
        return "unsupported codec type";
    case errc::invalid_magic:
        return "invalid magic number";
    case errc::ill_formed_method:
        return "service/method request ill-formed";
    case errc::service_not_found:
        return "can't find service";
    case errc::method_not_found:
        return "can't find method";
    case errc::malformed_message:
        return "malformed message";
    case errc::invalid_body:
        return "body does not match the expected type";
    case errc::handle_timeout:
        return "request handle timeout";
    case errc::duplicate_service:
        return "service already defined";
    case errc::no_available_servers:
        return "no available servers";
    case errc::unsupported_select_mode:
        return "not supported select mode";
    case errc::unsupported_protocol:
        return "unsupported protocol";
    case errc::invalid_address:
        return "invalid address";
    case errc::connect_timeout:
        return "connect timeout";
    case errc::shutdown:
        return "connection is shut down";
    case errc::registry_error:
        return "registry request failed";
    default:
        return "unknown error";
    }
}

class rpc_category final : public boost::system::error_category {
public:
    const char* name() const noexcept override {
        return "larkrpc";
    }

    std::string message(int value) const override {
        return code_to_msg(static_cast<errc>(value));
    }
};

} // namespace detail

inline const boost::system::error_category& rpc_category() noexcept {
    static const detail::rpc_category category;
    return category;
}

inline boost::system::error_code make_error_code(errc code) noexcept {
    return {static_cast<int>(code), rpc_category()};
}

// raised on the client when a remote call fails or times out
class invoke_exception final : public std::runtime_error {
public:
    explicit invoke_exception(const std::string& msg) : std::runtime_error{msg} {
    }
};

// the error-signaling return type of every served method
class error final {
public:
    error() noexcept = default;

    explicit error(std::string message) noexcept : message_{std::move(message)}, failed_{true} {
    }

    explicit operator bool() const noexcept {
        return failed_;
    }

    const std::string& message() const noexcept {
        return message_;
    }

private:
    std::string message_;
    bool failed_{false};
};

namespace detail {

// types
using tcp_socket = boost::asio::ip::tcp::socket;

// meta utilities
template <typename...>
using void_t = void;

template <typename _Ty>
struct function_args;

template <typename _Ret, typename... _Args>
struct function_args<_Ret(_Args...)> {
    using return_type = _Ret;
    static constexpr std::size_t arity{sizeof...(_Args)};

    template <std::size_t _Index>
    struct arg {
        using type = typename std::tuple_element<_Index, std::tuple<_Args...>>::type;
    };

    template <std::size_t _Index>
    using arg_t = typename arg<_Index>::type;
};

template <typename _Ret, typename _Ty, typename... _Args>
struct function_args<_Ret (_Ty::*)(_Args...)> : function_args<_Ret(_Args...)> {
    using receiver_type = _Ty;
};

template <typename _Ret, typename _Ty, typename... _Args>
struct function_args<_Ret (_Ty::*)(_Args...) const> : function_args<_Ret(_Args...)> {
    using receiver_type = _Ty;
};

template <typename _Ret, typename _Ty, typename... _Args>
struct function_args<_Ret (_Ty::*)(_Args...) noexcept> : function_args<_Ret(_Args...)> {
    using receiver_type = _Ty;
};

template <typename _Ret, typename _Ty, typename... _Args>
struct function_args<_Ret (_Ty::*)(_Args...) const noexcept> : function_args<_Ret(_Args...)> {
    using receiver_type = _Ty;
};

// error (T::*)(Arg, Reply*) where Arg is taken by value or const reference
template <typename _Func, typename = void>
struct is_rpc_method : std::false_type {};

template <typename _Func>
struct is_rpc_method<
    _Func, void_t<std::enable_if_t<std::is_member_function_pointer<_Func>{} && function_args<_Func>::arity == 2>>> {
private:
    using traits = function_args<_Func>;
    using raw_arg = typename traits::template arg_t<0>;
    using raw_reply = typename traits::template arg_t<1>;
    using arg_type = std::decay_t<raw_arg>;

public:
    static constexpr bool value{std::is_same<typename traits::return_type, error>{} &&
                                (std::is_same<raw_arg, arg_type>{} || std::is_same<raw_arg, const arg_type&>{}) &&
                                std::is_default_constructible<arg_type>{} && std::is_pointer<raw_reply>{} &&
                                !std::is_const<std::remove_pointer_t<raw_reply>>{} &&
                                std::is_default_constructible<std::remove_pointer_t<raw_reply>>{}};
};

template <typename _Func>
struct rpc_method_types {
    using receiver_type = typename function_args<_Func>::receiver_type;
    using arg_type = std::decay_t<typename function_args<_Func>::template arg_t<0>>;
    using reply_type = std::remove_pointer_t<typename function_args<_Func>::template arg_t<1>>;
};

// utilities functions
struct utils final : safe_noncopyable {
    // "Service.Method" splits on the last dot
    static bool split_service_method(std::string_view service_method, std::string& service_name,
                                     std::string& method_name) {
        const auto dot = service_method.rfind('.');
        if (dot == std::string_view::npos) {
            return false;
        }
        service_name = std::string{service_method.substr(0, dot)};
        method_name = std::string{service_method.substr(dot + 1)};
        return true;
    }

    // "250ms", "1.5s", "1m0s", "2h0m30s"
    static std::string format_duration(std::chrono::milliseconds duration) {
        auto count = duration.count();
        std::string sign;
        if (count < 0) {
            sign = "-";
            count = -count;
        }
        if (count == 0) {
            return "0s";
        }
        if (count < 1000) {
            return sign + std::to_string(count) + "ms";
        }

        const auto millis = count % 1000;
        const auto seconds = count / 1000;
        const auto hours = seconds / 3600;
        const auto minutes = seconds / 60 % 60;

        std::string out{sign};
        if (hours > 0) {
            out += std::to_string(hours) + "h";
        }
        if (hours > 0 || minutes > 0) {
            out += std::to_string(minutes) + "m";
        }
        out += std::to_string(seconds % 60);
        if (millis > 0) {
            auto fraction = std::to_string(1000 + millis).substr(1);
            fraction.erase(fraction.find_last_not_of('0') + 1);
            out += "." + fraction;
        }
        return out + "s";
    }

    // "protocol@host:port", the protocol defaults to tcp
    static bool split_address(std::string_view address, std::string& protocol, std::string& host,
                              std::string& port) {
        protocol = "tcp";
        const auto at = address.find('@');
        if (at != std::string_view::npos) {
            protocol = std::string{address.substr(0, at)};
            address.remove_prefix(at + 1);
        }
        const auto colon = address.rfind(':');
        if (colon == std::string_view::npos || colon == 0 || colon + 1 == address.size()) {
            return false;
        }
        host = std::string{address.substr(0, colon)};
        port = std::string{address.substr(colon + 1)};
        return true;
    }
};

} // namespace detail
} // namespace rpc
} // namespace lark

namespace boost {
namespace system {

template <>
struct is_error_code_enum<lark::rpc::errc> : std::true_type {};

} // namespace system
} // namespace boost

#endif // LARKRPC_COMMON_HPP_
