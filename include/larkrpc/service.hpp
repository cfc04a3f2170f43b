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

#ifndef LARKRPC_SERVICE_HPP_
#define LARKRPC_SERVICE_HPP_

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <vector>
#include <boost/core/demangle.hpp>

#include "larkrpc/codec.hpp"
#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/log.hpp"
#include "larkrpc/detail/noncopyable.hpp"

namespace lark {
namespace rpc {

class service;

template <typename _Ty>
class service_builder;

// one callable entry of a service
class method_type final : safe_noncopyable {
public:
    using invoker = std::function<error(value&, value&)>;
    using factory = std::function<std::unique_ptr<value>()>;

    method_type(std::string name, invoker invoke, factory new_arg, factory new_reply) noexcept
        : name_{std::move(name)},
          invoke_{std::move(invoke)},
          new_arg_{std::move(new_arg)},
          new_reply_{std::move(new_reply)} {
    }

    const std::string& name() const noexcept {
        return name_;
    }

    std::unique_ptr<value> new_arg() const {
        return new_arg_();
    }

    // value-initialized, containers start empty
    std::unique_ptr<value> new_reply() const {
        return new_reply_();
    }

    std::uint64_t num_calls() const noexcept {
        return num_calls_.load();
    }

private:
    friend class service;

    std::string name_;
    invoker invoke_;
    factory new_arg_;
    factory new_reply_;
    mutable std::atomic<std::uint64_t> num_calls_{0};
};

// A named catalog of methods bound to one receiver. Immutable once built,
// except for the per-method call counters.
class service final : safe_noncopyable {
public:
    service(service&&) = default;
    service& operator=(service&&) = default;

    // named after the receiver's type
    template <typename _Ty>
    static service_builder<_Ty> build(std::shared_ptr<_Ty> receiver);

    template <typename _Ty>
    static service_builder<_Ty> build(std::string name, std::shared_ptr<_Ty> receiver);

    const std::string& name() const noexcept {
        return name_;
    }

    const method_type* find_method(const std::string& name) const {
        const auto it = methods_.find(name);
        return it == methods_.end() ? nullptr : it->second.get();
    }

    std::vector<std::string> method_names() const {
        std::vector<std::string> names;
        for (const auto& method : methods_) {
            names.emplace_back(method.first);
        }
        return names;
    }

    error call(const method_type& method, value& arg, value& reply) const {
        ++method.num_calls_;
        try {
            return method.invoke_(arg, reply);
        } catch (const std::exception& e) {
            return error{e.what()};
        }
    }

private:
    template <typename>
    friend class service_builder;

    service() = default;

    std::string name_;
    std::map<std::string, std::unique_ptr<method_type>> methods_;
};

template <typename _Ty>
class service_builder final : safe_noncopyable {
public:
    service_builder(std::string name, std::shared_ptr<_Ty> receiver) : receiver_{std::move(receiver)} {
        if (name.empty() || name.front() < 'A' || name.front() > 'Z') {
            detail::logger()->critical("rpc server: {} is not a valid service name", name);
            throw std::invalid_argument{"rpc server: " + name + " is not a valid service name"};
        }
        service_.name_ = std::move(name);
    }

    template <typename _Func>
    std::enable_if_t<detail::is_rpc_method<_Func>::value, service_builder&> method(std::string name, _Func func) {
        using types = detail::rpc_method_types<_Func>;
        using arg_type = typename types::arg_type;
        using reply_type = typename types::reply_type;
        static_assert(std::is_base_of<typename types::receiver_type, _Ty>{}, "method of another receiver type");

        auto receiver = receiver_;
        auto invoke = [receiver, func](value& arg, value& reply) {
            auto& typed_arg = static_cast<typed_value<arg_type>&>(arg);
            auto& typed_reply = static_cast<typed_value<reply_type>&>(reply);
            return ((*receiver).*func)(typed_arg.get(), &typed_reply.get());
        };
        auto new_arg = []() -> std::unique_ptr<value> { return std::make_unique<typed_value<arg_type>>(); };
        auto new_reply = []() -> std::unique_ptr<value> { return std::make_unique<typed_value<reply_type>>(); };

        detail::logger()->info("rpc server: register {}.{}", service_.name_, name);
        auto entry = std::make_unique<method_type>(name, std::move(invoke), std::move(new_arg), std::move(new_reply));
        service_.methods_[std::move(name)] = std::move(entry);
        return *this;
    }

    // not of the shape error (T::*)(Arg, Reply*), left out of the catalog
    template <typename _Func>
    std::enable_if_t<!detail::is_rpc_method<_Func>::value, service_builder&> method(std::string name, _Func) {
        detail::logger()->debug("rpc server: skip {}.{}, not an rpc method", service_.name_, name);
        return *this;
    }

    service done() {
        return std::move(service_);
    }

    operator service() {
        return done();
    }

private:
    std::shared_ptr<_Ty> receiver_;
    service service_;
};

namespace detail {

inline std::string short_type_name(std::string name) {
    // "ns::Type" -> "Type"
    const auto colon = name.rfind("::");
    if (colon != std::string::npos) {
        name.erase(0, colon + 2);
    }
    return name;
}

} // namespace detail

template <typename _Ty>
inline service_builder<_Ty> service::build(std::shared_ptr<_Ty> receiver) {
    return service_builder<_Ty>{detail::short_type_name(boost::core::demangle(typeid(_Ty).name())),
                                std::move(receiver)};
}

template <typename _Ty>
inline service_builder<_Ty> service::build(std::string name, std::shared_ptr<_Ty> receiver) {
    return service_builder<_Ty>{std::move(name), std::move(receiver)};
}

} // namespace rpc
} // namespace lark

#endif // LARKRPC_SERVICE_HPP_
