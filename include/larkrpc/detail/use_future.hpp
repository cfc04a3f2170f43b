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

#ifndef LARKRPC_USE_FUTURE_HPP_
#define LARKRPC_USE_FUTURE_HPP_

#include <future>
#include <memory>
#include <string>
#include <tuple>

#include "larkrpc/detail/common.hpp"

namespace lark {
namespace rpc {
namespace detail {

struct return_void {
    void get() {
    }
};

// plain callbacks: called as callback(error, reply), nothing returned
template <typename Callable, typename Signature>
struct callback_adapter {
    using callback_type = Callable;
    using return_type = return_void;

    inline static std::tuple<callback_type, return_type> traits(Callable callback) {
        return {std::move(callback), {}};
    }
};

template <typename Promise, typename Result>
class use_future_handler_base {
public:
    using result_type = Result;
    using promise_type = typename Promise::template promise_type<result_type>;

    use_future_handler_base() : promise_{std::make_shared<promise_type>()} {
    }

    auto get_future() const {
        return promise_->get_future();
    }

protected:
    std::shared_ptr<promise_type> promise_;
};

// an empty error string is success
template <typename Promise, typename Result>
struct use_future_handler final : use_future_handler_base<Promise, Result> {
    template <typename Arg>
    void operator()(const std::string& error, Arg&& arg) const {
        if (error.empty()) {
            this->promise_->set_value(std::forward<Arg>(arg));
        } else {
            this->promise_->set_exception(std::make_exception_ptr(invoke_exception{error}));
        }
    }
};

template <typename Future, typename Result>
class use_future_return final {
public:
    using result_type = Result;
    using future_type = typename Future::template future_type<result_type>;

    use_future_return(future_type&& future) noexcept : future_{std::move(future)} {
    }

    future_type get() {
        return std::move(future_);
    }

private:
    future_type future_;
};

template <typename Traits, typename Result>
struct callback_adapter_impl {
    using traits_type = Traits;
    using callback_type = use_future_handler<traits_type, Result>;
    using result_type = typename callback_type::result_type;
    using return_type = use_future_return<traits_type, result_type>;

    inline static std::tuple<callback_type, return_type> traits(const Traits&) {
        callback_type callback{};
        auto future = callback.get_future();
        return {std::move(callback), std::move(future)};
    }
};

struct use_std_future_t final {
    template <typename Result>
    using promise_type = std::promise<Result>;

    template <typename Result>
    using future_type = std::future<Result>;
};

template <typename R, typename Result>
struct callback_adapter<use_std_future_t, R(const std::string&, Result)> final
    : callback_adapter_impl<use_std_future_t, Result> {};

} // namespace detail

constexpr detail::use_std_future_t use_std_future{};

} // namespace rpc
} // namespace lark

#endif // LARKRPC_USE_FUTURE_HPP_
