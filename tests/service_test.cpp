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

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "larkrpc/detail/dispatcher.hpp"
#include "test_services.hpp"

using namespace lark::rpc;
using larkrpc_test::args;
using larkrpc_test::T;

namespace {

class lower final {
public:
    error Sum(const args& a, int* reply) {
        *reply = a.num1 + a.num2;
        return {};
    }
};

class Quiet final {
public:
    error Sum(const args& a, int* reply) noexcept {
        *reply = a.num1 + a.num2;
        return {};
    }

    error Twice(args a, int* reply) const noexcept {
        *reply = 2 * a.num1;
        return {};
    }
};

} // namespace

TEST(ServiceTest, NamedAfterReceiverType) {
    const auto svc = larkrpc_test::make_t_service();
    EXPECT_EQ(svc.name(), "T");
}

TEST(ServiceTest, KeepsOnlyEligibleMethods) {
    const auto svc = larkrpc_test::make_t_service();
    const std::vector<std::string> expected{"Echo", "Fail", "Keys", "Sleep", "Sum", "Throw"};
    EXPECT_EQ(svc.method_names(), expected);
    EXPECT_EQ(svc.find_method("Count"), nullptr);
    EXPECT_EQ(svc.find_method("NoReply"), nullptr);
    EXPECT_EQ(svc.find_method("Plain"), nullptr);
}

TEST(ServiceTest, KeepsNoexceptMethods) {
    const service svc =
        service::build(std::make_shared<Quiet>()).method("Sum", &Quiet::Sum).method("Twice", &Quiet::Twice);
    EXPECT_EQ(svc.method_names(), (std::vector<std::string>{"Sum", "Twice"}));

    const auto* method = svc.find_method("Twice");
    ASSERT_NE(method, nullptr);
    auto arg = method->new_arg();
    static_cast<typed_value<args>&>(*arg).get() = args{21, 0};
    auto reply = method->new_reply();
    EXPECT_FALSE(svc.call(*method, *arg, *reply));
    EXPECT_EQ(static_cast<typed_value<int>&>(*reply).get(), 42);
}

TEST(ServiceTest, CallCountsAndReplies) {
    const auto svc = larkrpc_test::make_t_service();
    const auto* method = svc.find_method("Sum");
    ASSERT_NE(method, nullptr);
    EXPECT_EQ(method->num_calls(), 0u);

    auto arg = method->new_arg();
    static_cast<typed_value<args>&>(*arg).get() = args{3, 4};
    auto reply = method->new_reply();

    const auto err = svc.call(*method, *arg, *reply);
    EXPECT_FALSE(err);
    EXPECT_EQ(static_cast<typed_value<int>&>(*reply).get(), 7);
    EXPECT_EQ(method->num_calls(), 1u);

    svc.call(*method, *arg, *reply);
    EXPECT_EQ(method->num_calls(), 2u);
}

TEST(ServiceTest, ReportsMethodErrors) {
    const auto svc = larkrpc_test::make_t_service();

    const auto* fail = svc.find_method("Fail");
    ASSERT_NE(fail, nullptr);
    auto arg = fail->new_arg();
    auto reply = fail->new_reply();
    const auto refused = svc.call(*fail, *arg, *reply);
    EXPECT_TRUE(refused);
    EXPECT_EQ(refused.message(), "sum refused");

    const auto* thrower = svc.find_method("Throw");
    ASSERT_NE(thrower, nullptr);
    const auto exploded = svc.call(*thrower, *arg, *reply);
    EXPECT_TRUE(exploded);
    EXPECT_EQ(exploded.message(), "sum exploded");
    EXPECT_EQ(thrower->num_calls(), 1u);
}

TEST(ServiceTest, ContainerRepliesStartEmpty) {
    const auto svc = larkrpc_test::make_t_service();
    const auto* method = svc.find_method("Keys");
    ASSERT_NE(method, nullptr);
    auto reply = method->new_reply();
    EXPECT_TRUE(static_cast<typed_value<std::vector<std::string>>&>(*reply).get().empty());
}

TEST(ServiceTest, RejectsUnexportedNames) {
    EXPECT_THROW(service::build(std::make_shared<lower>()), std::invalid_argument);
    EXPECT_THROW(service::build("sum", std::make_shared<T>()), std::invalid_argument);
    EXPECT_THROW(service::build("", std::make_shared<T>()), std::invalid_argument);

    service named = service::build("Arith", std::make_shared<lower>()).method("Sum", &lower::Sum);
    EXPECT_EQ(named.name(), "Arith");
    EXPECT_NE(named.find_method("Sum"), nullptr);
}

TEST(DispatcherTest, RejectsDuplicateServices) {
    detail::dispatcher d;
    EXPECT_FALSE(d.add(std::make_shared<const service>(larkrpc_test::make_t_service())));
    EXPECT_EQ(d.add(std::make_shared<const service>(larkrpc_test::make_t_service())),
              make_error_code(errc::duplicate_service));
}

TEST(DispatcherTest, ResolvesServiceMethod) {
    detail::dispatcher d;
    d.add(std::make_shared<const service>(larkrpc_test::make_t_service()));

    boost::system::error_code code;
    std::string message;
    const auto target = d.find("T.Sum", code, message);
    EXPECT_FALSE(code);
    ASSERT_NE(target.method, nullptr);
    EXPECT_EQ(target.method->name(), "Sum");
    EXPECT_EQ(target.svc->name(), "T");

    d.find("TSum", code, message);
    EXPECT_EQ(code, make_error_code(errc::ill_formed_method));
    EXPECT_EQ(message, "rpc server: service/method request ill-formed: TSum");

    d.find("U.Sum", code, message);
    EXPECT_EQ(code, make_error_code(errc::service_not_found));
    EXPECT_EQ(message, "rpc server: can't find service U");

    d.find("T.Product", code, message);
    EXPECT_EQ(code, make_error_code(errc::method_not_found));
    EXPECT_EQ(message, "rpc server: can't find method Product");
}

TEST(UtilsTest, FormatsDurations) {
    using std::chrono::milliseconds;
    EXPECT_EQ(detail::utils::format_duration(milliseconds{0}), "0s");
    EXPECT_EQ(detail::utils::format_duration(milliseconds{100}), "100ms");
    EXPECT_EQ(detail::utils::format_duration(milliseconds{1000}), "1s");
    EXPECT_EQ(detail::utils::format_duration(milliseconds{1500}), "1.5s");
    EXPECT_EQ(detail::utils::format_duration(milliseconds{1050}), "1.05s");
    EXPECT_EQ(detail::utils::format_duration(milliseconds{60000}), "1m0s");
    EXPECT_EQ(detail::utils::format_duration(milliseconds{90500}), "1m30.5s");
    EXPECT_EQ(detail::utils::format_duration(std::chrono::hours{2} + std::chrono::seconds{30}), "2h0m30s");
}
