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
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <larkrpc_client.hpp>

#include "test_services.hpp"

using namespace lark::rpc;
using larkrpc_test::args;

TEST(DiscoveryTest, RoundRobinVisitsEachServerOncePerCycle) {
    const std::vector<std::string> servers{"tcp@a:1", "tcp@b:2", "tcp@c:3", "tcp@d:4"};
    multi_servers_discovery d{servers};

    std::vector<std::string> picked;
    for (std::size_t i{0}; i < 2 * servers.size(); ++i) {
        picked.emplace_back(d.get(select_mode::round_robin));
    }

    // list order, starting wherever the cursor began
    const auto start =
        static_cast<std::size_t>(std::find(servers.begin(), servers.end(), picked[0]) - servers.begin());
    for (std::size_t i{0}; i < picked.size(); ++i) {
        EXPECT_EQ(picked[i], servers[(start + i) % servers.size()]);
    }
    const std::set<std::string> first_cycle{picked.begin(), picked.begin() + servers.size()};
    EXPECT_EQ(first_cycle.size(), servers.size());
}

TEST(DiscoveryTest, RoundRobinSurvivesShrinkingList) {
    multi_servers_discovery d{{"tcp@a:1", "tcp@b:2", "tcp@c:3", "tcp@d:4", "tcp@e:5"}};
    d.get(select_mode::round_robin);
    d.get(select_mode::round_robin);
    d.get(select_mode::round_robin);

    d.update({"tcp@a:1"});
    for (int i{0}; i < 3; ++i) {
        EXPECT_EQ(d.get(select_mode::round_robin), "tcp@a:1");
    }
}

TEST(DiscoveryTest, RandomStaysWithinList) {
    const std::vector<std::string> servers{"tcp@a:1", "tcp@b:2", "tcp@c:3"};
    multi_servers_discovery d{servers};
    for (int i{0}; i < 30; ++i) {
        const auto server = d.get(select_mode::random);
        EXPECT_NE(std::find(servers.begin(), servers.end(), server), servers.end());
    }
}

TEST(DiscoveryTest, EmptyListIsReported) {
    multi_servers_discovery d;
    boost::system::error_code code;

    EXPECT_TRUE(d.get(select_mode::random, code).empty());
    EXPECT_EQ(code, make_error_code(errc::no_available_servers));

    EXPECT_TRUE(d.get(select_mode::round_robin, code).empty());
    EXPECT_EQ(code, make_error_code(errc::no_available_servers));

    EXPECT_THROW(d.get(select_mode::random), boost::system::system_error);
}

TEST(DiscoveryTest, UnsupportedModeIsReported) {
    multi_servers_discovery d{{"tcp@a:1"}};
    boost::system::error_code code;
    EXPECT_TRUE(d.get(static_cast<select_mode>(7), code).empty());
    EXPECT_EQ(code, make_error_code(errc::unsupported_select_mode));
}

TEST(DiscoveryTest, GetAllReturnsCopy) {
    multi_servers_discovery d{{"tcp@a:1", "tcp@b:2"}};
    auto servers = d.get_all();
    servers.clear();
    servers.emplace_back("tcp@z:9");

    EXPECT_EQ(d.get_all(), (std::vector<std::string>{"tcp@a:1", "tcp@b:2"}));
    EXPECT_NE(d.get(select_mode::random), "tcp@z:9");
}

TEST(XClientTest, CallsThroughDiscovery) {
    auto first = larkrpc_test::start_server();
    auto second = larkrpc_test::start_server();
    auto d = std::make_shared<multi_servers_discovery>(std::vector<std::string>{first->address(), second->address()});
    xclient xc{d, select_mode::round_robin};

    for (int i{0}; i < 6; ++i) {
        int reply{0};
        xc.call("T.Sum", args{i, 1}, reply);
        EXPECT_EQ(reply, i + 1);
    }

    try {
        int reply{0};
        xc.call("T.Fail", args{}, reply);
        FAIL() << "expected invoke_exception";
    } catch (const invoke_exception& e) {
        EXPECT_EQ(std::string{e.what()}, "sum refused");
    }
}

TEST(XClientTest, BroadcastsToEveryServer) {
    auto first = larkrpc_test::start_server();
    auto second = larkrpc_test::start_server();
    auto d = std::make_shared<multi_servers_discovery>(std::vector<std::string>{first->address(), second->address()});
    xclient xc{d, select_mode::random};

    int reply{0};
    xc.broadcast("T.Sum", args{20, 22}, &reply);
    EXPECT_EQ(reply, 42);

    xc.broadcast<int>("T.Sum", args{1, 1}, nullptr);

    EXPECT_THROW(xc.broadcast("T.Fail", args{}, &reply), invoke_exception);
    EXPECT_THROW(xc.broadcast("T.Sleep", args{300, 0}, &reply, std::chrono::milliseconds{50}), invoke_exception);
}

TEST(XClientTest, EmptyDiscoveryIsReported) {
    xclient xc{std::make_shared<multi_servers_discovery>(), select_mode::round_robin};
    int reply{0};
    try {
        xc.call("T.Sum", args{1, 2}, reply);
        FAIL() << "expected invoke_exception";
    } catch (const invoke_exception& e) {
        EXPECT_EQ(std::string{e.what()}, "rpc discovery: no available servers");
    }
}

TEST(XClientTest, BroadcastReportsUnreachableServer) {
    auto live = larkrpc_test::start_server();
    auto gone = larkrpc_test::start_server();
    const auto gone_address = gone->address();
    gone.reset();

    option opt;
    opt.connect_timeout = std::chrono::milliseconds{500};
    auto d = std::make_shared<multi_servers_discovery>(std::vector<std::string>{live->address(), gone_address});
    xclient xc{d, select_mode::random, opt};

    int reply{0};
    EXPECT_THROW(xc.broadcast("T.Sum", args{1, 2}, &reply), invoke_exception);
}

TEST(XClientTest, UnreachableServerIsReported) {
    auto gone = larkrpc_test::start_server();
    const auto gone_address = gone->address();
    gone.reset();

    option opt;
    opt.connect_timeout = std::chrono::milliseconds{500};
    xclient xc{std::make_shared<multi_servers_discovery>(std::vector<std::string>{gone_address}),
               select_mode::round_robin, opt};

    int reply{0};
    try {
        xc.call("T.Sum", args{1, 2}, reply);
        FAIL() << "expected invoke_exception";
    } catch (const invoke_exception& e) {
        EXPECT_EQ(std::string{e.what()}.rfind("rpc client: dial " + gone_address, 0), 0u);
    }
}
