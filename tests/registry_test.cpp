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
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <larkrpc_client.hpp>
#include <larkrpc_registry.hpp>

#include "test_services.hpp"

using namespace lark::rpc;

namespace {

std::unique_ptr<registry_server> start_registry(std::chrono::milliseconds timeout = default_registry_timeout) {
    auto s = std::make_unique<registry_server>(std::make_shared<registry>(timeout));
    s->listen(0, "127.0.0.1");
    s->start();
    return s;
}

} // namespace

TEST(RegistryTest, ListsAliveServersSorted) {
    registry r;
    r.put_server("tcp@127.0.0.1:3");
    r.put_server("tcp@127.0.0.1:1");
    r.put_server("tcp@127.0.0.1:2");
    r.put_server("tcp@127.0.0.1:1");

    const std::vector<std::string> expected{"tcp@127.0.0.1:1", "tcp@127.0.0.1:2", "tcp@127.0.0.1:3"};
    EXPECT_EQ(r.alive_servers(), expected);
    EXPECT_EQ(r.alive_servers(), expected);
}

TEST(RegistryTest, ExpiresSilentServers) {
    registry r{std::chrono::milliseconds{50}};
    r.put_server("tcp@127.0.0.1:1");
    EXPECT_EQ(r.alive_servers(), std::vector<std::string>{"tcp@127.0.0.1:1"});

    std::this_thread::sleep_for(std::chrono::milliseconds{120});
    r.put_server("tcp@127.0.0.1:2");
    EXPECT_EQ(r.alive_servers(), std::vector<std::string>{"tcp@127.0.0.1:2"});
}

TEST(RegistryTest, ZeroTimeoutNeverExpires) {
    registry r{std::chrono::milliseconds{0}};
    r.put_server("tcp@127.0.0.1:1");
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    EXPECT_EQ(r.alive_servers(), std::vector<std::string>{"tcp@127.0.0.1:1"});
}

TEST(RegistryServerTest, AnswersHttpRequests) {
    auto s = start_registry();
    const auto url = s->url();

    boost::system::error_code code;
    auto response = detail::http_request(detail::http::verb::post, url, {{server_field, "tcp@127.0.0.1:7"}}, code);
    ASSERT_FALSE(code);
    EXPECT_EQ(response.result(), detail::http::status::ok);

    response = detail::http_request(detail::http::verb::post, url, {{server_field, "tcp@127.0.0.1:5"}}, code);
    ASSERT_FALSE(code);

    response = detail::http_request(detail::http::verb::get, url, {}, code);
    ASSERT_FALSE(code);
    EXPECT_EQ(response.result(), detail::http::status::ok);
    EXPECT_EQ(detail::to_string(response[servers_field]), "tcp@127.0.0.1:5,tcp@127.0.0.1:7");

    response = detail::http_request(detail::http::verb::post, url, {}, code);
    ASSERT_FALSE(code);
    EXPECT_EQ(response.result(), detail::http::status::internal_server_error);

    response = detail::http_request(detail::http::verb::put, url, {}, code);
    ASSERT_FALSE(code);
    EXPECT_EQ(response.result(), detail::http::status::method_not_allowed);

    const auto endpoint = s->local_endpoint();
    response = detail::http_request(detail::http::verb::get,
                                    "http://127.0.0.1:" + std::to_string(endpoint.port()) + "/elsewhere", {}, code);
    ASSERT_FALSE(code);
    EXPECT_EQ(response.result(), detail::http::status::not_found);
}

TEST(HeartbeatTest, DefaultPeriodIsOneMinuteShort) {
    heartbeat beat{"http://127.0.0.1:1/_larkrpc_/registry", "tcp@127.0.0.1:1"};
    EXPECT_EQ(beat.period(), std::chrono::milliseconds{std::chrono::minutes{4}});
    EXPECT_FALSE(beat.running());
}

TEST(HeartbeatTest, KeepsServerAlive) {
    auto s = start_registry(std::chrono::milliseconds{300});
    heartbeat beat{s->url(), "tcp@127.0.0.1:9", std::chrono::milliseconds{50}};
    EXPECT_FALSE(beat.start());
    EXPECT_TRUE(beat.running());

    std::this_thread::sleep_for(std::chrono::milliseconds{500});
    EXPECT_EQ(s->get_registry()->alive_servers(), std::vector<std::string>{"tcp@127.0.0.1:9"});

    beat.stop();
    EXPECT_FALSE(beat.running());
}

TEST(HeartbeatTest, StartWhileRunningKeepsLoop) {
    auto s = start_registry();
    heartbeat beat{s->url(), "tcp@127.0.0.1:9", std::chrono::milliseconds{50}};
    EXPECT_FALSE(beat.start());
    EXPECT_FALSE(beat.start());
    EXPECT_TRUE(beat.running());

    beat.stop();
    EXPECT_FALSE(beat.running());

    // a stopped heartbeat can be started again
    EXPECT_FALSE(beat.start());
    EXPECT_TRUE(beat.running());
    EXPECT_EQ(s->get_registry()->alive_servers(), std::vector<std::string>{"tcp@127.0.0.1:9"});
}

TEST(HeartbeatTest, StopsAfterFailedSend) {
    auto s = start_registry();
    heartbeat beat{s->url(), "tcp@127.0.0.1:9", std::chrono::milliseconds{50}};
    EXPECT_FALSE(beat.start());

    s.reset();
    std::this_thread::sleep_for(std::chrono::milliseconds{400});
    EXPECT_FALSE(beat.running());
}

TEST(HeartbeatTest, FirstSendFailureIsReturned) {
    auto s = start_registry();
    const auto url = s->url();
    s.reset();

    heartbeat beat{url, "tcp@127.0.0.1:9"};
    EXPECT_TRUE(beat.start());
    EXPECT_FALSE(beat.running());
}

TEST(RegistryDiscoveryTest, PullsAliveServers) {
    auto r = start_registry();
    auto first = larkrpc_test::start_server();
    auto second = larkrpc_test::start_server();
    heartbeat first_beat{r->url(), first->address()};
    heartbeat second_beat{r->url(), second->address()};
    ASSERT_FALSE(first_beat.start());
    ASSERT_FALSE(second_beat.start());

    registry_discovery d{r->url()};
    auto servers = d.get_all();
    std::vector<std::string> expected{first->address(), second->address()};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(servers, expected);

    const auto picked = d.get(select_mode::round_robin);
    EXPECT_TRUE(picked == expected[0] || picked == expected[1]);

    xclient xc{std::make_shared<registry_discovery>(r->url()), select_mode::random};
    int reply{0};
    xc.call("T.Sum", larkrpc_test::args{3, 4}, reply);
    EXPECT_EQ(reply, 7);
}

TEST(RegistryDiscoveryTest, UnreachableRegistryIsReported) {
    auto r = start_registry();
    const auto url = r->url();
    r.reset();

    registry_discovery d{url};
    boost::system::error_code code;
    EXPECT_TRUE(d.get(select_mode::random, code).empty());
    EXPECT_TRUE(code);
    EXPECT_THROW(d.get_all(), boost::system::system_error);
}
