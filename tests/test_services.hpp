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

#ifndef LARKRPC_TEST_SERVICES_HPP_
#define LARKRPC_TEST_SERVICES_HPP_

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <larkrpc_server.hpp>

namespace larkrpc_test {

struct args final {
    int num1{0};
    int num2{0};

    MSGPACK_DEFINE(num1, num2);
};

class T final {
public:
    lark::rpc::error Sum(const args& a, int* reply) {
        *reply = a.num1 + a.num2;
        return {};
    }

    // sleeps num1 milliseconds
    lark::rpc::error Sleep(args a, int* reply) const {
        std::this_thread::sleep_for(std::chrono::milliseconds{a.num1});
        *reply = a.num1 + a.num2;
        return {};
    }

    lark::rpc::error Fail(const args&, int*) {
        return lark::rpc::error{"sum refused"};
    }

    lark::rpc::error Throw(const args&, int*) {
        throw std::runtime_error{"sum exploded"};
    }

    lark::rpc::error Echo(const std::string& text, std::string* reply) {
        *reply = text;
        return {};
    }

    lark::rpc::error Keys(const std::map<std::string, int>& m, std::vector<std::string>* reply) {
        for (const auto& p : m) {
            reply->emplace_back(p.first);
        }
        return {};
    }

    // wrong shapes
    int Count() const {
        return 0;
    }

    lark::rpc::error NoReply(const args&) {
        return {};
    }

    void Plain(const args&, int*) {
    }
};

inline lark::rpc::service make_t_service(std::shared_ptr<T> receiver = std::make_shared<T>()) {
    return lark::rpc::service::build(std::move(receiver))
        .method("Sum", &T::Sum)
        .method("Sleep", &T::Sleep)
        .method("Fail", &T::Fail)
        .method("Throw", &T::Throw)
        .method("Echo", &T::Echo)
        .method("Keys", &T::Keys)
        .method("Count", &T::Count)
        .method("NoReply", &T::NoReply)
        .method("Plain", &T::Plain);
}

// a server on an ephemeral loopback port, running in the background
inline std::unique_ptr<lark::rpc::server> start_server() {
    auto s = std::make_unique<lark::rpc::server>(lark::rpc::make_default_codec_registry(), 2);
    const auto code = s->register_service(make_t_service());
    if (code) {
        throw boost::system::system_error{code};
    }
    s->listen(0, "127.0.0.1");
    s->start();
    return s;
}

} // namespace larkrpc_test

#endif // LARKRPC_TEST_SERVICES_HPP_
