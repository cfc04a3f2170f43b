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

#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <larkrpc_client.hpp>

using namespace lark::rpc;

struct args final {
    int num1{0};
    int num2{0};

    MSGPACK_DEFINE(num1, num2);
};

void call_one(const std::shared_ptr<client>& c) {
    std::vector<std::thread> threads;
    for (int i{0}; i < 5; ++i) {
        threads.emplace_back([c, i]() {
            try {
                const auto reply = c->call<int>("Foo.Sum", args{i, i * i});
                std::cout << i << " + " << i * i << " = " << reply << std::endl;
            } catch (const invoke_exception& e) {
                std::cout << "call Foo.Sum error: " << e.what() << std::endl;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto result = c->async_call<int>("Foo.Sum", args{20, 22}, use_std_future);
    std::cout << "future: " << result.get() << std::endl;

    c->async_call<int>("Foo.Sum", args{1, 2}, [](const std::string& error, int&& reply) {
        if (error.empty()) {
            std::cout << "callback: " << reply << std::endl;
        } else {
            std::cout << "callback error: " << error << std::endl;
        }
    });
}

void broadcast(const std::string& registry_url) {
    xclient xc{std::make_shared<registry_discovery>(registry_url), select_mode::round_robin};
    for (int i{0}; i < 5; ++i) {
        try {
            int reply{0};
            xc.call("Foo.Sum", args{i, i * i}, reply);
            std::cout << "call " << i << " + " << i * i << " = " << reply << std::endl;
            xc.broadcast("Foo.Sum", args{i, i * i}, &reply);
            std::cout << "broadcast " << i << " + " << i * i << " = " << reply << std::endl;
        } catch (const std::exception& e) {
            std::cout << "error: " << e.what() << std::endl;
        }
    }
}

// usage: larkrpc_client_example tcp@host:port | http://host:port/_larkrpc_/registry
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " tcp@host:port | registry url" << std::endl;
        return 1;
    }

    const std::string target{argv[1]};
    if (target.compare(0, 7, "http://") == 0) {
        broadcast(target);
        return 0;
    }

    boost::system::error_code code;
    auto c = client::dial(target, code);
    if (code) {
        std::cerr << "dial " << target << ": " << code.message() << std::endl;
        return 1;
    }
    call_one(c);
    c->close();

    return 0;
}
