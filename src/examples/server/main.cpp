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

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include <larkrpc_server.hpp>

using namespace lark::rpc;

struct args final {
    int num1{0};
    int num2{0};

    MSGPACK_DEFINE(num1, num2);
};

class Foo final {
public:
    error Sum(const args& a, int* reply) {
        *reply = a.num1 + a.num2;
        return {};
    }

    error Sleep(const args& a, int* reply) const {
        std::this_thread::sleep_for(std::chrono::seconds{a.num1});
        *reply = a.num1 + a.num2;
        return {};
    }

    // not an rpc method, skipped at registration
    int Count() const {
        return 0;
    }
};

// usage: larkrpc_server_example [port] [registry url]
int main(int argc, char** argv) {
    const auto port = argc > 1 ? static_cast<unsigned short>(std::atoi(argv[1])) : 0;

    server s;
    const auto code = s.register_service(service::build(std::make_shared<Foo>())
                                             .method("Sum", &Foo::Sum)
                                             .method("Sleep", &Foo::Sleep)
                                             .method("Count", &Foo::Count));
    if (code) {
        std::cerr << code.message() << std::endl;
        return 1;
    }

    s.listen(port, "127.0.0.1");
    std::cout << "serving on " << s.address() << std::endl;

    std::unique_ptr<heartbeat> beat;
    if (argc > 2) {
        beat = std::make_unique<heartbeat>(argv[2], s.address());
        if (beat->start()) {
            return 1;
        }
    }

    s.run();

    return 0;
}
