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

#include <cstdlib>
#include <iostream>

#include <larkrpc_registry.hpp>

using namespace lark::rpc;

// usage: larkrpc_registry_example [port]
int main(int argc, char** argv) {
    const auto port = argc > 1 ? static_cast<unsigned short>(std::atoi(argv[1])) : 9999;

    set_log_level(spdlog::level::debug);

    registry_server s;
    s.listen(port, "127.0.0.1");
    std::cout << "registry on " << s.url() << std::endl;

    s.run();

    return 0;
}
