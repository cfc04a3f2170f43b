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

// larkrpc protocol
//
// option packet, once per connection, always in this fixed layout (big endian)
// 0     1     2     3     4                       8                      12    13
// +-----+-----+-----+-----+-----+-----+-----+-----+-----+-----+-----+-----+-----+------------------+
// |         magic         |    connect timeout    |    handle timeout     | len |  codec type ...  |
// +-----------------------+-----------------------+-----------------------+-----+------------------+
//
// then zero or more messages, each encoded with the codec named by the option
// +----------------------------------+----------------------------------+
// | header {service_method, seq, error} |              body              |
// +----------------------------------+----------------------------------+

#ifndef LARKRPC_PROTOCOL_HPP_
#define LARKRPC_PROTOCOL_HPP_

#include <chrono>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

#include "larkrpc/detail/endian.hpp"

namespace lark {
namespace rpc {

constexpr std::uint32_t magic_number{0x3bef5c};

namespace codec_type {

constexpr std::string_view msgpack{"application/msgpack"};
// reserved, not registered by default
constexpr std::string_view json{"application/json"};

} // namespace codec_type

struct option final {
    std::uint32_t magic_number{rpc::magic_number};
    std::string codec_type{rpc::codec_type::msgpack};
    // 0 means no limit
    std::chrono::milliseconds connect_timeout{std::chrono::seconds{10}};
    std::chrono::milliseconds handle_timeout{0};
};

inline option default_option() {
    return option{};
}

struct header final {
    // "Service.Method"
    std::string service_method;
    // chosen by the client
    std::uint64_t seq{0};
    // empty on requests, set by the server on failure
    std::string error;
};

namespace detail {

#pragma pack(1)
struct option_header final {
    std::uint32_t magic_number;
    std::uint32_t connect_timeout;
    std::uint32_t handle_timeout;
    std::uint8_t codec_length;
};
#pragma pack()

constexpr std::size_t option_header_size{sizeof(option_header)};

static_assert(option_header_size == 13, "option header size mismatch");

inline std::string encode_option(const option& opt) {
    if (opt.codec_type.size() > UINT8_MAX) {
        throw std::length_error{"codec type too long"};
    }

    option_header header;
    header.magic_number = to_be(opt.magic_number);
    header.connect_timeout = to_be(static_cast<std::uint32_t>(opt.connect_timeout.count()));
    header.handle_timeout = to_be(static_cast<std::uint32_t>(opt.handle_timeout.count()));
    header.codec_length = static_cast<std::uint8_t>(opt.codec_type.size());

    std::string bytes(option_header_size, '\0');
    std::memcpy(&bytes[0], &header, option_header_size);
    bytes += opt.codec_type;
    return bytes;
}

// fills everything but the codec type, returns the codec type length still to be read
inline std::size_t decode_option_header(const char* data, option& opt) noexcept {
    option_header header;
    std::memcpy(&header, data, option_header_size);
    opt.magic_number = from_be(header.magic_number);
    opt.connect_timeout = std::chrono::milliseconds{from_be(header.connect_timeout)};
    opt.handle_timeout = std::chrono::milliseconds{from_be(header.handle_timeout)};
    opt.codec_type.clear();
    return header.codec_length;
}

} // namespace detail
} // namespace rpc
} // namespace lark

#endif // LARKRPC_PROTOCOL_HPP_
