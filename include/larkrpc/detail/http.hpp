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

#ifndef LARKRPC_HTTP_HPP_
#define LARKRPC_HTTP_HPP_

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "larkrpc/detail/common.hpp"

namespace lark {
namespace rpc {
namespace detail {

namespace http = boost::beast::http;

using http_fields = std::vector<std::pair<std::string, std::string>>;
using http_response = http::response<http::string_body>;

struct http_url final {
    std::string host;
    std::string port;
    std::string target;
};

// "http://host[:port][/path]"
inline bool parse_http_url(std::string_view url, http_url& out) {
    constexpr std::string_view scheme{"http://"};
    if (url.substr(0, scheme.size()) != scheme) {
        return false;
    }
    url.remove_prefix(scheme.size());

    const auto slash = url.find('/');
    const auto authority = url.substr(0, slash);
    out.target = slash == std::string_view::npos ? std::string{"/"} : std::string{url.substr(slash)};

    const auto colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        out.host = std::string{authority};
        out.port = "80";
    } else {
        out.host = std::string{authority.substr(0, colon)};
        out.port = std::string{authority.substr(colon + 1)};
    }
    return !out.host.empty() && !out.port.empty();
}

inline std::string to_string(boost::beast::string_view view) {
    return std::string{view.data(), view.size()};
}

// one blocking request on a private io_service, bounded by timeout
inline http_response http_request(http::verb verb, const std::string& url, const http_fields& fields,
                                  boost::system::error_code& ec,
                                  std::chrono::milliseconds timeout = std::chrono::seconds{10}) {
    http_url u;
    if (!parse_http_url(url, u)) {
        ec = errc::invalid_address;
        return {};
    }

    boost::asio::io_service engine;
    boost::asio::ip::tcp::resolver resolver{engine};
    const auto endpoints = resolver.resolve(u.host, u.port, ec);
    if (ec) {
        return {};
    }

    http::request<http::string_body> request{verb, u.target, 11};
    request.set(http::field::host, u.host);
    request.set(http::field::user_agent, "larkrpc");
    for (const auto& field : fields) {
        request.set(field.first, field.second);
    }
    request.prepare_payload();

    boost::beast::tcp_stream stream{engine};
    boost::beast::flat_buffer buffer;
    http_response response;

    stream.expires_after(timeout);
    stream.async_connect(endpoints, [&](boost::system::error_code code, const boost::asio::ip::tcp::endpoint&) {
        if (code) {
            ec = code;
            return;
        }
        http::async_write(stream, request, [&](boost::system::error_code code, std::size_t) {
            if (code) {
                ec = code;
                return;
            }
            http::async_read(stream, buffer, response,
                             [&](boost::system::error_code code, std::size_t) { ec = code; });
        });
    });
    engine.run();

    boost::system::error_code ignored;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return response;
}

} // namespace detail
} // namespace rpc
} // namespace lark

#endif // LARKRPC_HTTP_HPP_
