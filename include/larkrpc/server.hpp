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

#ifndef LARKRPC_SERVER_HPP_
#define LARKRPC_SERVER_HPP_

#include <memory>
#include <string>
#include <thread>
#include <boost/asio.hpp>

#include "larkrpc/codec.hpp"
#include "larkrpc/service.hpp"
#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/dispatcher.hpp"
#include "larkrpc/detail/engines.hpp"
#include "larkrpc/detail/log.hpp"
#include "larkrpc/detail/msgpack_codec.hpp"
#include "larkrpc/detail/noncopyable.hpp"
#include "larkrpc/detail/session.hpp"
#include "larkrpc/detail/tasks.hpp"

namespace lark {
namespace rpc {

class server final : safe_noncopyable {
public:
    explicit server(codec_registry codecs = make_default_codec_registry(),
                    std::size_t engine_count = std::thread::hardware_concurrency())
        : codecs_{std::make_shared<const codec_registry>(std::move(codecs))},
          dispatcher_{std::make_shared<detail::dispatcher>()},
          engines_{engine_count} {
    }

    ~server() {
        stop();
    }

    // errc::duplicate_service when the name is already served
    boost::system::error_code register_service(service&& svc) {
        const auto name = svc.name();
        const auto code = dispatcher_->add(std::make_shared<const service>(std::move(svc)));
        if (code) {
            detail::logger()->warn("rpc: service already defined: {}", name);
        }
        return code;
    }

    server& listen(unsigned short port) {
        listen_impl(boost::asio::ip::tcp::resolver::query{std::to_string(port)});
        return *this;
    }

    template <typename _Host>
    server& listen(unsigned short port, _Host&& host) {
        listen_impl(boost::asio::ip::tcp::resolver::query{std::forward<_Host>(host), std::to_string(port)});
        return *this;
    }

    boost::asio::ip::tcp::endpoint local_endpoint() const {
        return acceptor_->local_endpoint();
    }

    // "tcp@host:port" of the listening socket
    std::string address() const {
        const auto endpoint = local_endpoint();
        return "tcp@" + endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    // serves in the background
    void start() {
        engines_.start();
    }

    void run() {
        engines_.run();
    }

    void stop() {
        engines_.stop();
        if (acceptor_) {
            boost::system::error_code code;
            acceptor_->close(code);
        }
        // requests already handed out run to the end
        workers_.wait();
    }

protected:
    void listen_impl(boost::asio::ip::tcp::resolver::query&& query) {
        auto& engine = engines_.get();
        const boost::asio::ip::tcp::endpoint endpoint{*boost::asio::ip::tcp::resolver{engine}.resolve(query)};
        acceptor_ = std::make_shared<boost::asio::ip::tcp::acceptor>(engine);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address{true});
        acceptor_->bind(endpoint);
        acceptor_->listen();
        detail::logger()->info("rpc server: listening on {}", address());
        do_accept();
    }

    void do_accept() {
        auto session = std::make_shared<detail::session>(dispatcher_, codecs_, engines_.get(), workers_);
        acceptor_->async_accept(session->socket(), [this, session](boost::system::error_code code) {
            if (!acceptor_->is_open()) {
                return;
            }

            if (!code) {
                boost::system::error_code ignored;
                session->socket().set_option(boost::asio::ip::tcp::no_delay{true}, ignored);
                session->run();
            } else {
                detail::logger()->error("rpc server: accept error: {}", code.message());
            }

            do_accept();
        });
    }

    std::shared_ptr<const codec_registry> codecs_;
    std::shared_ptr<detail::dispatcher> dispatcher_;
    detail::engines engines_;
    detail::tasks workers_;
    std::shared_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
};

} // namespace rpc
} // namespace lark

#endif // LARKRPC_SERVER_HPP_
