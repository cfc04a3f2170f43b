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

#ifndef LARKRPC_SESSION_HPP_
#define LARKRPC_SESSION_HPP_

#include <atomic>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include "larkrpc/codec.hpp"
#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/dispatcher.hpp"
#include "larkrpc/detail/log.hpp"
#include "larkrpc/detail/noncopyable.hpp"
#include "larkrpc/detail/protocol.hpp"
#include "larkrpc/detail/tasks.hpp"

namespace lark {
namespace rpc {
namespace detail {

// One accepted connection: option handshake, then a read loop that hands
// every request to a task of its own and answers each exactly once.
class session final : public std::enable_shared_from_this<session>, safe_noncopyable {
public:
    enum class state { awaiting_option, serving, draining, closed };

    session(std::shared_ptr<const dispatcher> dispatcher, std::shared_ptr<const codec_registry> codecs,
            boost::asio::io_service& engine, tasks& workers) noexcept
        : engine_{engine},
          socket_{engine},
          workers_{workers},
          dispatcher_{std::move(dispatcher)},
          codecs_{std::move(codecs)} {
    }

    ~session() noexcept = default;

    tcp_socket& socket() noexcept {
        return socket_;
    }

    void run() {
        do_read_option();
    }

    state current_state() const noexcept {
        return state_.load();
    }

private:
    struct call final {
        header h;
        dispatcher::target target;
        std::unique_ptr<value> arg;
        std::unique_ptr<value> reply;
        std::atomic_bool responded{false};
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    void do_read_option() {
        boost::asio::async_read(
            socket_, boost::asio::buffer(option_header_),
            [this, self = this->shared_from_this()](boost::system::error_code code, std::size_t bytes_transferred) {
                if (code) {
                    logger()->warn("rpc server: options error: {}", code.message());
                    abort_handshake();
                    return;
                }

                const auto codec_length = decode_option_header(option_header_, option_);
                if (option_.magic_number != magic_number) {
                    logger()->warn("rpc server: invalid magic number {:x}", option_.magic_number);
                    abort_handshake();
                    return;
                }

                if (codec_length == 0) {
                    do_negotiate();
                    return;
                }
                do_read_codec_type(codec_length);
            });
    }

    void do_read_codec_type(std::size_t codec_length) {
        option_.codec_type.resize(codec_length);
        boost::asio::async_read(
            socket_, boost::asio::buffer(&option_.codec_type[0], codec_length),
            [this, self = this->shared_from_this()](boost::system::error_code code, std::size_t bytes_transferred) {
                if (code) {
                    logger()->warn("rpc server: options error: {}", code.message());
                    abort_handshake();
                    return;
                }
                do_negotiate();
            });
    }

    void do_negotiate() {
        if (!codecs_->contains(option_.codec_type)) {
            logger()->warn("rpc server: invalid codec type {}", option_.codec_type);
            abort_handshake();
            return;
        }

        boost::system::error_code code;
        codec_ = codecs_->make(option_.codec_type, std::move(socket_), code);
        if (code || !codec_) {
            logger()->warn("rpc server: invalid codec type {}", option_.codec_type);
            abort_handshake();
            return;
        }

        state_ = state::serving;
        do_read_header();
    }

    void do_read_header() {
        auto h = std::make_shared<header>();
        codec_->async_read_header(*h, [this, self = this->shared_from_this(), h](boost::system::error_code code) {
            if (code) {
                // nothing to attach an error to, the connection cannot be salvaged
                if (code != boost::asio::error::eof && code != boost::asio::error::operation_aborted) {
                    logger()->error("rpc server: read header error: {}", code.message());
                }
                drain();
                return;
            }

            std::string message;
            auto target = dispatcher_->find(h->service_method, code, message);
            if (code) {
                do_reject(h, std::move(message));
                return;
            }

            auto c = std::make_shared<call>();
            c->h = *h;
            c->target = std::move(target);
            c->arg = c->target.method->new_arg();
            c->reply = c->target.method->new_reply();
            do_read_body(std::move(c));
        });
    }

    // the body is read and dropped so the next header lines up
    void do_reject(std::shared_ptr<header> h, std::string message) {
        codec_->async_read_body(nullptr, [this, self = this->shared_from_this(), h,
                                          message = std::move(message)](boost::system::error_code code) {
            if (code) {
                drain();
                return;
            }
            h->error = message;
            codec_->write(*h, nil_value{});
            do_read_header();
        });
    }

    void do_read_body(std::shared_ptr<call> c) {
        auto* arg = c->arg.get();
        codec_->async_read_body(arg, [this, self = this->shared_from_this(), c](boost::system::error_code code) {
            if (code == errc::invalid_body) {
                auto h = c->h;
                h.error = "rpc server: read body error: " + code.message();
                codec_->write(h, nil_value{});
                do_read_header();
                return;
            }
            if (code) {
                logger()->error("rpc server: read body error: {}", code.message());
                drain();
                return;
            }

            dispatch(c);
            do_read_header();
        });
    }

    void dispatch(const std::shared_ptr<call>& c) {
        ++in_flight_;

        const auto timeout = option_.handle_timeout;
        if (timeout.count() > 0) {
            c->timer = std::make_unique<boost::asio::steady_timer>(engine_);
            c->timer->expires_from_now(timeout);
            c->timer->async_wait([this, self = this->shared_from_this(), c, timeout](boost::system::error_code code) {
                if (code) {
                    return;
                }
                auto h = c->h;
                h.error = "rpc server: request handle timeout: expect within " + utils::format_duration(timeout);
                respond(c, h, nil_value{});
            });
        }

        // a timed out invocation still runs to the end, its response is dropped
        workers_.spawn([this, self = this->shared_from_this(), c]() {
            const auto err = c->target.svc->call(*c->target.method, *c->arg, *c->reply);
            if (err) {
                auto h = c->h;
                h.error = err.message().empty() ? std::string{"rpc server: invoke error"} : err.message();
                respond(c, h, nil_value{});
            } else {
                respond(c, c->h, *c->reply);
            }

            if (c->timer) {
                boost::asio::post(engine_, [c]() { c->timer->cancel(); });
            }
        });
    }

    void respond(const std::shared_ptr<call>& c, const header& h, const value& body) {
        if (c->responded.exchange(true)) {
            return;
        }
        codec_->write(h, body);
        if (--in_flight_ == 0 && draining_) {
            close();
        }
    }

    // the read loop is over, close once every dispatched request is answered
    void drain() {
        state_ = state::draining;
        draining_ = true;
        if (in_flight_ == 0) {
            close();
        }
    }

    void close() {
        state_ = state::closed;
        codec_->close();
    }

    // handshake failures, nothing is sent back
    void abort_handshake() {
        state_ = state::closed;
        boost::system::error_code code;
        socket_.shutdown(tcp_socket::shutdown_both, code);
        socket_.close(code);
    }

    boost::asio::io_service& engine_;
    tcp_socket socket_;
    tasks& workers_;
    std::shared_ptr<const dispatcher> dispatcher_;
    std::shared_ptr<const codec_registry> codecs_;
    std::shared_ptr<codec> codec_;
    char option_header_[option_header_size];
    option option_;
    std::atomic<state> state_{state::awaiting_option};
    std::atomic<std::size_t> in_flight_{0};
    std::atomic_bool draining_{false};
};

} // namespace detail
} // namespace rpc
} // namespace lark

#endif // LARKRPC_SESSION_HPP_
