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

#ifndef LARKRPC_CLIENT_HPP_
#define LARKRPC_CLIENT_HPP_

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include "larkrpc/codec.hpp"
#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/log.hpp"
#include "larkrpc/detail/msgpack_codec.hpp"
#include "larkrpc/detail/noncopyable.hpp"
#include "larkrpc/detail/protocol.hpp"
#include "larkrpc/detail/use_future.hpp"

namespace lark {
namespace rpc {

// One connection to one server. Calls may be issued from any thread and
// complete in whatever order the server answers them.
class client final : safe_noncopyable {
public:
    explicit client(option opt = default_option(), codec_registry codecs = make_default_codec_registry())
        : option_{std::move(opt)},
          codecs_{std::move(codecs)},
          engine_work_{std::make_unique<boost::asio::io_service::work>(engine_)},
          socket_{engine_} {
        engine_thread_ = std::thread{[this]() { engine_.run(); }};
    }

    ~client() {
        close();
        engine_work_.reset();
        engine_.stop();
        if (engine_thread_.joinable() && engine_thread_.get_id() != std::this_thread::get_id()) {
            engine_thread_.join();
        } else if (engine_thread_.joinable()) {
            engine_thread_.detach();
        }
        // the engine is stopped, nothing else can complete these
        terminate(errc::shutdown);
    }

    // address is "tcp@host:port" or "host:port"
    static std::shared_ptr<client> dial(const std::string& address, boost::system::error_code& ec,
                                        option opt = default_option(),
                                        codec_registry codecs = make_default_codec_registry()) {
        auto c = std::make_shared<client>(std::move(opt), std::move(codecs));
        c->connect(address, ec);
        if (ec) {
            detail::logger()->error("rpc client: dial {} error: {}", address, ec.message());
            return nullptr;
        }
        return c;
    }

    static std::shared_ptr<client> dial(const std::string& address, option opt = default_option(),
                                        codec_registry codecs = make_default_codec_registry()) {
        boost::system::error_code code;
        auto c = dial(address, code, std::move(opt), std::move(codecs));
        if (code) {
            throw boost::system::system_error{code, "rpc client: dial " + address};
        }
        return c;
    }

    bool available() const noexcept {
        return available_;
    }

    // pending calls fail with "connection is shut down" once the stream is released
    void close() {
        available_ = false;
        std::shared_ptr<codec> c;
        SCOPE_BLOCK {
            std::unique_lock<std::mutex> lock{codec_mutex_};
            c = codec_;
        }
        if (c) {
            c->close();
        }
    }

    // blocks for the reply; throws invoke_exception on a remote error or when timeout (if any) elapses
    template <typename _Reply, typename _Arg>
    void call(const std::string& service_method, const _Arg& args, _Reply& reply,
              std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) {
        auto promise = std::make_shared<std::promise<_Reply>>();
        auto result = promise->get_future();
        const auto seq = start<_Reply>(service_method, args, [promise](const std::string& error, _Reply&& r) {
            if (error.empty()) {
                promise->set_value(std::move(r));
            } else {
                promise->set_exception(std::make_exception_ptr(invoke_exception{error}));
            }
        });

        if (timeout.count() > 0 && result.wait_for(timeout) == std::future_status::timeout) {
            forget(seq);
            throw invoke_exception{"rpc client: call failed: deadline exceeded after " +
                                   detail::utils::format_duration(timeout)};
        }
        reply = result.get();
    }

    template <typename _Reply, typename _Arg>
    _Reply call(const std::string& service_method, const _Arg& args,
                std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) {
        _Reply reply{};
        call(service_method, args, reply, timeout);
        return reply;
    }

    // func is use_std_future (returns std::future<_Reply>) or a callable taking
    // (const std::string& error, _Reply&& reply); an empty error is success
    template <typename _Reply, typename _Arg, typename _Func>
    auto async_call(const std::string& service_method, const _Arg& args, _Func&& func) {
        using adapter_type = detail::callback_adapter<std::decay_t<_Func>, void(const std::string&, _Reply)>;
        auto adapter = adapter_type::traits(std::forward<_Func>(func));
        start<_Reply>(service_method, args, std::move(std::get<0>(adapter)));
        return std::get<1>(adapter).get();
    }

protected:
    struct pending_call final {
        std::unique_ptr<value> reply;
        // reply == nullptr on failure
        std::function<void(const std::string& error, value* reply)> done;
    };

    void connect(const std::string& address, boost::system::error_code& ec) {
        std::string protocol;
        std::string host;
        std::string port;
        if (!detail::utils::split_address(address, protocol, host, port)) {
            ec = errc::invalid_address;
            return;
        }
        if (protocol != "tcp") {
            ec = errc::unsupported_protocol;
            return;
        }
        if (!codecs_.contains(option_.codec_type)) {
            ec = errc::unsupported_codec;
            return;
        }

        boost::asio::ip::tcp::resolver resolver{engine_};
        const auto endpoints = resolver.resolve(boost::asio::ip::tcp::resolver::query{host, port}, ec);
        if (ec) {
            return;
        }

        ec = wait_connect(endpoints);
        if (ec) {
            return;
        }

        socket_.set_option(boost::asio::ip::tcp::no_delay{true}, ec);
        boost::asio::write(socket_, boost::asio::buffer(detail::encode_option(option_)), ec);
        if (ec) {
            return;
        }

        auto c = codecs_.make(option_.codec_type, std::move(socket_), ec);
        if (ec) {
            return;
        }
        SCOPE_BLOCK {
            std::unique_lock<std::mutex> lock{codec_mutex_};
            codec_ = std::move(c);
        }
        available_ = true;
        boost::asio::post(engine_, [this]() { do_receive(); });
    }

    template <typename _Endpoints>
    boost::system::error_code wait_connect(const _Endpoints& endpoints) {
        auto connected = std::make_shared<std::promise<boost::system::error_code>>();
        // both handlers run on the engine thread
        auto finished = std::make_shared<bool>(false);
        auto timed_out = std::make_shared<bool>(false);
        auto result = connected->get_future();

        boost::asio::steady_timer timer{engine_};
        const auto timeout = option_.connect_timeout;
        if (timeout.count() > 0) {
            timer.expires_from_now(timeout);
            timer.async_wait([this, finished, timed_out](boost::system::error_code code) {
                if (!code && !*finished) {
                    *timed_out = true;
                    boost::system::error_code ignored;
                    socket_.close(ignored);
                }
            });
        }

        boost::asio::async_connect(
            socket_, endpoints,
            [connected, finished, timed_out, &timer](boost::system::error_code code,
                                                     const boost::asio::ip::tcp::endpoint&) {
                *finished = true;
                timer.cancel();
                connected->set_value(*timed_out ? make_error_code(errc::connect_timeout) : code);
            });

        return result.get();
    }

    template <typename _Reply, typename _Arg, typename _Callback>
    std::uint64_t start(const std::string& service_method, const _Arg& args, _Callback&& callback) {
        auto pending = std::make_shared<pending_call>();
        pending->reply = std::make_unique<typed_value<_Reply>>();
        pending->done = [callback = std::forward<_Callback>(callback)](const std::string& error,
                                                                       value* reply) mutable {
            if (reply == nullptr) {
                callback(error.empty() ? std::string{"rpc client: invoke error"} : error, _Reply{});
                return;
            }
            callback(error, std::move(static_cast<typed_value<_Reply>*>(reply)->get()));
        };

        std::shared_ptr<codec> c;
        SCOPE_BLOCK {
            std::unique_lock<std::mutex> lock{codec_mutex_};
            c = codec_;
        }
        if (!available_ || !c) {
            pending->done("rpc client: " + make_error_code(errc::shutdown).message(), nullptr);
            return 0;
        }

        const std::uint64_t seq{seq_++};
        SCOPE_BLOCK {
            std::unique_lock<std::mutex> lock{pending_mutex_};
            pending_.emplace(seq, pending);
        }
        // lost the race with terminate(), nobody else will complete it
        if (!available_) {
            if (auto lost = take(seq)) {
                lost->done("rpc client: " + make_error_code(errc::shutdown).message(), nullptr);
            }
            return seq;
        }

        header h;
        h.service_method = service_method;
        h.seq = seq;
        c->write(h, typed_value<_Arg>{args});
        return seq;
    }

    std::shared_ptr<pending_call> take(std::uint64_t seq) {
        std::unique_lock<std::mutex> lock{pending_mutex_};
        const auto it = pending_.find(seq);
        if (it == pending_.end()) {
            return nullptr;
        }
        auto pending = std::move(it->second);
        pending_.erase(it);
        return pending;
    }

    // a late reply to a forgotten call is read and dropped
    void forget(std::uint64_t seq) {
        take(seq);
    }

    void do_receive() {
        auto h = std::make_shared<header>();
        codec_->async_read_header(*h, [this, h](boost::system::error_code code) {
            if (code) {
                terminate(code);
                return;
            }

            auto pending = take(h->seq);
            if (!pending) {
                codec_->async_read_body(nullptr, [this](boost::system::error_code code) {
                    if (code) {
                        terminate(code);
                        return;
                    }
                    do_receive();
                });
                return;
            }

            if (!h->error.empty()) {
                codec_->async_read_body(nullptr, [this, h, pending](boost::system::error_code code) {
                    pending->done(h->error, nullptr);
                    if (code) {
                        terminate(code);
                        return;
                    }
                    do_receive();
                });
                return;
            }

            codec_->async_read_body(pending->reply.get(), [this, pending](boost::system::error_code code) {
                if (code == errc::invalid_body) {
                    pending->done("rpc client: reading body " + code.message(), nullptr);
                    do_receive();
                    return;
                }
                if (code) {
                    pending->done("rpc client: reading body " + code.message(), nullptr);
                    terminate(code);
                    return;
                }
                pending->done({}, pending->reply.get());
                do_receive();
            });
        });
    }

    // fails every outstanding call
    void terminate(boost::system::error_code code) {
        available_ = false;
        std::unordered_map<std::uint64_t, std::shared_ptr<pending_call>> pending;
        SCOPE_BLOCK {
            std::unique_lock<std::mutex> lock{pending_mutex_};
            pending.swap(pending_);
        }
        if (pending.empty()) {
            return;
        }

        const auto message = (code == boost::asio::error::eof || code == boost::asio::error::operation_aborted ||
                              code == errc::shutdown)
                                 ? std::string{"rpc client: "} + make_error_code(errc::shutdown).message()
                                 : "rpc client: " + code.message();
        for (auto& p : pending) {
            p.second->done(message, nullptr);
        }
    }

    option option_;
    codec_registry codecs_;
    boost::asio::io_service engine_;
    std::unique_ptr<boost::asio::io_service::work> engine_work_;
    detail::tcp_socket socket_;
    std::thread engine_thread_;
    std::shared_ptr<codec> codec_;
    std::mutex codec_mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<pending_call>> pending_;
    std::mutex pending_mutex_;
    std::atomic<std::uint64_t> seq_{1};
    std::atomic_bool available_{false};
};

} // namespace rpc
} // namespace lark

#endif // LARKRPC_CLIENT_HPP_
