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

#ifndef LARKRPC_REGISTRY_HPP_
#define LARKRPC_REGISTRY_HPP_

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/engines.hpp"
#include "larkrpc/detail/http.hpp"
#include "larkrpc/detail/log.hpp"
#include "larkrpc/detail/noncopyable.hpp"

namespace lark {
namespace rpc {

constexpr const char* default_registry_path{"/_larkrpc_/registry"};
constexpr std::chrono::minutes default_registry_timeout{5};
// GET response header, comma separated alive addresses
constexpr const char* servers_field{"X-Larkrpc-Servers"};
// POST request header, the address sending the heartbeat
constexpr const char* server_field{"X-Larkrpc-Server"};

// address -> last heartbeat, expired entries are dropped when the alive list is read
class registry final : safe_noncopyable {
public:
    // timeout == 0 keeps every address forever
    explicit registry(std::chrono::milliseconds timeout = default_registry_timeout) noexcept : timeout_{timeout} {
    }

    void put_server(const std::string& address) {
        std::unique_lock<std::mutex> lock{servers_mutex_};
        servers_[address] = std::chrono::steady_clock::now();
    }

    // sorted
    std::vector<std::string> alive_servers() {
        std::vector<std::string> alive;
        const auto now = std::chrono::steady_clock::now();
        std::unique_lock<std::mutex> lock{servers_mutex_};
        for (auto it = servers_.begin(); it != servers_.end();) {
            if (timeout_.count() == 0 || it->second + timeout_ > now) {
                alive.emplace_back(it->first);
                ++it;
            } else {
                it = servers_.erase(it);
            }
        }
        return alive;
    }

    std::chrono::milliseconds timeout() const noexcept {
        return timeout_;
    }

private:
    std::chrono::milliseconds timeout_;
    std::map<std::string, std::chrono::steady_clock::time_point> servers_;
    std::mutex servers_mutex_;
};

namespace detail {

// one HTTP connection to the registry, keep-alive requests are served in turn
class registry_session final : public std::enable_shared_from_this<registry_session>, safe_noncopyable {
public:
    registry_session(std::shared_ptr<registry> reg, std::string path, boost::asio::io_service& engine)
        : registry_{std::move(reg)}, path_{std::move(path)}, stream_{engine} {
    }

    boost::beast::tcp_stream::socket_type& socket() noexcept {
        return stream_.socket();
    }

    void run() {
        do_read();
    }

private:
    void do_read() {
        request_ = {};
        stream_.expires_after(std::chrono::seconds{30});
        http::async_read(stream_, buffer_, request_,
                         [this, self = this->shared_from_this()](boost::system::error_code code, std::size_t) {
                             if (code == http::error::end_of_stream) {
                                 do_close();
                                 return;
                             }
                             if (code) {
                                 return;
                             }
                             do_write(handle());
                         });
    }

    std::shared_ptr<http_response> handle() {
        auto response = std::make_shared<http_response>();
        response->version(request_.version());
        response->keep_alive(request_.keep_alive());
        response->set(http::field::server, "larkrpc");

        auto target = to_string(request_.target());
        const auto query = target.find('?');
        if (query != std::string::npos) {
            target.resize(query);
        }

        if (target != path_) {
            response->result(http::status::not_found);
        } else if (request_.method() == http::verb::get) {
            response->result(http::status::ok);
            response->set(servers_field, boost::algorithm::join(registry_->alive_servers(), ","));
        } else if (request_.method() == http::verb::post) {
            auto address = to_string(request_[server_field]);
            boost::algorithm::trim(address);
            if (address.empty()) {
                response->result(http::status::internal_server_error);
            } else {
                registry_->put_server(address);
                response->result(http::status::ok);
                logger()->debug("rpc registry: heart beat from {}", address);
            }
        } else {
            response->result(http::status::method_not_allowed);
        }

        response->prepare_payload();
        return response;
    }

    void do_write(std::shared_ptr<http_response> response) {
        http::async_write(stream_, *response,
                          [this, self = this->shared_from_this(), response](boost::system::error_code code,
                                                                            std::size_t) {
                              if (code) {
                                  return;
                              }
                              if (response->need_eof()) {
                                  do_close();
                                  return;
                              }
                              do_read();
                          });
    }

    void do_close() {
        boost::system::error_code ignored;
        stream_.socket().shutdown(tcp_socket::shutdown_send, ignored);
    }

    std::shared_ptr<registry> registry_;
    std::string path_;
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
};

} // namespace detail

// serves a registry over HTTP at path
class registry_server final : safe_noncopyable {
public:
    explicit registry_server(std::shared_ptr<registry> reg = std::make_shared<registry>(),
                             std::string path = default_registry_path, std::size_t engine_count = 1)
        : registry_{std::move(reg)}, path_{std::move(path)}, engines_{engine_count} {
    }

    ~registry_server() {
        stop();
    }

    registry_server& listen(unsigned short port) {
        listen_impl(boost::asio::ip::tcp::resolver::query{std::to_string(port)});
        return *this;
    }

    template <typename _Host>
    registry_server& listen(unsigned short port, _Host&& host) {
        listen_impl(boost::asio::ip::tcp::resolver::query{std::forward<_Host>(host), std::to_string(port)});
        return *this;
    }

    boost::asio::ip::tcp::endpoint local_endpoint() const {
        return acceptor_->local_endpoint();
    }

    // "http://host:port/path"
    std::string url() const {
        const auto endpoint = local_endpoint();
        return "http://" + endpoint.address().to_string() + ":" + std::to_string(endpoint.port()) + path_;
    }

    const std::shared_ptr<registry>& get_registry() const noexcept {
        return registry_;
    }

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
    }

private:
    void listen_impl(boost::asio::ip::tcp::resolver::query&& query) {
        auto& engine = engines_.get();
        const boost::asio::ip::tcp::endpoint endpoint{*boost::asio::ip::tcp::resolver{engine}.resolve(query)};
        acceptor_ = std::make_shared<boost::asio::ip::tcp::acceptor>(engine);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address{true});
        acceptor_->bind(endpoint);
        acceptor_->listen();
        detail::logger()->info("rpc registry: serving {}", url());
        do_accept();
    }

    void do_accept() {
        auto session = std::make_shared<detail::registry_session>(registry_, path_, engines_.get());
        acceptor_->async_accept(session->socket(), [this, session](boost::system::error_code code) {
            if (!acceptor_->is_open()) {
                return;
            }

            if (!code) {
                session->run();
            } else {
                detail::logger()->error("rpc registry: accept error: {}", code.message());
            }

            do_accept();
        });
    }

    std::shared_ptr<registry> registry_;
    std::string path_;
    detail::engines engines_;
    std::shared_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
};

// Keeps one address alive in a registry: one heartbeat on start(), then one per period
// until a send fails or stop() is called.
class heartbeat final : safe_noncopyable {
public:
    // period == 0 means the default registry timeout minus one minute
    heartbeat(std::string registry_url, std::string address,
              std::chrono::milliseconds period = std::chrono::milliseconds{0})
        : registry_url_{std::move(registry_url)},
          address_{std::move(address)},
          period_{period.count() == 0 ? std::chrono::milliseconds{default_registry_timeout - std::chrono::minutes{1}}
                                     : period},
          timer_{engine_} {
    }

    ~heartbeat() {
        stop();
    }

    // the result of the first send; the loop only runs when it succeeded.
    // A running loop is left as it is.
    boost::system::error_code start() {
        std::unique_lock<std::mutex> lock{start_mutex_};
        if (running_) {
            return {};
        }
        // a loop that ended on its own or through stop()
        if (thread_.joinable()) {
            thread_.join();
        }
        engine_.reset();

        const auto code = send();
        if (code) {
            return code;
        }
        running_ = true;
        schedule();
        thread_ = std::thread{[this]() { engine_.run(); }};
        return {};
    }

    void stop() {
        std::unique_lock<std::mutex> lock{start_mutex_};
        running_ = false;
        engine_.stop();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        } else if (thread_.joinable()) {
            thread_.detach();
        }
    }

    bool running() const noexcept {
        return running_;
    }

    std::chrono::milliseconds period() const noexcept {
        return period_;
    }

    boost::system::error_code send() {
        detail::logger()->info("rpc server: send heart beat to registry {}", registry_url_);
        boost::system::error_code code;
        const auto response =
            detail::http_request(detail::http::verb::post, registry_url_, {{server_field, address_}}, code);
        if (!code && response.result() != detail::http::status::ok) {
            code = errc::registry_error;
        }
        if (code) {
            detail::logger()->error("rpc server: heart beat error: {}", code.message());
        }
        return code;
    }

private:
    void schedule() {
        timer_.expires_from_now(period_);
        timer_.async_wait([this](boost::system::error_code code) {
            if (code || !running_) {
                return;
            }
            if (send()) {
                running_ = false;
                return;
            }
            schedule();
        });
    }

    std::string registry_url_;
    std::string address_;
    std::chrono::milliseconds period_;
    boost::asio::io_service engine_;
    boost::asio::steady_timer timer_;
    std::thread thread_;
    std::mutex start_mutex_;
    std::atomic_bool running_{false};
};

} // namespace rpc
} // namespace lark

#endif // LARKRPC_REGISTRY_HPP_
