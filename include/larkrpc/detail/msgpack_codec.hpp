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

#ifndef LARKRPC_MSGPACK_CODEC_HPP_
#define LARKRPC_MSGPACK_CODEC_HPP_

#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <boost/asio.hpp>
#include <msgpack.hpp>

#include "larkrpc/codec.hpp"
#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/log.hpp"
#include "larkrpc/detail/protocol.hpp"

namespace lark {
namespace rpc {
namespace detail {

// header: [service_method, seq, error], body: the value itself
class msgpack_codec final : public codec, public std::enable_shared_from_this<msgpack_codec> {
public:
    explicit msgpack_codec(tcp_socket&& socket) noexcept : socket_{std::move(socket)} {
    }

    ~msgpack_codec() override = default;

    void async_read_header(header& h, read_handler handler) override {
        async_next([&h, handler = std::move(handler)](boost::system::error_code code, msgpack::object_handle&& handle) {
            if (code) {
                handler(code);
                return;
            }
            handler(decode_header(handle.get(), h));
        });
    }

    void async_read_body(value* body, read_handler handler) override {
        async_next([body, handler = std::move(handler)](boost::system::error_code code,
                                                         msgpack::object_handle&& handle) {
            if (code || body == nullptr) {
                handler(code);
                return;
            }
            try {
                body->unpack(handle.get());
            } catch (const std::exception& e) {
                logger()->debug("rpc codec: read body error: {}", e.what());
                handler(errc::invalid_body);
                return;
            }
            handler({});
        });
    }

    void write(const header& h, const value& body) override {
        msgpack::sbuffer buffer;
        msgpack::packer<msgpack::sbuffer> packer{buffer};
        packer.pack_array(3);
        packer.pack(h.service_method);
        packer.pack(h.seq);
        packer.pack(h.error);
        body.pack(packer);

        std::unique_lock<std::mutex> lock{write_queue_mutex_};
        if (closing_) {
            return;
        }
        write_queue_.emplace(buffer.data(), buffer.size());

        if (write_queue_.size() == 1) {
            lock.unlock();
            boost::asio::post(socket_.get_executor(), [this, self = shared_from_this()]() { do_write(); });
        }
    }

    void close() override {
        std::unique_lock<std::mutex> lock{write_queue_mutex_};
        if (closing_) {
            return;
        }
        closing_ = true;

        if (write_queue_.empty()) {
            lock.unlock();
            boost::asio::post(socket_.get_executor(), [this, self = shared_from_this()]() { close_socket(); });
        }
    }

private:
    using object_handler = std::function<void(boost::system::error_code, msgpack::object_handle&&)>;

    static boost::system::error_code decode_header(const msgpack::object& object, header& h) {
        if (object.type != msgpack::type::ARRAY || object.via.array.size != 3) {
            return errc::malformed_message;
        }
        try {
            object.via.array.ptr[0].convert(h.service_method);
            object.via.array.ptr[1].convert(h.seq);
            object.via.array.ptr[2].convert(h.error);
        } catch (const msgpack::type_error&) {
            return errc::malformed_message;
        }
        return {};
    }

    void async_next(object_handler handler) {
        auto handle = std::make_shared<msgpack::object_handle>();
        try {
            if (unpacker_.next(*handle)) {
                boost::asio::post(socket_.get_executor(),
                                  [self = shared_from_this(), handler = std::move(handler), handle]() {
                                      handler({}, std::move(*handle));
                                  });
                return;
            }
        } catch (const msgpack::unpack_error& e) {
            logger()->error("rpc codec: malformed message: {}", e.what());
            boost::asio::post(socket_.get_executor(), [self = shared_from_this(), handler = std::move(handler)]() {
                handler(errc::malformed_message, msgpack::object_handle{});
            });
            return;
        }

        unpacker_.reserve_buffer(read_buffer_size_);
        socket_.async_read_some(
            boost::asio::buffer(unpacker_.buffer(), unpacker_.buffer_capacity()),
            [this, self = shared_from_this(), handler = std::move(handler)](boost::system::error_code code,
                                                                           std::size_t bytes_transferred) mutable {
                if (code) {
                    // a partial object cut by the end of stream is not a clean eof
                    if (code == boost::asio::error::eof && unpacker_.nonparsed_size() > 0) {
                        code = errc::malformed_message;
                    }
                    handler(code, msgpack::object_handle{});
                    return;
                }

                unpacker_.buffer_consumed(bytes_transferred);
                async_next(std::move(handler));
            });
    }

    void do_write() {
        auto& buffer = get_buffer();
        boost::asio::async_write(
            socket_, boost::asio::buffer(buffer),
            [this, self = shared_from_this()](boost::system::error_code code, std::size_t bytes_transferred) {
                if (code) {
                    logger()->warn("rpc codec: write error: {}", code.message());
                    SCOPE_BLOCK {
                        std::unique_lock<std::mutex> lock{write_queue_mutex_};
                        closing_ = true;
                        write_queue_ = {};
                    }
                    close_socket();
                    return;
                }

                std::unique_lock<std::mutex> lock{write_queue_mutex_};
                write_queue_.pop();
                if (!write_queue_.empty()) {
                    lock.unlock();
                    do_write();
                } else if (closing_) {
                    lock.unlock();
                    close_socket();
                }
            });
    }

    std::string& get_buffer() {
        std::unique_lock<std::mutex> lock{write_queue_mutex_};
        return write_queue_.front();
    }

    void close_socket() {
        boost::system::error_code code;
        socket_.shutdown(tcp_socket::shutdown_both, code);
        socket_.close(code);
    }

    tcp_socket socket_;
    msgpack::unpacker unpacker_;
    const std::size_t read_buffer_size_{8192};
    std::queue<std::string> write_queue_;
    std::mutex write_queue_mutex_;
    bool closing_{false};
};

} // namespace detail

inline codec_registry make_default_codec_registry() {
    codec_registry registry;
    registry.add(codec_type::msgpack, [](detail::tcp_socket&& socket) -> std::shared_ptr<codec> {
        return std::make_shared<detail::msgpack_codec>(std::move(socket));
    });
    return registry;
}

} // namespace rpc
} // namespace lark

#endif // LARKRPC_MSGPACK_CODEC_HPP_
