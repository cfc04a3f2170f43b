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

#ifndef LARKRPC_CODEC_HPP_
#define LARKRPC_CODEC_HPP_

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <msgpack.hpp>

#include "larkrpc/detail/common.hpp"
#include "larkrpc/detail/noncopyable.hpp"
#include "larkrpc/detail/protocol.hpp"

namespace lark {
namespace rpc {

// A type-erased argument or reply slot. The codec reads a body into one and
// writes one out; the concrete type is fixed by the method entry that created it.
class value {
public:
    virtual ~value() = default;

    virtual void pack(msgpack::packer<msgpack::sbuffer>& packer) const = 0;
    virtual void unpack(const msgpack::object& object) = 0;
};

template <typename _Ty>
class typed_value final : public value {
public:
    typed_value() = default;

    explicit typed_value(_Ty v) : value_{std::move(v)} {
    }

    void pack(msgpack::packer<msgpack::sbuffer>& packer) const override {
        packer.pack(value_);
    }

    void unpack(const msgpack::object& object) override {
        object.convert(value_);
    }

    _Ty& get() noexcept {
        return value_;
    }

    const _Ty& get() const noexcept {
        return value_;
    }

private:
    _Ty value_{};
};

// placeholder body of error responses
class nil_value final : public value {
public:
    void pack(msgpack::packer<msgpack::sbuffer>& packer) const override {
        packer.pack_nil();
    }

    void unpack(const msgpack::object&) override {
    }
};

// Message reader/writer bound to one connection. Reads are issued by one
// reader at a time; write() may be called from any thread and sends each
// header+body pair as one uninterrupted message.
class codec : safe_noncopyable {
public:
    using read_handler = std::function<void(boost::system::error_code)>;

    virtual ~codec() = default;

    // eof on a clean end of stream, errc::malformed_message on bad data
    virtual void async_read_header(header& h, read_handler handler) = 0;
    // body == nullptr discards the body, errc::invalid_body when it does not convert
    virtual void async_read_body(value* body, read_handler handler) = 0;
    virtual void write(const header& h, const value& body) = 0;
    // releases the stream once queued writes are flushed
    virtual void close() = 0;
};

using codec_factory = std::function<std::shared_ptr<codec>(detail::tcp_socket&&)>;

class codec_registry final {
public:
    codec_registry() = default;

    template <typename _Tag>
    codec_registry& add(_Tag&& tag, codec_factory factory) {
        factories_[std::string{std::forward<_Tag>(tag)}] = std::move(factory);
        return *this;
    }

    bool contains(const std::string& tag) const {
        return factories_.find(tag) != factories_.end();
    }

    std::shared_ptr<codec> make(const std::string& tag, detail::tcp_socket&& socket,
                                boost::system::error_code& ec) const {
        const auto it = factories_.find(tag);
        if (it == factories_.end()) {
            ec = errc::unsupported_codec;
            return nullptr;
        }
        ec = {};
        return it->second(std::move(socket));
    }

private:
    std::unordered_map<std::string, codec_factory> factories_;
};

} // namespace rpc
} // namespace lark

#endif // LARKRPC_CODEC_HPP_
