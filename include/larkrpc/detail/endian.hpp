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

#ifndef LARKRPC_ENDIAN_HPP_
#define LARKRPC_ENDIAN_HPP_

#include <type_traits>
#include <boost/endian/conversion.hpp>

namespace lark {
namespace rpc {
namespace detail {

template <typename _Ty, typename = std::enable_if_t<std::is_integral<_Ty>{}>>
inline _Ty to_be(_Ty value) noexcept {
    return boost::endian::native_to_big(value);
}

template <typename _Ty, typename = std::enable_if_t<std::is_integral<_Ty>{}>>
inline _Ty from_be(_Ty value) noexcept {
    return boost::endian::big_to_native(value);
}

} // namespace detail
} // namespace rpc
} // namespace lark

#endif // LARKRPC_ENDIAN_HPP_
