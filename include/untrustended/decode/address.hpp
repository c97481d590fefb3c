#pragma once

#include "untrustended/decode/traits.hpp"

#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

#include <system_error>

namespace untrustended::decode {

/*
 * 网络地址解码：纯粹是整数原语的组合，任何位模式都是合法地址，
 * 唯一的失败是 end_of_input。
 *
 * 地址在网络上总是大端；read_le 按小端整数解释（例如某些主机字节序日志格式）。
 */

template <>
struct OrderedDecoder<asio::ip::address_v4> {
  static std::error_code read_be(Reader& r, asio::ip::address_v4& out) noexcept;
  static std::error_code read_le(Reader& r, asio::ip::address_v4& out) noexcept;
};

template <>
struct OrderedDecoder<asio::ip::address_v6> {
  static std::error_code read_be(Reader& r, asio::ip::address_v6& out) noexcept;
  static std::error_code read_le(Reader& r, asio::ip::address_v6& out) noexcept;
};

// 4 字节，192.0.2.1 对应 C0 00 02 01。
inline std::error_code read_ipv4addr(Reader& r, asio::ip::address_v4& out) noexcept {
  return OrderedDecoder<asio::ip::address_v4>::read_be(r, out);
}

// 16 字节（8 组大端 16 位）。
inline std::error_code read_ipv6addr(Reader& r, asio::ip::address_v6& out) noexcept {
  return OrderedDecoder<asio::ip::address_v6>::read_be(r, out);
}

}  // namespace untrustended::decode
