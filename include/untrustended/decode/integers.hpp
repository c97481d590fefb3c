#pragma once

#include "untrustended/decode/traits.hpp"

#include <cstdint>
#include <system_error>

namespace untrustended::decode {

using core::int128;
using core::uint128;

/*
 * 定宽整数解码。
 *
 * - 大端：先读到的字节是最高位；小端：先读到的字节是最低位；
 * - 宽度由更窄的读取移位相加组合而成（16=8+8, 24=16+8, 32=16+16, 48=32+16,
 *   64=32+32, 128=64+64），任何一次子读取失败立即返回 end_of_input，
 *   已消耗的字节不回退；
 * - 有符号值 = 同宽度无符号值按补码重新解释；24/48 位符号扩展到 32/64 位。
 */

template <>
struct OrderedDecoder<std::uint8_t> {
  static std::error_code read_be(Reader& r, std::uint8_t& out) noexcept;
  static std::error_code read_le(Reader& r, std::uint8_t& out) noexcept { return read_be(r, out); }
};

template <>
struct OrderedDecoder<std::int8_t> {
  static std::error_code read_be(Reader& r, std::int8_t& out) noexcept;
  static std::error_code read_le(Reader& r, std::int8_t& out) noexcept { return read_be(r, out); }
};

template <>
struct OrderedDecoder<std::uint16_t> {
  static std::error_code read_be(Reader& r, std::uint16_t& out) noexcept;
  static std::error_code read_le(Reader& r, std::uint16_t& out) noexcept;
};

template <>
struct OrderedDecoder<std::int16_t> {
  static std::error_code read_be(Reader& r, std::int16_t& out) noexcept;
  static std::error_code read_le(Reader& r, std::int16_t& out) noexcept;
};

template <>
struct OrderedDecoder<std::uint32_t> {
  static std::error_code read_be(Reader& r, std::uint32_t& out) noexcept;
  static std::error_code read_le(Reader& r, std::uint32_t& out) noexcept;
};

template <>
struct OrderedDecoder<std::int32_t> {
  static std::error_code read_be(Reader& r, std::int32_t& out) noexcept;
  static std::error_code read_le(Reader& r, std::int32_t& out) noexcept;
};

template <>
struct OrderedDecoder<std::uint64_t> {
  static std::error_code read_be(Reader& r, std::uint64_t& out) noexcept;
  static std::error_code read_le(Reader& r, std::uint64_t& out) noexcept;
};

template <>
struct OrderedDecoder<std::int64_t> {
  static std::error_code read_be(Reader& r, std::int64_t& out) noexcept;
  static std::error_code read_le(Reader& r, std::int64_t& out) noexcept;
};

template <>
struct OrderedDecoder<uint128> {
  static std::error_code read_be(Reader& r, uint128& out) noexcept;
  static std::error_code read_le(Reader& r, uint128& out) noexcept;
};

template <>
struct OrderedDecoder<int128> {
  static std::error_code read_be(Reader& r, int128& out) noexcept;
  static std::error_code read_le(Reader& r, int128& out) noexcept;
};

// 24/48 位没有对应的原生类型：用载体类型接入 OrderedDecoder，
// 取值放在更宽的整数里（有符号版本已做符号扩展）。
struct u24 {
  std::uint32_t value{0};
};
struct i24 {
  std::int32_t value{0};
};
struct u48 {
  std::uint64_t value{0};
};
struct i48 {
  std::int64_t value{0};
};

template <>
struct OrderedDecoder<u24> {
  static std::error_code read_be(Reader& r, u24& out) noexcept;
  static std::error_code read_le(Reader& r, u24& out) noexcept;
};

template <>
struct OrderedDecoder<i24> {
  static std::error_code read_be(Reader& r, i24& out) noexcept;
  static std::error_code read_le(Reader& r, i24& out) noexcept;
};

template <>
struct OrderedDecoder<u48> {
  static std::error_code read_be(Reader& r, u48& out) noexcept;
  static std::error_code read_le(Reader& r, u48& out) noexcept;
};

template <>
struct OrderedDecoder<i48> {
  static std::error_code read_be(Reader& r, i48& out) noexcept;
  static std::error_code read_le(Reader& r, i48& out) noexcept;
};

namespace detail {

template <class Carrier, class Value>
std::error_code read_carried(Reader& r, Order order, Value& out) noexcept {
  Carrier c;
  auto ec = order == Order::big ? OrderedDecoder<Carrier>::read_be(r, c)
                                : OrderedDecoder<Carrier>::read_le(r, c);
  if (ec) {
    return ec;
  }
  out = c.value;
  return {};
}

}  // namespace detail

// 8 位：只有一种字节序。
inline std::error_code read_u8(Reader& r, std::uint8_t& out) noexcept {
  return OrderedDecoder<std::uint8_t>::read_be(r, out);
}
inline std::error_code read_i8(Reader& r, std::int8_t& out) noexcept {
  return OrderedDecoder<std::int8_t>::read_be(r, out);
}

inline std::error_code read_u16be(Reader& r, std::uint16_t& out) noexcept {
  return OrderedDecoder<std::uint16_t>::read_be(r, out);
}
inline std::error_code read_u16le(Reader& r, std::uint16_t& out) noexcept {
  return OrderedDecoder<std::uint16_t>::read_le(r, out);
}
inline std::error_code read_i16be(Reader& r, std::int16_t& out) noexcept {
  return OrderedDecoder<std::int16_t>::read_be(r, out);
}
inline std::error_code read_i16le(Reader& r, std::int16_t& out) noexcept {
  return OrderedDecoder<std::int16_t>::read_le(r, out);
}

// 24 位：固定消耗 3 字节。
inline std::error_code read_u24be(Reader& r, std::uint32_t& out) noexcept {
  return detail::read_carried<u24>(r, Order::big, out);
}
inline std::error_code read_u24le(Reader& r, std::uint32_t& out) noexcept {
  return detail::read_carried<u24>(r, Order::little, out);
}
inline std::error_code read_i24be(Reader& r, std::int32_t& out) noexcept {
  return detail::read_carried<i24>(r, Order::big, out);
}
inline std::error_code read_i24le(Reader& r, std::int32_t& out) noexcept {
  return detail::read_carried<i24>(r, Order::little, out);
}

inline std::error_code read_u32be(Reader& r, std::uint32_t& out) noexcept {
  return OrderedDecoder<std::uint32_t>::read_be(r, out);
}
inline std::error_code read_u32le(Reader& r, std::uint32_t& out) noexcept {
  return OrderedDecoder<std::uint32_t>::read_le(r, out);
}
inline std::error_code read_i32be(Reader& r, std::int32_t& out) noexcept {
  return OrderedDecoder<std::int32_t>::read_be(r, out);
}
inline std::error_code read_i32le(Reader& r, std::int32_t& out) noexcept {
  return OrderedDecoder<std::int32_t>::read_le(r, out);
}

// 48 位：固定消耗 6 字节。
inline std::error_code read_u48be(Reader& r, std::uint64_t& out) noexcept {
  return detail::read_carried<u48>(r, Order::big, out);
}
inline std::error_code read_u48le(Reader& r, std::uint64_t& out) noexcept {
  return detail::read_carried<u48>(r, Order::little, out);
}
inline std::error_code read_i48be(Reader& r, std::int64_t& out) noexcept {
  return detail::read_carried<i48>(r, Order::big, out);
}
inline std::error_code read_i48le(Reader& r, std::int64_t& out) noexcept {
  return detail::read_carried<i48>(r, Order::little, out);
}

inline std::error_code read_u64be(Reader& r, std::uint64_t& out) noexcept {
  return OrderedDecoder<std::uint64_t>::read_be(r, out);
}
inline std::error_code read_u64le(Reader& r, std::uint64_t& out) noexcept {
  return OrderedDecoder<std::uint64_t>::read_le(r, out);
}
inline std::error_code read_i64be(Reader& r, std::int64_t& out) noexcept {
  return OrderedDecoder<std::int64_t>::read_be(r, out);
}
inline std::error_code read_i64le(Reader& r, std::int64_t& out) noexcept {
  return OrderedDecoder<std::int64_t>::read_le(r, out);
}

inline std::error_code read_u128be(Reader& r, uint128& out) noexcept {
  return OrderedDecoder<uint128>::read_be(r, out);
}
inline std::error_code read_u128le(Reader& r, uint128& out) noexcept {
  return OrderedDecoder<uint128>::read_le(r, out);
}
inline std::error_code read_i128be(Reader& r, int128& out) noexcept {
  return OrderedDecoder<int128>::read_be(r, out);
}
inline std::error_code read_i128le(Reader& r, int128& out) noexcept {
  return OrderedDecoder<int128>::read_le(r, out);
}

}  // namespace untrustended::decode
