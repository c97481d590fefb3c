#include "untrustended/decode/integers.hpp"

#include <bit>

namespace untrustended::decode {
namespace {

// 两个等宽的半字拼成一个整数：大端先读高半部分，小端先读低半部分。
template <class Wide, class Half>
std::error_code compose_be(Reader& r, Wide& out) noexcept {
  Half high = 0;
  auto ec = OrderedDecoder<Half>::read_be(r, high);
  if (ec) {
    return ec;
  }
  Half low = 0;
  ec = OrderedDecoder<Half>::read_be(r, low);
  if (ec) {
    return ec;
  }
  out = static_cast<Wide>((static_cast<Wide>(high) << (8 * sizeof(Half))) | static_cast<Wide>(low));
  return {};
}

template <class Wide, class Half>
std::error_code compose_le(Reader& r, Wide& out) noexcept {
  Half low = 0;
  auto ec = OrderedDecoder<Half>::read_le(r, low);
  if (ec) {
    return ec;
  }
  Half high = 0;
  ec = OrderedDecoder<Half>::read_le(r, high);
  if (ec) {
    return ec;
  }
  out = static_cast<Wide>((static_cast<Wide>(high) << (8 * sizeof(Half))) | static_cast<Wide>(low));
  return {};
}

// 有符号 = 同宽度无符号的位模式重新解释（不做第二套实现）。
template <class Signed, class Unsigned>
std::error_code reinterpret_be(Reader& r, Signed& out) noexcept {
  static_assert(sizeof(Signed) == sizeof(Unsigned));
  Unsigned bits = 0;
  auto ec = OrderedDecoder<Unsigned>::read_be(r, bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<Signed>(bits);
  return {};
}

template <class Signed, class Unsigned>
std::error_code reinterpret_le(Reader& r, Signed& out) noexcept {
  static_assert(sizeof(Signed) == sizeof(Unsigned));
  Unsigned bits = 0;
  auto ec = OrderedDecoder<Unsigned>::read_le(r, bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<Signed>(bits);
  return {};
}

// 低 24/48 位的补码符号扩展（依赖 C++20 规定的算术右移）。
constexpr std::int32_t sign_extend_24(std::uint32_t bits) noexcept {
  return static_cast<std::int32_t>(bits << 8) >> 8;
}

constexpr std::int64_t sign_extend_48(std::uint64_t bits) noexcept {
  return static_cast<std::int64_t>(bits << 16) >> 16;
}

}  // namespace

std::error_code OrderedDecoder<std::uint8_t>::read_be(Reader& r, std::uint8_t& out) noexcept {
  core::byte b = 0;
  auto ec = r.read_byte(b);
  if (ec) {
    return core::from_input_error(ec);
  }
  out = b;
  return {};
}

std::error_code OrderedDecoder<std::int8_t>::read_be(Reader& r, std::int8_t& out) noexcept {
  return reinterpret_be<std::int8_t, std::uint8_t>(r, out);
}

std::error_code OrderedDecoder<std::uint16_t>::read_be(Reader& r, std::uint16_t& out) noexcept {
  return compose_be<std::uint16_t, std::uint8_t>(r, out);
}

std::error_code OrderedDecoder<std::uint16_t>::read_le(Reader& r, std::uint16_t& out) noexcept {
  return compose_le<std::uint16_t, std::uint8_t>(r, out);
}

std::error_code OrderedDecoder<std::int16_t>::read_be(Reader& r, std::int16_t& out) noexcept {
  return reinterpret_be<std::int16_t, std::uint16_t>(r, out);
}

std::error_code OrderedDecoder<std::int16_t>::read_le(Reader& r, std::int16_t& out) noexcept {
  return reinterpret_le<std::int16_t, std::uint16_t>(r, out);
}

std::error_code OrderedDecoder<std::uint32_t>::read_be(Reader& r, std::uint32_t& out) noexcept {
  return compose_be<std::uint32_t, std::uint16_t>(r, out);
}

std::error_code OrderedDecoder<std::uint32_t>::read_le(Reader& r, std::uint32_t& out) noexcept {
  return compose_le<std::uint32_t, std::uint16_t>(r, out);
}

std::error_code OrderedDecoder<std::int32_t>::read_be(Reader& r, std::int32_t& out) noexcept {
  return reinterpret_be<std::int32_t, std::uint32_t>(r, out);
}

std::error_code OrderedDecoder<std::int32_t>::read_le(Reader& r, std::int32_t& out) noexcept {
  return reinterpret_le<std::int32_t, std::uint32_t>(r, out);
}

std::error_code OrderedDecoder<std::uint64_t>::read_be(Reader& r, std::uint64_t& out) noexcept {
  return compose_be<std::uint64_t, std::uint32_t>(r, out);
}

std::error_code OrderedDecoder<std::uint64_t>::read_le(Reader& r, std::uint64_t& out) noexcept {
  return compose_le<std::uint64_t, std::uint32_t>(r, out);
}

std::error_code OrderedDecoder<std::int64_t>::read_be(Reader& r, std::int64_t& out) noexcept {
  return reinterpret_be<std::int64_t, std::uint64_t>(r, out);
}

std::error_code OrderedDecoder<std::int64_t>::read_le(Reader& r, std::int64_t& out) noexcept {
  return reinterpret_le<std::int64_t, std::uint64_t>(r, out);
}

std::error_code OrderedDecoder<uint128>::read_be(Reader& r, uint128& out) noexcept {
  return compose_be<uint128, std::uint64_t>(r, out);
}

std::error_code OrderedDecoder<uint128>::read_le(Reader& r, uint128& out) noexcept {
  return compose_le<uint128, std::uint64_t>(r, out);
}

std::error_code OrderedDecoder<int128>::read_be(Reader& r, int128& out) noexcept {
  return reinterpret_be<int128, uint128>(r, out);
}

std::error_code OrderedDecoder<int128>::read_le(Reader& r, int128& out) noexcept {
  return reinterpret_le<int128, uint128>(r, out);
}

// 24 = 16 + 8
std::error_code OrderedDecoder<u24>::read_be(Reader& r, u24& out) noexcept {
  std::uint16_t high = 0;
  auto ec = read_u16be(r, high);
  if (ec) {
    return ec;
  }
  std::uint8_t low = 0;
  ec = read_u8(r, low);
  if (ec) {
    return ec;
  }
  out.value = (static_cast<std::uint32_t>(high) << 8) | low;
  return {};
}

std::error_code OrderedDecoder<u24>::read_le(Reader& r, u24& out) noexcept {
  std::uint16_t low = 0;
  auto ec = read_u16le(r, low);
  if (ec) {
    return ec;
  }
  std::uint8_t high = 0;
  ec = read_u8(r, high);
  if (ec) {
    return ec;
  }
  out.value = (static_cast<std::uint32_t>(high) << 16) | low;
  return {};
}

std::error_code OrderedDecoder<i24>::read_be(Reader& r, i24& out) noexcept {
  u24 bits;
  auto ec = OrderedDecoder<u24>::read_be(r, bits);
  if (ec) {
    return ec;
  }
  out.value = sign_extend_24(bits.value);
  return {};
}

std::error_code OrderedDecoder<i24>::read_le(Reader& r, i24& out) noexcept {
  u24 bits;
  auto ec = OrderedDecoder<u24>::read_le(r, bits);
  if (ec) {
    return ec;
  }
  out.value = sign_extend_24(bits.value);
  return {};
}

// 48 = 32 + 16
std::error_code OrderedDecoder<u48>::read_be(Reader& r, u48& out) noexcept {
  std::uint32_t high = 0;
  auto ec = read_u32be(r, high);
  if (ec) {
    return ec;
  }
  std::uint16_t low = 0;
  ec = read_u16be(r, low);
  if (ec) {
    return ec;
  }
  out.value = (static_cast<std::uint64_t>(high) << 16) | low;
  return {};
}

std::error_code OrderedDecoder<u48>::read_le(Reader& r, u48& out) noexcept {
  std::uint32_t low = 0;
  auto ec = read_u32le(r, low);
  if (ec) {
    return ec;
  }
  std::uint16_t high = 0;
  ec = read_u16le(r, high);
  if (ec) {
    return ec;
  }
  out.value = (static_cast<std::uint64_t>(high) << 32) | low;
  return {};
}

std::error_code OrderedDecoder<i48>::read_be(Reader& r, i48& out) noexcept {
  u48 bits;
  auto ec = OrderedDecoder<u48>::read_be(r, bits);
  if (ec) {
    return ec;
  }
  out.value = sign_extend_48(bits.value);
  return {};
}

std::error_code OrderedDecoder<i48>::read_le(Reader& r, i48& out) noexcept {
  u48 bits;
  auto ec = OrderedDecoder<u48>::read_le(r, bits);
  if (ec) {
    return ec;
  }
  out.value = sign_extend_48(bits.value);
  return {};
}

}  // namespace untrustended::decode
