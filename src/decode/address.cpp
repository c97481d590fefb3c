#include "untrustended/decode/address.hpp"

#include "untrustended/decode/integers.hpp"

#include <cstddef>

namespace untrustended::decode {
namespace {

asio::ip::address_v6 make_v6(uint128 bits) noexcept {
  asio::ip::address_v6::bytes_type octets{};
  for (std::size_t i = 0; i < octets.size(); ++i) {
    const auto shift = static_cast<unsigned>(8u * (octets.size() - 1u - i));
    octets[i] = static_cast<unsigned char>((bits >> shift) & 0xFFu);
  }
  return asio::ip::address_v6(octets);
}

}  // namespace

std::error_code OrderedDecoder<asio::ip::address_v4>::read_be(Reader& r, asio::ip::address_v4& out) noexcept {
  std::uint32_t bits = 0;
  auto ec = read_u32be(r, bits);
  if (ec) {
    return ec;
  }
  out = asio::ip::address_v4(bits);
  return {};
}

std::error_code OrderedDecoder<asio::ip::address_v4>::read_le(Reader& r, asio::ip::address_v4& out) noexcept {
  std::uint32_t bits = 0;
  auto ec = read_u32le(r, bits);
  if (ec) {
    return ec;
  }
  out = asio::ip::address_v4(bits);
  return {};
}

std::error_code OrderedDecoder<asio::ip::address_v6>::read_be(Reader& r, asio::ip::address_v6& out) noexcept {
  uint128 bits = 0;
  auto ec = read_u128be(r, bits);
  if (ec) {
    return ec;
  }
  out = make_v6(bits);
  return {};
}

std::error_code OrderedDecoder<asio::ip::address_v6>::read_le(Reader& r, asio::ip::address_v6& out) noexcept {
  uint128 bits = 0;
  auto ec = read_u128le(r, bits);
  if (ec) {
    return ec;
  }
  out = make_v6(bits);
  return {};
}

}  // namespace untrustended::decode
