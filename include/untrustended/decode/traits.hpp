#pragma once

#include "untrustended/core/common.hpp"
#include "untrustended/core/error.hpp"
#include "untrustended/input/input.hpp"

#include <concepts>
#include <system_error>

namespace untrustended::decode {

using core::Order;
using input::Input;
using input::Reader;

/**
 * @brief 按字节序区分的类型解码器（扩展点，按类型特化）。
 *
 * 特化需要提供：
 * - static std::error_code read_be(Reader&, T&) noexcept;
 * - static std::error_code read_le(Reader&, T&) noexcept;
 *
 * 内置整数与地址类型也是本模板的特化，read_u16be 等具名函数只是转发。
 */
template <typename T>
struct OrderedDecoder;

/**
 * @brief 与字节序无关的类型解码器（扩展点，按类型特化）。
 *
 * 用于结构化记录（如 TLV），字段顺序由记录自身布局决定：
 * - static std::error_code read(Reader&, T&) noexcept;
 */
template <typename T>
struct Decoder;

template <typename T>
concept OrderedDecodable = requires(Reader& r, T& out) {
  { OrderedDecoder<T>::read_be(r, out) } -> std::same_as<std::error_code>;
  { OrderedDecoder<T>::read_le(r, out) } -> std::same_as<std::error_code>;
};

template <typename T>
concept Decodable = requires(Reader& r, T& out) {
  { Decoder<T>::read(r, out) } -> std::same_as<std::error_code>;
};

/**
 * @brief 读取一个 T。
 *
 * 成功时 out 被赋值、游标前进 T 编码所占字节数；失败时游标可能已前进
 * （不回退），调用方应放弃整个解析。内置特化在失败时不修改 out。
 */
template <OrderedDecodable T>
std::error_code read_be(Reader& r, T& out) noexcept {
  return OrderedDecoder<T>::read_be(r, out);
}

template <OrderedDecodable T>
std::error_code read_le(Reader& r, T& out) noexcept {
  return OrderedDecoder<T>::read_le(r, out);
}

template <OrderedDecodable T>
std::error_code read(Reader& r, Order order, T& out) noexcept {
  return order == Order::big ? OrderedDecoder<T>::read_be(r, out)
                             : OrderedDecoder<T>::read_le(r, out);
}

template <Decodable T>
std::error_code read(Reader& r, T& out) noexcept {
  return Decoder<T>::read(r, out);
}

/**
 * @brief 用 Decoder<T> 读完整个 input。
 *
 * 有剩余字节时返回 incomplete（默认 core::errc::unknown_error）。
 */
template <Decodable T>
std::error_code read_all(
  Input input,
  T& out,
  std::error_code incomplete = core::make_error_code(core::errc::unknown_error)) noexcept {
  return input.read_all(incomplete, [&out](Reader& r) { return Decoder<T>::read(r, out); });
}

}  // namespace untrustended::decode
