#pragma once

#include "untrustended/core/common.hpp"

#include <cstddef>
#include <system_error>
#include <type_traits>

namespace untrustended::input {

using core::byte;
using core::bytes_view;

/**
 * @brief 游标层错误码：只有“输入耗尽”一种失败。
 */
enum class errc : int {
  ok = 0,
  end_of_input = 1,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

class Reader;

// 读取回调：接收 Reader&，返回 std::error_code。
template <class F>
concept ReadFn = std::is_invocable_r_v<std::error_code, F&, Reader&>;

namespace detail {
void log_incomplete(std::size_t consumed, bytes_view rest) noexcept;
}  // namespace detail

/**
 * @brief 不拥有内存的只读字节视图（不可信输入）。
 *
 * 注意：
 * - Input 只是 span；调用方必须保证底层内存在 Input、Reader 以及
 *   由其借出的视图（bytes_view/string_view）存活期间不被修改或释放。
 */
class Input final {
 public:
  constexpr Input() noexcept = default;
  constexpr explicit Input(bytes_view bytes) noexcept : bytes_(bytes) {}
  constexpr Input(const byte* data, std::size_t size) noexcept : bytes_(data, size) {}

  [[nodiscard]] constexpr std::size_t size() const noexcept { return bytes_.size(); }
  [[nodiscard]] constexpr bool empty() const noexcept { return bytes_.empty(); }
  [[nodiscard]] constexpr bytes_view as_bytes() const noexcept { return bytes_; }

  /**
   * @brief 用一个 Reader 读完整个输入。
   *
   * - fn 返回错误：原样返回该错误
   * - fn 成功但仍有剩余字节：返回 incomplete（调用方指定的“未读完”错误）
   */
  template <ReadFn F>
  std::error_code read_all(std::error_code incomplete, F&& fn) const;

 private:
  bytes_view bytes_{};
};

/**
 * @brief 单调前进的读游标。
 *
 * 约定：
 * - 位置始终在 [0, size] 内；成功读取精确前进所读字节数；从不后退；
 * - read_bytes/skip 失败时位置不变；
 * - 不做线程安全保证，同一时刻只能有一个持有者。
 */
class Reader final {
 public:
  explicit Reader(Input input) noexcept : in_(input.as_bytes()) {}

  [[nodiscard]] bool at_end() const noexcept { return pos_ == in_.size(); }
  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }

  // 下一个字节等于 b 时返回 true，不消耗输入。
  [[nodiscard]] bool peek(byte b) const noexcept;

  std::error_code read_byte(byte& out) noexcept;
  std::error_code read_bytes(std::size_t n, Input& out) noexcept;
  Input read_bytes_to_end() noexcept;

  std::error_code skip(std::size_t n) noexcept;
  void skip_to_end() noexcept;

  /**
   * @brief 执行 fn，并把 fn 消耗掉的那段输入作为子视图返回。
   *
   * fn 失败时返回其错误，out 不变（已消耗的字节不回退）。
   */
  template <ReadFn F>
  std::error_code read_partial(F&& fn, Input& out) {
    const auto start = pos_;
    std::error_code ec = fn(*this);
    if (ec) {
      return ec;
    }
    out = Input(in_.subspan(start, pos_ - start));
    return {};
  }

 private:
  bytes_view in_{};
  std::size_t pos_{0};
};

template <ReadFn F>
std::error_code Input::read_all(std::error_code incomplete, F&& fn) const {
  Reader r(*this);
  std::error_code ec = fn(r);
  if (ec) {
    return ec;
  }
  if (!r.at_end()) {
    detail::log_incomplete(r.consumed(), bytes_.subspan(r.consumed()));
    return incomplete;
  }
  return {};
}

}  // namespace untrustended::input

namespace std {
template <>
struct is_error_code_enum<untrustended::input::errc> : true_type {};
}  // namespace std
