#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace untrustended::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;

// 128 位整数使用编译器扩展（GCC/Clang）。
__extension__ typedef unsigned __int128 uint128;
__extension__ typedef __int128 int128;

/**
 * @brief 多字节整数的字节序。
 */
enum class Order : std::uint8_t {
    big = 0,
    little = 1,
};

// read_all 发现剩余字节时，debug 日志里最多 dump 的字节数。
inline constexpr std::size_t kMaxLoggedBytes = 64;

}  // 命名空间 untrustended::core
