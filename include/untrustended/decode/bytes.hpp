#pragma once

#include "untrustended/decode/traits.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace untrustended::decode {

/*
 * 字节串与文本解码。
 *
 * 命名约定：
 * - *_view 版本零拷贝，返回指向原始输入缓冲区的视图；调用方必须保证
 *   输入缓冲区在视图存活期间不被修改或释放（与 Reader 的生命周期无关）；
 * - 其余版本返回拥有所有权的拷贝。
 *
 * length 一律是字节数，不是字符数。
 */

// 读取 length 个字节；不足时返回 end_of_input 且游标不动。
std::error_code read_bytes(Reader& r, std::size_t length, std::vector<core::byte>& out) noexcept;
std::error_code read_bytes_view(Reader& r, std::size_t length, core::bytes_view& out) noexcept;

/**
 * @brief 读取 length 个字节并校验为严格 UTF-8。
 *
 * 拒绝：过长编码、代理区码点（U+D800..U+DFFF）、大于 U+10FFFF 的码点、
 * 截断的多字节序列。校验失败返回 parse_error（字节已被消耗）。
 */
std::error_code read_utf8(Reader& r, std::size_t length, std::string& out) noexcept;
std::error_code read_utf8_view(Reader& r, std::size_t length, std::string_view& out) noexcept;

/**
 * @brief 读取 length 个字节作为大端 UTF-16，转成 UTF-8 输出。
 *
 * - length 为奇数：直接返回 parse_error，不消耗任何字节；
 * - 孤立代理项（未配对的高/低代理）返回 parse_error。
 */
std::error_code read_utf16(Reader& r, std::size_t length, std::string& out) noexcept;

// 纯校验：bytes 是否为严格 UTF-8。
[[nodiscard]] bool is_valid_utf8(core::bytes_view bytes) noexcept;

}  // namespace untrustended::decode
