#pragma once

#include <system_error>

namespace untrustended::core {

/**
 * @brief 解码原语的错误分类（所有 decode 接口只返回本分类的错误码）。
 *
 * 约定：
 * - end_of_input：剩余字节不足以完成本次读取
 * - parse_error：字节足够，但不构成目标类型的合法值（非法 UTF-8/UTF-16、奇数长度 UTF-16）
 * - invalid_value：语法合法但语义不允许；核心原语不会返回，留给上层（如未知 TLV tag）
 * - unknown_error：调用方自选的兜底错误，read_all 默认用它表示“有剩余字节”
 */
enum class errc : int {
    ok = 0,
    end_of_input = 1,
    parse_error = 2,
    invalid_value = 3,
    unknown_error = 4,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief 将游标层（input::errc）的错误映射到本分类。
 *
 * 映射是全函数：
 * - 成功 -> 成功
 * - input::errc::end_of_input -> errc::end_of_input
 * - 已属于本分类的错误码原样返回
 * - 其余 -> errc::unknown_error
 */
std::error_code from_input_error(std::error_code ec) noexcept;

}  // namespace untrustended::core

namespace std {
template <>
struct is_error_code_enum<untrustended::core::errc> : true_type {};
}  // namespace std
