#pragma once

#include "untrustended/core/common.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace untrustended::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 用途：
 * - 测试/示例里用 “45 00 00 14 ...” 这样的文本书写输入缓冲区；
 * - read_all 发现未读完的字节时，以 hexdump 形式写进 debug 日志。
 */

struct HexDumpOptions final {
    // 每行字节数（0 按 16 处理）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分只打印一行截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（不可打印字符用 '.'）。
    bool show_ascii{false};
};

[[nodiscard]] std::string hex_dump(core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 解析 16 进制文本为 bytes。
 *
 * 支持大小写、空白/逗号/冒号/连字符等分隔符，以及可选的 0x/0X 前缀。
 * 非 16 进制字符或 nibble 个数为奇数时返回 core::errc::parse_error，
 * 此时 out 的内容不做保证。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<core::byte> &out) noexcept;

} // namespace untrustended::utils
