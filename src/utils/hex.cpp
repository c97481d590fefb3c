#include "untrustended/utils/hex.hpp"

#include "untrustended/core/error.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>

namespace untrustended::utils {
namespace {

constexpr char kDigits[] = "0123456789abcdef";

[[nodiscard]] std::optional<std::uint8_t> nibble_(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<std::uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

[[nodiscard]] bool is_separator_(char c) noexcept {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case ',':
    case ';':
    case ':':
    case '-':
    case '_':
    case '|':
    case '[':
    case ']':
        return true;
    default:
        return false;
    }
}

void append_byte_(std::string &out, core::byte b) {
    out.push_back(kDigits[(b >> 4) & 0x0F]);
    out.push_back(kDigits[b & 0x0F]);
}

} // namespace

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
    const std::size_t total = bytes.size();
    const std::size_t shown =
        options.max_bytes == 0 ? total : std::min(total, options.max_bytes);
    const std::size_t per_line =
        options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line;

    std::string out;
    out.reserve((shown / per_line + 2) * (per_line * 4 + 8));

    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        const std::size_t line_n = std::min(per_line, shown - offset);

        if (options.show_offset) {
            char prefix[24];
            std::snprintf(prefix, sizeof(prefix), "%04zx: ", offset);
            out += prefix;
        }

        for (std::size_t i = 0; i < line_n; ++i) {
            if (i != 0) {
                out.push_back(' ');
            }
            append_byte_(out, bytes[offset + i]);
        }

        if (options.show_ascii) {
            // 短行补齐，保证 ASCII 列对齐。
            out.append((per_line - line_n) * 3 + 2, ' ');
            for (std::size_t i = 0; i < line_n; ++i) {
                const auto c = bytes[offset + i];
                out.push_back((c >= 0x20 && c <= 0x7E) ? static_cast<char>(c) : '.');
            }
        }
        out.push_back('\n');
    }

    if (shown < total) {
        out += "... (truncated, total=" + std::to_string(total) + " bytes)\n";
    }
    return out;
}

std::error_code parse_hex(std::string_view text,
                          std::vector<core::byte> &out) noexcept {
    out.clear();
    out.reserve(text.size() / 2);

    std::optional<std::uint8_t> high;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (is_separator_(c)) {
            continue;
        }
        // 可选 0x/0X 前缀：只在一个字节的起始位置识别。
        if (!high && c == '0' && i + 1 < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }

        const auto v = nibble_(c);
        if (!v) {
            return core::make_error_code(core::errc::parse_error);
        }
        if (!high) {
            high = v;
            continue;
        }
        out.push_back(static_cast<core::byte>((*high << 4) | *v));
        high.reset();
    }

    if (high) {
        return core::make_error_code(core::errc::parse_error);
    }
    return {};
}

} // namespace untrustended::utils
