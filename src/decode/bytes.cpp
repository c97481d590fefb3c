#include "untrustended/decode/bytes.hpp"

#include "core/logger.hpp"
#include "untrustended/decode/integers.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <utility>

namespace untrustended::decode {
namespace {

// 返回第一个非法序列的起始下标；全部合法时返回 nullopt。
std::optional<std::size_t> first_invalid_utf8(core::bytes_view s) noexcept {
  std::size_t i = 0;
  while (i < s.size()) {
    const auto b0 = s[i];
    if (b0 < 0x80) {
      ++i;
      continue;
    }

    std::size_t len = 0;
    std::uint8_t lo = 0x80;  // 第二个字节的合法范围，用于排除过长编码与代理区
    std::uint8_t hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
      len = 2;
    } else if (b0 == 0xE0) {
      len = 3;
      lo = 0xA0;
    } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
      len = 3;
    } else if (b0 == 0xED) {
      len = 3;
      hi = 0x9F;
    } else if (b0 == 0xF0) {
      len = 4;
      lo = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
      len = 4;
    } else if (b0 == 0xF4) {
      len = 4;
      hi = 0x8F;
    } else {
      return i;
    }

    if (s.size() - i < len) {
      return i;
    }
    if (s[i + 1] < lo || s[i + 1] > hi) {
      return i;
    }
    for (std::size_t k = 2; k < len; ++k) {
      if (s[i + k] < 0x80 || s[i + k] > 0xBF) {
        return i;
      }
    }
    i += len;
  }
  return std::nullopt;
}

std::error_code reject_text(const char* what, std::size_t offset) noexcept {
  core::detail::logger()->debug("{}: rejected at input offset {}", what, offset);
  return core::make_error_code(core::errc::parse_error);
}

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

constexpr bool is_high_surrogate(std::uint16_t u) noexcept { return u >= 0xD800 && u <= 0xDBFF; }
constexpr bool is_low_surrogate(std::uint16_t u) noexcept { return u >= 0xDC00 && u <= 0xDFFF; }

}  // namespace

std::error_code read_bytes_view(Reader& r, std::size_t length, core::bytes_view& out) noexcept {
  Input sub;
  auto ec = r.read_bytes(length, sub);
  if (ec) {
    return core::from_input_error(ec);
  }
  out = sub.as_bytes();
  return {};
}

std::error_code read_bytes(Reader& r, std::size_t length, std::vector<core::byte>& out) noexcept {
  core::bytes_view view;
  auto ec = read_bytes_view(r, length, view);
  if (ec) {
    return ec;
  }
  out.assign(view.begin(), view.end());
  return {};
}

bool is_valid_utf8(core::bytes_view bytes) noexcept {
  return !first_invalid_utf8(bytes).has_value();
}

std::error_code read_utf8_view(Reader& r, std::size_t length, std::string_view& out) noexcept {
  core::bytes_view view;
  auto ec = read_bytes_view(r, length, view);
  if (ec) {
    return ec;
  }
  if (const auto bad = first_invalid_utf8(view)) {
    return reject_text("read_utf8", r.consumed() - length + *bad);
  }
  out = std::string_view(reinterpret_cast<const char*>(view.data()), view.size());
  return {};
}

std::error_code read_utf8(Reader& r, std::size_t length, std::string& out) noexcept {
  std::string_view view;
  auto ec = read_utf8_view(r, length, view);
  if (ec) {
    return ec;
  }
  out.assign(view);
  return {};
}

std::error_code read_utf16(Reader& r, std::size_t length, std::string& out) noexcept {
  if (length % 2 != 0) {
    return reject_text("read_utf16 (odd length)", r.consumed());
  }

  const auto start = r.consumed();
  std::vector<std::uint16_t> units;
  // length 可能来自不可信的长度字段，预留量以实际剩余字节为上限。
  units.reserve(std::min(length, r.remaining()) / 2);
  for (std::size_t i = 0; i < length / 2; ++i) {
    std::uint16_t unit = 0;
    auto ec = read_u16be(r, unit);
    if (ec) {
      return ec;
    }
    units.push_back(unit);
  }

  std::string text;
  text.reserve(units.size());
  for (std::size_t i = 0; i < units.size(); ++i) {
    const auto u = units[i];
    if (is_low_surrogate(u)) {
      return reject_text("read_utf16", start + 2 * i);
    }
    if (!is_high_surrogate(u)) {
      append_utf8(text, u);
      continue;
    }
    if (i + 1 == units.size() || !is_low_surrogate(units[i + 1])) {
      return reject_text("read_utf16", start + 2 * i);
    }
    const auto cp = 0x10000u + ((static_cast<std::uint32_t>(u) - 0xD800u) << 10) +
                    (static_cast<std::uint32_t>(units[i + 1]) - 0xDC00u);
    append_utf8(text, cp);
    ++i;
  }

  out = std::move(text);
  return {};
}

}  // namespace untrustended::decode
