#include <untrustended/core/log.hpp>
#include <untrustended/decode/bytes.hpp>
#include <untrustended/decode/integers.hpp>
#include <untrustended/utils/hex.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace app {

// tag(u16be) + length(u16be) + UTF-8 文本
struct TextRecord {
    std::uint16_t tag{0};
    std::string text;
};

} // namespace app

namespace untrustended::decode {

template <>
struct Decoder<app::TextRecord> {
    static std::error_code read(Reader &r, app::TextRecord &out) noexcept {
        std::uint16_t tag = 0;
        std::uint16_t length = 0;
        if (auto ec = read_u16be(r, tag)) {
            return ec;
        }
        if (tag == 0) {
            return core::make_error_code(core::errc::invalid_value);
        }
        if (auto ec = read_u16be(r, length)) {
            return ec;
        }
        if (auto ec = read_utf8(r, length, out.text)) {
            return ec;
        }
        out.tag = tag;
        return {};
    }
};

} // namespace untrustended::decode

using namespace untrustended;

namespace {

void show(const char *title, std::string_view hex_text) {
    std::vector<core::byte> buf;
    if (auto ec = utils::parse_hex(hex_text, buf)) {
        std::cerr << title << ": 输入格式错误\n";
        return;
    }

    app::TextRecord rec;
    auto ec = decode::read_all(input::Input{buf}, rec);
    if (ec) {
        std::cout << title << ": " << ec.message() << "\n";
        return;
    }
    std::cout << title << ": tag=" << rec.tag << " text=\"" << rec.text << "\"\n";
}

} // namespace

int main() {
    std::cout << "=== TLV 记录解析示例 ===\n\n";

    // 失败路径的细节写到 debug 日志（stderr）。
    core::set_log_level(core::LogLevel::debug);

    show("正常", "00 07 00 08 75 6e 74 72 75 73 74 65");
    show("多余字节", "00 07 00 07 75 6e 74 72 75 73 74 65");
    show("缺少字节", "00 07 00 09 75 6e 74 72 75 73 74 65");
    show("非法 UTF-8", "00 07 00 02 c3 28");
    show("非法 tag", "00 00 00 00");

    return 0;
}
