#include <untrustended/decode/address.hpp>
#include <untrustended/decode/integers.hpp>
#include <untrustended/utils/hex.hpp>

#include <cstdint>
#include <iostream>
#include <vector>

using namespace untrustended;

namespace {

struct Ipv6Endpoints {
    asio::ip::address_v6 src;
    asio::ip::address_v6 dst;
    std::uint32_t flow_label{0};
    std::uint8_t next_header{0};
    std::uint8_t hop_limit{0};
};

// RFC 2460 3：固定 40 字节首部。
std::error_code parse_ipv6_header(input::Reader &r, Ipv6Endpoints &out) noexcept {
    std::uint32_t first_quad = 0;
    if (auto ec = decode::read_u32be(r, first_quad)) {
        return ec;
    }
    if ((first_quad >> 28) != 6) {
        return core::make_error_code(core::errc::parse_error);
    }
    out.flow_label = first_quad & 0x000FFFFFu;

    std::uint16_t payload_length = 0;
    if (auto ec = decode::read_u16be(r, payload_length)) {
        return ec;
    }
    if (auto ec = decode::read_u8(r, out.next_header)) {
        return ec;
    }
    if (auto ec = decode::read_u8(r, out.hop_limit)) {
        return ec;
    }
    if (auto ec = decode::read_ipv6addr(r, out.src)) {
        return ec;
    }
    return decode::read_ipv6addr(r, out.dst);
}

} // namespace

int main() {
    std::cout << "=== IPv6 首部解析示例 ===\n\n";

    std::vector<core::byte> packet;
    auto ec = utils::parse_hex("60 00 00 00  00 00 84 80"
                               "20 01 0d b8 00 00 00 00  00 00 00 00 00 00 00 01"
                               "20 01 0d b8 00 00 00 00  00 00 00 00 00 00 00 02",
                               packet);
    if (ec) {
        std::cerr << "输入格式错误: " << ec.message() << "\n";
        return 1;
    }

    Ipv6Endpoints hdr;
    ec = input::Input{packet}.read_all(
        core::make_error_code(core::errc::end_of_input),
        [&hdr](input::Reader &r) { return parse_ipv6_header(r, hdr); });
    if (ec) {
        std::cerr << "解析失败: " << ec.message() << "\n";
        return 1;
    }

    std::cout << "src=" << hdr.src.to_string() << " dst=" << hdr.dst.to_string()
              << " next_header=" << unsigned(hdr.next_header)
              << " hop_limit=" << unsigned(hdr.hop_limit) << "\n";

    // 版本号不对。
    packet[0] = 0x40;
    ec = input::Input{packet}.read_all(
        core::make_error_code(core::errc::end_of_input),
        [&hdr](input::Reader &r) { return parse_ipv6_header(r, hdr); });
    std::cout << "版本错误: " << ec.message() << "\n";

    return 0;
}
