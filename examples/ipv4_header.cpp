#include <untrustended/decode/address.hpp>
#include <untrustended/decode/integers.hpp>
#include <untrustended/utils/hex.hpp>

#include <cstdint>
#include <iostream>
#include <vector>

using namespace untrustended;

namespace {

struct Ipv4Endpoints {
    asio::ip::address_v4 src;
    asio::ip::address_v4 dst;
    std::uint8_t ttl{0};
    std::uint8_t protocol{0};
};

// RFC 791 3.1：固定 20 字节首部（不含选项）。
std::error_code parse_ipv4_header(input::Reader &r, Ipv4Endpoints &out) noexcept {
    std::uint8_t version_ihl = 0;
    if (auto ec = decode::read_u8(r, version_ihl)) {
        return ec;
    }
    if ((version_ihl >> 4) != 4) {
        return core::make_error_code(core::errc::parse_error);
    }

    std::uint8_t tos = 0;
    std::uint16_t total_length = 0;
    std::uint16_t identification = 0;
    std::uint16_t flags_and_offset = 0;
    std::uint16_t checksum = 0;
    if (auto ec = decode::read_u8(r, tos)) {
        return ec;
    }
    if (auto ec = decode::read_u16be(r, total_length)) {
        return ec;
    }
    if (auto ec = decode::read_u16be(r, identification)) {
        return ec;
    }
    if (auto ec = decode::read_u16be(r, flags_and_offset)) {
        return ec;
    }
    if (auto ec = decode::read_u8(r, out.ttl)) {
        return ec;
    }
    if (auto ec = decode::read_u8(r, out.protocol)) {
        return ec;
    }
    if (auto ec = decode::read_u16be(r, checksum)) {
        return ec;
    }
    if (auto ec = decode::read_ipv4addr(r, out.src)) {
        return ec;
    }
    return decode::read_ipv4addr(r, out.dst);
}

} // namespace

int main() {
    std::cout << "=== IPv4 首部解析示例 ===\n\n";

    std::vector<core::byte> packet;
    auto ec = utils::parse_hex("45 00 00 00  00 00 00 00  80 84 00 00"
                               "c0 00 02 2a  cb 00 71 0d",
                               packet);
    if (ec) {
        std::cerr << "输入格式错误: " << ec.message() << "\n";
        return 1;
    }
    std::cout << utils::hex_dump(packet);

    Ipv4Endpoints hdr;
    ec = input::Input{packet}.read_all(
        core::make_error_code(core::errc::end_of_input),
        [&hdr](input::Reader &r) { return parse_ipv4_header(r, hdr); });
    if (ec) {
        std::cerr << "解析失败: " << ec.message() << "\n";
        return 1;
    }

    std::cout << "src=" << hdr.src.to_string() << " dst=" << hdr.dst.to_string()
              << " ttl=" << unsigned(hdr.ttl) << " protocol=" << unsigned(hdr.protocol)
              << "\n";

    // 截掉最后一个字节：读目的地址时遇到 end_of_input。
    ec = input::Input{packet.data(), packet.size() - 1}.read_all(
        core::make_error_code(core::errc::end_of_input),
        [&hdr](input::Reader &r) { return parse_ipv4_header(r, hdr); });
    std::cout << "截断输入: " << ec.message() << "\n";

    return 0;
}
