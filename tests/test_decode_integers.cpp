#include "untrustended/decode/integers.hpp"

#include "test_main.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace {

using untrustended::core::byte;
using untrustended::core::errc;
using untrustended::core::int128;
using untrustended::core::make_error_code;
using untrustended::core::Order;
using untrustended::core::uint128;
using untrustended::input::Input;
using untrustended::input::Reader;

namespace decode = untrustended::decode;

// 把 value 的低 width 个字节按指定字节序写出（负数按补码截断）。
template <class T>
std::vector<byte> encode(T value, std::size_t width, Order order) {
  const auto bits = static_cast<uint128>(value);
  std::vector<byte> out(width);
  for (std::size_t i = 0; i < width; ++i) {
    const auto b = static_cast<byte>((bits >> (8 * i)) & 0xFF);
    if (order == Order::big) {
      out[width - 1 - i] = b;
    } else {
      out[i] = b;
    }
  }
  return out;
}

template <class T, class ReadFn>
void expect_roundtrip(const std::vector<T>& values, std::size_t width, Order order, ReadFn read) {
  for (const auto v : values) {
    const auto buf = encode(v, width, order);
    Reader r{Input{buf}};
    T out{};
    TEST_EXPECT_OK(read(r, out));
    TEST_EXPECT(out == v);
    TEST_EXPECT_EQ(r.consumed(), width);
    TEST_EXPECT(r.at_end());
  }
}

template <class T>
std::vector<T> signed_specials(T min, T max) {
  return {min, static_cast<T>(min + 1), static_cast<T>(-1), T{0}, T{1}, static_cast<T>(max - 1), max};
}

template <class T>
std::vector<T> unsigned_specials(T max) {
  return {T{0}, T{1}, static_cast<T>(max / 2), static_cast<T>(max - 1), max};
}

constexpr uint128 kU128Max = ~uint128{0};
constexpr int128 kI128Max = static_cast<int128>(kU128Max >> 1);
constexpr int128 kI128Min = -kI128Max - 1;

void test_unsigned_boundaries() {
  expect_roundtrip(unsigned_specials<std::uint8_t>(0xFF), 1, Order::big, decode::read_u8);

  const auto u16 = unsigned_specials<std::uint16_t>(0xFFFF);
  expect_roundtrip(u16, 2, Order::big, decode::read_u16be);
  expect_roundtrip(u16, 2, Order::little, decode::read_u16le);

  const auto u24 = unsigned_specials<std::uint32_t>(0xFF'FFFF);
  expect_roundtrip(u24, 3, Order::big, decode::read_u24be);
  expect_roundtrip(u24, 3, Order::little, decode::read_u24le);

  const auto u32 = unsigned_specials<std::uint32_t>(0xFFFF'FFFF);
  expect_roundtrip(u32, 4, Order::big, decode::read_u32be);
  expect_roundtrip(u32, 4, Order::little, decode::read_u32le);

  const auto u48 = unsigned_specials<std::uint64_t>(0xFFFF'FFFF'FFFFull);
  expect_roundtrip(u48, 6, Order::big, decode::read_u48be);
  expect_roundtrip(u48, 6, Order::little, decode::read_u48le);

  const auto u64 = unsigned_specials<std::uint64_t>(~std::uint64_t{0});
  expect_roundtrip(u64, 8, Order::big, decode::read_u64be);
  expect_roundtrip(u64, 8, Order::little, decode::read_u64le);

  const auto u128 = unsigned_specials<uint128>(kU128Max);
  expect_roundtrip(u128, 16, Order::big, decode::read_u128be);
  expect_roundtrip(u128, 16, Order::little, decode::read_u128le);
}

void test_signed_boundaries() {
  expect_roundtrip(signed_specials<std::int8_t>(-128, 127), 1, Order::big, decode::read_i8);

  const auto i16 = signed_specials<std::int16_t>(-32768, 32767);
  expect_roundtrip(i16, 2, Order::big, decode::read_i16be);
  expect_roundtrip(i16, 2, Order::little, decode::read_i16le);

  const auto i24 = signed_specials<std::int32_t>(-8'388'608, 8'388'607);
  expect_roundtrip(i24, 3, Order::big, decode::read_i24be);
  expect_roundtrip(i24, 3, Order::little, decode::read_i24le);

  const auto i32 = signed_specials<std::int32_t>(INT32_MIN, INT32_MAX);
  expect_roundtrip(i32, 4, Order::big, decode::read_i32be);
  expect_roundtrip(i32, 4, Order::little, decode::read_i32le);

  const auto i48 = signed_specials<std::int64_t>(-140'737'488'355'328, 140'737'488'355'327);
  expect_roundtrip(i48, 6, Order::big, decode::read_i48be);
  expect_roundtrip(i48, 6, Order::little, decode::read_i48le);

  const auto i64 = signed_specials<std::int64_t>(INT64_MIN, INT64_MAX);
  expect_roundtrip(i64, 8, Order::big, decode::read_i64be);
  expect_roundtrip(i64, 8, Order::little, decode::read_i64le);

  const auto i128 = signed_specials<int128>(kI128Min, kI128Max);
  expect_roundtrip(i128, 16, Order::big, decode::read_i128be);
  expect_roundtrip(i128, 16, Order::little, decode::read_i128le);
}

// 固定种子的随机值，覆盖边界值之外的位模式。
void test_seeded_random_values() {
  std::mt19937_64 rng(0x5EED'1234u);
  std::vector<std::uint64_t> u64;
  std::vector<uint128> u128;
  std::vector<std::uint32_t> u24;
  std::vector<std::uint64_t> u48;
  for (int i = 0; i < 64; ++i) {
    const auto a = rng();
    const auto b = rng();
    u64.push_back(a);
    u128.push_back((static_cast<uint128>(a) << 64) | b);
    u24.push_back(static_cast<std::uint32_t>(b & 0xFF'FFFF));
    u48.push_back(a & 0xFFFF'FFFF'FFFFull);
  }
  expect_roundtrip(u24, 3, Order::big, decode::read_u24be);
  expect_roundtrip(u24, 3, Order::little, decode::read_u24le);
  expect_roundtrip(u48, 6, Order::big, decode::read_u48be);
  expect_roundtrip(u48, 6, Order::little, decode::read_u48le);
  expect_roundtrip(u64, 8, Order::big, decode::read_u64be);
  expect_roundtrip(u64, 8, Order::little, decode::read_u64le);
  expect_roundtrip(u128, 16, Order::big, decode::read_u128be);
  expect_roundtrip(u128, 16, Order::little, decode::read_u128le);
}

void test_byte_order_matters() {
  const std::vector<byte> two{0x01, 0x00};
  std::uint16_t v = 0;
  // 大端：先读到的字节是最高位。
  Reader be{Input{two}};
  TEST_EXPECT_OK(decode::read_u16be(be, v));
  TEST_EXPECT_EQ(v, 256u);
  Reader le{Input{two}};
  TEST_EXPECT_OK(decode::read_u16le(le, v));
  TEST_EXPECT_EQ(v, 1u);

  const std::vector<byte> three{0x01, 0x02, 0x03};
  std::uint32_t v24 = 0;
  Reader be24{Input{three}};
  TEST_EXPECT_OK(decode::read_u24be(be24, v24));
  TEST_EXPECT_EQ(v24, 0x010203u);
  Reader le24{Input{three}};
  TEST_EXPECT_OK(decode::read_u24le(le24, v24));
  TEST_EXPECT_EQ(v24, 0x030201u);

  const std::vector<byte> six{0x01, 0x02, 0x03, 0x04, 0x05, 0x06};
  std::uint64_t v48 = 0;
  Reader be48{Input{six}};
  TEST_EXPECT_OK(decode::read_u48be(be48, v48));
  TEST_EXPECT_EQ(v48, 0x0102'0304'0506ull);
  Reader le48{Input{six}};
  TEST_EXPECT_OK(decode::read_u48le(le48, v48));
  TEST_EXPECT_EQ(v48, 0x0605'0403'0201ull);

  // 符号位在大端是第一个字节，在小端是最后一个字节。
  const std::vector<byte> sign{0x80, 0x00, 0x01};
  std::int32_t s24 = 0;
  Reader sbe{Input{sign}};
  TEST_EXPECT_OK(decode::read_i24be(sbe, s24));
  TEST_EXPECT_EQ(s24, -8'388'607);
  Reader sle{Input{sign}};
  TEST_EXPECT_OK(decode::read_i24le(sle, s24));
  TEST_EXPECT_EQ(s24, 0x010080);
}

void test_exact_consumption_sequence() {
  std::vector<byte> buf(1 + 2 + 3 + 4 + 6 + 8 + 16);
  for (std::size_t i = 0; i < buf.size(); ++i) {
    buf[i] = static_cast<byte>(i + 1);
  }
  Reader r{Input{buf}};

  std::uint8_t a = 0;
  TEST_EXPECT_OK(decode::read_u8(r, a));
  TEST_EXPECT_EQ(a, 1u);
  TEST_EXPECT_EQ(r.consumed(), 1u);

  std::uint16_t b = 0;
  TEST_EXPECT_OK(decode::read_u16be(r, b));
  TEST_EXPECT_EQ(b, 0x0203u);
  TEST_EXPECT_EQ(r.consumed(), 3u);

  std::uint32_t c = 0;
  TEST_EXPECT_OK(decode::read_u24le(r, c));
  TEST_EXPECT_EQ(c, 0x060504u);
  TEST_EXPECT_EQ(r.consumed(), 6u);

  std::int32_t d = 0;
  TEST_EXPECT_OK(decode::read_i32be(r, d));
  TEST_EXPECT_EQ(d, 0x0708090A);
  TEST_EXPECT_EQ(r.consumed(), 10u);

  std::uint64_t e = 0;
  TEST_EXPECT_OK(decode::read_u48le(r, e));
  TEST_EXPECT_EQ(e, 0x100F'0E0D'0C0Bull);
  TEST_EXPECT_EQ(r.consumed(), 16u);

  std::int64_t f = 0;
  TEST_EXPECT_OK(decode::read_i64be(r, f));
  TEST_EXPECT_EQ(f, 0x1112'1314'1516'1718ll);
  TEST_EXPECT_EQ(r.consumed(), 24u);

  uint128 g = 0;
  TEST_EXPECT_OK(decode::read_u128le(r, g));
  const uint128 expected_g =
    (static_cast<uint128>(0x2827'2625'2423'2221ull) << 64) | 0x201F'1E1D'1C1B'1A19ull;
  TEST_EXPECT(g == expected_g);
  TEST_EXPECT_EQ(r.consumed(), 40u);
  TEST_EXPECT(r.at_end());
}

// 剩余长度不足时失败，且与内容无关。
void test_end_of_input_depends_only_on_length() {
  struct Case {
    std::size_t width;
    std::error_code (*read)(Reader&);
  };
  const Case cases[] = {
    {1, [](Reader& r) { std::uint8_t v = 0; return decode::read_u8(r, v); }},
    {2, [](Reader& r) { std::int16_t v = 0; return decode::read_i16le(r, v); }},
    {3, [](Reader& r) { std::uint32_t v = 0; return decode::read_u24be(r, v); }},
    {4, [](Reader& r) { std::uint32_t v = 0; return decode::read_u32le(r, v); }},
    {6, [](Reader& r) { std::int64_t v = 0; return decode::read_i48be(r, v); }},
    {8, [](Reader& r) { std::uint64_t v = 0; return decode::read_u64be(r, v); }},
    {16, [](Reader& r) { int128 v = 0; return decode::read_i128le(r, v); }},
  };

  for (const auto& c : cases) {
    for (std::size_t len = 0; len < c.width; ++len) {
      for (byte fill : {byte{0x00}, byte{0x7F}, byte{0xFF}}) {
        const std::vector<byte> buf(len, fill);
        Reader r{Input{buf}};
        TEST_EXPECT_ERR(c.read(r), errc::end_of_input);
      }
    }
    const std::vector<byte> enough(c.width, 0xA5);
    Reader r{Input{enough}};
    TEST_EXPECT_OK(c.read(r));
  }
}

// 多字节读取中途失败：已读的字节不回退，out 不被修改。
void test_partial_failure_does_not_rewind() {
  const std::vector<byte> buf{0xDE, 0xAD, 0xBE};
  Reader r{Input{buf}};
  std::uint32_t v = 0x1234'5678;
  TEST_EXPECT_ERR(decode::read_u32be(r, v), errc::end_of_input);
  TEST_EXPECT_EQ(v, 0x1234'5678u);
  TEST_EXPECT_EQ(r.consumed(), 3u);
  TEST_EXPECT(r.at_end());
}

void test_generic_entry_points() {
  const std::vector<byte> buf{0x12, 0x34, 0x12, 0x34, 0x12, 0x34};
  Reader r{Input{buf}};

  std::uint16_t a = 0;
  TEST_EXPECT_OK(decode::read_be(r, a));
  TEST_EXPECT_EQ(a, 0x1234u);

  std::uint16_t b = 0;
  TEST_EXPECT_OK(decode::read_le(r, b));
  TEST_EXPECT_EQ(b, 0x3412u);

  std::int16_t c = 0;
  TEST_EXPECT_OK(decode::read(r, Order::little, c));
  TEST_EXPECT_EQ(c, 0x3412);
  TEST_EXPECT(r.at_end());

  static_assert(decode::OrderedDecodable<std::uint8_t>);
  static_assert(decode::OrderedDecodable<int128>);
  static_assert(!decode::OrderedDecodable<float>);
  static_assert(!decode::Decodable<std::uint32_t>);
}

// 24/48 位载体类型也走同一个扩展点。
void test_odd_width_carriers() {
  static_assert(decode::OrderedDecodable<decode::u24>);
  static_assert(decode::OrderedDecodable<decode::i24>);
  static_assert(decode::OrderedDecodable<decode::u48>);
  static_assert(decode::OrderedDecodable<decode::i48>);

  const std::vector<byte> buf{0xFF, 0xFF, 0xFE, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06};

  Reader r{Input{buf}};
  decode::i24 s24;
  TEST_EXPECT_OK(decode::read(r, Order::big, s24));
  TEST_EXPECT_EQ(s24.value, -2);
  decode::u48 u48le;
  TEST_EXPECT_OK(decode::read(r, Order::little, u48le));
  TEST_EXPECT_EQ(u48le.value, 0x0605'0403'0201ull);
  TEST_EXPECT(r.at_end());

  Reader r2{Input{buf}};
  decode::u24 u24le;
  TEST_EXPECT_OK(decode::read_le(r2, u24le));
  TEST_EXPECT_EQ(u24le.value, 0xFEFFFFu);
  decode::i48 s48;
  TEST_EXPECT_OK(decode::read_be(r2, s48));
  TEST_EXPECT_EQ(s48.value, 0x0102'0304'0506ll);

  // 具名函数与载体类型结果一致。
  Reader r3{Input{buf}};
  std::uint32_t named = 0;
  TEST_EXPECT_OK(decode::read_u24be(r3, named));
  Reader r4{Input{buf}};
  decode::u24 carried;
  TEST_EXPECT_OK(decode::read_be(r4, carried));
  TEST_EXPECT_EQ(named, carried.value);
  TEST_EXPECT_EQ(r3.consumed(), r4.consumed());

  // 不足 6 字节：end_of_input，载体不变。
  const std::vector<byte> short_buf{0x01, 0x02, 0x03, 0x04, 0x05};
  Reader r5{Input{short_buf}};
  decode::u48 untouched{7};
  TEST_EXPECT_ERR(decode::read(r5, Order::big, untouched), errc::end_of_input);
  TEST_EXPECT_EQ(untouched.value, 7u);
}

}  // namespace

int main() {
  test_unsigned_boundaries();
  test_signed_boundaries();
  test_seeded_random_values();
  test_byte_order_matters();
  test_exact_consumption_sequence();
  test_end_of_input_depends_only_on_length();
  test_partial_failure_does_not_rewind();
  test_generic_entry_points();
  test_odd_width_carriers();
  return ::untrustended::tests::run_and_report();
}
