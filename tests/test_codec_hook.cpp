#include "structbin/codec/marshal.hpp"

#include "test_main.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace {

using structbin::codec::field;
using structbin::codec::marshal;
using structbin::codec::unmarshal;
using structbin::core::byte;
using structbin::core::ByteOrder;
using structbin::tests::from_hex;

// 底层是 4 字节整数，但钩子固定写 8 字节大端
struct MyInt {
  std::int32_t value{0};

  std::error_code marshal_binary(structbin::core::Sink& sink, std::size_t& written) const {
    std::array<byte, 8> buf{};
    structbin::core::store_uint<std::uint64_t>(
      ByteOrder::big, static_cast<std::uint64_t>(static_cast<std::int64_t>(value)), buf.data());
    written = 0;
    auto ec = structbin::codec::write_all(sink, buf);
    if (ec) {
      return ec;
    }
    written = buf.size();
    return {};
  }

  std::error_code unmarshal_binary(structbin::core::Source& source, std::size_t& consumed) {
    std::array<byte, 8> buf{};
    consumed = 0;
    auto ec = structbin::codec::read_full(source, buf, true, consumed);
    if (ec) {
      return ec;
    }
    value = static_cast<std::int32_t>(structbin::core::load_uint<std::uint64_t>(ByteOrder::big, buf.data()));
    return {};
  }
};

struct Wrapper {
  std::uint8_t kind{0};
  MyInt id;
  std::vector<MyInt> more;

  static constexpr auto binary_fields() {
    return std::make_tuple(field("Kind", &Wrapper::kind), field("Id", &Wrapper::id), field("More", &Wrapper::more));
  }
};

// 钩子写入的字节数与自报值不一致：仅记录日志，不是错误
struct Liar {
  std::error_code marshal_binary(structbin::core::Sink& sink, std::size_t& written) const {
    const std::array<byte, 2> buf{0xCA, 0xFE};
    written = 100;
    return structbin::codec::write_all(sink, buf);
  }

  std::error_code unmarshal_binary(structbin::core::Source& source, std::size_t& consumed) {
    std::array<byte, 2> buf{};
    std::size_t got = 0;
    consumed = 0;
    return structbin::codec::read_full(source, buf, false, got);
  }
};

struct Failing {
  std::error_code marshal_binary(structbin::core::Sink&, std::size_t& written) const {
    written = 0;
    return structbin::core::make_error_code(structbin::core::errc::invalid_argument);
  }

  std::error_code unmarshal_binary(structbin::core::Source&, std::size_t& consumed) {
    consumed = 0;
    return structbin::core::make_error_code(structbin::core::errc::invalid_argument);
  }
};

void test_hook_replaces_native_encoding() {
  std::vector<byte> out;
  TEST_EXPECT_OK(marshal(MyInt{11}, out));
  TEST_EXPECT_HEX(out, "000000000000000b");

  MyInt back;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(unmarshal(out, &back, consumed));
  TEST_EXPECT_EQ(back.value, 11);
  TEST_EXPECT_EQ(consumed, static_cast<std::size_t>(8));
}

void test_hook_nested_in_struct_and_sequence() {
  Wrapper w;
  w.kind = 3;
  w.id = MyInt{-1};
  w.more = {MyInt{1}, MyInt{2}};

  std::vector<byte> out;
  TEST_EXPECT_OK(marshal(w, out));
  TEST_EXPECT_HEX(out,
                  "03"
                  "ffffffffffffffff"
                  "0000000000000002"
                  "0000000000000001"
                  "0000000000000002");

  Wrapper back;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(unmarshal(out, &back, consumed));
  TEST_EXPECT_EQ(consumed, out.size());
  TEST_EXPECT_EQ(back.kind, static_cast<std::uint8_t>(3));
  TEST_EXPECT_EQ(back.id.value, -1);
  TEST_EXPECT_EQ(back.more.size(), static_cast<std::size_t>(2));
}

void test_top_level_hook_target_by_reference() {
  const auto in = from_hex("000000000000002a");
  structbin::core::BytesSource source(in);
  structbin::codec::Decoder dec(source);

  MyInt v;
  TEST_EXPECT_OK(dec.decode(v));
  TEST_EXPECT_EQ(v.value, 42);
}

void test_hook_count_mismatch_is_not_an_error() {
  std::vector<byte> out;
  structbin::core::VectorSink sink(out);
  structbin::codec::Encoder enc(sink);
  TEST_EXPECT_OK(enc.encode(Liar{}));
  TEST_EXPECT_HEX(out, "cafe");
  // 计数以 sink 实际前进为准
  TEST_EXPECT_EQ(enc.bytes_written(), static_cast<std::size_t>(2));

  Liar back;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(unmarshal(out, &back, consumed));
  TEST_EXPECT_EQ(consumed, static_cast<std::size_t>(2));
}

void test_hook_errors_propagate() {
  std::vector<byte> out;
  auto ec = marshal(Failing{}, out);
  TEST_EXPECT(ec == structbin::core::errc::invalid_argument);

  Failing back;
  std::size_t consumed = 7;
  ec = unmarshal(from_hex("00"), &back, consumed);
  TEST_EXPECT(ec == structbin::core::errc::invalid_argument);
  TEST_EXPECT_EQ(consumed, static_cast<std::size_t>(0));

  // 钩子自己选择严格读取时，截断原样传播
  MyInt v;
  ec = unmarshal(from_hex("0000"), &v, consumed);
  TEST_EXPECT(ec == structbin::codec::errc::truncated);
}

}  // namespace

int main() {
  test_hook_replaces_native_encoding();
  test_hook_nested_in_struct_and_sequence();
  test_top_level_hook_target_by_reference();
  test_hook_count_mismatch_is_not_an_error();
  test_hook_errors_propagate();
  return ::structbin::tests::run_and_report();
}
