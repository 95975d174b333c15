#include "structbin/codec/marshal.hpp"

#include "test_main.hpp"

#include <any>
#include <array>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace {

using structbin::codec::Decoder;
using structbin::codec::Encoder;
using structbin::codec::errc;
using structbin::codec::field;
using structbin::codec::Kind;
using structbin::codec::marshal;
using structbin::codec::Options;
using structbin::codec::unmarshal;
using structbin::core::byte;
using structbin::core::BytesSource;
using structbin::core::VectorSink;
using structbin::tests::from_hex;

struct WithCallback {
  std::int32_t id{0};
  std::function<void()> on_change;

  static constexpr auto binary_fields() {
    return std::make_tuple(field("Id", &WithCallback::id), field("OnChange", &WithCallback::on_change));
  }
};

struct Node {
  std::int32_t value{0};
  std::unique_ptr<Node> next;

  static constexpr auto binary_fields() {
    return std::make_tuple(field("Value", &Node::value), field("Next", &Node::next));
  }
};

struct RawHolder {
  std::uint8_t a{0};
  std::uint16_t* b{nullptr};

  static constexpr auto binary_fields() {
    return std::make_tuple(field("A", &RawHolder::a), field("B", &RawHolder::b));
  }
};

struct Tagged {
  std::int64_t id{0};
  std::string name;
  bool some_flag{false};
  std::uint8_t untagged{0};

  static constexpr auto binary_fields() {
    return std::make_tuple(
      field("Id", &Tagged::id, R"(someTag:"+")"),
      field("Name", &Tagged::name, R"(someTag:"aaaaaa")"),
      field("SomeFlag", &Tagged::some_flag, R"(someTag:"-")"),
      field("Untagged", &Tagged::untagged, R"(someTag:"")"));
  }
};

std::unique_ptr<Node> make_chain(int n) {
  std::unique_ptr<Node> head;
  for (int i = n; i > 0; --i) {
    auto node = std::make_unique<Node>();
    node->value = i;
    node->next = std::move(head);
    head = std::move(node);
  }
  return head;
}

template <class T>
void expect_encode_rejected(const T& value, Kind expected) {
  std::vector<byte> out;
  VectorSink sink(out);
  Encoder enc(sink);
  auto ec = enc.encode(value);
  TEST_EXPECT(ec == errc::unsupported_kind);
  TEST_EXPECT(out.empty());
  TEST_EXPECT(enc.unsupported_kind().has_value());
  TEST_EXPECT_EQ(enc.unsupported_kind().value_or(Kind::unknown), expected);
}

void test_forbidden_top_level_encode() {
  expect_encode_rejected(std::function<int()>{}, Kind::func);
  expect_encode_rejected(static_cast<void*>(nullptr), Kind::unsafe_pointer);
  expect_encode_rejected(std::any{}, Kind::interface);
  expect_encode_rejected(std::monostate{}, Kind::invalid);
  expect_encode_rejected(+[](int) { return 0; }, Kind::func);

  std::future<int> fut;
  expect_encode_rejected(fut, Kind::chan);
}

void test_forbidden_nested_encode() {
  // 元素/键值类型在写前缀之前检查
  expect_encode_rejected(std::vector<void*>{nullptr}, Kind::unsafe_pointer);
  expect_encode_rejected(std::vector<std::any>{}, Kind::interface);
  expect_encode_rejected(std::map<std::string, std::function<void()>>{}, Kind::func);
  expect_encode_rejected(std::array<std::any, 2>{}, Kind::interface);

  // 结构体：前面的字段已写出，随后整个操作失败
  std::vector<byte> out;
  auto ec = marshal(WithCallback{5, {}}, out);
  TEST_EXPECT(ec == errc::unsupported_kind);
  TEST_EXPECT_HEX(out, "00000005");
}

void test_forbidden_decode() {
  const auto in = from_hex("00");
  std::size_t consumed = 0;

  std::function<void()> fn;
  TEST_EXPECT(unmarshal(in, &fn, consumed) == errc::unsupported_kind);
  TEST_EXPECT_EQ(consumed, static_cast<std::size_t>(0));

  std::any any;
  TEST_EXPECT(unmarshal(in, any, consumed) == errc::unsupported_kind);

  std::vector<void*> ptrs;
  TEST_EXPECT(unmarshal(in, &ptrs, consumed) == errc::unsupported_kind);

  BytesSource source(in);
  Decoder dec(source);
  WithCallback w;
  TEST_EXPECT(dec.decode(&w) == errc::unsupported_kind);
  TEST_EXPECT_EQ(dec.unsupported_kind().value_or(Kind::unknown), Kind::func);
}

void test_decode_requires_pointer() {
  const auto in = from_hex("0000000000000001");
  std::size_t consumed = 0;

  std::int64_t v = 0;
  TEST_EXPECT(unmarshal(in, v, consumed) == errc::not_a_pointer);
  TEST_EXPECT_EQ(v, static_cast<std::int64_t>(0));
  TEST_EXPECT_EQ(consumed, static_cast<std::size_t>(0));

  std::optional<std::int64_t> opt;
  TEST_EXPECT(unmarshal(in, opt, consumed) == errc::not_a_pointer);

  std::vector<std::int64_t> seq;
  TEST_EXPECT(unmarshal(in, seq, consumed) == errc::not_a_pointer);
}

void test_nil_target_is_noop() {
  const auto in = from_hex("0000000000000001");
  std::size_t consumed = 99;

  std::int64_t* nil = nullptr;
  TEST_EXPECT_OK(unmarshal(in, nil, consumed));
  TEST_EXPECT_EQ(consumed, static_cast<std::size_t>(0));

  std::unique_ptr<std::int64_t> empty;
  TEST_EXPECT_OK(unmarshal(in, empty, consumed));
  TEST_EXPECT(empty == nullptr);

  TEST_EXPECT_OK(unmarshal(in, nullptr, consumed));
  TEST_EXPECT_EQ(consumed, static_cast<std::size_t>(0));
}

void test_short_write_is_fatal() {
  std::array<byte, 12> storage{};
  structbin::core::SpanSink sink(storage);
  Encoder enc(sink);

  auto ec = enc.encode(std::string("more than four"));
  TEST_EXPECT(ec == errc::short_write);
  // 长度前缀写完后只剩 4 字节
  TEST_EXPECT_EQ(sink.written(), static_cast<std::size_t>(12));
  TEST_EXPECT_EQ(enc.bytes_written(), static_cast<std::size_t>(12));
}

void test_truncated_input_zero_fills_by_default() {
  // 声称 10 字节，实际只有 3 字节
  const auto in = from_hex("000000000000000a" "616263");
  std::string s;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(unmarshal(in, &s, consumed));
  TEST_EXPECT_EQ(s.size(), static_cast<std::size_t>(10));
  TEST_EXPECT_EQ(s.substr(0, 3), "abc");
  TEST_EXPECT_EQ(s[9], '\0');
  // 调用方通过 consumed 判断截断
  TEST_EXPECT_EQ(consumed, in.size());
}

void test_truncated_input_strict() {
  const auto in = from_hex("000000000000000a" "616263");
  BytesSource source(in);
  Decoder dec(source, Options{.strict_truncation = true});
  std::string s;
  TEST_EXPECT(dec.decode(&s) == errc::truncated);
}

void test_length_prefix_limit() {
  std::size_t consumed = 0;
  std::vector<std::uint8_t> seq;
  TEST_EXPECT(unmarshal(from_hex("ffffffffffffffff"), &seq, consumed) == errc::length_overflow);

  const auto in = from_hex("0000000000000003" "010203");
  BytesSource source(in);
  Decoder dec(source, Options{.max_length = 2});
  TEST_EXPECT(dec.decode(&seq) == errc::length_overflow);
}

void test_length_limit_scales_with_element_size() {
  // 8 字节的前缀声称 0x0fffffff 个 string：按内存占用折算后超限，不做任何分配
  std::size_t consumed = 0;
  std::vector<std::string> names{"kept"};
  TEST_EXPECT(unmarshal(from_hex("000000000fffffff"), &names, consumed) == errc::length_overflow);
  TEST_EXPECT_EQ(consumed, static_cast<std::size_t>(0));
  TEST_EXPECT_EQ(names.size(), static_cast<std::size_t>(1));

  std::map<std::string, std::string> index;
  TEST_EXPECT(unmarshal(from_hex("0000000000ffffff"), &index, consumed) == errc::length_overflow);

  // 边界：16 字节上限容纳 4 个 uint32，5 个即超限
  const Options opts{.max_length = 16};
  std::vector<std::uint32_t> values;
  {
    const auto in = from_hex("0000000000000004" "00000001000000020000000300000004");
    BytesSource source(in);
    Decoder dec(source, opts);
    TEST_EXPECT_OK(dec.decode(&values));
    TEST_EXPECT_EQ(values.size(), static_cast<std::size_t>(4));
  }
  {
    const auto in = from_hex("0000000000000005");
    BytesSource source(in);
    Decoder dec(source, opts);
    TEST_EXPECT(dec.decode(&values) == errc::length_overflow);
  }

  // string 仍按字节数限制
  {
    const auto in = from_hex("0000000000000010");
    BytesSource source(in);
    Decoder dec(source, opts);
    std::string s;
    TEST_EXPECT_OK(dec.decode(&s));
    TEST_EXPECT_EQ(s.size(), static_cast<std::size_t>(16));
  }
}

void test_nested_nil_raw_pointer() {
  const auto in = from_hex("01" "0002");
  RawHolder h;
  std::size_t consumed = 0;
  TEST_EXPECT(unmarshal(in, &h, consumed) == errc::nil_pointer);
  TEST_EXPECT_EQ(h.a, static_cast<std::uint8_t>(1));
}

void test_recursive_type_depth_limit() {
  const auto chain = make_chain(3);
  std::vector<byte> out;
  TEST_EXPECT_OK(marshal(chain, out));
  TEST_EXPECT_HEX(out, "00000001" "00000002" "00000003");

  // 无存在标记时解码总会继续分配 next，直到深度上限
  Node back;
  std::size_t consumed = 0;
  TEST_EXPECT(unmarshal(out, &back, consumed) == errc::depth_exceeded);

  std::vector<byte> deep;
  VectorSink sink(deep);
  Encoder enc(sink, Options{.max_depth = 1});
  TEST_EXPECT(enc.encode(*chain) == errc::depth_exceeded);
}

void test_presence_markers_round_trip_nil() {
  const Options opts{.presence_markers = true};
  const auto chain = make_chain(2);

  std::vector<byte> out;
  VectorSink sink(out);
  Encoder enc(sink, opts);
  TEST_EXPECT_OK(enc.encode(*chain));
  TEST_EXPECT_HEX(out, "00000001" "01" "00000002" "00");

  BytesSource source(out);
  Decoder dec(source, opts);
  Node back;
  back.next = make_chain(5);
  TEST_EXPECT_OK(dec.decode(&back));
  TEST_EXPECT_EQ(dec.bytes_read(), out.size());
  TEST_EXPECT_EQ(back.value, 1);
  TEST_EXPECT(back.next != nullptr);
  if (back.next) {
    TEST_EXPECT_EQ(back.next->value, 2);
    TEST_EXPECT(back.next->next == nullptr);
  }
}

void test_only_tagged_encode_default_decode() {
  const Tagged data{1, "some Name", true, 7};

  std::vector<byte> out;
  VectorSink sink(out);
  Encoder enc(sink, "someTag", true);
  TEST_EXPECT_OK(enc.encode(data));
  TEST_EXPECT_HEX(out,
                  "0000000000000001"
                  "0000000000000009"
                  "736f6d65204e616d65");

  // 默认模式解码：SomeFlag/Untagged 读到末尾，补 0
  Tagged back;
  back.some_flag = true;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(unmarshal(out, &back, consumed));
  TEST_EXPECT_EQ(back.id, static_cast<std::int64_t>(1));
  TEST_EXPECT_EQ(back.name, "some Name");
  TEST_EXPECT(!back.some_flag);
  TEST_EXPECT_EQ(back.untagged, static_cast<std::uint8_t>(0));

  // 同一标签模式解码：完整对称
  Tagged same;
  TEST_EXPECT_OK(structbin::codec::unmarshal_only(out, &same, "someTag", consumed));
  TEST_EXPECT_EQ(consumed, out.size());
  TEST_EXPECT_EQ(same.name, "some Name");
  TEST_EXPECT(!same.some_flag);

  // 其它标签键：没有字段参与
  std::vector<byte> none;
  TEST_EXPECT_OK(structbin::codec::marshal_only(data, "json", none));
  TEST_EXPECT(none.empty());
}

}  // namespace

int main() {
  test_forbidden_top_level_encode();
  test_forbidden_nested_encode();
  test_forbidden_decode();
  test_decode_requires_pointer();
  test_nil_target_is_noop();
  test_short_write_is_fatal();
  test_truncated_input_zero_fills_by_default();
  test_truncated_input_strict();
  test_length_prefix_limit();
  test_length_limit_scales_with_element_size();
  test_nested_nil_raw_pointer();
  test_recursive_type_depth_limit();
  test_presence_markers_round_trip_nil();
  test_only_tagged_encode_default_decode();
  return ::structbin::tests::run_and_report();
}
