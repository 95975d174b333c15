#pragma once

#include "structbin/codec/error.hpp"
#include "structbin/codec/fields.hpp"
#include "structbin/codec/hook.hpp"
#include "structbin/codec/kind.hpp"
#include "structbin/codec/options.hpp"
#include "structbin/codec/stream.hpp"
#include "structbin/codec/tag.hpp"
#include "structbin/codec/trace.hpp"
#include "structbin/core/byte_order.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace structbin::codec {

namespace detail {

template <class T>
inline constexpr bool is_optional_v = is_specialization_of<T, std::optional>::value;

// 为空的可空字段分配新的存储（裸指针无法分配，由调用方处理）。
template <class P>
void allocate(P& p) {
  if constexpr (is_specialization_of<P, std::unique_ptr>::value) {
    p = std::make_unique<pointee_t<P>>();
  } else if constexpr (is_specialization_of<P, std::shared_ptr>::value) {
    p = std::make_shared<pointee_t<P>>();
  } else {
    p.emplace();
  }
}

template <class P>
void reset(P& p) noexcept {
  if constexpr (std::is_pointer_v<P>) {
    p = nullptr;
  } else if constexpr (!std::is_same_v<P, std::nullptr_t>) {
    p.reset();
  }
}

}  // namespace detail

/**
 * @brief 解码会话：与 Encoder 对称，从 source 读取并重建值。
 *
 * 说明：
 * - 顶层目标必须是指针类（T*、unique_ptr、shared_ptr），否则返回 errc::not_a_pointer；
 *   空指针目标直接返回成功，不消耗任何字节
 * - 变长序列与 map 会被清空后重建；定长数组原地填充
 * - 嵌套的 unique_ptr/shared_ptr/optional 字段总是换上新分配的存储再解码，
 *   不论编码端当时是否写过字节；嵌套的空裸指针无法分配，返回 errc::nil_pointer
 * - 输入不足时默认补 0 继续（见 read_full），截断检测由调用方比对 consumed 完成
 * - 变长序列/map 的条目数上限为 max_length / 单个条目的内存大小
 * - 失败时目标可能已被部分填充
 */
class Decoder final {
 public:
  explicit Decoder(Source& source, Options options = {});

  Decoder(Source& source, std::string tag, bool only_tagged);

  Decoder(const Decoder&) = delete;
  Decoder& operator=(const Decoder&) = delete;

  template <class T>
  std::error_code decode(T&& target) noexcept;

  [[nodiscard]] std::size_t bytes_read() const noexcept { return source_.count(); }
  [[nodiscard]] std::optional<Kind> unsupported_kind() const noexcept { return unsupported_; }
  [[nodiscard]] const Options& options() const noexcept { return options_; }

 private:
  class CountingSource final : public Source {
   public:
    explicit CountingSource(Source& inner) : inner_(inner) {}

    std::error_code read_some(core::mutable_bytes_view out, std::size_t& n) noexcept override;

    [[nodiscard]] std::size_t count() const noexcept { return count_; }

   private:
    Source& inner_;
    std::size_t count_{0};
  };

  template <class T>
  std::error_code decode_value(T& value) noexcept;

  template <class T>
  std::error_code decode_elements(T& range) noexcept;

  template <class T>
  std::error_code decode_slice(T& seq) noexcept;

  template <class T>
  std::error_code decode_map(T& map) noexcept;

  template <class T>
  std::error_code decode_pointer(T& ptr) noexcept;

  template <class T>
  std::error_code decode_struct(T& value) noexcept;

  template <class T>
  std::error_code decode_custom(T& value) noexcept;

  template <class UInt>
  std::error_code read_uint(UInt& out) noexcept {
    std::array<core::byte, sizeof(UInt)> buf{};
    auto ec = read_bytes(core::mutable_bytes_view{buf.data(), buf.size()});
    if (ec) {
      return ec;
    }
    out = core::load_uint<UInt>(options_.byte_order, buf.data());
    return {};
  }

  std::error_code read_bytes(core::mutable_bytes_view out) noexcept;
  // unit 为每个单位在内存中的大小：长度上限按 max_length / unit 折算，
  // 使得长度前缀能触发的分配量不超过 max_length 字节。
  std::error_code read_length(std::uint64_t& n, std::size_t unit = 1) noexcept;
  std::error_code unsupported(Kind kind) noexcept;

  CountingSource source_;
  Options options_;
  std::size_t depth_{0};
  std::optional<Kind> unsupported_;
};

template <class T>
std::error_code Decoder::decode(T&& target) noexcept {
  using U = std::remove_cvref_t<T>;
  constexpr Kind kind = classify<U>();

  unsupported_.reset();
  depth_ = 0;

  std::error_code ec;
  if constexpr (is_forbidden(kind)) {
    ec = unsupported(kind);
  } else if constexpr (kind == Kind::custom) {
    ec = decode_custom(target);
  } else if constexpr (kind == Kind::pointer && !detail::is_optional_v<U>) {
    // 空目标：不读取任何字节，目标保持不变
    if constexpr (!std::is_same_v<U, std::nullptr_t>) {
      if (!detail::is_nil(target)) {
        ec = decode_value(*target);
      }
    }
  } else {
    ec = make_error_code(errc::not_a_pointer);
  }

  if (ec) {
    detail::trace_failure(detail::Direction::decode, ec);
  }
  return ec;
}

template <class T>
std::error_code Decoder::decode_value(T& value) noexcept {
  constexpr Kind kind = classify<T>();
  static_assert(kind != Kind::unknown,
                "structbin: type has no wire representation; "
                "describe its fields or give it marshal_binary/unmarshal_binary");

  if constexpr (is_forbidden(kind)) {
    return unsupported(kind);
  } else if constexpr (kind == Kind::custom) {
    return decode_custom(value);
  } else if constexpr (kind == Kind::boolean) {
    std::uint8_t b = 0;
    auto ec = read_uint(b);
    if (ec) {
      return ec;
    }
    value = b != 0;
    return {};
  } else if constexpr (is_integer(kind)) {
    detail::wire_uint_t<T> bits = 0;
    auto ec = read_uint(bits);
    if (ec) {
      return ec;
    }
    value = detail::from_wire<T>(bits);
    return {};
  } else if constexpr (kind == Kind::float32) {
    std::uint32_t bits = 0;
    auto ec = read_uint(bits);
    if (ec) {
      return ec;
    }
    value = std::bit_cast<float>(bits);
    return {};
  } else if constexpr (kind == Kind::float64) {
    std::uint64_t bits = 0;
    auto ec = read_uint(bits);
    if (ec) {
      return ec;
    }
    value = std::bit_cast<double>(bits);
    return {};
  } else if constexpr (kind == Kind::complex64) {
    std::uint32_t re = 0;
    std::uint32_t im = 0;
    auto ec = read_uint(re);
    if (!ec) {
      ec = read_uint(im);
    }
    if (ec) {
      return ec;
    }
    value = T(std::bit_cast<float>(re), std::bit_cast<float>(im));
    return {};
  } else if constexpr (kind == Kind::complex128) {
    std::uint64_t re = 0;
    std::uint64_t im = 0;
    auto ec = read_uint(re);
    if (!ec) {
      ec = read_uint(im);
    }
    if (ec) {
      return ec;
    }
    value = T(std::bit_cast<double>(re), std::bit_cast<double>(im));
    return {};
  } else if constexpr (kind == Kind::string) {
    static_assert(!std::is_pointer_v<T>, "structbin: cannot decode into a C string, use std::string");
    std::uint64_t n = 0;
    auto ec = read_length(n);
    if (ec) {
      return ec;
    }
    value.resize(static_cast<std::size_t>(n));
    return read_bytes(core::mutable_bytes_view{reinterpret_cast<core::byte*>(value.data()), value.size()});
  } else if constexpr (kind == Kind::array) {
    return decode_elements(value);
  } else if constexpr (kind == Kind::slice) {
    return decode_slice(value);
  } else if constexpr (kind == Kind::map) {
    return decode_map(value);
  } else if constexpr (kind == Kind::pointer) {
    return decode_pointer(value);
  } else {
    return decode_struct(value);
  }
}

template <class T>
std::error_code Decoder::decode_elements(T& range) noexcept {
  using E = std::ranges::range_value_t<T>;
  if constexpr (is_forbidden(classify<E>())) {
    return unsupported(classify<E>());
  } else {
    for (auto& elem : range) {
      auto ec = decode_value<E>(elem);
      if (ec) {
        return ec;
      }
    }
    return {};
  }
}

template <class T>
std::error_code Decoder::decode_slice(T& seq) noexcept {
  using E = typename T::value_type;
  if constexpr (is_forbidden(classify<E>())) {
    return unsupported(classify<E>());
  } else {
    std::uint64_t n = 0;
    auto ec = read_length(n, sizeof(E));
    if (ec) {
      return ec;
    }
    seq.clear();
    if constexpr (requires { seq.reserve(std::size_t{}); }) {
      // 只做有限预分配：长度前缀来自输入，不能完全信任
      seq.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(n, 4096)));
    }
    for (std::uint64_t i = 0; i < n; ++i) {
      E elem{};
      ec = decode_value(elem);
      if (ec) {
        return ec;
      }
      seq.push_back(std::move(elem));
    }
    return {};
  }
}

template <class T>
std::error_code Decoder::decode_map(T& map) noexcept {
  using K = typename T::key_type;
  using M = typename T::mapped_type;

  if constexpr (is_forbidden(classify<K>())) {
    return unsupported(classify<K>());
  } else if constexpr (is_forbidden(classify<M>())) {
    return unsupported(classify<M>());
  } else {
    std::uint64_t n = 0;
    auto ec = read_length(n, sizeof(K) + sizeof(M));
    if (ec) {
      return ec;
    }
    map.clear();
    for (std::uint64_t i = 0; i < n; ++i) {
      K key{};
      M mapped{};
      ec = decode_value(key);
      if (ec) {
        return ec;
      }
      ec = decode_value(mapped);
      if (ec) {
        return ec;
      }
      map.insert_or_assign(std::move(key), std::move(mapped));
    }
    return {};
  }
}

template <class T>
std::error_code Decoder::decode_pointer(T& ptr) noexcept {
  if (options_.presence_markers) {
    std::uint8_t marker = 0;
    auto ec = read_uint(marker);
    if (ec) {
      return ec;
    }
    if (marker == 0x00) {
      detail::reset(ptr);
      return {};
    }
  }

  if constexpr (std::is_same_v<T, std::nullptr_t>) {
    return {};
  } else {
    if (depth_ >= options_.max_depth) {
      return make_error_code(errc::depth_exceeded);
    }
    if constexpr (std::is_pointer_v<T>) {
      if (ptr == nullptr) {
        return make_error_code(errc::nil_pointer);
      }
    } else {
      detail::allocate(ptr);
    }
    ++depth_;
    auto ec = decode_value(*ptr);
    --depth_;
    return ec;
  }
}

template <class T>
std::error_code Decoder::decode_struct(T& value) noexcept {
  const auto table = field_table<T>();
  return detail::for_each_field(
    fields_of<T>(),
    [&](const auto& f, std::size_t index) -> std::error_code {
      if (!field_included(lookup_tag(table[index].tags, options_.tag), options_.only_tagged)) {
        return {};
      }
      auto ec = decode_value(value.*(f.member));
      if (ec) {
        detail::trace_field_failure(detail::Direction::decode, table[index].name, ec);
      }
      return ec;
    });
}

template <class T>
std::error_code Decoder::decode_custom(T& value) noexcept {
  static_assert(BinaryUnmarshaler<T>, "structbin: type provides marshal_binary but no unmarshal_binary");

  const auto before = source_.count();
  std::size_t reported = 0;
  auto ec = value.unmarshal_binary(source_, reported);
  if (ec) {
    return ec;
  }
  const auto actual = source_.count() - before;
  if (reported != actual) {
    detail::trace_hook_count(detail::Direction::decode, reported, actual);
  }
  return {};
}

}  // namespace structbin::codec
