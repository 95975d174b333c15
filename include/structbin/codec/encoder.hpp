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

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace structbin::codec {

/**
 * @brief 编码会话：把任意受支持类型的值按线上规则写入 sink。
 *
 * 线上规则（默认大端）：
 * - 标量：定宽，见 Kind 说明；bool 为 0x00/0x01
 * - string：8 字节长度前缀（字节数）+ 原始字节（char* 按 NUL 结尾计长，nullptr 为空串）
 * - 定长数组：无前缀，按下标顺序逐个元素
 * - 变长序列：8 字节元素个数前缀 + 逐个元素
 * - map：8 字节条目数前缀 + 每条目“键编码紧跟值编码”；条目顺序为容器迭代顺序
 * - struct：无前缀、无字段标记，按声明顺序逐个字段（受标签规则过滤）
 * - 可空值：空值不写任何字节（Options::presence_markers 关闭时）
 *
 * 说明：
 * - 会话对象按调用创建，不做线程安全保证；同一会话可连续编码多个值
 * - 写入是增量的，失败时 sink 中可能留有部分前缀
 */
class Encoder final {
 public:
  explicit Encoder(Sink& sink, Options options = {});

  // 便捷构造：指定标签键与 only_tagged 模式。
  Encoder(Sink& sink, std::string tag, bool only_tagged);

  Encoder(const Encoder&) = delete;
  Encoder& operator=(const Encoder&) = delete;

  /**
   * @brief 编码一个值。
   *
   * 顶层的指针类值会被解引用；空指针编码为 0 字节并返回成功。
   */
  template <class T>
  std::error_code encode(const T& value) noexcept;

  [[nodiscard]] std::size_t bytes_written() const noexcept { return sink_.count(); }

  // 最近一次失败时遇到的禁止类别（没有则为空）。
  [[nodiscard]] std::optional<Kind> unsupported_kind() const noexcept { return unsupported_; }

  [[nodiscard]] const Options& options() const noexcept { return options_; }

 private:
  // 统计实际写入 sink 的字节数（钩子也经由它写入）。
  class CountingSink final : public Sink {
   public:
    explicit CountingSink(Sink& inner) : inner_(inner) {}

    std::error_code write(core::bytes_view in, std::size_t& written) noexcept override;

    [[nodiscard]] std::size_t count() const noexcept { return count_; }

   private:
    Sink& inner_;
    std::size_t count_{0};
  };

  template <class T>
  std::error_code encode_value(const T& value) noexcept;

  template <class T>
  std::error_code encode_dispatch(const T& value) noexcept;

  template <class T>
  std::error_code encode_elements(const T& range) noexcept;

  template <class T>
  std::error_code encode_map(const T& map) noexcept;

  template <class T>
  std::error_code encode_pointer(const T& ptr) noexcept;

  template <class T>
  std::error_code encode_struct(const T& value) noexcept;

  template <class T>
  std::error_code encode_custom(const T& value) noexcept;

  template <class UInt>
  std::error_code write_uint(UInt v) noexcept {
    std::array<core::byte, sizeof(UInt)> buf{};
    core::store_uint<UInt>(options_.byte_order, v, buf.data());
    return write_all(sink_, core::bytes_view{buf.data(), buf.size()});
  }

  std::error_code write_length(std::size_t n) noexcept;
  std::error_code unsupported(Kind kind) noexcept;

  CountingSink sink_;
  Options options_;
  std::size_t depth_{0};
  std::optional<Kind> unsupported_;
};

template <class T>
std::error_code Encoder::encode(const T& value) noexcept {
  unsupported_.reset();
  depth_ = 0;

  std::error_code ec;
  if constexpr (classify<T>() == Kind::pointer) {
    // 顶层指针：直接跟随，空值为 0 字节（不受 presence_markers 影响）
    if constexpr (!std::is_same_v<T, std::nullptr_t>) {
      if (!detail::is_nil(value)) {
        ec = encode_value<detail::pointee_t<T>>(*value);
      }
    }
  } else {
    ec = encode_value<T>(value);
  }

  if (ec) {
    detail::trace_failure(detail::Direction::encode, ec);
  }
  return ec;
}

template <class T>
std::error_code Encoder::encode_value(const T& value) noexcept {
  if constexpr (!std::is_same_v<T, std::remove_cv_t<T>>) {
    return encode_value<std::remove_cv_t<T>>(value);
  } else {
    return encode_dispatch<T>(value);
  }
}

template <class T>
std::error_code Encoder::encode_dispatch(const T& value) noexcept {
  constexpr Kind kind = classify<T>();
  static_assert(kind != Kind::unknown,
                "structbin: type has no wire representation; "
                "describe its fields or give it marshal_binary/unmarshal_binary");

  if constexpr (is_forbidden(kind)) {
    return unsupported(kind);
  } else if constexpr (kind == Kind::custom) {
    return encode_custom(value);
  } else if constexpr (kind == Kind::boolean) {
    return write_uint<std::uint8_t>(value ? 0x01 : 0x00);
  } else if constexpr (is_integer(kind)) {
    return write_uint(detail::to_wire(value));
  } else if constexpr (kind == Kind::float32) {
    return write_uint(std::bit_cast<std::uint32_t>(value));
  } else if constexpr (kind == Kind::float64) {
    return write_uint(std::bit_cast<std::uint64_t>(value));
  } else if constexpr (kind == Kind::complex64) {
    auto ec = write_uint(std::bit_cast<std::uint32_t>(value.real()));
    if (ec) {
      return ec;
    }
    return write_uint(std::bit_cast<std::uint32_t>(value.imag()));
  } else if constexpr (kind == Kind::complex128) {
    auto ec = write_uint(std::bit_cast<std::uint64_t>(value.real()));
    if (ec) {
      return ec;
    }
    return write_uint(std::bit_cast<std::uint64_t>(value.imag()));
  } else if constexpr (kind == Kind::string) {
    if constexpr (std::is_pointer_v<T>) {
      // C 字符串：nullptr 按空串编码
      const std::string_view text = value == nullptr ? std::string_view{} : std::string_view{value};
      auto ec = write_length(text.size());
      if (ec) {
        return ec;
      }
      return write_all(sink_, core::bytes_view{reinterpret_cast<const core::byte*>(text.data()), text.size()});
    } else {
      auto ec = write_length(value.size());
      if (ec) {
        return ec;
      }
      return write_all(sink_, core::bytes_view{reinterpret_cast<const core::byte*>(value.data()), value.size()});
    }
  } else if constexpr (kind == Kind::array) {
    return encode_elements(value);
  } else if constexpr (kind == Kind::slice) {
    using E = std::ranges::range_value_t<T>;
    if constexpr (is_forbidden(classify<E>())) {
      return unsupported(classify<E>());
    } else {
      auto ec = write_length(value.size());
      if (ec) {
        return ec;
      }
      return encode_elements(value);
    }
  } else if constexpr (kind == Kind::map) {
    return encode_map(value);
  } else if constexpr (kind == Kind::pointer) {
    return encode_pointer(value);
  } else {
    return encode_struct(value);
  }
}

template <class T>
std::error_code Encoder::encode_elements(const T& range) noexcept {
  using E = std::ranges::range_value_t<T>;
  if constexpr (is_forbidden(classify<E>())) {
    return unsupported(classify<E>());
  } else {
    for (const auto& elem : range) {
      auto ec = encode_value<E>(elem);
      if (ec) {
        return ec;
      }
    }
    return {};
  }
}

template <class T>
std::error_code Encoder::encode_map(const T& map) noexcept {
  using K = typename T::key_type;
  using M = typename T::mapped_type;

  // 键/值类型在写入条目数之前检查
  if constexpr (is_forbidden(classify<K>())) {
    return unsupported(classify<K>());
  } else if constexpr (is_forbidden(classify<M>())) {
    return unsupported(classify<M>());
  } else {
    auto ec = write_length(map.size());
    if (ec) {
      return ec;
    }
    for (const auto& [key, mapped] : map) {
      ec = encode_value<K>(key);
      if (ec) {
        return ec;
      }
      ec = encode_value<M>(mapped);
      if (ec) {
        return ec;
      }
    }
    return {};
  }
}

template <class T>
std::error_code Encoder::encode_pointer(const T& ptr) noexcept {
  const bool nil = detail::is_nil(ptr);
  if (options_.presence_markers) {
    auto ec = write_uint<std::uint8_t>(nil ? 0x00 : 0x01);
    if (ec) {
      return ec;
    }
  }

  if constexpr (std::is_same_v<T, std::nullptr_t>) {
    return {};
  } else {
    if (nil) {
      return {};
    }
    if (depth_ >= options_.max_depth) {
      return make_error_code(errc::depth_exceeded);
    }
    ++depth_;
    auto ec = encode_value<detail::pointee_t<T>>(*ptr);
    --depth_;
    return ec;
  }
}

template <class T>
std::error_code Encoder::encode_struct(const T& value) noexcept {
  const auto table = field_table<T>();
  return detail::for_each_field(
    fields_of<T>(),
    [&](const auto& f, std::size_t index) -> std::error_code {
      if (!field_included(lookup_tag(table[index].tags, options_.tag), options_.only_tagged)) {
        return {};
      }
      using M = typename std::remove_cvref_t<decltype(f)>::member_type;
      auto ec = encode_value<M>(value.*(f.member));
      if (ec) {
        detail::trace_field_failure(detail::Direction::encode, table[index].name, ec);
      }
      return ec;
    });
}

template <class T>
std::error_code Encoder::encode_custom(const T& value) noexcept {
  static_assert(BinaryMarshaler<T>, "structbin: type provides unmarshal_binary but no marshal_binary");

  const auto before = sink_.count();
  std::size_t reported = 0;
  auto ec = value.marshal_binary(sink_, reported);
  if (ec) {
    return ec;
  }
  const auto actual = sink_.count() - before;
  if (reported != actual) {
    detail::trace_hook_count(detail::Direction::encode, reported, actual);
  }
  return {};
}

}  // namespace structbin::codec
