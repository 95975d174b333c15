#pragma once

#include "structbin/codec/fields.hpp"
#include "structbin/codec/hook.hpp"

#include <any>
#include <array>
#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace structbin::codec {

/**
 * @brief 值的类别（由静态类型决定，与具体实例无关）。
 *
 * 分为三组：
 * - 标量：boolean ~ complex128，宽度固定，见 wire 规则
 * - 复合：string/array/slice/map/structure/pointer，递归编码
 * - 禁止类别：invalid/unsafe_pointer/chan/func/interface，
 *   无论出现在顶层还是嵌套位置，都会以 errc::unsupported_kind 中止整个操作
 *
 * unknown 不是线上类别：表示类型既没有描述字段也没有钩子，
 * 编解码模板会在编译期拒绝它。
 */
enum class Kind : std::uint8_t {
  invalid = 0,

  boolean,
  int8,
  int16,
  int32,
  int64,
  uint8,
  uint16,
  uint32,
  uint64,
  float32,
  float64,
  complex64,
  complex128,

  string,
  array,
  slice,
  map,
  structure,
  pointer,
  custom,

  unsafe_pointer,
  chan,
  func,
  interface,

  unknown,
};

[[nodiscard]] constexpr bool is_forbidden(Kind k) noexcept {
  switch (k) {
    case Kind::invalid:
    case Kind::unsafe_pointer:
    case Kind::chan:
    case Kind::func:
    case Kind::interface:
      return true;
    default:
      return false;
  }
}

[[nodiscard]] constexpr bool is_integer(Kind k) noexcept {
  return k >= Kind::int8 && k <= Kind::uint64;
}

/**
 * @brief 类别名称（用于错误日志）。
 */
[[nodiscard]] std::string_view kind_name(Kind k) noexcept;

/**
 * @brief 并发通道类别的扩展点。
 *
 * 默认把 std::future/std::shared_future/std::promise 视为通道；
 * 业务侧的通道/队列类型可特化为 std::true_type 以便被拒绝。
 */
template <class T>
struct is_channel : std::false_type {};

template <class T>
struct is_channel<std::future<T>> : std::true_type {};

template <class T>
struct is_channel<std::shared_future<T>> : std::true_type {};

template <class T>
struct is_channel<std::promise<T>> : std::true_type {};

namespace detail {

template <class T, template <class...> class Tmpl>
struct is_specialization_of : std::false_type {};

template <template <class...> class Tmpl, class... Args>
struct is_specialization_of<Tmpl<Args...>, Tmpl> : std::true_type {};

template <class T>
struct is_std_array : std::false_type {};

template <class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template <class T>
struct is_std_function : std::false_type {};

template <class Sig>
struct is_std_function<std::function<Sig>> : std::true_type {};

// 闭包/函数对象：普通 operator()，或模板 operator()（泛型 lambda，按 1~3 个模板实参探测）。
// 更多模板参数的泛型可调用对象不会被识别，落到 unknown 并在编译期被拒绝。
template <class T>
concept Closure = std::is_class_v<T> &&
                  (requires { &T::operator(); } ||
                   requires { &T::template operator()<int>; } ||
                   requires { &T::template operator()<int, int>; } ||
                   requires { &T::template operator()<int, int, int>; });

// C 字符串（char* / const char*）：按 string 类别编码，以 NUL 结尾为界。
template <class T>
concept CString = std::is_pointer_v<T> && std::is_same_v<std::remove_cv_t<std::remove_pointer_t<T>>, char>;

template <class T>
concept Callable = std::is_function_v<std::remove_pointer_t<T>> ||
                   std::is_member_function_pointer_v<T> ||
                   is_std_function<T>::value ||
                   Closure<T>;

template <class T>
concept StringLike = is_specialization_of<T, std::basic_string>::value;

template <class T>
concept FixedSequence = is_std_array<T>::value || std::is_bounded_array_v<T>;

template <class T>
concept MapLike = requires(T& m, typename T::key_type k, typename T::mapped_type v) {
  m.size();
  m.begin();
  m.end();
  m.clear();
  m.insert_or_assign(std::move(k), std::move(v));
};

template <class T>
concept VariableSequence = !StringLike<T> && !MapLike<T> &&
                           requires(T& s, typename T::value_type v) {
                             s.size();
                             s.begin();
                             s.end();
                             s.clear();
                             s.push_back(std::move(v));
                           };

template <class T>
concept PointerLike = std::is_same_v<T, std::nullptr_t> ||
                      (std::is_pointer_v<T> && !std::is_void_v<std::remove_pointer_t<T>> &&
                       !std::is_function_v<std::remove_pointer_t<T>>) ||
                      is_specialization_of<T, std::unique_ptr>::value ||
                      is_specialization_of<T, std::shared_ptr>::value ||
                      is_specialization_of<T, std::optional>::value;

template <std::size_t Size, bool Signed>
constexpr Kind integer_kind() noexcept {
  if constexpr (Size == 1) {
    return Signed ? Kind::int8 : Kind::uint8;
  } else if constexpr (Size == 2) {
    return Signed ? Kind::int16 : Kind::uint16;
  } else if constexpr (Size == 4) {
    return Signed ? Kind::int32 : Kind::uint32;
  } else if constexpr (Size == 8) {
    return Signed ? Kind::int64 : Kind::uint64;
  } else {
    return Kind::unknown;
  }
}

}  // namespace detail

/**
 * @brief Type Classifier：把静态类型映射到 Kind。
 *
 * 判定顺序：禁止类别 -> 自定义钩子 -> 标量 -> 复合 -> unknown。
 * 钩子优先于一切内建规则（即使底层类型本身可以原生编码）。
 *
 * char* / const char* 视为 string（只能编码；解码目标必须是 std::string）。
 */
template <class T>
constexpr Kind classify() noexcept {
  using U = std::remove_cv_t<T>;

  if constexpr (std::is_void_v<U> || std::is_same_v<U, std::monostate>) {
    return Kind::invalid;
  } else if constexpr (std::is_pointer_v<U> && std::is_void_v<std::remove_pointer_t<U>>) {
    return Kind::unsafe_pointer;
  } else if constexpr (std::is_member_object_pointer_v<U>) {
    return Kind::unsafe_pointer;
  } else if constexpr (is_channel<U>::value) {
    return Kind::chan;
  } else if constexpr (detail::Callable<U>) {
    return Kind::func;
  } else if constexpr (std::is_same_v<U, std::any> || std::is_abstract_v<U>) {
    return Kind::interface;
  } else if constexpr (BinaryMarshaler<U> || BinaryUnmarshaler<U>) {
    return Kind::custom;
  } else if constexpr (std::is_same_v<U, bool>) {
    return Kind::boolean;
  } else if constexpr (std::is_integral_v<U>) {
    return detail::integer_kind<sizeof(U), std::is_signed_v<U>>();
  } else if constexpr (std::is_enum_v<U>) {
    return classify<std::underlying_type_t<U>>();
  } else if constexpr (std::is_same_v<U, float>) {
    return Kind::float32;
  } else if constexpr (std::is_same_v<U, double>) {
    return Kind::float64;
  } else if constexpr (std::is_same_v<U, std::complex<float>>) {
    return Kind::complex64;
  } else if constexpr (std::is_same_v<U, std::complex<double>>) {
    return Kind::complex128;
  } else if constexpr (std::is_same_v<U, std::string> || detail::CString<U>) {
    return Kind::string;
  } else if constexpr (detail::PointerLike<U>) {
    return Kind::pointer;
  } else if constexpr (detail::FixedSequence<U>) {
    return Kind::array;
  } else if constexpr (detail::MapLike<U>) {
    return Kind::map;
  } else if constexpr (detail::VariableSequence<U>) {
    return Kind::slice;
  } else if constexpr (Described<U>) {
    return Kind::structure;
  } else {
    return Kind::unknown;
  }
}

template <class T>
inline constexpr Kind kind_of = classify<T>();

namespace detail {

template <class T>
struct pointee {
  using type = void;
};

template <class T>
struct pointee<T*> {
  using type = T;
};

template <class T, class D>
struct pointee<std::unique_ptr<T, D>> {
  using type = T;
};

template <class T>
struct pointee<std::shared_ptr<T>> {
  using type = T;
};

template <class T>
struct pointee<std::optional<T>> {
  using type = T;
};

template <class T>
using pointee_t = typename pointee<T>::type;

// 可空值的判空：T*、unique_ptr、shared_ptr、optional、nullptr_t。
template <class P>
constexpr bool is_nil(const P& p) noexcept {
  if constexpr (std::is_same_v<P, std::nullptr_t>) {
    return true;
  } else if constexpr (is_specialization_of<P, std::optional>::value) {
    return !p.has_value();
  } else {
    return p == nullptr;
  }
}

template <std::size_t Size>
struct uint_of;

template <>
struct uint_of<1> {
  using type = std::uint8_t;
};

template <>
struct uint_of<2> {
  using type = std::uint16_t;
};

template <>
struct uint_of<4> {
  using type = std::uint32_t;
};

template <>
struct uint_of<8> {
  using type = std::uint64_t;
};

// 整数/枚举在线上的无符号承载类型（宽度 = sizeof）。
template <class T>
using wire_uint_t = typename uint_of<sizeof(T)>::type;

template <class T>
constexpr wire_uint_t<T> to_wire(T v) noexcept {
  if constexpr (std::is_enum_v<T>) {
    return static_cast<wire_uint_t<T>>(static_cast<std::underlying_type_t<T>>(v));
  } else {
    return static_cast<wire_uint_t<T>>(v);
  }
}

template <class T>
constexpr T from_wire(wire_uint_t<T> bits) noexcept {
  if constexpr (std::is_enum_v<T>) {
    return static_cast<T>(static_cast<std::underlying_type_t<T>>(bits));
  } else {
    return static_cast<T>(bits);
  }
}

}  // namespace detail

}  // namespace structbin::codec
