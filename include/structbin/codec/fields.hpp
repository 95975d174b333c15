#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>

namespace structbin::codec {

/**
 * @brief 单个结构体字段的描述：声明名、成员指针、标签串。
 *
 * 标签串沿用 `key:"value" key2:"value2"` 的约定格式，
 * 只用于决定字段是否参与编解码，不影响线上布局。
 */
template <class Owner, class Member>
struct Field final {
  using owner_type = Owner;
  using member_type = Member;

  std::string_view name;
  Member Owner::*member;
  std::string_view tags;
};

template <class Owner, class Member>
constexpr Field<Owner, Member> field(
  std::string_view name,
  Member Owner::*member,
  std::string_view tags = {}) noexcept {
  return Field<Owner, Member>{name, member, tags};
}

/**
 * @brief 字段元信息（FieldDescriptor 的非类型化部分）。
 *
 * index 即声明顺序，也就是线上顺序；标签不会改变顺序。
 */
struct FieldInfo final {
  std::string_view name;
  std::string_view tags;
  std::size_t index{0};
};

/**
 * @brief 外部描述特化点（用于无法修改的类型）。
 *
 * @code
 * template <>
 * struct structbin::codec::describe<Point> {
 *   static constexpr auto fields() {
 *     return std::make_tuple(field("X", &Point::x), field("Y", &Point::y));
 *   }
 * };
 * @endcode
 */
template <class T>
struct describe {};

template <class T>
concept MemberDescribed = requires { T::binary_fields(); };

template <class T>
concept ExternallyDescribed = requires { describe<T>::fields(); };

template <class T>
concept Described = MemberDescribed<T> || ExternallyDescribed<T>;

/**
 * @brief 取得类型的字段描述元组（按声明顺序）。
 *
 * 外部特化优先于成员函数 binary_fields()。
 */
template <Described T>
constexpr auto fields_of() noexcept {
  if constexpr (ExternallyDescribed<T>) {
    return describe<T>::fields();
  } else {
    return T::binary_fields();
  }
}

/**
 * @brief 每个类型一份、首次使用时构建的只读字段表。
 *
 * 函数内静态变量的初始化是线程安全的，表构建后不再修改，可被并发读取。
 */
template <Described T>
std::span<const FieldInfo> field_table() noexcept {
  static const auto table = std::apply(
    [](const auto&... f) {
      std::size_t index = 0;
      return std::array<FieldInfo, sizeof...(f)>{FieldInfo{f.name, f.tags, index++}...};
    },
    fields_of<T>());
  return std::span<const FieldInfo>{table.data(), table.size()};
}

namespace detail {

// 按声明顺序依次调用 fn(field, index)，遇到第一个错误即停止。
template <class Tuple, class Fn>
std::error_code for_each_field(const Tuple& fields, Fn&& fn) {
  std::error_code ec;
  std::size_t index = 0;
  std::apply(
    [&](const auto&... f) { (void)(((ec = fn(f, index++)), !ec) && ...); },
    fields);
  return ec;
}

}  // namespace detail

}  // namespace structbin::codec
