#pragma once

#include <system_error>

namespace structbin::codec {

/**
 * @brief 编解码引擎错误码。
 *
 * - unsupported_kind：值（或其嵌套元素/键/值类型）属于禁止类别，整个操作中止
 * - not_a_pointer：顶层 decode 目标不是指针
 * - short_write：sink 接受的字节数少于请求数，立即中止
 * - truncated：仅在 Options::strict_truncation 打开时出现；默认模式下短读按 0 填充
 * - length_overflow：解码出的长度前缀超过 Options::max_length
 * - nil_pointer：嵌套的裸指针为空，无法为其分配存储
 * - depth_exceeded：嵌套指针层数超过 Options::max_depth
 *
 * 自定义钩子返回的错误原样传播，不做转换。
 */
enum class errc : int {
  ok = 0,
  unsupported_kind = 1,
  not_a_pointer = 2,
  short_write = 3,
  truncated = 4,
  length_overflow = 5,
  nil_pointer = 6,
  depth_exceeded = 7,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace structbin::codec

namespace std {
template <>
struct is_error_code_enum<structbin::codec::errc> : true_type {};
}  // namespace std
