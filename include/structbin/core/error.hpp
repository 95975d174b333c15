#pragma once

#include <system_error>

namespace structbin::core {

/**
 * @brief 本库通用错误码（I/O 适配层等跨模块复用）。
 *
 * 约定：
 * - 所有接口返回 std::error_code，不走异常路径。
 * - 编解码引擎自身的错误见 structbin::codec::errc。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  buffer_overflow = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace structbin::core

namespace std {
template <>
struct is_error_code_enum<structbin::core::errc> : true_type {};
}  // namespace std
