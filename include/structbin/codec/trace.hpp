#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>

// 编解码模板内部使用的日志入口（实现位于 src/codec/trace.cpp，基于 spdlog）。
// 不属于稳定 API，业务侧不要直接调用。
namespace structbin::codec::detail {

enum class Direction : unsigned char {
  encode,
  decode,
};

void trace_unsupported(Direction dir, std::string_view kind) noexcept;
void trace_short_write(std::size_t requested, std::size_t accepted) noexcept;
void trace_short_read(std::size_t requested, std::size_t got, bool strict) noexcept;
void trace_hook_count(Direction dir, std::size_t reported, std::size_t actual) noexcept;
void trace_length_overflow(std::uint64_t length, std::uint64_t limit) noexcept;
void trace_failure(Direction dir, const std::error_code& ec) noexcept;
// 结构体字段失败：带上字段名（嵌套结构体逐层各记录一次）。
void trace_field_failure(Direction dir, std::string_view field, const std::error_code& ec) noexcept;

}  // namespace structbin::codec::detail
