#pragma once

#include "structbin/core/io.hpp"

#include <cstddef>
#include <system_error>

namespace structbin::codec {

using core::Sink;
using core::Source;

/**
 * @brief 把 in 全部写入 sink。
 *
 * sink 接受的字节数少于 in.size() 时返回 errc::short_write；
 * 此时 sink 中已写入的前缀保持原样（不回滚）。
 */
std::error_code write_all(Sink& sink, core::bytes_view in) noexcept;

/**
 * @brief 反复调用 read_some，直到读满 out 或来源不再给出字节。
 *
 * 约定（与历史格式保持一致）：
 * - strict == false：读到末尾仍不足时，剩余部分补 0 并返回成功；
 *   是否截断由调用方在顶层自行比对 consumed 判断
 * - strict == true：不足时返回 errc::truncated
 * - 来源返回的其它错误原样传播
 *
 * got 为实际从来源读到的字节数（不含补 0 部分）。
 */
std::error_code read_full(
  Source& source,
  core::mutable_bytes_view out,
  bool strict,
  std::size_t& got) noexcept;

}  // namespace structbin::codec
