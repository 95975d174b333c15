#pragma once

#include "structbin/codec/decoder.hpp"
#include "structbin/codec/encoder.hpp"
#include "structbin/core/io.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace structbin::codec {

/**
 * @brief 一次性编码：使用默认配置，把 value 追加到 out。
 *
 * 失败时 out 中可能已追加了部分字节（不回滚）。
 */
template <class T>
std::error_code marshal(const T& value, std::vector<core::byte>& out) noexcept {
  core::VectorSink sink(out);
  Encoder enc(sink);
  return enc.encode(value);
}

/**
 * @brief 一次性编码（only_tagged 模式）：只处理带 tag 标签的字段。
 */
template <class T>
std::error_code marshal_only(const T& value, std::string_view tag, std::vector<core::byte>& out) noexcept {
  core::VectorSink sink(out);
  Encoder enc(sink, std::string(tag), true);
  return enc.encode(value);
}

/**
 * @brief 一次性解码：使用默认配置，从 in 解码到 target（必须是指针类）。
 *
 * 成功时 consumed 为输入中被读走的字节数（来源实际前进的字节，与钩子自报值无关）；
 * 失败时 consumed 为 0。
 */
template <class T>
std::error_code unmarshal(core::bytes_view in, T&& target, std::size_t& consumed) noexcept {
  core::BytesSource source(in);
  Decoder dec(source);
  auto ec = dec.decode(std::forward<T>(target));
  consumed = ec ? 0 : source.consumed();
  return ec;
}

/**
 * @brief 一次性解码（only_tagged 模式）。
 */
template <class T>
std::error_code unmarshal_only(
  core::bytes_view in,
  T&& target,
  std::string_view tag,
  std::size_t& consumed) noexcept {
  core::BytesSource source(in);
  Decoder dec(source, std::string(tag), true);
  auto ec = dec.decode(std::forward<T>(target));
  consumed = ec ? 0 : source.consumed();
  return ec;
}

}  // namespace structbin::codec
