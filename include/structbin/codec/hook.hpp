#pragma once

#include "structbin/core/io.hpp"

#include <concepts>
#include <cstddef>
#include <system_error>

namespace structbin::codec {

/**
 * @brief 自定义编码钩子：类型自行把自身写入 sink。
 *
 * - 钩子优先于所有内建规则（包括原本可以原生编码的类别）
 * - written 为钩子自报的写入字节数，仅供参考：引擎按 sink 实际前进的字节计数，
 *   两者不一致时只记 debug 日志，不视为错误
 * - 返回的错误原样传播
 *
 * @code
 * struct Id {
 *   int value;
 *   std::error_code marshal_binary(structbin::core::Sink& sink, std::size_t& written) const;
 *   std::error_code unmarshal_binary(structbin::core::Source& source, std::size_t& consumed);
 * };
 * @endcode
 */
template <class T>
concept BinaryMarshaler = requires(const T& value, core::Sink& sink, std::size_t& written) {
  { value.marshal_binary(sink, written) } -> std::same_as<std::error_code>;
};

/**
 * @brief 自定义解码钩子：类型自行从 source 读取自身。
 *
 * consumed 同样仅供参考。
 */
template <class T>
concept BinaryUnmarshaler = requires(T& value, core::Source& source, std::size_t& consumed) {
  { value.unmarshal_binary(source, consumed) } -> std::same_as<std::error_code>;
};

}  // namespace structbin::codec
