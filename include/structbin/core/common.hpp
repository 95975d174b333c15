#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace structbin::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

/**
 * @brief 多字节数值在线上的字节序。
 *
 * 同一次 encode/decode 调用内字节序保持一致，不支持中途切换。
 */
enum class ByteOrder : std::uint8_t {
  big = 0,
  little = 1,
};

// 进程级默认值：只读常量，不允许在运行期修改（避免并发调用之间互相干扰）。
inline constexpr ByteOrder kDefaultByteOrder = ByteOrder::big;
inline constexpr std::string_view kDefaultTag = "bin";
inline constexpr std::string_view kExcludeTag = "-";

// 长度前缀（字符串字节数/序列元素数/映射条目数）在线上固定占 8 字节。
inline constexpr std::size_t kLengthPrefixBytes = 8;

// 解码时允许的最大长度前缀：防止损坏输入触发超大分配。
inline constexpr std::uint64_t kDefaultMaxLength = 256ull * 1024 * 1024;  // 256M

}  // 命名空间 structbin::core
