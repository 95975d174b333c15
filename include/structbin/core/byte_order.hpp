#pragma once

#include "structbin/core/common.hpp"

#include <cstddef>
#include <type_traits>

namespace structbin::core {

/**
 * @brief 按指定字节序写入无符号整数（out 至少 sizeof(UInt) 字节）。
 */
template <class UInt>
constexpr void store_uint(ByteOrder order, UInt v, byte* out) noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    const auto shift = static_cast<unsigned>(8u * i);
    const auto b = static_cast<byte>((v >> shift) & 0xFFu);
    if (order == ByteOrder::big) {
      out[sizeof(UInt) - 1u - i] = b;
    } else {
      out[i] = b;
    }
  }
}

/**
 * @brief 按指定字节序读取无符号整数（in 至少 sizeof(UInt) 字节）。
 */
template <class UInt>
constexpr UInt load_uint(ByteOrder order, const byte* in) noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  UInt v = 0;
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    const auto b = order == ByteOrder::big ? in[i] : in[sizeof(UInt) - 1u - i];
    v = static_cast<UInt>((v << 8) | b);
  }
  return v;
}

}  // namespace structbin::core
