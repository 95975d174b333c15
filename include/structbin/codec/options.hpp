#pragma once

#include "structbin/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace structbin::codec {

// 嵌套指针的最大解引用深度：防止自引用类型（例如链表节点）在
// “解码总是为指针字段分配存储”的规则下无限递归。
inline constexpr std::size_t kDefaultMaxDepth = 64;

/**
 * @brief 单次编解码会话的配置（按值传入，会话之间互不共享）。
 */
struct Options final {
  // 所有多字节数值（包括长度前缀）使用的字节序。
  core::ByteOrder byte_order{core::kDefaultByteOrder};

  // 查找的标签键。
  std::string tag{core::kDefaultTag};

  // true：只处理带非空、且不是 "-" 标签的字段。
  bool only_tagged{false};

  // true：输入不足时返回 errc::truncated，而不是补 0 继续。
  bool strict_truncation{false};

  // true：每个嵌套的可空字段前写 1 字节存在标记（0x00 空 / 0x01 有值）。
  // 关闭时保持历史格式：空值不占字节，解码时总是分配并读取。
  bool presence_markers{false};

  // 解码时允许的最大长度前缀。
  std::uint64_t max_length{core::kDefaultMaxLength};

  std::size_t max_depth{kDefaultMaxDepth};
};

}  // namespace structbin::codec
