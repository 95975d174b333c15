#pragma once

#include <optional>
#include <string_view>

namespace structbin::codec {

/**
 * @brief 在标签串中查找 key 对应的值。
 *
 * 标签串格式：`key:"value"`，多个键值对以空格分隔。
 * - key 不存在时返回 std::nullopt
 * - 标签串格式错误时，从出错位置起的内容视为不存在
 * - 返回值指向 tags 内部（引号内的原始内容，不做转义还原）
 */
[[nodiscard]] std::optional<std::string_view> lookup_tag(
  std::string_view tags,
  std::string_view key) noexcept;

/**
 * @brief 字段是否参与编解码。
 *
 * - only_tagged == false：所有字段都参与，包括标记为 "-" 的字段
 * - only_tagged == true：只有带非空、且不是 "-" 的标签的字段参与
 *
 * 编码与解码使用同一规则。
 */
[[nodiscard]] bool field_included(std::optional<std::string_view> tag, bool only_tagged) noexcept;

}  // namespace structbin::codec
