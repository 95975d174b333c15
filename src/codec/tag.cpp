#include "structbin/codec/tag.hpp"

#include "structbin/core/common.hpp"

#include <cstddef>

namespace structbin::codec {
namespace {

[[nodiscard]] bool is_key_terminator(char c) noexcept {
  const auto u = static_cast<unsigned char>(c);
  return u <= ' ' || c == ':' || c == '"' || u == 0x7F;
}

}  // namespace

std::optional<std::string_view> lookup_tag(std::string_view tags, std::string_view key) noexcept {
  while (!tags.empty()) {
    // 跳过键值对之间的空白
    std::size_t i = 0;
    while (i < tags.size() && tags[i] == ' ') {
      ++i;
    }
    tags.remove_prefix(i);
    if (tags.empty()) {
      break;
    }

    // 键：直到 ':' / 空白 / 引号 / 控制字符
    i = 0;
    while (i < tags.size() && !is_key_terminator(tags[i])) {
      ++i;
    }
    if (i == 0 || i + 1 >= tags.size() || tags[i] != ':' || tags[i + 1] != '"') {
      break;
    }
    const auto name = tags.substr(0, i);
    tags.remove_prefix(i + 1);

    // 值：带引号，允许反斜杠转义
    i = 1;
    while (i < tags.size() && tags[i] != '"') {
      if (tags[i] == '\\') {
        ++i;
      }
      ++i;
    }
    if (i >= tags.size()) {
      break;
    }
    const auto value = tags.substr(1, i - 1);
    tags.remove_prefix(i + 1);

    if (name == key) {
      return value;
    }
  }
  return std::nullopt;
}

bool field_included(std::optional<std::string_view> tag, bool only_tagged) noexcept {
  if (!only_tagged) {
    return true;
  }
  return tag.has_value() && !tag->empty() && *tag != core::kExcludeTag;
}

}  // namespace structbin::codec
