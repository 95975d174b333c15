#pragma once

#include "structbin/core/common.hpp"
#include "structbin/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace structbin::utils {

/**
 * @brief 16 进制工具：用于测试断言、示例输出与调试日志。
 */

/**
 * @brief 紧凑小写 16 进制（无分隔符），例如 {0x00, 0x0a} -> "000a"。
 */
[[nodiscard]] std::string to_hex(core::bytes_view bytes);

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出 ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};
};

/**
 * @brief 多行 hexdump（带行首偏移）。
 */
[[nodiscard]] std::string hex_dump(core::bytes_view bytes, HexDumpOptions options = {});

/**
 * @brief 解析 16 进制字符串为 bytes（覆盖 out）。
 *
 * 支持大小写 hex，忽略空白与常见分隔符（, : - _ |），
 * 以便直接粘贴 “00 00 00 0a ...” 形式的抓包片段。
 *
 * 非法字符或奇数个 nibble 返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text, std::vector<core::byte>& out) noexcept;

} // namespace structbin::utils
