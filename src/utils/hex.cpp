#include "structbin/utils/hex.hpp"

#include <algorithm>

namespace structbin::utils {
namespace {

constexpr std::string_view kDigits = "0123456789abcdef";

[[nodiscard]] int nibble_(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(char c) noexcept {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case ',':
    case ':':
    case '-':
    case '_':
    case '|':
        return true;
    default:
        return false;
    }
}

void append_byte_(std::string& out, core::byte b) {
    out.push_back(kDigits[(b >> 4) & 0x0F]);
    out.push_back(kDigits[b & 0x0F]);
}

void append_offset_(std::string& out, std::size_t offset) {
    // 固定 4 位；超过 0xFFFF 时自然变长
    std::string digits;
    do {
        digits.push_back(kDigits[offset & 0x0F]);
        offset >>= 4;
    } while (offset != 0);
    while (digits.size() < 4) {
        digits.push_back('0');
    }
    out.append(digits.rbegin(), digits.rend());
    out.append(": ");
}

} // namespace

std::string to_hex(core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        append_byte_(out, b);
    }
    return out;
}

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
    const std::size_t total = bytes.size();
    const std::size_t limit =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line =
        (options.bytes_per_line == 0 ? static_cast<std::size_t>(16) : options.bytes_per_line);

    std::string out;
    for (std::size_t offset = 0; offset < limit; offset += per_line) {
        const std::size_t line_n = std::min(per_line, limit - offset);

        append_offset_(out, offset);
        for (std::size_t i = 0; i < line_n; ++i) {
            append_byte_(out, bytes[offset + i]);
            if (i + 1 != line_n) {
                out.push_back(' ');
            }
        }

        if (options.show_ascii) {
            // 补齐短行，保证 ASCII 列对齐
            out.append((per_line - line_n) * 3 + 2, ' ');
            for (std::size_t i = 0; i < line_n; ++i) {
                const auto c = bytes[offset + i];
                out.push_back((c >= 0x20 && c <= 0x7E) ? static_cast<char>(c) : '.');
            }
        }
        out.push_back('\n');
    }

    if (limit < total) {
        out.append("... (truncated, total=");
        out.append(std::to_string(total));
        out.append(" bytes)\n");
    }
    return out;
}

std::error_code parse_hex(std::string_view text, std::vector<core::byte>& out) noexcept {
    out.clear();

    int hi = -1;
    for (char c : text) {
        if (is_separator_(c)) {
            continue;
        }
        const int v = nibble_(c);
        if (v < 0) {
            return core::make_error_code(core::errc::invalid_argument);
        }
        if (hi < 0) {
            hi = v;
            continue;
        }
        out.push_back(static_cast<core::byte>((hi << 4) | v));
        hi = -1;
    }

    // 两个 nibble 组成一个 byte
    if (hi >= 0) {
        return core::make_error_code(core::errc::invalid_argument);
    }
    return {};
}

} // namespace structbin::utils
