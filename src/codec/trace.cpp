#include "structbin/codec/trace.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>

namespace structbin::codec::detail {
namespace {

[[nodiscard]] const char* direction_name(Direction dir) noexcept {
  return dir == Direction::encode ? "encode" : "decode";
}

}  // namespace

void trace_unsupported(Direction dir, std::string_view kind) noexcept {
  spdlog::debug("structbin {}: can't handle {}", direction_name(dir), kind);
}

void trace_short_write(std::size_t requested, std::size_t accepted) noexcept {
  spdlog::debug("structbin encode: only {} bytes of {} written", accepted, requested);
}

void trace_short_read(std::size_t requested, std::size_t got, bool strict) noexcept {
  if (strict) {
    spdlog::debug("structbin decode: truncated input, got {} bytes of {}", got, requested);
    return;
  }
  spdlog::debug("structbin decode: short read, got {} bytes of {}, zero-filling {}",
                got, requested, requested - got);
}

void trace_hook_count(Direction dir, std::size_t reported, std::size_t actual) noexcept {
  spdlog::debug("structbin {}: custom hook reported {} bytes, stream advanced {}",
                direction_name(dir), reported, actual);
}

void trace_length_overflow(std::uint64_t length, std::uint64_t limit) noexcept {
  spdlog::debug("structbin decode: length prefix {} exceeds limit {}", length, limit);
}

void trace_failure(Direction dir, const std::error_code& ec) noexcept {
  spdlog::debug("structbin {} failed: [{}] {}", direction_name(dir), ec.category().name(), ec.message());
}

void trace_field_failure(Direction dir, std::string_view field, const std::error_code& ec) noexcept {
  spdlog::debug("structbin {}: field {} failed: {}", direction_name(dir), field, ec.message());
}

}  // namespace structbin::codec::detail
