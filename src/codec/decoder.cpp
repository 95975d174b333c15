#include "structbin/codec/decoder.hpp"

#include <utility>

namespace structbin::codec {

std::error_code Decoder::CountingSource::read_some(core::mutable_bytes_view out, std::size_t& n) noexcept {
  n = 0;
  auto ec = inner_.read_some(out, n);
  count_ += n;
  return ec;
}

Decoder::Decoder(Source& source, Options options) : source_(source), options_(std::move(options)) {}

Decoder::Decoder(Source& source, std::string tag, bool only_tagged) : source_(source) {
  options_.tag = std::move(tag);
  options_.only_tagged = only_tagged;
}

std::error_code Decoder::read_bytes(core::mutable_bytes_view out) noexcept {
  std::size_t got = 0;
  return read_full(source_, out, options_.strict_truncation, got);
}

std::error_code Decoder::read_length(std::uint64_t& n, std::size_t unit) noexcept {
  auto ec = read_uint(n);
  if (ec) {
    return ec;
  }
  const std::uint64_t limit = options_.max_length / (unit == 0 ? 1 : unit);
  if (n > limit) {
    detail::trace_length_overflow(n, limit);
    return make_error_code(errc::length_overflow);
  }
  return {};
}

std::error_code Decoder::unsupported(Kind kind) noexcept {
  unsupported_ = kind;
  detail::trace_unsupported(detail::Direction::decode, kind_name(kind));
  return make_error_code(errc::unsupported_kind);
}

}  // namespace structbin::codec
