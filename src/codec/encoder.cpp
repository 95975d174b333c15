#include "structbin/codec/encoder.hpp"

#include <utility>

namespace structbin::codec {

std::error_code Encoder::CountingSink::write(core::bytes_view in, std::size_t& written) noexcept {
  written = 0;
  auto ec = inner_.write(in, written);
  count_ += written;
  return ec;
}

Encoder::Encoder(Sink& sink, Options options) : sink_(sink), options_(std::move(options)) {}

Encoder::Encoder(Sink& sink, std::string tag, bool only_tagged) : sink_(sink) {
  options_.tag = std::move(tag);
  options_.only_tagged = only_tagged;
}

std::error_code Encoder::write_length(std::size_t n) noexcept {
  return write_uint<std::uint64_t>(static_cast<std::uint64_t>(n));
}

std::error_code Encoder::unsupported(Kind kind) noexcept {
  unsupported_ = kind;
  detail::trace_unsupported(detail::Direction::encode, kind_name(kind));
  return make_error_code(errc::unsupported_kind);
}

}  // namespace structbin::codec
