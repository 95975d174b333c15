#include "structbin/codec/stream.hpp"

#include "structbin/codec/error.hpp"
#include "structbin/codec/trace.hpp"

#include <algorithm>

namespace structbin::codec {

std::error_code write_all(Sink& sink, core::bytes_view in) noexcept {
  if (in.empty()) {
    return {};
  }
  std::size_t written = 0;
  auto ec = sink.write(in, written);
  if (ec) {
    return ec;
  }
  if (written != in.size()) {
    detail::trace_short_write(in.size(), written);
    return make_error_code(errc::short_write);
  }
  return {};
}

std::error_code read_full(
  Source& source,
  core::mutable_bytes_view out,
  bool strict,
  std::size_t& got) noexcept {
  got = 0;
  while (got < out.size()) {
    std::size_t n = 0;
    auto ec = source.read_some(out.subspan(got), n);
    if (ec) {
      return ec;
    }
    if (n == 0) {
      break;
    }
    got += n;
  }

  if (got == out.size()) {
    return {};
  }

  detail::trace_short_read(out.size(), got, strict);
  if (strict) {
    return make_error_code(errc::truncated);
  }
  std::fill(out.begin() + static_cast<std::ptrdiff_t>(got), out.end(), core::byte{0});
  return {};
}

}  // namespace structbin::codec
