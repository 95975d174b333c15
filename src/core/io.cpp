#include "structbin/core/io.hpp"

#include <algorithm>

namespace structbin::core {

std::error_code VectorSink::write(bytes_view in, std::size_t& written) noexcept {
  written = 0;
  if (in.empty()) {
    return {};
  }
  if (in.size() > (out_.max_size() - out_.size())) {
    return make_error_code(errc::buffer_overflow);
  }
  out_.insert(out_.end(), in.begin(), in.end());
  written = in.size();
  return {};
}

std::error_code SpanSink::write(bytes_view in, std::size_t& written) noexcept {
  const auto n = std::min(in.size(), out_.size() - written_);
  std::copy_n(in.begin(), n, out_.begin() + static_cast<std::ptrdiff_t>(written_));
  written_ += n;
  written = n;
  return {};
}

std::error_code BytesSource::read_some(mutable_bytes_view out, std::size_t& n) noexcept {
  auto limit = std::min(out.size(), remaining());
  if (chunk_ != 0) {
    limit = std::min(limit, chunk_);
  }
  std::copy_n(in_.begin() + static_cast<std::ptrdiff_t>(pos_), limit, out.begin());
  pos_ += limit;
  n = limit;
  return {};
}

}  // namespace structbin::core
