#include "structbin/codec/error.hpp"

#include <string>

namespace structbin::codec {
namespace {

class codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "structbin.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unsupported_kind:
        return "unsupported kind";
      case errc::not_a_pointer:
        return "can only decode into a pointer";
      case errc::short_write:
        return "short write";
      case errc::truncated:
        return "truncated input";
      case errc::length_overflow:
        return "length prefix exceeds limit";
      case errc::nil_pointer:
        return "cannot allocate storage behind a nil raw pointer";
      case errc::depth_exceeded:
        return "pointer nesting too deep";
      default:
        return "unknown structbin.codec error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace structbin::codec
