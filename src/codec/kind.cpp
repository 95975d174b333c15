#include "structbin/codec/kind.hpp"

namespace structbin::codec {

std::string_view kind_name(Kind k) noexcept {
  switch (k) {
    case Kind::invalid:
      return "invalid";
    case Kind::boolean:
      return "bool";
    case Kind::int8:
      return "int8";
    case Kind::int16:
      return "int16";
    case Kind::int32:
      return "int32";
    case Kind::int64:
      return "int64";
    case Kind::uint8:
      return "uint8";
    case Kind::uint16:
      return "uint16";
    case Kind::uint32:
      return "uint32";
    case Kind::uint64:
      return "uint64";
    case Kind::float32:
      return "float32";
    case Kind::float64:
      return "float64";
    case Kind::complex64:
      return "complex64";
    case Kind::complex128:
      return "complex128";
    case Kind::string:
      return "string";
    case Kind::array:
      return "array";
    case Kind::slice:
      return "slice";
    case Kind::map:
      return "map";
    case Kind::structure:
      return "struct";
    case Kind::pointer:
      return "ptr";
    case Kind::custom:
      return "custom";
    case Kind::unsafe_pointer:
      return "unsafe pointer";
    case Kind::chan:
      return "chan";
    case Kind::func:
      return "func";
    case Kind::interface:
      return "interface";
    case Kind::unknown:
      return "unknown";
  }
  return "unknown";
}

}  // namespace structbin::codec
