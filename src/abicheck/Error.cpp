#include "Error.hpp"

#include <base/Error.hpp>

using namespace abicheck;

std::string_view detail::error_kind_representation(Error::Kind kind) {
  using K = Error::Kind;

  switch (kind) {
      // clang-format off
    case K::None: return "None";
    case K::UnknownArchitecture: return "UnknownArchitecture";
    case K::MalformedDescriptor: return "MalformedDescriptor";
    case K::IncompleteSnapshot: return "IncompleteSnapshot";
    case K::UnexpectedRegister: return "UnexpectedRegister";
    case K::DuplicateRegister: return "DuplicateRegister";
    case K::ValueOutOfRange: return "ValueOutOfRange";
    case K::ArchitectureMismatch: return "ArchitectureMismatch";
      // clang-format on

    default:
      unreachable();
  }
}
