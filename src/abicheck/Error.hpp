#pragma once
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace abicheck {

// Failure of an operation on malformed input. A default constructed `Error` means success.
struct Error {
  enum class Kind {
    None,
    UnknownArchitecture,
    MalformedDescriptor,
    IncompleteSnapshot,
    UnexpectedRegister,
    DuplicateRegister,
    ValueOutOfRange,
    ArchitectureMismatch,
  };
  Kind kind{};
  std::string detail{};

  bool failed() const { return kind != Kind::None; }
  explicit operator bool() const { return failed(); }
};

namespace detail {

std::string_view error_kind_representation(Error::Kind kind);

}

}  // namespace abicheck

template <>
struct fmt::formatter<abicheck::Error::Kind> : formatter<std::string_view> {
  auto format(const abicheck::Error::Kind& kind, format_context& ctx) const {
    return formatter<string_view>::format(abicheck::detail::error_kind_representation(kind), ctx);
  }
};

template <>
struct fmt::formatter<abicheck::Error> : formatter<std::string_view> {
  auto format(const abicheck::Error& error, format_context& ctx) const {
    if (error.detail.empty()) {
      return fmt::format_to(ctx.out(), "{}", error.kind);
    }
    return fmt::format_to(ctx.out(), "{}: {}", error.kind, error.detail);
  }
};
