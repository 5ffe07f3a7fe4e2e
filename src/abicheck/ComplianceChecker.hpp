#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "AbiDescriptor.hpp"
#include "Error.hpp"
#include "Register.hpp"
#include "RegisterSnapshot.hpp"

namespace abicheck {

struct Violation {
  enum class Kind {
    RegisterNotPreserved,
    StackMisaligned,
    ArgumentRegisterUninitialized,
    ReturnRegisterUnset,
  };
  Kind kind{};

  // Offending register. Unused for StackMisaligned.
  RegisterSlot reg{};

  // StackMisaligned: stack pointer modulo the required alignment.
  uint64_t misalignment{};

  // RegisterNotPreserved: value before and after the boundary.
  uint64_t expected{};
  uint64_t observed{};

  bool operator==(const Violation& other) const = default;
};

struct ComplianceVerdict {
  bool pass{};
  std::vector<Violation> violations{};

  bool operator==(const ComplianceVerdict& other) const = default;
};

struct CheckOptions {
  enum class Boundary {
    // `after` was taken when the callee returned.
    Exit,
    // `after` was taken on the first instruction of the callee. On x86-64 the stack pointer
    // then still includes the return address pushed by `call`.
    Entry,
  };
  Boundary boundary = Boundary::Exit;

  // Entry: number of declared integer parameters.
  size_t parameter_count = 0;

  // Exit: number of return registers the function defines.
  size_t return_count = 0;

  // Fill pattern the register source uses for registers that were never written.
  std::optional<uint64_t> poison_value{};
};

class ComplianceChecker {
 public:
  static Error check(const RegisterSnapshot& before,
                     const RegisterSnapshot& after,
                     const AbiDescriptor& descriptor,
                     ComplianceVerdict& verdict);

  static Error check(const RegisterSnapshot& before,
                     const RegisterSnapshot& after,
                     const AbiDescriptor& descriptor,
                     const CheckOptions& options,
                     ComplianceVerdict& verdict);
};

namespace detail {

std::string_view violation_kind_representation(Violation::Kind kind);

}

}  // namespace abicheck

template <>
struct fmt::formatter<abicheck::Violation::Kind> : formatter<std::string_view> {
  auto format(const abicheck::Violation::Kind& kind, format_context& ctx) const {
    return formatter<string_view>::format(abicheck::detail::violation_kind_representation(kind),
                                          ctx);
  }
};

template <>
struct fmt::formatter<abicheck::Violation> : formatter<std::string_view> {
  auto format(const abicheck::Violation& violation, format_context& ctx) const {
    using K = abicheck::Violation::Kind;

    switch (violation.kind) {
      case K::RegisterNotPreserved:
        return fmt::format_to(ctx.out(), "{}({}): {:#x} -> {:#x}", violation.kind, violation.reg,
                              violation.expected, violation.observed);
      case K::StackMisaligned:
        return fmt::format_to(ctx.out(), "{}(remainder {})", violation.kind,
                              violation.misalignment);
      default:
        return fmt::format_to(ctx.out(), "{}({})", violation.kind, violation.reg);
    }
  }
};

template <>
struct fmt::formatter<abicheck::ComplianceVerdict> : formatter<std::string_view> {
  auto format(const abicheck::ComplianceVerdict& verdict, format_context& ctx) const {
    auto out = fmt::format_to(ctx.out(), "{}", verdict.pass ? "pass" : "fail");
    for (size_t i = 0; i < verdict.violations.size(); ++i) {
      out = fmt::format_to(out, "{}{}", i == 0 ? ": " : ", ", verdict.violations[i]);
    }
    return out;
  }
};
