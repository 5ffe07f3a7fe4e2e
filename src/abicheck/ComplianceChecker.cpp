#include "ComplianceChecker.hpp"

#include <base/Error.hpp>
#include <base/Format.hpp>

#include <algorithm>
#include <span>

using namespace abicheck;

static bool is_defined(uint64_t value, const CheckOptions& options) {
  return !options.poison_value || value != *options.poison_value;
}

// Bytes the call instruction itself pushes. The other families keep the return address in
// a link register.
static uint64_t call_pushed_bytes(RegisterFamily family) {
  return family == RegisterFamily::X64 ? 8 : 0;
}

static void check_stack_alignment(const RegisterSnapshot& after,
                                  const AbiDescriptor& descriptor,
                                  const CheckOptions& options,
                                  std::vector<Violation>& violations) {
  // Alignment is validated on the state that precedes the next call. At entry that state is
  // the caller's, before the call pushed its return address.
  auto stack_pointer = after.stack_pointer();
  if (options.boundary == CheckOptions::Boundary::Entry) {
    stack_pointer += call_pushed_bytes(after.family());
  }

  const auto remainder = stack_pointer % descriptor.stack_alignment;
  if (remainder != 0) {
    violations.push_back(Violation{
      .kind = Violation::Kind::StackMisaligned,
      .misalignment = remainder,
    });
  }
}

static void check_preservation(const RegisterSnapshot& before,
                               const RegisterSnapshot& after,
                               const AbiDescriptor& descriptor,
                               std::vector<Violation>& violations) {
  // Caller-saved registers may change freely.
  for (const auto reg : descriptor.callee_saved) {
    const auto expected = before.get(reg);
    const auto observed = after.get(reg);

    if (expected != observed) {
      violations.push_back(Violation{
        .kind = Violation::Kind::RegisterNotPreserved,
        .reg = reg,
        .expected = expected,
        .observed = observed,
      });
    }
  }
}

static void check_defined(const RegisterSnapshot& after,
                          std::span<const RegisterSlot> registers,
                          size_t count,
                          const CheckOptions& options,
                          Violation::Kind kind,
                          std::vector<Violation>& violations) {
  // Parameters past the register sequence live on the stack and are not inspected.
  count = std::min(count, registers.size());

  for (const auto reg : registers.first(count)) {
    if (!is_defined(after.get(reg), options)) {
      violations.push_back(Violation{
        .kind = kind,
        .reg = reg,
      });
    }
  }
}

Error ComplianceChecker::check(const RegisterSnapshot& before,
                               const RegisterSnapshot& after,
                               const AbiDescriptor& descriptor,
                               ComplianceVerdict& verdict) {
  return check(before, after, descriptor, CheckOptions{}, verdict);
}

Error ComplianceChecker::check(const RegisterSnapshot& before,
                               const RegisterSnapshot& after,
                               const AbiDescriptor& descriptor,
                               const CheckOptions& options,
                               ComplianceVerdict& verdict) {
  verdict = ComplianceVerdict{};

  if (auto error = validate_descriptor(descriptor)) {
    return error;
  }

  if (before.architecture() != after.architecture() ||
      before.architecture() != descriptor.architecture) {
    return Error{
      .kind = Error::Kind::ArchitectureMismatch,
      .detail = base::format("before: {}, after: {}, descriptor: {}", before.architecture(),
                             after.architecture(), descriptor.architecture),
    };
  }

  auto& violations = verdict.violations;

  check_stack_alignment(after, descriptor, options, violations);
  check_preservation(before, after, descriptor, violations);

  switch (options.boundary) {
    case CheckOptions::Boundary::Entry: {
      check_defined(after, descriptor.argument_registers, options.parameter_count, options,
                    Violation::Kind::ArgumentRegisterUninitialized, violations);
      break;
    }

    case CheckOptions::Boundary::Exit: {
      check_defined(after, descriptor.return_registers, options.return_count, options,
                    Violation::Kind::ReturnRegisterUnset, violations);
      break;
    }

    default:
      unreachable();
  }

  verdict.pass = violations.empty();

  return {};
}

std::string_view detail::violation_kind_representation(Violation::Kind kind) {
  using K = Violation::Kind;

  switch (kind) {
      // clang-format off
    case K::RegisterNotPreserved: return "RegisterNotPreserved";
    case K::StackMisaligned: return "StackMisaligned";
    case K::ArgumentRegisterUninitialized: return "ArgumentRegisterUninitialized";
    case K::ReturnRegisterUnset: return "ReturnRegisterUnset";
      // clang-format on

    default:
      unreachable();
  }
}
