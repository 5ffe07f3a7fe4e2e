#include "AbiDescriptor.hpp"

#include <base/Format.hpp>

#include <algorithm>
#include <bit>
#include <span>
#include <utility>

using namespace abicheck;

static bool contains(std::span<const RegisterSlot> slots, RegisterSlot slot) {
  return std::find(slots.begin(), slots.end(), slot) != slots.end();
}

static Error malformed(std::string detail) {
  return Error{
    .kind = Error::Kind::MalformedDescriptor,
    .detail = std::move(detail),
  };
}

bool AbiDescriptor::is_argument(RegisterSlot slot) const {
  return contains(argument_registers, slot);
}

bool AbiDescriptor::is_return(RegisterSlot slot) const {
  return contains(return_registers, slot);
}

bool AbiDescriptor::is_callee_saved(RegisterSlot slot) const {
  return contains(callee_saved, slot);
}

bool AbiDescriptor::is_caller_saved(RegisterSlot slot) const {
  return contains(caller_saved, slot);
}

RegisterRole AbiDescriptor::roles(RegisterSlot slot) const {
  auto roles = slot.fixed_roles();

  if (is_argument(slot)) {
    roles = roles | RegisterRole::Argument;
  }
  if (is_return(slot)) {
    roles = roles | RegisterRole::Return;
  }
  if (is_callee_saved(slot)) {
    roles = roles | RegisterRole::CalleeSaved;
  }
  if (is_caller_saved(slot)) {
    roles = roles | RegisterRole::CallerSaved;
  }

  return roles;
}

AbiDescriptor AbiDescriptor::x64_sysv() {
  using R = x64::Register;

  return AbiDescriptor{
    .architecture = Architecture::X64SysV,
    .argument_registers = {R::Rdi, R::Rsi, R::Rdx, R::Rcx, R::R8, R::R9},
    .return_registers = {R::Rax, R::Rdx},
    .callee_saved = {R::Rbx, R::Rbp, R::R12, R::R13, R::R14, R::R15},
    .caller_saved = {R::Rax, R::Rcx, R::Rdx, R::Rsi, R::Rdi, R::R8, R::R9, R::R10, R::R11},
    .stack_alignment = 16,
    .red_zone = true,
    .red_zone_size = 128,
    .shadow_space = 0,
  };
}

AbiDescriptor AbiDescriptor::x64_ms64() {
  using R = x64::Register;

  return AbiDescriptor{
    .architecture = Architecture::X64Ms64,
    .argument_registers = {R::Rcx, R::Rdx, R::R8, R::R9},
    .return_registers = {R::Rax},
    .callee_saved = {R::Rbx, R::Rbp, R::Rsi, R::Rdi, R::R12, R::R13, R::R14, R::R15},
    .caller_saved = {R::Rax, R::Rcx, R::Rdx, R::R8, R::R9, R::R10, R::R11},
    .stack_alignment = 16,
    .red_zone = false,
    .red_zone_size = 0,
    .shadow_space = 32,
  };
}

AbiDescriptor AbiDescriptor::aarch64_aapcs64() {
  using R = aarch64::Register;

  // X8 (indirect result), X16/X17 (intra-procedure-call scratch) and X18 (platform register)
  // are treated as caller-saved.
  return AbiDescriptor{
    .architecture = Architecture::AArch64Aapcs64,
    .argument_registers = {R::X0, R::X1, R::X2, R::X3, R::X4, R::X5, R::X6, R::X7},
    .return_registers = {R::X0, R::X1},
    .callee_saved =
      {
        R::X19,
        R::X20,
        R::X21,
        R::X22,
        R::X23,
        R::X24,
        R::X25,
        R::X26,
        R::X27,
        R::X28,
        R::X29,
      },
    .caller_saved =
      {
        R::X0,  R::X1,  R::X2,  R::X3,  R::X4,  R::X5,  R::X6,  R::X7,  R::X8,  R::X9,
        R::X10, R::X11, R::X12, R::X13, R::X14, R::X15, R::X16, R::X17, R::X18, R::X30,
      },
    .stack_alignment = 16,
    .red_zone = false,
    .red_zone_size = 0,
    .shadow_space = 0,
  };
}

static AbiDescriptor riscv_descriptor(Architecture architecture) {
  using R = riscv::Register;

  return AbiDescriptor{
    .architecture = architecture,
    .argument_registers = {R::A0, R::A1, R::A2, R::A3, R::A4, R::A5, R::A6, R::A7},
    .return_registers = {R::A0, R::A1},
    .callee_saved =
      {
        R::S0,
        R::S1,
        R::S2,
        R::S3,
        R::S4,
        R::S5,
        R::S6,
        R::S7,
        R::S8,
        R::S9,
        R::S10,
        R::S11,
      },
    .caller_saved =
      {
        R::Ra, R::T0, R::T1, R::T2, R::A0, R::A1, R::A2, R::A3,
        R::A4, R::A5, R::A6, R::A7, R::T3, R::T4, R::T5, R::T6,
      },
    .stack_alignment = 16,
    .red_zone = false,
    .red_zone_size = 0,
    .shadow_space = 0,
  };
}

AbiDescriptor AbiDescriptor::rv64g() {
  return riscv_descriptor(Architecture::Rv64G);
}

AbiDescriptor AbiDescriptor::rv32g() {
  // ILP32 keeps the 16 byte stack alignment of LP64.
  return riscv_descriptor(Architecture::Rv32G);
}

static Error validate_family(std::span<const RegisterSlot> slots,
                             RegisterFamily family,
                             std::string_view set_name) {
  for (const auto slot : slots) {
    if (slot.family() != family || slot.index() >= register_count(family)) {
      return malformed(base::format("{} register #{} of the {} family does not belong to {}",
                                    set_name, slot.index(), slot.family(), family));
    }
  }
  return {};
}

static Error validate_unique(std::span<const RegisterSlot> slots, std::string_view set_name) {
  for (size_t i = 0; i < slots.size(); ++i) {
    for (size_t j = i + 1; j < slots.size(); ++j) {
      if (slots[i] == slots[j]) {
        return malformed(base::format("{} is listed twice in {}", slots[i], set_name));
      }
    }
  }
  return {};
}

Error abicheck::validate_descriptor(const AbiDescriptor& descriptor) {
  if (!is_supported_architecture(descriptor.architecture)) {
    return malformed(
      base::format("architecture #{} is not supported", int(descriptor.architecture)));
  }

  if (descriptor.stack_alignment == 0 || !std::has_single_bit(descriptor.stack_alignment)) {
    return malformed(
      base::format("stack alignment {} is not a power of two", descriptor.stack_alignment));
  }

  if (!descriptor.red_zone && descriptor.red_zone_size != 0) {
    return malformed(base::format("red zone size {} given without a red zone",
                                  descriptor.red_zone_size));
  }

  const auto family = register_family(descriptor.architecture);

  const std::pair<std::span<const RegisterSlot>, std::string_view> sets[]{
    {descriptor.argument_registers, "argument registers"},
    {descriptor.return_registers, "return registers"},
    {descriptor.callee_saved, "callee-saved registers"},
    {descriptor.caller_saved, "caller-saved registers"},
  };

  for (const auto& [slots, name] : sets) {
    if (auto error = validate_family(slots, family, name)) {
      return error;
    }
    if (auto error = validate_unique(slots, name)) {
      return error;
    }
  }

  for (size_t i = 0; i < register_count(family); ++i) {
    const RegisterSlot slot(family, i);

    const auto callee_saved = descriptor.is_callee_saved(slot);
    const auto caller_saved = descriptor.is_caller_saved(slot);

    if (!slot.is_general_purpose()) {
      if (callee_saved || caller_saved) {
        return malformed(
          base::format("{} is not a general-purpose register but has a preservation rule", slot));
      }
      continue;
    }

    if (callee_saved && caller_saved) {
      return malformed(base::format("{} is both callee-saved and caller-saved", slot));
    }
    if (!callee_saved && !caller_saved) {
      return malformed(base::format("{} is neither callee-saved nor caller-saved", slot));
    }
  }

  for (const auto slot : descriptor.argument_registers) {
    if (!descriptor.is_caller_saved(slot)) {
      return malformed(base::format("argument register {} is not caller-saved", slot));
    }
  }

  for (const auto slot : descriptor.return_registers) {
    if (!descriptor.is_caller_saved(slot)) {
      return malformed(base::format("return register {} is not caller-saved", slot));
    }
  }

  return {};
}
