#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <base/EnumBitOperations.hpp>
#include <fmt/format.h>

#include "Architecture.hpp"

namespace abicheck {

namespace x64 {

enum class Register : uint8_t {
  Rax = 0,
  Rcx,
  Rdx,
  Rbx,
  Rsp,
  Rbp,
  Rsi,
  Rdi,
  R8,
  R9,
  R10,
  R11,
  R12,
  R13,
  R14,
  R15 = 15,
};

}  // namespace x64

namespace aarch64 {

enum class Register : uint8_t {
  X0 = 0,
  X1,
  X2,
  X3,
  X4,
  X5,
  X6,
  X7,
  X8,
  X9,
  X10,
  X11,
  X12,
  X13,
  X14,
  X15,
  X16,
  X17,
  X18,
  X19,
  X20,
  X21,
  X22,
  X23,
  X24,
  X25,
  X26,
  X27,
  X28,
  X29,
  X30,
  Sp = 31,
};

}  // namespace aarch64

namespace riscv {

enum class Register : uint8_t {
  Zero = 0,
  Ra,
  Sp,
  Gp,
  Tp,
  T0,
  T1,
  T2,
  S0,
  S1,
  A0,
  A1,
  A2,
  A3,
  A4,
  A5,
  A6,
  A7,
  S2,
  S3,
  S4,
  S5,
  S6,
  S7,
  S8,
  S9,
  S10,
  S11,
  T3,
  T4,
  T5,
  T6 = 31,
};

}  // namespace riscv

enum class RegisterRole : uint16_t {
  None = 0,
  General = (1 << 0),
  Argument = (1 << 1),
  Return = (1 << 2),
  CalleeSaved = (1 << 3),
  CallerSaved = (1 << 4),
  StackPointer = (1 << 5),
  FramePointer = (1 << 6),
  Link = (1 << 7),
  Reserved = (1 << 8),
};

constexpr size_t max_register_count = 32;

// Uniform identity of a register inside its register family. Constructed implicitly from
// the per-family enums so ABI tables stay typed.
class RegisterSlot {
  RegisterFamily family_{};
  uint8_t index_{};

 public:
  constexpr RegisterSlot() = default;
  RegisterSlot(RegisterFamily family, size_t index);

  constexpr RegisterSlot(x64::Register reg) : family_(RegisterFamily::X64), index_(uint8_t(reg)) {}
  constexpr RegisterSlot(aarch64::Register reg)
      : family_(RegisterFamily::AArch64), index_(uint8_t(reg)) {}
  constexpr RegisterSlot(riscv::Register reg)
      : family_(RegisterFamily::RiscV), index_(uint8_t(reg)) {}

  RegisterFamily family() const { return family_; }
  size_t index() const { return index_; }

  std::string_view name() const;
  RegisterRole fixed_roles() const;

  bool is_general_purpose() const;

  bool operator==(const RegisterSlot& other) const = default;
};

size_t register_count(RegisterFamily family);
RegisterSlot stack_pointer_register(RegisterFamily family);

// Resolves a canonical register name (case-insensitive) or a RISC-V alias.
bool find_register(RegisterFamily family, std::string_view name, RegisterSlot& slot);

// Renders a role set as `callee-saved|frame-pointer`.
std::string format_register_roles(RegisterRole roles);

}  // namespace abicheck

IMPLEMENT_ENUM_BIT_OPERATIONS(abicheck::RegisterRole)

template <>
struct fmt::formatter<abicheck::RegisterSlot> : formatter<std::string_view> {
  auto format(const abicheck::RegisterSlot& slot, format_context& ctx) const {
    return formatter<string_view>::format(slot.name(), ctx);
  }
};
