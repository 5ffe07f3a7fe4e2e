#pragma once
#include <cstdint>
#include <vector>

#include <base/containers/StaticVector.hpp>

#include "Architecture.hpp"
#include "Error.hpp"
#include "Register.hpp"

namespace abicheck {

struct AbiDescriptor {
  constexpr static size_t max_argument_registers = 8;

  Architecture architecture{};

  // Ordered: first entry carries the first integer argument.
  base::StaticVector<RegisterSlot, max_argument_registers> argument_registers{};
  std::vector<RegisterSlot> return_registers{};

  std::vector<RegisterSlot> callee_saved{};
  std::vector<RegisterSlot> caller_saved{};

  uint32_t stack_alignment{};

  bool red_zone{};
  uint32_t red_zone_size{};

  // Space the caller reserves for the callee to spill register arguments.
  uint32_t shadow_space{};

  bool is_argument(RegisterSlot slot) const;
  bool is_return(RegisterSlot slot) const;
  bool is_callee_saved(RegisterSlot slot) const;
  bool is_caller_saved(RegisterSlot slot) const;

  // Fixed register file roles combined with the roles this ABI assigns.
  RegisterRole roles(RegisterSlot slot) const;

  static AbiDescriptor x64_sysv();
  static AbiDescriptor x64_ms64();
  static AbiDescriptor aarch64_aapcs64();
  static AbiDescriptor rv64g();
  static AbiDescriptor rv32g();
};

Error validate_descriptor(const AbiDescriptor& descriptor);

}  // namespace abicheck
