#include "Architecture.hpp"
#include "private/Names.hpp"

#include <base/Error.hpp>

using namespace abicheck;

static constexpr Architecture architectures[]{
  Architecture::X64SysV, Architecture::X64Ms64, Architecture::AArch64Aapcs64,
  Architecture::Rv64G,   Architecture::Rv32G,
};

std::span<const Architecture> abicheck::supported_architectures() {
  return architectures;
}

bool abicheck::is_supported_architecture(Architecture architecture) {
  for (const auto supported : architectures) {
    if (supported == architecture) {
      return true;
    }
  }
  return false;
}

bool abicheck::parse_architecture(std::string_view name, Architecture& architecture) {
  for (const auto supported : architectures) {
    if (detail::names_equal(detail::architecture_name(supported), name)) {
      architecture = supported;
      return true;
    }
  }
  return false;
}

RegisterFamily abicheck::register_family(Architecture architecture) {
  switch (architecture) {
      // clang-format off
    case Architecture::X64SysV: return RegisterFamily::X64;
    case Architecture::X64Ms64: return RegisterFamily::X64;
    case Architecture::AArch64Aapcs64: return RegisterFamily::AArch64;
    case Architecture::Rv64G: return RegisterFamily::RiscV;
    case Architecture::Rv32G: return RegisterFamily::RiscV;
      // clang-format on

    default:
      unreachable();
  }
}

uint32_t abicheck::register_width(Architecture architecture) {
  return architecture == Architecture::Rv32G ? 32 : 64;
}

std::string_view detail::architecture_name(Architecture architecture) {
  switch (architecture) {
      // clang-format off
    case Architecture::X64SysV: return "x86-64-SysV";
    case Architecture::X64Ms64: return "x86-64-MS64";
    case Architecture::AArch64Aapcs64: return "AArch64-AAPCS64";
    case Architecture::Rv64G: return "RV64G";
    case Architecture::Rv32G: return "RV32G";
      // clang-format on

    default:
      unreachable();
  }
}

std::string_view detail::register_family_name(RegisterFamily family) {
  switch (family) {
      // clang-format off
    case RegisterFamily::X64: return "x64";
    case RegisterFamily::AArch64: return "aarch64";
    case RegisterFamily::RiscV: return "riscv";
      // clang-format on

    default:
      unreachable();
  }
}
