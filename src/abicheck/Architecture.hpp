#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <fmt/format.h>

namespace abicheck {

enum class Architecture {
  X64SysV,
  X64Ms64,
  AArch64Aapcs64,
  Rv64G,
  Rv32G,
};

// Hardware register file shared by one or more ABIs.
enum class RegisterFamily {
  X64,
  AArch64,
  RiscV,
};

std::span<const Architecture> supported_architectures();

bool is_supported_architecture(Architecture architecture);
bool parse_architecture(std::string_view name, Architecture& architecture);

RegisterFamily register_family(Architecture architecture);
uint32_t register_width(Architecture architecture);

namespace detail {

std::string_view architecture_name(Architecture architecture);
std::string_view register_family_name(RegisterFamily family);

}  // namespace detail

}  // namespace abicheck

template <>
struct fmt::formatter<abicheck::Architecture> : formatter<std::string_view> {
  auto format(abicheck::Architecture architecture, format_context& ctx) const {
    return formatter<string_view>::format(abicheck::detail::architecture_name(architecture), ctx);
  }
};

template <>
struct fmt::formatter<abicheck::RegisterFamily> : formatter<std::string_view> {
  auto format(abicheck::RegisterFamily family, format_context& ctx) const {
    return formatter<string_view>::format(abicheck::detail::register_family_name(family), ctx);
  }
};
