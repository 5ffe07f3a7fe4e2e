#include "Register.hpp"
#include "private/Names.hpp"

#include <base/Error.hpp>
#include <base/Parsing.hpp>

#include <iterator>
#include <span>
#include <utility>

using namespace abicheck;

namespace {

struct RegisterInfo {
  std::string_view name;
  RegisterRole roles;
};

constexpr auto G = RegisterRole::General;
constexpr auto SP = RegisterRole::StackPointer;
constexpr auto FP = RegisterRole::General | RegisterRole::FramePointer;
constexpr auto LR = RegisterRole::General | RegisterRole::Link;
constexpr auto RES = RegisterRole::Reserved;

constexpr RegisterInfo x64_registers[]{
  {"RAX", G},  {"RCX", G},  {"RDX", G},  {"RBX", G},  {"RSP", SP}, {"RBP", FP},
  {"RSI", G},  {"RDI", G},  {"R8", G},   {"R9", G},   {"R10", G},  {"R11", G},
  {"R12", G},  {"R13", G},  {"R14", G},  {"R15", G},
};

constexpr RegisterInfo aarch64_registers[]{
  {"X0", G},  {"X1", G},  {"X2", G},  {"X3", G},  {"X4", G},  {"X5", G},   {"X6", G},
  {"X7", G},  {"X8", G},  {"X9", G},  {"X10", G}, {"X11", G}, {"X12", G},  {"X13", G},
  {"X14", G}, {"X15", G}, {"X16", G}, {"X17", G}, {"X18", G}, {"X19", G},  {"X20", G},
  {"X21", G}, {"X22", G}, {"X23", G}, {"X24", G}, {"X25", G}, {"X26", G},  {"X27", G},
  {"X28", G}, {"X29", FP}, {"X30", LR}, {"SP", SP},
};

constexpr RegisterInfo riscv_registers[]{
  {"zero", RES}, {"ra", LR}, {"sp", SP},  {"gp", RES}, {"tp", RES}, {"t0", G},  {"t1", G},
  {"t2", G},     {"s0", FP}, {"s1", G},   {"a0", G},   {"a1", G},   {"a2", G},  {"a3", G},
  {"a4", G},     {"a5", G},  {"a6", G},   {"a7", G},   {"s2", G},   {"s3", G},  {"s4", G},
  {"s5", G},     {"s6", G},  {"s7", G},   {"s8", G},   {"s9", G},   {"s10", G}, {"s11", G},
  {"t3", G},     {"t4", G},  {"t5", G},   {"t6", G},
};

static_assert(std::size(x64_registers) == 16);
static_assert(std::size(aarch64_registers) == max_register_count);
static_assert(std::size(riscv_registers) == max_register_count);

}  // namespace

static std::span<const RegisterInfo> register_file(RegisterFamily family) {
  switch (family) {
      // clang-format off
    case RegisterFamily::X64: return x64_registers;
    case RegisterFamily::AArch64: return aarch64_registers;
    case RegisterFamily::RiscV: return riscv_registers;
      // clang-format on

    default:
      unreachable();
  }
}

static const RegisterInfo& register_info(const RegisterSlot& slot) {
  const auto file = register_file(slot.family());
  verify(slot.index() < file.size(), "register index {} is out of range for {}", slot.index(),
         slot.family());

  return file[slot.index()];
}

RegisterSlot::RegisterSlot(RegisterFamily family, size_t index) : family_(family) {
  verify(index < register_file(family).size(), "register index {} is out of range for {}", index,
         family);

  index_ = uint8_t(index);
}

std::string_view RegisterSlot::name() const {
  return register_info(*this).name;
}

RegisterRole RegisterSlot::fixed_roles() const {
  return register_info(*this).roles;
}

bool RegisterSlot::is_general_purpose() const {
  return (fixed_roles() & RegisterRole::General) != RegisterRole::None;
}

size_t abicheck::register_count(RegisterFamily family) {
  return register_file(family).size();
}

RegisterSlot abicheck::stack_pointer_register(RegisterFamily family) {
  switch (family) {
      // clang-format off
    case RegisterFamily::X64: return x64::Register::Rsp;
    case RegisterFamily::AArch64: return aarch64::Register::Sp;
    case RegisterFamily::RiscV: return riscv::Register::Sp;
      // clang-format on

    default:
      unreachable();
  }
}

static bool find_riscv_alias(std::string_view name, RegisterSlot& slot) {
  if (detail::names_equal(name, "fp")) {
    slot = riscv::Register::S0;
    return true;
  }

  // Numeric names: x0 - x31.
  if (name.size() < 2 || (name[0] != 'x' && name[0] != 'X')) {
    return false;
  }

  uint32_t index = 0;
  if (!base::parse_integer(name.substr(1), index) || index >= max_register_count) {
    return false;
  }

  // Reject leading zeros so that `x01` does not silently alias `x1`.
  if (name.size() > 2 && name[1] == '0') {
    return false;
  }

  slot = RegisterSlot(RegisterFamily::RiscV, index);
  return true;
}

bool abicheck::find_register(RegisterFamily family, std::string_view name, RegisterSlot& slot) {
  const auto file = register_file(family);

  for (size_t i = 0; i < file.size(); ++i) {
    if (detail::names_equal(file[i].name, name)) {
      slot = RegisterSlot(family, i);
      return true;
    }
  }

  if (family == RegisterFamily::RiscV) {
    return find_riscv_alias(name, slot);
  }

  return false;
}

std::string abicheck::format_register_roles(RegisterRole roles) {
  constexpr std::pair<RegisterRole, std::string_view> role_names[]{
    {RegisterRole::General, "general"},
    {RegisterRole::Argument, "argument"},
    {RegisterRole::Return, "return"},
    {RegisterRole::CalleeSaved, "callee-saved"},
    {RegisterRole::CallerSaved, "caller-saved"},
    {RegisterRole::StackPointer, "stack-pointer"},
    {RegisterRole::FramePointer, "frame-pointer"},
    {RegisterRole::Link, "link"},
    {RegisterRole::Reserved, "reserved"},
  };

  std::string s;

  for (const auto& [role, name] : role_names) {
    if ((roles & role) == RegisterRole::None) {
      continue;
    }

    if (!s.empty()) {
      s += '|';
    }
    s += name;
  }

  return s.empty() ? std::string("none") : s;
}
