#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "Architecture.hpp"
#include "Error.hpp"
#include "Register.hpp"

namespace abicheck {

// Register values as delivered by a register source (debugger, simulator, test fixture).
using RawRegisterValues = std::map<std::string, uint64_t>;

// Complete register file of one architecture at a call boundary.
class RegisterSnapshot {
  Architecture architecture_{};
  std::array<uint64_t, max_register_count> values{};
  uint64_t stack_pointer_{};

  explicit RegisterSnapshot(Architecture architecture) : architecture_(architecture) {}

 public:
  // Every register of `architecture` must be present exactly once in `raw_values`.
  static Error capture(Architecture architecture,
                       const RawRegisterValues& raw_values,
                       std::optional<RegisterSnapshot>& snapshot);

  Architecture architecture() const { return architecture_; }
  RegisterFamily family() const { return register_family(architecture_); }
  size_t size() const { return register_count(family()); }

  uint64_t get(RegisterSlot slot) const;
  uint64_t stack_pointer() const { return stack_pointer_; }

  RawRegisterValues to_raw() const;

  bool operator==(const RegisterSnapshot& other) const = default;
};

}  // namespace abicheck
