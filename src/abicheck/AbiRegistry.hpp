#pragma once
#include <string_view>

#include "AbiDescriptor.hpp"
#include "Architecture.hpp"
#include "Error.hpp"

namespace abicheck {

// Read-only table of the built-in ABI descriptors. The table is built and validated once;
// call `initialize` before spawning threads that perform lookups.
class AbiRegistry {
 public:
  static void initialize();

  static Error get_descriptor(Architecture architecture, const AbiDescriptor*& descriptor);
  static Error get_descriptor(std::string_view name, const AbiDescriptor*& descriptor);
};

}  // namespace abicheck
