#include "AbiRegistry.hpp"

#include <base/Error.hpp>
#include <base/Format.hpp>
#include <base/Log.hpp>

#include <vector>

using namespace abicheck;

namespace {

class DescriptorTable {
  std::vector<AbiDescriptor> descriptors;

 public:
  DescriptorTable() {
    for (const auto architecture : supported_architectures()) {
      auto descriptor = build(architecture);

      const auto error = validate_descriptor(descriptor);
      verify(!error, "built-in descriptor for {} is malformed: {}", architecture, error);

      descriptors.push_back(std::move(descriptor));
    }

    log_debug("registered {} ABI descriptors", descriptors.size());
  }

  static AbiDescriptor build(Architecture architecture) {
    switch (architecture) {
        // clang-format off
      case Architecture::X64SysV: return AbiDescriptor::x64_sysv();
      case Architecture::X64Ms64: return AbiDescriptor::x64_ms64();
      case Architecture::AArch64Aapcs64: return AbiDescriptor::aarch64_aapcs64();
      case Architecture::Rv64G: return AbiDescriptor::rv64g();
      case Architecture::Rv32G: return AbiDescriptor::rv32g();
        // clang-format on

      default:
        unreachable();
    }
  }

  const AbiDescriptor* find(Architecture architecture) const {
    for (const auto& descriptor : descriptors) {
      if (descriptor.architecture == architecture) {
        return &descriptor;
      }
    }
    return nullptr;
  }
};

}  // namespace

static const DescriptorTable& descriptor_table() {
  static const DescriptorTable table;
  return table;
}

void AbiRegistry::initialize() {
  (void)descriptor_table();
}

Error AbiRegistry::get_descriptor(Architecture architecture, const AbiDescriptor*& descriptor) {
  descriptor = descriptor_table().find(architecture);
  if (!descriptor) {
    return Error{
      .kind = Error::Kind::UnknownArchitecture,
      .detail = base::format("architecture #{} has no registered descriptor", int(architecture)),
    };
  }
  return {};
}

Error AbiRegistry::get_descriptor(std::string_view name, const AbiDescriptor*& descriptor) {
  Architecture architecture{};
  if (!parse_architecture(name, architecture)) {
    descriptor = nullptr;
    return Error{
      .kind = Error::Kind::UnknownArchitecture,
      .detail = std::string(name),
    };
  }
  return get_descriptor(architecture, descriptor);
}
