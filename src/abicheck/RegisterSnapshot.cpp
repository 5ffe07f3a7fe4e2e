#include "RegisterSnapshot.hpp"

#include <base/Error.hpp>
#include <base/Format.hpp>

using namespace abicheck;

Error RegisterSnapshot::capture(Architecture architecture,
                                const RawRegisterValues& raw_values,
                                std::optional<RegisterSnapshot>& snapshot) {
  snapshot.reset();

  if (!is_supported_architecture(architecture)) {
    return Error{
      .kind = Error::Kind::UnknownArchitecture,
      .detail = base::format("architecture #{}", int(architecture)),
    };
  }

  RegisterSnapshot captured(architecture);

  const auto family = register_family(architecture);
  const auto width = register_width(architecture);
  const auto max_value = width >= 64 ? ~uint64_t(0) : (uint64_t(1) << width) - 1;

  std::array<const std::string*, max_register_count> sources{};

  for (const auto& [name, value] : raw_values) {
    RegisterSlot slot;
    if (!find_register(family, name, slot)) {
      return Error{
        .kind = Error::Kind::UnexpectedRegister,
        .detail = base::format("{} is not a register of {}", name, architecture),
      };
    }

    auto& source = sources[slot.index()];
    if (source) {
      return Error{
        .kind = Error::Kind::DuplicateRegister,
        .detail = base::format("{} and {} both name {}", *source, name, slot),
      };
    }

    if (value > max_value) {
      return Error{
        .kind = Error::Kind::ValueOutOfRange,
        .detail = base::format("{} = {:#x} does not fit in {} bits", slot, value, width),
      };
    }

    source = &name;
    captured.values[slot.index()] = value;
  }

  for (size_t i = 0; i < register_count(family); ++i) {
    if (!sources[i]) {
      return Error{
        .kind = Error::Kind::IncompleteSnapshot,
        .detail = base::format("{} is missing", RegisterSlot(family, i)),
      };
    }
  }

  captured.stack_pointer_ = captured.get(stack_pointer_register(family));

  snapshot = std::move(captured);
  return {};
}

uint64_t RegisterSnapshot::get(RegisterSlot slot) const {
  verify(slot.family() == family(), "register {} of {} family read from a {} snapshot",
         slot.index(), slot.family(), architecture_);

  return values[slot.index()];
}

RawRegisterValues RegisterSnapshot::to_raw() const {
  RawRegisterValues raw;

  for (size_t i = 0; i < size(); ++i) {
    const RegisterSlot slot(family(), i);
    raw.emplace(std::string(slot.name()), values[i]);
  }

  return raw;
}
