#include "TestRegisters.hpp"

#include <gtest/gtest.h>

#include <abicheck/RegisterSnapshot.hpp>

using namespace abicheck;
using namespace abicheck::test;

static Error try_capture(Architecture architecture, const RawRegisterValues& values) {
  std::optional<RegisterSnapshot> snapshot;
  const auto error = RegisterSnapshot::capture(architecture, values, snapshot);
  EXPECT_EQ(snapshot.has_value(), !error.failed());
  return error;
}

TEST(RegisterSnapshot, CapturesCompleteRegisterFile) {
  for (const auto architecture : supported_architectures()) {
    const auto values = make_raw_values(architecture);
    const auto snapshot = capture(architecture, values);

    EXPECT_EQ(snapshot.architecture(), architecture);
    EXPECT_EQ(snapshot.size(), values.size());
    EXPECT_EQ(snapshot.stack_pointer(), aligned_stack_pointer);

    for (const auto& [name, value] : values) {
      RegisterSlot slot;
      ASSERT_TRUE(find_register(snapshot.family(), name, slot)) << name;
      EXPECT_EQ(snapshot.get(slot), value) << name;
    }

    EXPECT_EQ(snapshot.to_raw(), values);
  }
}

TEST(RegisterSnapshot, MissingRegisterIsIncomplete) {
  auto values = make_raw_values(Architecture::X64SysV);
  values.erase("R15");
  values.erase("RBX");

  const auto error = try_capture(Architecture::X64SysV, values);
  EXPECT_EQ(error.kind, Error::Kind::IncompleteSnapshot);
  // Reported in register file order.
  EXPECT_EQ(error.detail, "RBX is missing");
}

TEST(RegisterSnapshot, MissingStackPointerIsIncomplete) {
  auto values = make_raw_values(Architecture::AArch64Aapcs64);
  values.erase("SP");

  EXPECT_EQ(try_capture(Architecture::AArch64Aapcs64, values).kind,
            Error::Kind::IncompleteSnapshot);
}

TEST(RegisterSnapshot, EmptyInputIsIncomplete) {
  EXPECT_EQ(try_capture(Architecture::Rv64G, {}).kind, Error::Kind::IncompleteSnapshot);
}

TEST(RegisterSnapshot, UnexpectedRegister) {
  {
    auto values = make_raw_values(Architecture::X64Ms64);
    values["XMM6"] = 0;

    const auto error = try_capture(Architecture::X64Ms64, values);
    EXPECT_EQ(error.kind, Error::Kind::UnexpectedRegister);
    EXPECT_NE(error.detail.find("XMM6"), std::string::npos) << error.detail;
  }

  {
    // Registers of a different family are not accepted.
    auto values = make_raw_values(Architecture::Rv64G);
    values["R12"] = 0;

    const auto error = try_capture(Architecture::Rv64G, values);
    EXPECT_EQ(error.kind, Error::Kind::UnexpectedRegister);
  }

  {
    // The first unexpected name in lexical order is reported.
    auto values = make_raw_values(Architecture::AArch64Aapcs64);
    values["W3"] = 0;
    values["PC"] = 0;

    const auto error = try_capture(Architecture::AArch64Aapcs64, values);
    EXPECT_EQ(error.kind, Error::Kind::UnexpectedRegister);
    EXPECT_EQ(error.detail, "PC is not a register of AArch64-AAPCS64");
  }
}

TEST(RegisterSnapshot, NamesAreCaseInsensitive) {
  auto values = make_raw_values(Architecture::X64SysV);
  values.erase("RBX");
  values["rbx"] = 0x1234;

  const auto snapshot = capture(Architecture::X64SysV, values);
  EXPECT_EQ(snapshot.get(x64::Register::Rbx), 0x1234u);
}

TEST(RegisterSnapshot, RiscVAliases) {
  auto values = make_raw_values(Architecture::Rv64G);
  values.erase("s0");
  values.erase("a0");
  values["fp"] = 0xf00;
  values["x10"] = 0xa0;

  const auto snapshot = capture(Architecture::Rv64G, values);
  EXPECT_EQ(snapshot.get(riscv::Register::S0), 0xf00u);
  EXPECT_EQ(snapshot.get(riscv::Register::A0), 0xa0u);
}

TEST(RegisterSnapshot, DuplicateRegister) {
  {
    auto values = make_raw_values(Architecture::Rv64G);
    values["fp"] = 0;

    const auto error = try_capture(Architecture::Rv64G, values);
    EXPECT_EQ(error.kind, Error::Kind::DuplicateRegister);
    EXPECT_NE(error.detail.find("s0"), std::string::npos) << error.detail;
  }

  {
    auto values = make_raw_values(Architecture::X64SysV);
    values["rax"] = 0;

    EXPECT_EQ(try_capture(Architecture::X64SysV, values).kind, Error::Kind::DuplicateRegister);
  }
}

TEST(RegisterSnapshot, ValuesMustFitNativeWidth) {
  auto values = make_raw_values(Architecture::Rv32G);
  values["t0"] = 0x1'0000'0000;

  const auto error = try_capture(Architecture::Rv32G, values);
  EXPECT_EQ(error.kind, Error::Kind::ValueOutOfRange);
  EXPECT_NE(error.detail.find("t0"), std::string::npos) << error.detail;

  values["t0"] = 0xffff'ffff;
  EXPECT_FALSE(try_capture(Architecture::Rv32G, values).failed());

  values["t0"] = 0xffff'ffff'ffff'ffff;
  EXPECT_FALSE(try_capture(Architecture::Rv64G, values).failed());
}

TEST(RegisterSnapshot, UnknownArchitecture) {
  const auto values = make_raw_values(Architecture::Rv64G);
  EXPECT_EQ(try_capture(Architecture(42), values).kind, Error::Kind::UnknownArchitecture);
}
