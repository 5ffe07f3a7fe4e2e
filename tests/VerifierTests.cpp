#include "TestRegisters.hpp"

#include <gtest/gtest.h>

#include <Verifier.hpp>

#include <fstream>
#include <string>
#include <vector>

using namespace abicheck;

static std::string write_dump(const std::string& file_name, const RawRegisterValues& values) {
  const auto path = testing::TempDir() + file_name;

  std::ofstream file(path);
  for (const auto& [name, value] : values) {
    file << name << " = " << fmt::format("{:#x}", value) << '\n';
  }

  return path;
}

static int run_verifier(const std::vector<std::string>& arguments) {
  const std::vector<std::string_view> views(arguments.begin(), arguments.end());
  return Verifier::run(views);
}

static bool parse(const std::vector<std::string_view>& arguments,
                  VerifierArguments& parsed,
                  std::string& error) {
  return Verifier::parse_arguments(arguments, parsed, error);
}

TEST(Verifier, ParsesCheckArguments) {
  VerifierArguments parsed;
  std::string error;

  ASSERT_TRUE(parse({"RV64G", "before.txt", "after.txt"}, parsed, error)) << error;
  EXPECT_FALSE(parsed.list);
  EXPECT_EQ(parsed.architecture, "RV64G");
  EXPECT_EQ(parsed.before_path, "before.txt");
  EXPECT_EQ(parsed.after_path, "after.txt");
  EXPECT_EQ(parsed.options.boundary, CheckOptions::Boundary::Exit);
  EXPECT_FALSE(parsed.options.poison_value.has_value());

  ASSERT_TRUE(parse({"x86-64-SysV", "b", "a", "--entry", "3", "--poison", "0xDEADBEEF",
                     "--returns", "2"},
                    parsed, error))
    << error;
  EXPECT_EQ(parsed.options.boundary, CheckOptions::Boundary::Entry);
  EXPECT_EQ(parsed.options.parameter_count, 3u);
  EXPECT_EQ(parsed.options.return_count, 2u);
  EXPECT_EQ(parsed.options.poison_value, 0xdeadbeef);

  ASSERT_TRUE(parse({"--list"}, parsed, error)) << error;
  EXPECT_TRUE(parsed.list);
}

TEST(Verifier, RejectsMalformedArguments) {
  VerifierArguments parsed;
  std::string error;

  EXPECT_FALSE(parse({}, parsed, error));
  EXPECT_FALSE(parse({"RV64G", "before.txt"}, parsed, error));

  EXPECT_FALSE(parse({"RV64G", "b", "a", "--entry"}, parsed, error));
  EXPECT_EQ(error, "--entry expects a value");

  EXPECT_FALSE(parse({"RV64G", "b", "a", "--returns", "two"}, parsed, error));
  EXPECT_EQ(error, "--returns: `two` is not a number");

  EXPECT_FALSE(parse({"RV64G", "b", "a", "--verbose", "1"}, parsed, error));
  EXPECT_EQ(error, "unknown option --verbose");

  EXPECT_FALSE(parse({"RV64G", "b", "a", "--verbose"}, parsed, error));
  EXPECT_EQ(error, "unknown option --verbose");
}

TEST(Verifier, ExitStatusFollowsVerdict) {
  const auto architecture = Architecture::X64SysV;

  auto before_values = test::make_raw_values(architecture);
  const auto before = write_dump("verifier_sysv_before.txt", before_values);

  auto after_values = before_values;
  test::set_value(after_values, x64::Register::Rax, 0x2a);
  const auto compliant = write_dump("verifier_sysv_compliant.txt", after_values);

  test::set_value(after_values, x64::Register::R12, 0x99);
  const auto clobbered = write_dump("verifier_sysv_clobbered.txt", after_values);

  EXPECT_EQ(run_verifier({"x86-64-SysV", before, compliant}), Verifier::exit_pass);
  EXPECT_EQ(run_verifier({"x86-64-SysV", before, clobbered}), Verifier::exit_violations);

  // RAX carries the poison pattern, so one expected return value is unset.
  EXPECT_EQ(run_verifier({"x86-64-SysV", before, compliant, "--returns", "1", "--poison", "42"}),
            Verifier::exit_violations);
  EXPECT_EQ(run_verifier({"x86-64-SysV", before, compliant, "--returns", "1", "--poison", "43"}),
            Verifier::exit_pass);
}

TEST(Verifier, EntryBoundaryOnX64) {
  const auto architecture = Architecture::X64SysV;

  const auto before_values = test::make_raw_values(architecture);
  const auto before = write_dump("verifier_entry_before.txt", before_values);

  auto after_values = before_values;
  test::set_value(after_values, x64::Register::Rsp, test::aligned_stack_pointer - 8);
  const auto after = write_dump("verifier_entry_after.txt", after_values);

  EXPECT_EQ(run_verifier({"x86-64-SysV", before, after, "--entry", "2"}), Verifier::exit_pass);
}

TEST(Verifier, InputErrorsExitWithError) {
  const auto architecture = Architecture::Rv64G;

  auto values = test::make_raw_values(architecture);
  const auto complete = write_dump("verifier_rv_complete.txt", values);

  values.erase("a0");
  const auto incomplete = write_dump("verifier_rv_incomplete.txt", values);

  EXPECT_EQ(run_verifier({}), Verifier::exit_error);
  EXPECT_EQ(run_verifier({"RV64G", complete, complete, "--entry"}), Verifier::exit_error);
  EXPECT_EQ(run_verifier({"RV64G", complete, complete, "--frobnicate", "1"}),
            Verifier::exit_error);

  EXPECT_EQ(run_verifier({"MIPS-O32", complete, complete}), Verifier::exit_error);
  EXPECT_EQ(run_verifier({"RV64G", complete, incomplete}), Verifier::exit_error);
  EXPECT_EQ(run_verifier({"RV64G", complete, testing::TempDir() + "verifier_missing.txt"}),
            Verifier::exit_error);
  EXPECT_EQ(run_verifier({"RV64G", testing::TempDir(), testing::TempDir()}),
            Verifier::exit_error);

  // Dumps of another register family.
  EXPECT_EQ(run_verifier({"AArch64-AAPCS64", complete, complete}), Verifier::exit_error);

  EXPECT_EQ(run_verifier({"RV64G", complete, complete}), Verifier::exit_pass);
}

TEST(Verifier, ListsArchitectures) {
  testing::internal::CaptureStdout();
  const auto status = run_verifier({"--list"});
  const auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(status, Verifier::exit_pass);
  for (const auto architecture : supported_architectures()) {
    EXPECT_NE(output.find(fmt::format("{}", architecture)), std::string::npos) << output;
  }
  EXPECT_NE(output.find("callee-saved"), std::string::npos) << output;
}
