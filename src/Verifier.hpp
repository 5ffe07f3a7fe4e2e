#pragma once
#include <span>
#include <string>
#include <string_view>

#include <abicheck/ComplianceChecker.hpp>

struct VerifierArguments {
  bool list = false;

  std::string architecture;
  std::string before_path;
  std::string after_path;

  abicheck::CheckOptions options{};
};

// Command line driver: `<architecture> <before dump> <after dump> [--entry N] [--returns N]
// [--poison VALUE]` or `--list`. Arguments exclude the program name.
class Verifier {
 public:
  constexpr static int exit_pass = 0;
  constexpr static int exit_violations = 1;
  constexpr static int exit_error = 2;

  static bool parse_arguments(std::span<const std::string_view> arguments,
                              VerifierArguments& parsed,
                              std::string& error);

  static int run(std::span<const std::string_view> arguments);
  static int run(const VerifierArguments& arguments);
};
