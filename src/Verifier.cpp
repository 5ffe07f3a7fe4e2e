#include "Verifier.hpp"
#include "RegisterDumpReader.hpp"

#include <base/Format.hpp>
#include <base/Log.hpp>
#include <base/Parsing.hpp>

#include <abicheck/AbiRegistry.hpp>
#include <abicheck/RegisterSnapshot.hpp>
#include <abicheck/VerdictLog.hpp>

#include <optional>

static void print_usage() {
  log_info(
    "usage: abi_verifier [architecture] [before dump] [after dump] [--entry N] [--returns N] "
    "[--poison VALUE]");
  log_info("       abi_verifier --list");
}

static bool parse_number(std::string_view s, uint64_t& value) {
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    return base::parse_integer(s.substr(2), value, 16);
  }
  return base::parse_integer(s, value, 10);
}

static void list_architectures() {
  for (const auto architecture : abicheck::supported_architectures()) {
    const abicheck::AbiDescriptor* descriptor = nullptr;
    if (const auto error = abicheck::AbiRegistry::get_descriptor(architecture, descriptor)) {
      log_error("{}", error);
      continue;
    }

    log_info("{} (width {}, stack alignment {}, red zone {}, shadow space {})", architecture,
             abicheck::register_width(architecture), descriptor->stack_alignment,
             descriptor->red_zone_size, descriptor->shadow_space);

    const auto family = abicheck::register_family(architecture);
    for (size_t i = 0; i < abicheck::register_count(family); ++i) {
      const abicheck::RegisterSlot reg(family, i);
      log_info("  {:<5} {}", reg, abicheck::format_register_roles(descriptor->roles(reg)));
    }
  }
}

static bool capture_dump(abicheck::Architecture architecture,
                         const std::string& path,
                         std::optional<abicheck::RegisterSnapshot>& snapshot) {
  abicheck::RawRegisterValues values;
  std::string read_error;
  if (!RegisterDumpReader::read(path, values, read_error)) {
    log_error("{}", read_error);
    return false;
  }

  if (const auto error = abicheck::RegisterSnapshot::capture(architecture, values, snapshot)) {
    log_error("{}: {}", path, error);
    return false;
  }

  return true;
}

bool Verifier::parse_arguments(std::span<const std::string_view> arguments,
                               VerifierArguments& parsed,
                               std::string& error) {
  parsed = VerifierArguments{};

  if (arguments.size() == 1 && arguments[0] == "--list") {
    parsed.list = true;
    return true;
  }

  if (arguments.size() < 3) {
    error = "expected an architecture and two register dumps";
    return false;
  }

  parsed.architecture = arguments[0];
  parsed.before_path = arguments[1];
  parsed.after_path = arguments[2];

  for (size_t i = 3; i < arguments.size(); i += 2) {
    const auto flag = arguments[i];

    if (flag != "--entry" && flag != "--returns" && flag != "--poison") {
      error = base::format("unknown option {}", flag);
      return false;
    }

    if (i + 1 >= arguments.size()) {
      error = base::format("{} expects a value", flag);
      return false;
    }

    uint64_t value = 0;
    if (!parse_number(arguments[i + 1], value)) {
      error = base::format("{}: `{}` is not a number", flag, arguments[i + 1]);
      return false;
    }

    if (flag == "--entry") {
      parsed.options.boundary = abicheck::CheckOptions::Boundary::Entry;
      parsed.options.parameter_count = size_t(value);
    } else if (flag == "--returns") {
      parsed.options.return_count = size_t(value);
    } else {
      parsed.options.poison_value = value;
    }
  }

  return true;
}

int Verifier::run(std::span<const std::string_view> arguments) {
  VerifierArguments parsed;
  std::string error;

  if (!parse_arguments(arguments, parsed, error)) {
    log_error("{}", error);
    print_usage();
    return exit_error;
  }

  return run(parsed);
}

int Verifier::run(const VerifierArguments& arguments) {
  if (arguments.list) {
    list_architectures();
    return exit_pass;
  }

  const abicheck::AbiDescriptor* descriptor = nullptr;
  if (const auto error = abicheck::AbiRegistry::get_descriptor(arguments.architecture, descriptor)) {
    log_error("{}", error);
    return exit_error;
  }

  std::optional<abicheck::RegisterSnapshot> before;
  std::optional<abicheck::RegisterSnapshot> after;

  if (!capture_dump(descriptor->architecture, arguments.before_path, before) ||
      !capture_dump(descriptor->architecture, arguments.after_path, after)) {
    return exit_error;
  }

  abicheck::ComplianceVerdict verdict;
  if (const auto error = abicheck::ComplianceChecker::check(*before, *after, *descriptor,
                                                            arguments.options, verdict)) {
    log_error("{}", error);
    return exit_error;
  }

  abicheck::VerdictLog::log_verdict(verdict, *before, *after);

  return verdict.pass ? exit_pass : exit_violations;
}
