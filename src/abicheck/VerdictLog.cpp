#include "VerdictLog.hpp"

#include <base/Error.hpp>
#include <base/Log.hpp>

#include <iterator>

using namespace abicheck;

std::string VerdictLog::format_register_changes(const RegisterSnapshot& before,
                                                const RegisterSnapshot& after) {
  verify(before.family() == after.family(), "cannot diff {} and {} snapshots",
         before.architecture(), after.architecture());

  std::string s;

  for (size_t i = 0; i < before.size(); ++i) {
    const RegisterSlot reg(before.family(), i);

    if (before.get(reg) != after.get(reg)) {
      if (!s.empty()) {
        s += ' ';
      }
      base::format_to(std::back_inserter(s), "{}:{:x}->{:x}", reg, before.get(reg),
                      after.get(reg));
    }
  }

  return s;
}

void VerdictLog::log_verdict(const ComplianceVerdict& verdict,
                             const RegisterSnapshot& before,
                             const RegisterSnapshot& after) {
  if (verdict.pass) {
    log_info("{}: call boundary is compliant", after.architecture());
  } else {
    log_error("{}: {} violation(s)", after.architecture(), verdict.violations.size());
  }

  for (const auto& violation : verdict.violations) {
    log_error("  {}", violation);
  }

  const auto changes = format_register_changes(before, after);
  log_info("changed registers: {}", changes.empty() ? "none" : changes);
}
