#pragma once
#include <string>

#include "ComplianceChecker.hpp"
#include "RegisterSnapshot.hpp"

namespace abicheck {

class VerdictLog {
 public:
  // `name:old->new` for every register that differs between the snapshots.
  static std::string format_register_changes(const RegisterSnapshot& before,
                                             const RegisterSnapshot& after);

  static void log_verdict(const ComplianceVerdict& verdict,
                          const RegisterSnapshot& before,
                          const RegisterSnapshot& after);
};

}  // namespace abicheck
