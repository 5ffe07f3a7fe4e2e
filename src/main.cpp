#include "Verifier.hpp"

#include <abicheck/AbiRegistry.hpp>

#include <string_view>
#include <vector>

int main(int argc, const char* argv[]) {
  abicheck::AbiRegistry::initialize();

  std::vector<std::string_view> arguments;
  for (int i = 1; i < argc; ++i) {
    arguments.emplace_back(argv[i]);
  }

  return Verifier::run(arguments);
}
