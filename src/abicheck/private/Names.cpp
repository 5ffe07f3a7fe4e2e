#include "Names.hpp"

static char to_lower(char c) {
  if (c >= 'A' && c <= 'Z') {
    return char(c - 'A' + 'a');
  }
  return c;
}

bool abicheck::detail::names_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }

  for (size_t i = 0; i < a.size(); ++i) {
    if (to_lower(a[i]) != to_lower(b[i])) {
      return false;
    }
  }

  return true;
}
