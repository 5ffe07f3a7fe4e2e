#pragma once
#include <string_view>

namespace abicheck::detail {

// Case-insensitive ASCII comparison used for architecture and register names.
bool names_equal(std::string_view a, std::string_view b);

}  // namespace abicheck::detail
