#pragma once
#include <string>
#include <string_view>

#include <abicheck/RegisterSnapshot.hpp>

// Reads textual register dumps: one `name = value` (or `name: value`) pair per line, `#`
// starts a comment, values are decimal or 0x-prefixed hexadecimal.
class RegisterDumpReader {
 public:
  static bool parse(std::string_view text, abicheck::RawRegisterValues& values, std::string& error);
  static bool read(const std::string& file_path,
                   abicheck::RawRegisterValues& values,
                   std::string& error);
};
