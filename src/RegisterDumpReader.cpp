#include "RegisterDumpReader.hpp"

#include <base/File.hpp>
#include <base/Format.hpp>
#include <base/Parsing.hpp>

#include <cstdint>

static std::string_view trim(std::string_view s) {
  const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r'; };

  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }

  return s;
}

static bool parse_value(std::string_view s, uint64_t& value) {
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    return base::parse_integer(s.substr(2), value, 16);
  }
  return base::parse_integer(s, value, 10);
}

bool RegisterDumpReader::parse(std::string_view text,
                               abicheck::RawRegisterValues& values,
                               std::string& error) {
  values.clear();

  size_t line_number = 0;

  while (!text.empty()) {
    const auto line_end = text.find('\n');
    auto line = text.substr(0, line_end);
    text = line_end == std::string_view::npos ? std::string_view{} : text.substr(line_end + 1);

    line_number++;

    const auto comment = line.find('#');
    if (comment != std::string_view::npos) {
      line = line.substr(0, comment);
    }

    line = trim(line);
    if (line.empty()) {
      continue;
    }

    const auto separator = line.find_first_of("=:");
    if (separator == std::string_view::npos) {
      error = base::format("line {}: expected `name = value`", line_number);
      return false;
    }

    const auto name = trim(line.substr(0, separator));
    const auto value_text = trim(line.substr(separator + 1));

    if (name.empty()) {
      error = base::format("line {}: missing register name", line_number);
      return false;
    }

    uint64_t value = 0;
    if (!parse_value(value_text, value)) {
      error = base::format("line {}: `{}` is not a valid 64 bit value", line_number, value_text);
      return false;
    }

    const auto [it, inserted] = values.emplace(std::string(name), value);
    if (!inserted) {
      error = base::format("line {}: {} is given twice", line_number, name);
      return false;
    }
  }

  return true;
}

// Register dumps are a few hundred bytes. Anything larger is not a dump.
constexpr int64_t max_dump_size = 1024 * 1024;

bool RegisterDumpReader::read(const std::string& file_path,
                              abicheck::RawRegisterValues& values,
                              std::string& error) {
  // Not File::read_text_file: it aborts on failure, a bad dump path is a usage error here.
  base::File file(file_path, "r");
  if (!file) {
    error = base::format("opening file `{}` for reading failed", file_path);
    return false;
  }

  file.seek(base::File::SeekOrigin::End, 0);
  const auto file_size = file.tell();
  file.seek(base::File::SeekOrigin::Set, 0);

  // Directories open successfully but report a bogus size.
  if (file.error() || file_size < 0 || file_size > max_dump_size) {
    error = base::format("`{}` is not a readable register dump", file_path);
    return false;
  }

  std::string text;
  text.resize(size_t(file_size) + 1);

  const auto read_size = file.read(text.data(), text.size());
  if (file.error()) {
    error = base::format("reading file `{}` failed", file_path);
    return false;
  }

  text.resize(read_size);

  if (!parse(text, values, error)) {
    error = base::format("{}: {}", file_path, error);
    return false;
  }

  return true;
}
