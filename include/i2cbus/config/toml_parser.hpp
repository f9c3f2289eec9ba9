#pragma once

#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace i2cbus {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct TomlValue {
  using Array = std::vector<TomlValue>;
  using Variant = std::variant<bool, int64_t, double, std::string, Array>;

  Variant value;

  [[nodiscard]] bool is_bool() const;
  [[nodiscard]] bool is_int() const;
  [[nodiscard]] bool is_double() const;
  [[nodiscard]] bool is_string() const;
  [[nodiscard]] bool is_array() const;

  [[nodiscard]] bool as_bool() const;
  [[nodiscard]] int64_t as_int() const;
  [[nodiscard]] double as_double() const;
  [[nodiscard]] const std::string& as_string() const;
  [[nodiscard]] const Array& as_array() const;
};

using TomlSection = std::unordered_map<std::string, TomlValue>;
using TomlDocument = std::unordered_map<std::string, TomlSection>;

// Flat TOML subset: [section] headers (dots are part of the name), scalar and
// array values, '#' comments. Throws ConfigError naming source and line.
TomlDocument parse_toml(std::istream& in, const std::string& source_name);
TomlDocument parse_toml_string(const std::string& text);
TomlDocument parse_toml_file(const std::string& path);

}  // namespace i2cbus
