#include "i2cbus/config/toml_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace i2cbus {

namespace {

struct LineRef {
  const std::string& source;
  int line_no;
};

[[noreturn]] void fail(const LineRef& at, const std::string& what) {
  throw ConfigError(at.source + ":" + std::to_string(at.line_no) + ": " + what);
}

std::string trim(const std::string& s) {
  auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
  const auto first = std::find_if(s.begin(), s.end(), not_space);
  const auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
  return (first < last) ? std::string(first, last) : std::string();
}

std::string strip_comment(const std::string& line) {
  bool in_string = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '\\' && in_string) {
      ++i;
      continue;
    }
    if (line[i] == '"') {
      in_string = !in_string;
    } else if (line[i] == '#' && !in_string) {
      return line.substr(0, i);
    }
  }
  return line;
}

TomlValue parse_value(const std::string& raw, const LineRef& at);

TomlValue parse_string(const std::string& raw, const LineRef& at) {
  if (raw.size() < 2 || raw.back() != '"') {
    fail(at, "unterminated string");
  }

  std::string out;
  for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
    if (raw[i] != '\\') {
      out.push_back(raw[i]);
      continue;
    }
    if (i + 2 >= raw.size()) {
      fail(at, "dangling escape in string");
    }
    switch (raw[++i]) {
      case '"':
        out.push_back('"');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        fail(at, std::string("unsupported escape '\\") + raw[i] + "'");
    }
  }
  return TomlValue{out};
}

TomlValue parse_array(const std::string& raw, const LineRef& at) {
  if (raw.back() != ']') {
    fail(at, "unterminated array");
  }

  TomlValue::Array items;
  std::string current;
  int depth = 0;
  bool in_string = false;
  const std::string body = raw.substr(1, raw.size() - 2);

  auto flush = [&](bool allow_empty) {
    const std::string item = trim(current);
    current.clear();
    if (item.empty()) {
      if (!allow_empty) {
        fail(at, "empty array element");
      }
      return;
    }
    items.push_back(parse_value(item, at));
  };

  bool escaped = false;
  for (char ch : body) {
    if (escaped) {
      escaped = false;
    } else if (in_string && ch == '\\') {
      escaped = true;
    } else if (ch == '"') {
      in_string = !in_string;
    } else if (!in_string && ch == '[') {
      ++depth;
    } else if (!in_string && ch == ']') {
      if (--depth < 0) {
        fail(at, "unbalanced ']' in array");
      }
    } else if (!in_string && depth == 0 && ch == ',') {
      flush(false);
      continue;
    }
    current.push_back(ch);
  }
  if (in_string || depth != 0) {
    fail(at, "malformed array");
  }
  // Trailing comma is accepted.
  flush(true);
  return TomlValue{items};
}

TomlValue parse_number(const std::string& raw, const LineRef& at) {
  const bool negative = raw.front() == '-';
  const std::size_t digits_at = (negative || raw.front() == '+') ? 1 : 0;
  const bool hex = raw.compare(digits_at, 2, "0x") == 0 || raw.compare(digits_at, 2, "0X") == 0;

  if (!hex && raw.find_first_of(".eE") != std::string::npos) {
    double parsed = 0.0;
    std::istringstream iss(raw);
    iss >> parsed;
    if (iss.fail() || !iss.eof()) {
      fail(at, "invalid float '" + raw + "'");
    }
    return TomlValue{parsed};
  }

  const char* begin = raw.data() + digits_at + (hex ? 2 : 0);
  const char* end = raw.data() + raw.size();
  int64_t value = 0;
  const auto result = std::from_chars(begin, end, value, hex ? 16 : 10);
  if (begin == end || result.ec != std::errc() || result.ptr != end) {
    fail(at, "invalid integer '" + raw + "'");
  }
  return TomlValue{negative ? -value : value};
}

TomlValue parse_value(const std::string& raw, const LineRef& at) {
  if (raw.empty()) {
    fail(at, "missing value");
  }
  if (raw.front() == '"') {
    return parse_string(raw, at);
  }
  if (raw.front() == '[') {
    return parse_array(raw, at);
  }
  if (raw == "true" || raw == "false") {
    return TomlValue{raw == "true"};
  }
  return parse_number(raw, at);
}

}  // namespace

bool TomlValue::is_bool() const { return std::holds_alternative<bool>(value); }
bool TomlValue::is_int() const { return std::holds_alternative<int64_t>(value); }
bool TomlValue::is_double() const { return std::holds_alternative<double>(value); }
bool TomlValue::is_string() const { return std::holds_alternative<std::string>(value); }
bool TomlValue::is_array() const { return std::holds_alternative<Array>(value); }

bool TomlValue::as_bool() const { return std::get<bool>(value); }
int64_t TomlValue::as_int() const { return std::get<int64_t>(value); }
double TomlValue::as_double() const {
  return is_int() ? static_cast<double>(as_int()) : std::get<double>(value);
}
const std::string& TomlValue::as_string() const { return std::get<std::string>(value); }
const TomlValue::Array& TomlValue::as_array() const { return std::get<Array>(value); }

TomlDocument parse_toml(std::istream& in, const std::string& source_name) {
  TomlDocument doc;
  TomlSection* section = nullptr;
  std::string section_name;

  std::string raw_line;
  int line_no = 0;
  while (std::getline(in, raw_line)) {
    ++line_no;
    const LineRef at{source_name, line_no};
    const std::string line = trim(strip_comment(raw_line));
    if (line.empty()) {
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']') {
        fail(at, "malformed section header");
      }
      section_name = trim(line.substr(1, line.size() - 2));
      if (section_name.empty()) {
        fail(at, "empty section name");
      }
      if (doc.count(section_name) != 0) {
        fail(at, "section [" + section_name + "] defined twice");
      }
      section = &doc[section_name];
      continue;
    }

    if (section == nullptr) {
      fail(at, "key-value outside of any section");
    }

    const std::size_t eq = line.find('=');
    if (eq == std::string::npos) {
      fail(at, "expected 'key = value'");
    }
    const std::string key = trim(line.substr(0, eq));
    if (key.empty()) {
      fail(at, "empty key");
    }
    if (section->count(key) != 0) {
      fail(at, "duplicate key '" + key + "' in [" + section_name + "]");
    }
    section->emplace(key, parse_value(trim(line.substr(eq + 1)), at));
  }

  return doc;
}

TomlDocument parse_toml_string(const std::string& text) {
  std::istringstream in(text);
  return parse_toml(in, "<string>");
}

TomlDocument parse_toml_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("Failed to open TOML file: " + path);
  }
  return parse_toml(in, path);
}

}  // namespace i2cbus
