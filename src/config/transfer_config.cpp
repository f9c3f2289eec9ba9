#include "i2cbus/config/transfer_config.hpp"

#include "i2cbus/config/toml_parser.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace i2cbus {

namespace {

constexpr const char* kMessagePrefix = "message.";

int64_t as_int_in_range(const TomlValue& value, const std::string& key_name, int64_t lo, int64_t hi) {
  if (!value.is_int()) {
    throw ConfigError("Config key '" + key_name + "' must be integer");
  }
  const int64_t x = value.as_int();
  if (x < lo || x > hi) {
    throw ConfigError("Config key '" + key_name + "' is out of range [" + std::to_string(lo) + ", " +
                      std::to_string(hi) + "]");
  }
  return x;
}

bool as_bool(const TomlValue& value, const std::string& key_name) {
  if (!value.is_bool()) {
    throw ConfigError("Config key '" + key_name + "' must be boolean");
  }
  return value.as_bool();
}

const std::string& as_string(const TomlValue& value, const std::string& key_name) {
  if (!value.is_string()) {
    throw ConfigError("Config key '" + key_name + "' must be string");
  }
  return value.as_string();
}

const TomlValue::Array& as_array(const TomlValue& value, const std::string& key_name) {
  if (!value.is_array()) {
    throw ConfigError("Config key '" + key_name + "' must be an array");
  }
  return value.as_array();
}

const TomlSection& require_section(const TomlDocument& doc, const std::string& name) {
  const auto it = doc.find(name);
  if (it == doc.end()) {
    throw ConfigError("Missing required section [" + name + "]");
  }
  return it->second;
}

const TomlValue& require_key(const TomlSection& section, const std::string& key, const std::string& section_name) {
  const auto it = section.find(key);
  if (it == section.end()) {
    throw ConfigError("Missing required key '" + section_name + "." + key + "'");
  }
  return it->second;
}

void validate_allowed_keys(const TomlSection& section, const std::unordered_set<std::string>& allowed,
                           const std::string& section_name) {
  for (const auto& [key, _] : section) {
    if (allowed.find(key) == allowed.end()) {
      throw ConfigError("Unknown key '" + key + "' in section [" + section_name + "]");
    }
  }
}

template <typename Fn>
void maybe_apply(const TomlSection& section, const std::string& key, Fn&& fn) {
  const auto it = section.find(key);
  if (it != section.end()) {
    fn(it->second);
  }
}

bool is_message_section(const std::string& name) {
  return name.compare(0, std::char_traits<char>::length(kMessagePrefix), kMessagePrefix) == 0;
}

std::size_t message_index(const std::string& section_name) {
  const std::string digits = section_name.substr(std::char_traits<char>::length(kMessagePrefix));
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
    throw ConfigError("Invalid message section name [" + section_name + "]");
  }
  if (digits.size() > 1 && digits.front() == '0') {
    throw ConfigError("Message index must not have leading zeros: [" + section_name + "]");
  }
  if (digits.size() > 3) {
    throw ConfigError("Message index too large: [" + section_name + "]");
  }
  return static_cast<std::size_t>(std::stoul(digits));
}

MessageSection parse_message(const TomlSection& section, const std::string& name) {
  validate_allowed_keys(section, {"direction", "data", "length", "flags"}, name);

  MessageSection msg;
  const std::string& direction = as_string(require_key(section, "direction", name), name + ".direction");
  if (direction == "read") {
    msg.read = true;
  } else if (direction != "write") {
    throw ConfigError("Config key '" + name + ".direction' must be \"read\" or \"write\"");
  }

  if (msg.read) {
    if (section.count("data") != 0) {
      throw ConfigError("Config key '" + name + ".data' is not allowed on a read message");
    }
    msg.length = static_cast<uint32_t>(
        as_int_in_range(require_key(section, "length", name), name + ".length", 0,
                        static_cast<int64_t>(kMaxMessageLength)));
  } else {
    if (section.count("length") != 0) {
      throw ConfigError("Config key '" + name + ".length' is not allowed on a write message");
    }
    const auto& data = as_array(require_key(section, "data", name), name + ".data");
    if (data.size() > kMaxMessageLength) {
      throw ConfigError("Config key '" + name + ".data' exceeds 65535 bytes");
    }
    msg.data.reserve(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
      msg.data.push_back(static_cast<uint8_t>(
          as_int_in_range(data[i], name + ".data[" + std::to_string(i) + "]", 0, 0xFF)));
    }
  }

  maybe_apply(section, "flags", [&](const TomlValue& v) {
    for (const auto& item : as_array(v, name + ".flags")) {
      const std::string& flag_name = as_string(item, name + ".flags");
      try {
        msg.flags = static_cast<uint16_t>(msg.flags | parse_flag_name(flag_name));
      } catch (const std::invalid_argument& ex) {
        throw ConfigError("Config key '" + name + ".flags': " + ex.what());
      }
    }
  });

  return msg;
}

TransferConfig build_config(const TomlDocument& doc) {
  TransferConfig cfg;
  std::map<std::size_t, MessageSection> messages;

  for (const auto& [name, section] : doc) {
    if (name == "bus" || name == "transfer") {
      continue;
    }
    if (!is_message_section(name)) {
      throw ConfigError("Unknown section [" + name + "]");
    }
    messages.emplace(message_index(name), parse_message(section, name));
  }

  const auto& bus = require_section(doc, "bus");
  validate_allowed_keys(bus, {"device", "address"}, "bus");
  maybe_apply(bus, "device", [&](const TomlValue& v) { cfg.bus.device = as_string(v, "bus.device"); });
  cfg.bus.address = static_cast<uint16_t>(as_int_in_range(require_key(bus, "address", "bus"), "bus.address", 0, 0x3FF));
  if (cfg.bus.device.empty()) {
    throw ConfigError("Config key 'bus.device' must not be empty");
  }

  const auto transfer_it = doc.find("transfer");
  if (transfer_it != doc.end()) {
    const auto& transfer = transfer_it->second;
    validate_allowed_keys(transfer, {"repeat", "interval_ms", "verbose"}, "transfer");
    maybe_apply(transfer, "repeat", [&](const TomlValue& v) {
      cfg.transfer.repeat = static_cast<uint32_t>(as_int_in_range(v, "transfer.repeat", 1, UINT32_MAX));
    });
    maybe_apply(transfer, "interval_ms", [&](const TomlValue& v) {
      cfg.transfer.interval_ms = static_cast<uint32_t>(as_int_in_range(v, "transfer.interval_ms", 0, UINT32_MAX));
    });
    maybe_apply(transfer, "verbose", [&](const TomlValue& v) { cfg.transfer.verbose = as_bool(v, "transfer.verbose"); });
  }

  if (messages.empty()) {
    throw ConfigError("Transfer script defines no [message.N] sections");
  }
  std::size_t expected = 0;
  for (auto& [index, msg] : messages) {
    if (index != expected) {
      throw ConfigError("Missing section [message." + std::to_string(expected) + "]");
    }
    cfg.messages.push_back(std::move(msg));
    ++expected;
  }

  return cfg;
}

}  // namespace

TransferConfig load_transfer_config(const std::string& path) { return build_config(parse_toml_file(path)); }

TransferConfig parse_transfer_config(const std::string& text) { return build_config(parse_toml_string(text)); }

std::vector<Message> build_messages(const TransferConfig& cfg) {
  std::vector<Message> out;
  out.reserve(cfg.messages.size());
  for (const auto& m : cfg.messages) {
    out.push_back(m.read ? make_read(m.length, m.flags) : make_write(m.data, m.flags));
  }
  return out;
}

std::string transfer_config_to_string(const TransferConfig& cfg) {
  std::ostringstream oss;
  oss << "[bus]\n";
  oss << "device=" << cfg.bus.device << "\n";
  oss << "address=0x" << std::hex << std::setw(2) << std::setfill('0') << cfg.bus.address << std::dec << "\n";

  oss << "[transfer]\n";
  oss << "repeat=" << cfg.transfer.repeat << ", interval_ms=" << cfg.transfer.interval_ms
      << ", verbose=" << (cfg.transfer.verbose ? "true" : "false") << "\n";

  for (std::size_t i = 0; i < cfg.messages.size(); ++i) {
    const auto& m = cfg.messages[i];
    oss << "[message." << i << "] " << (m.read ? "read" : "write");
    if (m.read) {
      oss << " length=" << m.length;
    } else {
      oss << " data=[";
      for (std::size_t j = 0; j < m.data.size(); ++j) {
        oss << (j == 0 ? "" : " ") << "0x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<unsigned>(m.data[j]) << std::dec;
      }
      oss << "]";
    }
    oss << " flags=" << flags_to_string(m.flags) << "\n";
  }

  return oss.str();
}

}  // namespace i2cbus
