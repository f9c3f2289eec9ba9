#include "i2cbus/cli_options.hpp"

#include <charconv>
#include <string>

namespace i2cbus {

namespace {

uint64_t parse_cli_number(const std::string& text, const std::string& option, uint64_t lo, uint64_t hi) {
  const bool hex = text.size() > 2 && (text.compare(0, 2, "0x") == 0 || text.compare(0, 2, "0X") == 0);
  const char* begin = text.data() + (hex ? 2 : 0);
  const char* end = text.data() + text.size();

  uint64_t value = 0;
  const auto result = std::from_chars(begin, end, value, hex ? 16 : 10);
  if (begin == end || result.ec == std::errc::invalid_argument || result.ptr != end) {
    throw CliUsageError("Option " + option + " expects a non-negative integer, got '" + text + "'");
  }
  if (result.ec == std::errc::result_out_of_range || value < lo || value > hi) {
    throw CliUsageError("Option " + option + " value '" + text + "' is out of range [" + std::to_string(lo) +
                        ", " + std::to_string(hi) + "]");
  }
  return value;
}

}  // namespace

CliOptions parse_cli_options(int argc, const char* const* argv) {
  CliOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--config" && has_value) {
      options.config_path = argv[++i];
      continue;
    }
    if (arg == "--device" && has_value) {
      options.device = argv[++i];
      continue;
    }
    if (arg == "--address" && has_value) {
      options.address = static_cast<uint16_t>(parse_cli_number(argv[++i], arg, 0, 0x3FF));
      continue;
    }
    if (arg == "--repeat" && has_value) {
      options.repeat = static_cast<uint32_t>(parse_cli_number(argv[++i], arg, 1, UINT32_MAX));
      continue;
    }
    if (arg == "--verbose") {
      options.verbose = true;
      continue;
    }
    if (arg == "--print-config") {
      options.print_config = true;
      continue;
    }
    throw CliUsageError("Unknown or incomplete option '" + arg + "'");
  }

  if (options.config_path.empty()) {
    throw CliUsageError("Missing required option --config");
  }
  return options;
}

void apply_cli_overrides(const CliOptions& options, TransferConfig& cfg) {
  if (!options.device.empty()) {
    cfg.bus.device = options.device;
  }
  if (options.address) {
    cfg.bus.address = *options.address;
  }
  if (options.repeat) {
    cfg.transfer.repeat = *options.repeat;
  }
  cfg.transfer.verbose = cfg.transfer.verbose || options.verbose;
}

}  // namespace i2cbus
