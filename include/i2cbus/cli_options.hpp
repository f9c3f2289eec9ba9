#pragma once

#include "i2cbus/config/transfer_config.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace i2cbus {

class CliUsageError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

struct CliOptions {
  std::string config_path;
  std::string device;
  std::optional<uint16_t> address;
  std::optional<uint32_t> repeat;
  bool verbose = false;
  bool print_config = false;
};

// Parses i2c_transfer's command line. Numeric values accept decimal or 0x hex
// and are range-checked like their config counterparts. Throws CliUsageError.
CliOptions parse_cli_options(int argc, const char* const* argv);

void apply_cli_overrides(const CliOptions& options, TransferConfig& cfg);

}  // namespace i2cbus
