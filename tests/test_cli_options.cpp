#include "i2cbus/cli_options.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

#define REQUIRE(cond, msg)      \
  do {                          \
    if (!(cond)) {              \
      std::cerr << msg << "\n"; \
      return false;             \
    }                           \
  } while (0)

i2cbus::CliOptions parse(std::vector<const char*> args) {
  args.insert(args.begin(), "i2c_transfer");
  return i2cbus::parse_cli_options(static_cast<int>(args.size()), args.data());
}

bool rejected(const std::vector<const char*>& args) {
  try {
    (void)parse(args);
  } catch (const i2cbus::CliUsageError&) {
    return true;
  }
  return false;
}

bool test_overrides_apply() {
  const auto options = parse({"--config", "eeprom.toml", "--device", "/dev/i2c-7", "--address", "0x51",
                              "--repeat", "4", "--verbose", "--print-config"});
  REQUIRE(options.config_path == "eeprom.toml", "Config path mismatch");
  REQUIRE(options.address && *options.address == 0x51, "Hex address override mismatch");
  REQUIRE(options.repeat && *options.repeat == 4, "Repeat override mismatch");
  REQUIRE(options.verbose && options.print_config, "Boolean switches should be set");

  i2cbus::TransferConfig cfg;
  cfg.bus.address = 0x50;
  i2cbus::apply_cli_overrides(options, cfg);
  REQUIRE(cfg.bus.device == "/dev/i2c-7", "Device override should apply");
  REQUIRE(cfg.bus.address == 0x51, "Address override should apply");
  REQUIRE(cfg.transfer.repeat == 4, "Repeat override should apply");
  REQUIRE(cfg.transfer.verbose, "Verbose override should apply");
  return true;
}

bool test_absent_overrides_keep_config() {
  const auto options = parse({"--config", "eeprom.toml"});
  i2cbus::TransferConfig cfg;
  cfg.bus.address = 0x68;
  cfg.transfer.repeat = 9;
  i2cbus::apply_cli_overrides(options, cfg);
  REQUIRE(cfg.bus.address == 0x68, "Address must stay when not overridden");
  REQUIRE(cfg.transfer.repeat == 9, "Repeat must stay when not overridden");
  REQUIRE(cfg.bus.device == "/dev/i2c-1", "Device must stay when not overridden");

  REQUIRE(parse({"--config", "x", "--address", "80"}).address == uint16_t{80}, "Decimal address should parse");
  REQUIRE(parse({"--config", "x", "--address", "0x3FF"}).address == uint16_t{0x3FF}, "10-bit maximum accepted");
  return true;
}

bool test_bad_numbers_are_usage_errors() {
  REQUIRE(rejected({"--config", "x", "--address", "zz"}), "Non-numeric address should be rejected");
  REQUIRE(rejected({"--config", "x", "--address", "0x10050"}), "Address must not wrap to 16 bits");
  REQUIRE(rejected({"--config", "x", "--address", "0x400"}), "Address above 10 bits should be rejected");
  REQUIRE(rejected({"--config", "x", "--address", "-1"}), "Negative address should be rejected");
  REQUIRE(rejected({"--config", "x", "--address", "0x"}), "Bare hex prefix should be rejected");
  REQUIRE(rejected({"--config", "x", "--repeat", "-1"}), "Negative repeat must not wrap");
  REQUIRE(rejected({"--config", "x", "--repeat", "0"}), "Zero repeat should be rejected");
  REQUIRE(rejected({"--config", "x", "--repeat", "4294967296"}), "Repeat above uint32 should be rejected");
  REQUIRE(rejected({"--config", "x", "--repeat", "99999999999999999999999"}), "Overflowing repeat should be rejected");
  REQUIRE(rejected({"--config", "x", "--repeat", "3x"}), "Trailing garbage should be rejected");
  return true;
}

bool test_usage_errors() {
  REQUIRE(rejected({}), "Missing --config should be rejected");
  REQUIRE(rejected({"--config"}), "--config without a value should be rejected");
  REQUIRE(rejected({"--config", "x", "--speed", "400000"}), "Unknown option should be rejected");
  return true;
}

}  // namespace

int main() {
  if (!test_overrides_apply()) {
    return EXIT_FAILURE;
  }
  if (!test_absent_overrides_keep_config()) {
    return EXIT_FAILURE;
  }
  if (!test_bad_numbers_are_usage_errors()) {
    return EXIT_FAILURE;
  }
  if (!test_usage_errors()) {
    return EXIT_FAILURE;
  }

  std::cout << "cli_options_tests: ok\n";
  return EXIT_SUCCESS;
}
