#include "i2cbus/bus_handle.hpp"
#include "i2cbus/cli_options.hpp"
#include "i2cbus/config/transfer_config.hpp"
#include "i2cbus/transfer_engine.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

void print_usage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " --config <path> [--device <path>] [--address <addr>] [--repeat <n>] [--verbose]"
               " [--print-config]\n";
}

std::string hex_bytes(const std::vector<uint8_t>& data) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < data.size(); ++i) {
    oss << (i == 0 ? "" : " ") << "0x" << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<unsigned>(data[i]);
  }
  return oss.str();
}

void trace_messages(uint16_t address, const std::vector<i2cbus::Message>& messages) {
  for (std::size_t i = 0; i < messages.size(); ++i) {
    const auto& m = messages[i];
    std::cout << "msg " << i << ": addr 0x" << std::hex << address << std::dec << ", "
              << (m.read ? "read" : "write") << ", len " << m.data.size() << ", flags "
              << i2cbus::flags_to_string(m.flags);
    if (!m.read && !m.data.empty()) {
      std::cout << ", buf " << hex_bytes(m.data);
    }
    std::cout << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const i2cbus::CliOptions options = i2cbus::parse_cli_options(argc, argv);
    i2cbus::TransferConfig cfg = i2cbus::load_transfer_config(options.config_path);
    i2cbus::apply_cli_overrides(options, cfg);

    if (options.print_config) {
      std::cout << i2cbus::transfer_config_to_string(cfg) << std::flush;
    }

    i2cbus::BusHandle bus(cfg.bus.device);
    if (cfg.transfer.verbose) {
      std::cout << bus << " functionality=0x" << std::hex << bus.functionality() << std::dec << "\n";
    }

    for (uint32_t run = 0; run < cfg.transfer.repeat; ++run) {
      if (run > 0 && cfg.transfer.interval_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg.transfer.interval_ms));
      }

      std::vector<i2cbus::Message> messages = i2cbus::build_messages(cfg);
      if (cfg.transfer.verbose) {
        trace_messages(cfg.bus.address, messages);
      }
      i2cbus::transfer(bus, cfg.bus.address, messages);

      for (std::size_t i = 0; i < messages.size(); ++i) {
        if (messages[i].read) {
          std::cout << "msg " << i << " read: " << hex_bytes(messages[i].data) << "\n";
        }
      }
    }

    bus.close();
    return EXIT_SUCCESS;
  } catch (const i2cbus::CliUsageError& ex) {
    std::cerr << "i2c_transfer failed: " << ex.what() << "\n";
    print_usage(argv[0]);
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "i2c_transfer failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
