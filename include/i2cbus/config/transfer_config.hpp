#pragma once

#include "i2cbus/message.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace i2cbus {

struct BusSection {
  std::string device = "/dev/i2c-1";
  uint16_t address = 0;
};

struct TransferSection {
  uint32_t repeat = 1;
  uint32_t interval_ms = 0;
  bool verbose = false;
};

struct MessageSection {
  bool read = false;
  std::vector<uint8_t> data;  // write payload
  uint32_t length = 0;        // read length
  uint16_t flags = 0;
};

struct TransferConfig {
  BusSection bus;
  TransferSection transfer;
  std::vector<MessageSection> messages;
};

// Loads a transfer script:
//
//   [bus]          device = "/dev/i2c-1", address = 0x50
//   [transfer]     repeat = 1, interval_ms = 0, verbose = false   (optional)
//   [message.0]    direction = "write", data = [0x00, 0x10], flags = []
//   [message.1]    direction = "read", length = 2, flags = ["ignore_nak"]
//
// Message sections must be numbered contiguously from 0.
TransferConfig load_transfer_config(const std::string& path);
TransferConfig parse_transfer_config(const std::string& text);

std::vector<Message> build_messages(const TransferConfig& cfg);

std::string transfer_config_to_string(const TransferConfig& cfg);

}  // namespace i2cbus
