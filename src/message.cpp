#include "i2cbus/message.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace i2cbus {

namespace {

struct FlagName {
  uint16_t bit;
  const char* name;
};

constexpr std::array<FlagName, 7> kFlagNames{{
    {kFlagTenBit, "ten_bit"},
    {kFlagRecvLen, "recv_len"},
    {kFlagNoReadAck, "no_read_ack"},
    {kFlagIgnoreNak, "ignore_nak"},
    {kFlagRevDirAddr, "rev_dir_addr"},
    {kFlagNoStart, "no_start"},
    {kFlagStop, "stop"},
}};

}  // namespace

Message make_write(std::vector<uint8_t> data, uint16_t flags) {
  Message msg;
  msg.data = std::move(data);
  msg.read = false;
  msg.flags = flags;
  return msg;
}

Message make_read(std::size_t length, uint16_t flags) {
  Message msg;
  msg.data.assign(length, 0);
  msg.read = true;
  msg.flags = flags;
  return msg;
}

uint16_t parse_flag_name(const std::string& name) {
  for (const auto& entry : kFlagNames) {
    if (name == entry.name) {
      return entry.bit;
    }
  }
  throw std::invalid_argument("Unknown I2C message flag '" + name + "'");
}

std::string flags_to_string(uint16_t flags) {
  std::string out;
  for (const auto& entry : kFlagNames) {
    if ((flags & entry.bit) == 0) {
      continue;
    }
    if (!out.empty()) {
      out += '|';
    }
    out += entry.name;
  }
  return out.empty() ? "none" : out;
}

}  // namespace i2cbus
