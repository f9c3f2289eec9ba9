#pragma once

#include <cstddef>
#include <cstdint>
#include <linux/i2c.h>
#include <string>
#include <vector>

namespace i2cbus {

// Modifier bits for Message::flags, same values as <linux/i2c.h>.
inline constexpr uint16_t kFlagRead = I2C_M_RD;
inline constexpr uint16_t kFlagTenBit = I2C_M_TEN;
inline constexpr uint16_t kFlagRecvLen = I2C_M_RECV_LEN;
inline constexpr uint16_t kFlagNoReadAck = I2C_M_NO_RD_ACK;
inline constexpr uint16_t kFlagIgnoreNak = I2C_M_IGNORE_NAK;
inline constexpr uint16_t kFlagRevDirAddr = I2C_M_REV_DIR_ADDR;
inline constexpr uint16_t kFlagNoStart = I2C_M_NOSTART;
inline constexpr uint16_t kFlagStop = I2C_M_STOP;

inline constexpr std::size_t kMaxMessageLength = 0xFFFF;

struct Message {
  // Outbound bytes for a write, pre-sized receive buffer for a read.
  std::vector<uint8_t> data;
  bool read = false;
  // Protocol modifiers. The read bit is taken from `read`, never from here.
  uint16_t flags = 0;
};

[[nodiscard]] Message make_write(std::vector<uint8_t> data, uint16_t flags = 0);
[[nodiscard]] Message make_read(std::size_t length, uint16_t flags = 0);

// "ten_bit", "recv_len", "no_read_ack", "ignore_nak", "rev_dir_addr", "no_start", "stop".
[[nodiscard]] uint16_t parse_flag_name(const std::string& name);
[[nodiscard]] std::string flags_to_string(uint16_t flags);

}  // namespace i2cbus
