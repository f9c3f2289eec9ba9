#pragma once

#include "i2cbus/bus_handle.hpp"
#include "i2cbus/message.hpp"

#include <cstdint>
#include <vector>

namespace i2cbus {

class TransferEngine {
 public:
  // Runs `messages` against `address` as a single I2C_RDWR batch. On success
  // every read message's data is replaced by the bytes the adapter returned;
  // write messages are left as given. On failure read buffers are undefined.
  void transfer(BusHandle& bus, uint16_t address, std::vector<Message>& messages) const;
};

void transfer(BusHandle& bus, uint16_t address, std::vector<Message>& messages);

}  // namespace i2cbus
