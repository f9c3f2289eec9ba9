#include "i2cbus/transfer_engine.hpp"

#include "i2cbus/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <linux/i2c-dev.h>
#include <linux/i2c.h>
#include <string>
#include <type_traits>

namespace i2cbus {

namespace {

// Field widths of the I2C_RDWR record are fixed by the kernel ABI.
static_assert(std::is_same_v<decltype(i2c_msg::addr), __u16>, "i2c_msg.addr must be 16-bit");
static_assert(std::is_same_v<decltype(i2c_msg::flags), __u16>, "i2c_msg.flags must be 16-bit");
static_assert(std::is_same_v<decltype(i2c_msg::len), __u16>, "i2c_msg.len must be 16-bit");
static_assert(std::is_same_v<decltype(i2c_msg::buf), __u8*>, "i2c_msg.buf must be a byte pointer");
static_assert(std::is_same_v<decltype(i2c_rdwr_ioctl_data::nmsgs), __u32>,
              "i2c_rdwr_ioctl_data.nmsgs must be 32-bit");

constexpr uint16_t kMaxSevenBitAddress = 0x7F;
constexpr uint16_t kMaxTenBitAddress = 0x3FF;
constexpr std::size_t kMaxMessagesPerTransfer = I2C_RDWR_IOCTL_MAX_MSGS;
constexpr std::size_t kRecvLenMinBuffer = 1 + I2C_SMBUS_BLOCK_MAX;

std::string message_context(std::size_t index) { return "message " + std::to_string(index) + ": "; }

void validate(uint16_t address, const std::vector<Message>& messages) {
  if (messages.empty()) {
    throw InvalidArgumentError("empty message list");
  }
  if (messages.size() > kMaxMessagesPerTransfer) {
    throw InvalidArgumentError("too many messages in one transfer (" + std::to_string(messages.size()) +
                               " > " + std::to_string(kMaxMessagesPerTransfer) + ")");
  }
  if (address > kMaxTenBitAddress) {
    throw InvalidArgumentError("I2C address exceeds 10-bit range");
  }

  for (std::size_t i = 0; i < messages.size(); ++i) {
    const Message& msg = messages[i];
    if (msg.data.size() > kMaxMessageLength) {
      throw InvalidArgumentError(message_context(i) + "payload exceeds 65535 bytes");
    }
    if (((msg.flags & kFlagTenBit) == 0) && (address > kMaxSevenBitAddress)) {
      throw InvalidArgumentError(message_context(i) + "address needs the ten_bit flag");
    }
    if ((msg.flags & kFlagRecvLen) != 0) {
      if (!msg.read) {
        throw InvalidArgumentError(message_context(i) + "recv_len is only valid on reads");
      }
      if (msg.data.size() < kRecvLenMinBuffer) {
        throw InvalidArgumentError(message_context(i) + "recv_len needs a buffer of at least " +
                                   std::to_string(kRecvLenMinBuffer) + " bytes");
      }
    }
  }
}

// Kernel-facing mirror of one call. Records point into `buffers`, so the
// batch is neither copied nor moved once built.
struct TransferBatch {
  std::vector<std::vector<uint8_t>> buffers;
  std::vector<i2c_msg> records;
  i2c_rdwr_ioctl_data request{};

  TransferBatch(uint16_t address, const std::vector<Message>& messages)
      : buffers(messages.size()), records(messages.size()) {
    for (std::size_t i = 0; i < messages.size(); ++i) {
      const Message& msg = messages[i];
      auto& buffer = buffers[i];
      if (msg.read) {
        buffer.assign(msg.data.size(), 0);
        if ((msg.flags & kFlagRecvLen) != 0) {
          // Extra bytes past the count byte; the driver adds the count it receives.
          buffer[0] = 1;
        }
      } else {
        buffer = msg.data;
      }

      i2c_msg& record = records[i];
      record.addr = address;
      record.flags = static_cast<__u16>((msg.flags & ~kFlagRead) | (msg.read ? kFlagRead : 0));
      record.len = static_cast<__u16>(buffer.size());
      record.buf = buffer.data();
    }

    request.msgs = records.data();
    request.nmsgs = static_cast<__u32>(records.size());
  }

  TransferBatch(const TransferBatch&) = delete;
  TransferBatch& operator=(const TransferBatch&) = delete;
};

std::size_t received_length(const i2c_msg& record, const std::vector<uint8_t>& buffer) {
  if ((record.flags & kFlagRecvLen) != 0) {
    return std::min(buffer.size(), static_cast<std::size_t>(buffer[0]) + 1);
  }
  return buffer.size();
}

}  // namespace

void TransferEngine::transfer(BusHandle& bus, uint16_t address, std::vector<Message>& messages) const {
  validate(address, messages);

  TransferBatch batch(address, messages);
  bus.execute(batch.request);

  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (!messages[i].read) {
      continue;
    }
    const auto& buffer = batch.buffers[i];
    const std::size_t length = received_length(batch.records[i], buffer);
    messages[i].data.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(length));
  }
}

void transfer(BusHandle& bus, uint16_t address, std::vector<Message>& messages) {
  TransferEngine{}.transfer(bus, address, messages);
}

}  // namespace i2cbus
