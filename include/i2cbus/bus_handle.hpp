#pragma once

#include "i2cbus/device_io.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace i2cbus {

class TransferEngine;

// One open i2c-dev adapter. Construction opens the node and checks that the
// adapter supports plain I2C_RDWR transfers; the descriptor is released on
// every failure path before the constructor throws.
class BusHandle {
 public:
  explicit BusHandle(std::string device_path);
  BusHandle(std::string device_path, std::shared_ptr<DeviceIo> io);
  ~BusHandle();

  BusHandle(const BusHandle&) = delete;
  BusHandle& operator=(const BusHandle&) = delete;
  BusHandle(BusHandle&&) = delete;
  BusHandle& operator=(BusHandle&&) = delete;

  // Idempotent. The handle counts as released even when close() throws.
  void close();
  [[nodiscard]] bool is_open() const noexcept;

  [[nodiscard]] int fd() const noexcept;
  [[nodiscard]] const std::string& device_path() const noexcept;
  [[nodiscard]] uint32_t functionality() const noexcept;
  [[nodiscard]] std::string to_string() const;

 private:
  friend class TransferEngine;

  // Issues one I2C_RDWR request. Throws DeviceClosedError or TransferError.
  void execute(i2c_rdwr_ioctl_data& request);

  void open();
  void release_after_failed_open() noexcept;

  std::string device_path_;
  std::shared_ptr<DeviceIo> io_;
  int fd_;
  uint32_t functionality_;
  mutable std::mutex mutex_;
};

std::ostream& operator<<(std::ostream& os, const BusHandle& bus);

}  // namespace i2cbus
