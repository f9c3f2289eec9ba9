#pragma once

#include <cstdint>
#include <linux/i2c-dev.h>
#include <linux/i2c.h>
#include <memory>
#include <string>

namespace i2cbus {

// Kernel boundary for an i2c-dev character device. Every call returns a
// non-negative value on success and -errno on failure.
class DeviceIo {
 public:
  virtual ~DeviceIo() = default;

  [[nodiscard]] virtual int open_device(const std::string& path) = 0;
  [[nodiscard]] virtual int close_device(int fd) = 0;
  // I2C_FUNCS
  [[nodiscard]] virtual int query_functionality(int fd, uint32_t& functionality) = 0;
  // I2C_RDWR
  [[nodiscard]] virtual int transfer(int fd, i2c_rdwr_ioctl_data& request) = 0;
};

class LinuxDeviceIo : public DeviceIo {
 public:
  [[nodiscard]] int open_device(const std::string& path) override;
  [[nodiscard]] int close_device(int fd) override;
  [[nodiscard]] int query_functionality(int fd, uint32_t& functionality) override;
  [[nodiscard]] int transfer(int fd, i2c_rdwr_ioctl_data& request) override;
};

[[nodiscard]] std::shared_ptr<DeviceIo> make_linux_device_io();

}  // namespace i2cbus
