#pragma once

#include <stdexcept>
#include <string>

namespace i2cbus {

class I2cError : public std::runtime_error {
 public:
  explicit I2cError(const std::string& message, int error_number = 0);
  [[nodiscard]] int error_number() const noexcept;

 private:
  int error_number_;
};

class DeviceOpenError : public I2cError {
 public:
  DeviceOpenError(const std::string& path, int error_number);
  [[nodiscard]] const std::string& path() const noexcept;

 private:
  std::string path_;
};

class CapabilityQueryError : public I2cError {
 public:
  explicit CapabilityQueryError(int error_number);
};

// Device opened fine but does not advertise I2C_FUNC_I2C.
class UnsupportedDeviceError : public I2cError {
 public:
  explicit UnsupportedDeviceError(const std::string& path);
  [[nodiscard]] const std::string& path() const noexcept;

 private:
  std::string path_;
};

class DeviceCloseError : public I2cError {
 public:
  explicit DeviceCloseError(int error_number);
};

class DeviceClosedError : public I2cError {
 public:
  explicit DeviceClosedError(const std::string& path);
};

class TransferError : public I2cError {
 public:
  explicit TransferError(int error_number);
};

class InvalidArgumentError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace i2cbus
