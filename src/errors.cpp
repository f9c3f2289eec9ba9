#include "i2cbus/errors.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

namespace i2cbus {

namespace {

std::string format_errno(const std::string& prefix, int err) {
  std::ostringstream oss;
  oss << prefix;
  if (err != 0) {
    oss << " (errno=" << err << ": " << std::strerror(err) << ")";
  }
  return oss.str();
}

}  // namespace

I2cError::I2cError(const std::string& message, int error_number)
    : std::runtime_error(format_errno(message, error_number)),
      error_number_(error_number) {}

int I2cError::error_number() const noexcept { return error_number_; }

DeviceOpenError::DeviceOpenError(const std::string& path, int error_number)
    : I2cError("Opening I2C device '" + path + "'", error_number), path_(path) {}

const std::string& DeviceOpenError::path() const noexcept { return path_; }

CapabilityQueryError::CapabilityQueryError(int error_number)
    : I2cError("Querying supported functions", error_number) {}

UnsupportedDeviceError::UnsupportedDeviceError(const std::string& path)
    : I2cError("I2C not supported on device '" + path + "'"), path_(path) {}

const std::string& UnsupportedDeviceError::path() const noexcept { return path_; }

DeviceCloseError::DeviceCloseError(int error_number)
    : I2cError("Closing I2C device", error_number) {}

DeviceClosedError::DeviceClosedError(const std::string& path)
    : I2cError("I2C device '" + path + "' is closed", EBADF) {}

TransferError::TransferError(int error_number) : I2cError("I2C transfer", error_number) {}

}  // namespace i2cbus
