#include "i2cbus/bus_handle.hpp"

#include "i2cbus/errors.hpp"

#include <cstring>
#include <iostream>
#include <sstream>
#include <utility>

namespace i2cbus {

BusHandle::BusHandle(std::string device_path)
    : BusHandle(std::move(device_path), make_linux_device_io()) {}

BusHandle::BusHandle(std::string device_path, std::shared_ptr<DeviceIo> io)
    : device_path_(std::move(device_path)),
      io_(std::move(io)),
      fd_(-1),
      functionality_(0) {
  if (!io_) {
    throw InvalidArgumentError("BusHandle requires a DeviceIo implementation");
  }
  open();
}

BusHandle::~BusHandle() {
  try {
    close();
  } catch (const DeviceCloseError& ex) {
    std::cerr << "BusHandle(" << device_path_ << "): " << ex.what() << "\n";
  }
}

void BusHandle::open() {
  const int fd = io_->open_device(device_path_);
  if (fd < 0) {
    throw DeviceOpenError(device_path_, -fd);
  }
  fd_ = fd;

  uint32_t funcs = 0;
  const int rc = io_->query_functionality(fd_, funcs);
  if (rc < 0) {
    release_after_failed_open();
    throw CapabilityQueryError(-rc);
  }

  if ((funcs & I2C_FUNC_I2C) == 0) {
    release_after_failed_open();
    throw UnsupportedDeviceError(device_path_);
  }
  functionality_ = funcs;
}

void BusHandle::release_after_failed_open() noexcept {
  const int rc = io_->close_device(fd_);
  fd_ = -1;
  if (rc < 0) {
    std::cerr << "BusHandle(" << device_path_ << "): close after failed open (errno=" << -rc << ": "
              << std::strerror(-rc) << ")\n";
  }
}

void BusHandle::close() {
  std::scoped_lock lock(mutex_);
  if (fd_ < 0) {
    return;
  }

  // The kernel consumes the descriptor even when close() reports an error.
  const int fd = fd_;
  fd_ = -1;
  const int rc = io_->close_device(fd);
  if (rc < 0) {
    throw DeviceCloseError(-rc);
  }
}

bool BusHandle::is_open() const noexcept {
  std::scoped_lock lock(mutex_);
  return fd_ >= 0;
}

int BusHandle::fd() const noexcept {
  std::scoped_lock lock(mutex_);
  return fd_;
}

const std::string& BusHandle::device_path() const noexcept { return device_path_; }

uint32_t BusHandle::functionality() const noexcept { return functionality_; }

std::string BusHandle::to_string() const {
  std::ostringstream oss;
  oss << "I2C (device=" << device_path_ << ", fd=" << fd() << ")";
  return oss.str();
}

void BusHandle::execute(i2c_rdwr_ioctl_data& request) {
  std::scoped_lock lock(mutex_);
  if (fd_ < 0) {
    throw DeviceClosedError(device_path_);
  }

  const int rc = io_->transfer(fd_, request);
  if (rc < 0) {
    throw TransferError(-rc);
  }
}

std::ostream& operator<<(std::ostream& os, const BusHandle& bus) { return os << bus.to_string(); }

}  // namespace i2cbus
