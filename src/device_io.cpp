#include "i2cbus/device_io.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace i2cbus {

int LinuxDeviceIo::open_device(const std::string& path) {
  const int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
  return (fd < 0) ? -errno : fd;
}

int LinuxDeviceIo::close_device(int fd) {
  return (::close(fd) < 0) ? -errno : 0;
}

int LinuxDeviceIo::query_functionality(int fd, uint32_t& functionality) {
  unsigned long funcs = 0;
  if (::ioctl(fd, I2C_FUNCS, &funcs) < 0) {
    return -errno;
  }
  functionality = static_cast<uint32_t>(funcs);
  return 0;
}

int LinuxDeviceIo::transfer(int fd, i2c_rdwr_ioctl_data& request) {
  const int rc = ::ioctl(fd, I2C_RDWR, &request);
  return (rc < 0) ? -errno : rc;
}

std::shared_ptr<DeviceIo> make_linux_device_io() { return std::make_shared<LinuxDeviceIo>(); }

}  // namespace i2cbus
