#include "i2cbus/bus_handle.hpp"
#include "i2cbus/errors.hpp"
#include "i2cbus/transfer_engine.hpp"

#include "fake_device_io.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using i2cbus_test::FakeDeviceIo;

void expect(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAILED: " << msg << "\n";
    std::exit(1);
  }
}

std::size_t count_process_fds() {
  std::size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd")) {
    (void)entry;
    ++count;
  }
  return count;
}

void test_open_and_idempotent_close() {
  auto io = std::make_shared<FakeDeviceIo>();
  i2cbus::BusHandle bus("/dev/i2c-3", io);

  expect(bus.is_open(), "handle should be open after construction");
  expect(bus.fd() == 101, "fd should come from the device seam");
  expect(bus.device_path() == "/dev/i2c-3", "device path should be retained");
  expect((bus.functionality() & I2C_FUNC_I2C) != 0, "functionality mask should be captured");
  expect(io->query_count == 1, "capabilities should be queried exactly once");
  expect(bus.to_string() == "I2C (device=/dev/i2c-3, fd=101)", "to_string format mismatch");

  bus.close();
  expect(!bus.is_open(), "handle should be closed");
  expect(bus.fd() == -1, "closed handle should report fd -1");
  bus.close();
  expect(io->close_count == 1, "second close must not release the descriptor again");
  expect(io->closed_fds.front() == 101, "close should release the opened descriptor");
}

void test_destructor_releases_descriptor() {
  auto io = std::make_shared<FakeDeviceIo>();
  {
    i2cbus::BusHandle bus("/dev/i2c-1", io);
    expect(io->open_descriptors() == 1, "descriptor should be held while in scope");
  }
  expect(io->open_descriptors() == 0, "destructor should release the descriptor");
}

void test_destructor_logs_failed_close() {
  auto io = std::make_shared<FakeDeviceIo>();
  std::ostringstream captured;
  std::streambuf* previous = std::cerr.rdbuf(captured.rdbuf());
  {
    i2cbus::BusHandle bus("/dev/i2c-5", io);
    io->close_errno = EIO;
  }
  std::cerr.rdbuf(previous);

  const std::string log = captured.str();
  expect(io->close_count == 1, "destructor should attempt exactly one close");
  expect(log.find("/dev/i2c-5") != std::string::npos, "close failure log should name the device");
  expect(log.find("Closing I2C device") != std::string::npos, "close failure log should name the stage");
  expect(log.find("errno=" + std::to_string(EIO)) != std::string::npos, "close failure log should carry errno");
}

void test_open_failure() {
  auto io = std::make_shared<FakeDeviceIo>();
  io->open_errno = EACCES;
  bool thrown = false;
  try {
    i2cbus::BusHandle bus("/dev/i2c-9", io);
  } catch (const i2cbus::DeviceOpenError& ex) {
    thrown = true;
    expect(ex.error_number() == EACCES, "open error should carry errno");
    expect(ex.path() == "/dev/i2c-9", "open error should carry the path");
  }
  expect(thrown, "open failure should raise DeviceOpenError");
  expect(io->query_count == 0, "capabilities must not be queried after a failed open");
  expect(io->close_count == 0, "nothing to close after a failed open");
}

void test_capability_query_failure_releases_descriptor() {
  auto io = std::make_shared<FakeDeviceIo>();
  io->query_errno = ENOTTY;
  bool thrown = false;
  try {
    i2cbus::BusHandle bus("/dev/i2c-1", io);
  } catch (const i2cbus::CapabilityQueryError& ex) {
    thrown = true;
    expect(ex.error_number() == ENOTTY, "query error should carry errno");
  }
  expect(thrown, "query failure should raise CapabilityQueryError");
  expect(io->open_descriptors() == 0, "descriptor leaked after query failure");
}

void test_unsupported_device_releases_descriptor() {
  auto io = std::make_shared<FakeDeviceIo>();
  io->functionality = I2C_FUNC_SMBUS_BYTE | I2C_FUNC_SMBUS_BYTE_DATA;
  bool thrown = false;
  try {
    i2cbus::BusHandle bus("/dev/i2c-2", io);
  } catch (const i2cbus::UnsupportedDeviceError& ex) {
    thrown = true;
    expect(ex.path() == "/dev/i2c-2", "unsupported error should carry the path");
  }
  expect(thrown, "missing I2C_FUNC_I2C should raise UnsupportedDeviceError");
  expect(io->open_descriptors() == 0, "descriptor leaked after capability rejection");
  expect(io->close_count == 1, "descriptor should be released exactly once");
}

void test_close_failure_still_marks_released() {
  auto io = std::make_shared<FakeDeviceIo>();
  i2cbus::BusHandle bus("/dev/i2c-1", io);
  io->close_errno = EIO;

  bool thrown = false;
  try {
    bus.close();
  } catch (const i2cbus::DeviceCloseError& ex) {
    thrown = true;
    expect(ex.error_number() == EIO, "close error should carry errno");
  }
  expect(thrown, "close failure should raise DeviceCloseError");
  expect(!bus.is_open(), "handle must be released even when close fails");

  bus.close();
  expect(io->close_count == 1, "failed close must not be retried");
}

void test_closed_handle_rejects_transfers() {
  auto io = std::make_shared<FakeDeviceIo>();
  i2cbus::BusHandle bus("/dev/i2c-1", io);
  bus.close();

  std::vector<i2cbus::Message> messages{i2cbus::make_write({0x00})};
  bool thrown = false;
  try {
    i2cbus::transfer(bus, 0x50, messages);
  } catch (const i2cbus::DeviceClosedError& ex) {
    thrown = true;
    expect(ex.error_number() == EBADF, "closed handle error should carry EBADF");
  }
  expect(thrown, "closed handle should raise DeviceClosedError");
  expect(io->transfer_count == 0, "closed handle must not reach the kernel");
}

void test_linux_open_missing_path() {
  const std::size_t before = count_process_fds();
  bool thrown = false;
  try {
    i2cbus::BusHandle bus("/dev/i2cbus-test-does-not-exist");
  } catch (const i2cbus::DeviceOpenError& ex) {
    thrown = true;
    expect(ex.error_number() == ENOENT, "missing node should report ENOENT");
  }
  expect(thrown, "missing node should raise DeviceOpenError");
  expect(count_process_fds() == before, "descriptor count changed after failed open");
}

void test_linux_non_i2c_node_is_rejected_without_leak() {
  const std::size_t before = count_process_fds();
  bool thrown = false;
  try {
    i2cbus::BusHandle bus("/dev/null");
  } catch (const i2cbus::CapabilityQueryError& ex) {
    thrown = true;
    expect(ex.error_number() != 0, "query error should carry errno");
  }
  expect(thrown, "/dev/null should fail the I2C_FUNCS query");
  expect(count_process_fds() == before, "descriptor leaked after rejecting /dev/null");
}

}  // namespace

int main() {
  test_open_and_idempotent_close();
  test_destructor_releases_descriptor();
  test_destructor_logs_failed_close();
  test_open_failure();
  test_capability_query_failure_releases_descriptor();
  test_unsupported_device_releases_descriptor();
  test_close_failure_still_marks_released();
  test_closed_handle_rejects_transfers();
  test_linux_open_missing_path();
  test_linux_non_i2c_node_is_rejected_without_leak();
  std::cout << "bus_handle_tests passed\n";
  return 0;
}
