#include "i2cbus/bus_handle.hpp"
#include "i2cbus/transfer_engine.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  const std::string bus_path = (argc > 1) ? argv[1] : "/dev/i2c-1";
  const std::size_t length = (argc > 2) ? std::stoul(argv[2]) : 16;

  try {
    i2cbus::BusHandle bus(bus_path);

    // 16-bit memory offset 0x0000, then a repeated-start read.
    std::vector<i2cbus::Message> messages{
        i2cbus::make_write({0x00, 0x00}),
        i2cbus::make_read(length),
    };
    i2cbus::transfer(bus, 0x50, messages);

    std::cout << "EEPROM@0x50 [" << bus << "]:";
    for (uint8_t byte : messages[1].data) {
      std::cout << " " << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(byte);
    }
    std::cout << std::dec << "\n";

    bus.close();
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "read_eeprom failed: " << ex.what() << "\n";
    return 1;
  }
}
