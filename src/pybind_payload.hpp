#pragma once

#include <pybind11/pybind11.h>

#include <cstdint>
#include <string>
#include <vector>

namespace i2cbus::python {

namespace py = pybind11;

// Payloads cross the Python boundary as bytes, bytearray or a list of ints;
// the library itself only sees std::vector<uint8_t>.
inline std::vector<uint8_t> to_bytes(const py::handle& obj) {
  if (py::isinstance<py::bytes>(obj) || py::isinstance<py::bytearray>(obj)) {
    const std::string raw = py::isinstance<py::bytes>(obj) ? std::string(py::reinterpret_borrow<py::bytes>(obj))
                                                           : std::string(py::reinterpret_borrow<py::bytearray>(obj));
    return std::vector<uint8_t>(raw.begin(), raw.end());
  }
  if (py::isinstance<py::list>(obj)) {
    std::vector<uint8_t> out;
    for (const auto& item : py::reinterpret_borrow<py::list>(obj)) {
      if (!py::isinstance<py::int_>(item)) {
        throw py::type_error("Invalid data element type, should be int.");
      }
      long long value = -1;
      try {
        value = item.cast<long long>();
      } catch (const py::cast_error&) {
        throw py::value_error("Invalid data value, should be 0..255.");
      }
      if (value < 0 || value > 0xFF) {
        throw py::value_error("Invalid data value, should be 0..255.");
      }
      out.push_back(static_cast<uint8_t>(value));
    }
    return out;
  }
  throw py::type_error("Invalid data type, should be bytes, bytearray, or list.");
}

// Rebuilds read results in the container type the caller supplied.
inline py::object from_bytes(const std::vector<uint8_t>& data, const py::handle& like) {
  const char* raw = reinterpret_cast<const char*>(data.data());
  if (py::isinstance<py::bytes>(like)) {
    return py::bytes(raw, data.size());
  }
  if (py::isinstance<py::bytearray>(like)) {
    return py::bytearray(raw, data.size());
  }
  py::list out;
  for (uint8_t byte : data) {
    out.append(py::int_(byte));
  }
  return out;
}

}  // namespace i2cbus::python
