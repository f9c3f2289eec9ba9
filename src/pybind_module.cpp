#include "i2cbus/bus_handle.hpp"
#include "i2cbus/errors.hpp"
#include "i2cbus/transfer_engine.hpp"
#include "pybind_payload.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

using i2cbus::python::from_bytes;
using i2cbus::python::to_bytes;

namespace {

// Python-facing descriptor; `data` may be bytes, bytearray or a list of ints.
struct PyMessage {
  py::object data;
  bool read = false;
  uint16_t flags = 0;
};

void py_transfer(i2cbus::BusHandle& bus, uint16_t address, const std::vector<PyMessage*>& messages) {
  std::vector<i2cbus::Message> native;
  native.reserve(messages.size());
  for (const PyMessage* m : messages) {
    native.push_back(i2cbus::Message{to_bytes(m->data), m->read, m->flags});
  }

  {
    py::gil_scoped_release release;
    i2cbus::transfer(bus, address, native);
  }

  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (messages[i]->read) {
      messages[i]->data = from_bytes(native[i].data, messages[i]->data);
    }
  }
}

}  // namespace

PYBIND11_MODULE(_i2cbus, m) {
  py::register_exception<i2cbus::I2cError>(m, "I2CError", PyExc_IOError);

  py::class_<PyMessage>(m, "Message")
      .def(py::init([](py::object data, bool read, uint16_t flags) {
             (void)to_bytes(data);
             return PyMessage{std::move(data), read, flags};
           }),
           py::arg("data"), py::arg("read") = false, py::arg("flags") = 0)
      .def_readwrite("data", &PyMessage::data)
      .def_readwrite("read", &PyMessage::read)
      .def_readwrite("flags", &PyMessage::flags);

  py::class_<i2cbus::BusHandle>(m, "I2C")
      .def(py::init<std::string>(), py::arg("devpath"), py::call_guard<py::gil_scoped_release>())
      .def("close", &i2cbus::BusHandle::close, py::call_guard<py::gil_scoped_release>())
      .def("transfer", &py_transfer, py::arg("address"), py::arg("messages"))
      .def_property_readonly("fd", &i2cbus::BusHandle::fd)
      .def_property_readonly("devpath", &i2cbus::BusHandle::device_path)
      .def_property_readonly("functionality", &i2cbus::BusHandle::functionality)
      .def("__str__", &i2cbus::BusHandle::to_string)
      .def("__enter__", [](i2cbus::BusHandle& self) -> i2cbus::BusHandle& { return self; },
           py::return_value_policy::reference)
      .def("__exit__", [](i2cbus::BusHandle& self, py::args) { self.close(); });

  m.attr("I2C_M_RD") = py::int_(i2cbus::kFlagRead);
  m.attr("I2C_M_TEN") = py::int_(i2cbus::kFlagTenBit);
  m.attr("I2C_M_RECV_LEN") = py::int_(i2cbus::kFlagRecvLen);
  m.attr("I2C_M_NO_RD_ACK") = py::int_(i2cbus::kFlagNoReadAck);
  m.attr("I2C_M_IGNORE_NAK") = py::int_(i2cbus::kFlagIgnoreNak);
  m.attr("I2C_M_REV_DIR_ADDR") = py::int_(i2cbus::kFlagRevDirAddr);
  m.attr("I2C_M_NOSTART") = py::int_(i2cbus::kFlagNoStart);
  m.attr("I2C_M_STOP") = py::int_(i2cbus::kFlagStop);
}
