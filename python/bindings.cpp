#include <optional>
#include <sstream>
#include <string>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "memmon/memmon.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_memmon, m) {
    m.doc() = "Accelerator memory monitor C++ binding";

    py::register_exception<memmon::DeviceQueryError>(m, "DeviceQueryError", PyExc_RuntimeError);

    py::enum_<memmon::BackendKind>(m, "BackendKind")
        .value("Auto", memmon::BackendKind::Auto)
        .value("CudaRuntime", memmon::BackendKind::CudaRuntime)
        .value("Nvml", memmon::BackendKind::Nvml)
        .value("Hlml", memmon::BackendKind::Hlml)
        .value("Off", memmon::BackendKind::None);

    py::class_<memmon::DeviceRef>(m, "DeviceRef")
        .def(py::init<std::string, std::optional<int>>(), py::arg("type"), py::arg("index") = py::none())
        .def_static("parse", &memmon::DeviceRef::parse)
        .def_readonly("type", &memmon::DeviceRef::type)
        .def_readonly("index", &memmon::DeviceRef::index)
        .def("__str__", &memmon::DeviceRef::toString);

    py::class_<memmon::InitOptions>(m, "InitOptions")
        .def(py::init<>())
        .def_readwrite("name", &memmon::InitOptions::name)
        .def_readwrite("poll_rate", &memmon::InitOptions::pollRate)
        .def_readwrite("backend", &memmon::InitOptions::backend)
        .def_readwrite("enable_debug_output", &memmon::InitOptions::enableDebugOutput);

    py::class_<memmon::MonitorOptions>(m, "MonitorOptions")
        .def(py::init<>())
        .def_readwrite("poll_rate", &memmon::MonitorOptions::pollRate)
        .def_readwrite("name", &memmon::MonitorOptions::name);

    // Device queries can block in the driver; release the GIL around them.
    py::class_<memmon::MemoryMonitor>(m, "MemoryMonitor")
        .def("monitor", &memmon::MemoryMonitor::monitor, py::call_guard<py::gil_scoped_release>())
        .def("stop", &memmon::MemoryMonitor::stop, py::call_guard<py::gil_scoped_release>())
        .def("read", &memmon::MemoryMonitor::read, py::call_guard<py::gil_scoped_release>())
        .def("dump_debug", [](const memmon::MemoryMonitor& self) {
            std::ostringstream oss;
            {
                py::gil_scoped_release release;
                self.dumpDebug(oss);
            }
            py::print(oss.str(), py::arg("end") = "");
        })
        .def_property_readonly("disabled", &memmon::MemoryMonitor::disabled)
        .def_property_readonly("state", [](const memmon::MemoryMonitor& self) {
            return std::string(memmon::toString(self.state()));
        })
        .def_property_readonly("device", &memmon::MemoryMonitor::device)
        .def_property_readonly("options", &memmon::MemoryMonitor::options);

    m.def("make_monitor", [](const std::string& device, const memmon::InitOptions& opts) {
        return memmon::makeMonitor(device, opts);
    }, py::arg("device"), py::arg("options") = memmon::InitOptions{});

    m.def("probe_cuda_runtime", [] {
        const auto r = memmon::probeCudaRuntime();
        return py::make_tuple(r.available, r.reason);
    });

    m.def("probe_nvml", [] {
        const auto r = memmon::probeNvml();
        return py::make_tuple(r.available, r.reason);
    });

    m.def("probe_hlml", [] {
        const auto r = memmon::probeHlml();
        return py::make_tuple(r.available, r.reason);
    });
}
