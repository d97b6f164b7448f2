#pragma once

#include <memory>
#include <string>

#include "memmon/core/aggregate_data.hpp"
#include "memmon/core/device.hpp"
#include "memmon/core/device_query.hpp"
#include "memmon/core/memory_monitor.hpp"

namespace memmon {
    enum class BackendKind { Auto, CudaRuntime, Nvml, Hlml, None };

    struct InitOptions {
        std::string name = "memmon";
        double pollRate = 8.0;          // samples per second, <= 0 or non-finite disables the polling loop
        BackendKind backend = BackendKind::Auto;
        bool enableDebugOutput = false;
    };

    struct BackendProbeResult {
        bool available;
        std::string reason;
    };

    BackendProbeResult probeCudaRuntime();
    BackendProbeResult probeNvml();
    BackendProbeResult probeHlml();

    // Returns null (and a reason) when the requested backend is not compiled in.
    // Auto picks by device family: HLML for "hpu", otherwise the CUDA runtime
    // and then NVML.
    std::shared_ptr<IDeviceQuery> createDeviceQuery(BackendKind backend,
                                                    const DeviceRef& device,
                                                    std::string* reasonOut = nullptr);

    // Parses the device ("cuda", "cuda:1", "hpu"), picks a backend and builds the monitor.
    // A monitor that cannot reach its device comes back disabled.
    std::unique_ptr<MemoryMonitor> makeMonitor(const std::string& device, const InitOptions& opts = {});
} // namespace memmon
