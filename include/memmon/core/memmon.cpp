#include "memmon/memmon.hpp"

#include <memory>
#include <string>
#include <utility>

#include "memmon/core/debug_logger.hpp"

#if MEMMON_ENABLE_NVIDIA && MEMMON_HAS_CUDA
  #include "memmon/backends/nvidia/cuda_device_query.hpp"
#endif

#if MEMMON_ENABLE_NVIDIA && MEMMON_HAS_NVML
  #include "memmon/backends/nvidia/nvml_device_query.hpp"
#endif

#if MEMMON_ENABLE_HABANA && MEMMON_HAS_HLML
  #include "memmon/backends/habana/hlml_device_query.hpp"
#endif

namespace memmon {

    BackendProbeResult probeCudaRuntime() {
#if MEMMON_ENABLE_NVIDIA && MEMMON_HAS_CUDA
        BackendProbeResult res{false, ""};
        res.available = nvidia::CudaDeviceQuery().isAvailable(&res.reason);
        return res;
#else
        return {false, "CUDA runtime not available (MEMMON_ENABLE_NVIDIA=OFF or CUDA not found)."};
#endif
    }

    BackendProbeResult probeNvml() {
#if MEMMON_ENABLE_NVIDIA && MEMMON_HAS_NVML
        BackendProbeResult res{false, ""};
        res.available = nvidia::NvmlDeviceQuery::probe(&res.reason);
        return res;
#else
        return {false, "NVML not available (MEMMON_ENABLE_NVIDIA=OFF or NVML not found)."};
#endif
    }

    BackendProbeResult probeHlml() {
#if MEMMON_ENABLE_HABANA && MEMMON_HAS_HLML
        BackendProbeResult res{false, ""};
        res.available = habana::HlmlDeviceQuery::probe(&res.reason);
        return res;
#else
        return {false, "HLML not available (MEMMON_ENABLE_HABANA=OFF or HLML not found)."};
#endif
    }

    std::shared_ptr<IDeviceQuery> createDeviceQuery(const BackendKind backend,
                                                    const DeviceRef& device,
                                                    std::string* reasonOut) {
        if (reasonOut) reasonOut->clear();

        auto setReason = [&](const std::string& r) {
            if (reasonOut && reasonOut->empty()) *reasonOut = r;
        };

        auto tryCuda = [&]() -> std::shared_ptr<IDeviceQuery> {
#if MEMMON_ENABLE_NVIDIA && MEMMON_HAS_CUDA
            return std::make_shared<nvidia::CudaDeviceQuery>();
#else
            setReason("CUDA runtime not available (MEMMON_ENABLE_NVIDIA=OFF or CUDA not found).");
            return nullptr;
#endif
        };

        auto tryNvml = [&]() -> std::shared_ptr<IDeviceQuery> {
#if MEMMON_ENABLE_NVIDIA && MEMMON_HAS_NVML
            return std::make_shared<nvidia::NvmlDeviceQuery>();
#else
            setReason("NVML not available (MEMMON_ENABLE_NVIDIA=OFF or NVML not found).");
            return nullptr;
#endif
        };

        auto tryHlml = [&]() -> std::shared_ptr<IDeviceQuery> {
#if MEMMON_ENABLE_HABANA && MEMMON_HAS_HLML
            return std::make_shared<habana::HlmlDeviceQuery>();
#else
            setReason("HLML not available (MEMMON_ENABLE_HABANA=OFF or HLML not found).");
            return nullptr;
#endif
        };

        switch (backend) {
            case BackendKind::None:
                setReason("Memory monitoring disabled (backend=none).");
                return nullptr;

            case BackendKind::CudaRuntime: {
                auto q = tryCuda();
                if (!q) setReason("Requested backend=cuda but the CUDA runtime is unavailable.");
                return q;
            }

            case BackendKind::Nvml: {
                auto q = tryNvml();
                if (!q) setReason("Requested backend=nvml but NVML is unavailable.");
                return q;
            }

            case BackendKind::Hlml: {
                auto q = tryHlml();
                if (!q) setReason("Requested backend=hlml but HLML is unavailable.");
                return q;
            }

            case BackendKind::Auto:
            default: {
                if (device.type == "hpu") {
                    if (auto q = tryHlml()) return q;
                    setReason("No device backend available for hpu (HLML not compiled in).");
                    return nullptr;
                }
                // Prefer the CUDA runtime (real allocator pools), then NVML
                if (auto q = tryCuda(); q && q->isAvailable()) return q;
                if (auto q = tryNvml()) return q;
                setReason("No device backend available (CUDA/NVML not compiled in or not available).");
                return nullptr;
            }
        }
    }

    std::unique_ptr<MemoryMonitor> makeMonitor(const std::string& device, const InitOptions& opts) {
        DebugLogger::setEnabled(opts.enableDebugOutput);

        DeviceRef ref = DeviceRef::parse(device);

        std::string reason;
        auto query = createDeviceQuery(opts.backend, ref, &reason);
        if (!query) {
            MEMMON_LOG_DEBUG("no device query for '", device, "': ", reason);
        }

        MonitorOptions mo;
        mo.name = opts.name;
        mo.pollRate = opts.pollRate;
        return std::make_unique<MemoryMonitor>(std::move(ref), std::move(query), std::move(mo));
    }

} // namespace memmon
