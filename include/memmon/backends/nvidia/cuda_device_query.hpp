#pragma once
#include "memmon/core/device_query.hpp"

#include <string>

#if MEMMON_ENABLE_NVIDIA && MEMMON_HAS_CUDA
#include <cuda_runtime.h>

namespace memmon::nvidia {

    /**
     * @brief Queries the CUDA runtime.
     *
     * Allocator figures ("active", "reserved" and their peaks) are the
     * attributes of the device's default stream-ordered memory pool, so they
     * only count cudaMallocAsync/cudaFreeAsync traffic on that pool. Memory
     * taken with plain cudaMalloc, cudaMallocManaged or a custom pool is
     * invisible to them and they read 0 for such workloads; it still shows up
     * in memInfo() and therefore in min_free and system_peak. Use the NVML
     * binding for a per-process footprint that covers every allocation path.
     */
    class CudaDeviceQuery : public IDeviceQuery {
    public:
        std::string family() const override { return "cuda"; }
        bool isAvailable(std::string* reason = nullptr) const override;

        MemInfo memInfo(const DeviceRef& device) override;
        AllocatorStats allocatorStats(const DeviceRef& device) override;
        void resetPeakStats(const DeviceRef& device) override;
        std::map<std::string, int64_t> rawStats(const DeviceRef& device) override;
        std::string memorySummary(const DeviceRef& device) override;

    private:
        static void check(cudaError_t r, const char* what);
        static int resolveIndex(const DeviceRef& device);
        static int64_t poolAttribute(int deviceId, cudaMemPoolAttr attr);
    };
}
#else
namespace memmon::nvidia {
    class CudaDeviceQuery;
}
#endif
