#pragma once
#include "memmon/core/device_query.hpp"

#include <mutex>
#include <string>

#if MEMMON_ENABLE_NVIDIA && MEMMON_HAS_NVML
#include <nvml.h>

namespace memmon::nvidia {

    // NVML has no allocator statistics, so "active" is this process's
    // footprint on the device, "reserved" is device-wide used memory, and
    // both peaks are high-water marks kept here since the last reset.
    class NvmlDeviceQuery : public IDeviceQuery {
    public:
        NvmlDeviceQuery();
        ~NvmlDeviceQuery() override;

        std::string family() const override { return "cuda"; }
        bool isAvailable(std::string* reason = nullptr) const override;

        MemInfo memInfo(const DeviceRef& device) override;
        AllocatorStats allocatorStats(const DeviceRef& device) override;
        void resetPeakStats(const DeviceRef& device) override;
        std::string memorySummary(const DeviceRef& device) override;

        static bool probe(std::string* reason = nullptr);

    private:
        nvmlDevice_t handle(const DeviceRef& device) const;
        void check(nvmlReturn_t r, const char* what) const;

        static std::string nvmlErrorToString(nvmlReturn_t r);

        bool initialized_ = false;
        std::string initError_;

        std::mutex peakMu_;
        int64_t activePeak_ = 0;
        int64_t reservedPeak_ = 0;
    };
}
#else
namespace memmon::nvidia {
    class NvmlDeviceQuery;
}
#endif
