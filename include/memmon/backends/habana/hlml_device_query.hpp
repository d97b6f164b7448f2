#pragma once
#include "memmon/core/device_query.hpp"

#include <mutex>
#include <string>

#if MEMMON_ENABLE_HABANA && MEMMON_HAS_HLML
#include <hlml.h>

namespace memmon::habana {

    /**
     * @brief Gaudi ("hpu") memory through Habana's management library.
     *
     * HLML reports device-wide free/used/total only. There is no allocator or
     * per-process breakdown, so "active" and "reserved" are both the device's
     * used memory, "total_memory" is its capacity, and the peaks are
     * high-water marks kept here since the last reset.
     */
    class HlmlDeviceQuery : public IDeviceQuery {
    public:
        HlmlDeviceQuery();
        ~HlmlDeviceQuery() override;

        std::string family() const override { return "hpu"; }
        bool isAvailable(std::string* reason = nullptr) const override;

        MemInfo memInfo(const DeviceRef& device) override;
        AllocatorStats allocatorStats(const DeviceRef& device) override;
        void resetPeakStats(const DeviceRef& device) override;
        std::string memorySummary(const DeviceRef& device) override;

        static bool probe(std::string* reason = nullptr);

    private:
        hlml_device_t handle(const DeviceRef& device) const;
        hlml_memory_t memory(const DeviceRef& device) const;
        void check(hlml_return_t r, const char* what) const;

        static std::string hlmlErrorToString(hlml_return_t r);

        bool initialized_ = false;
        std::string initError_;

        std::mutex peakMu_;
        int64_t usedPeak_ = 0;
    };
}
#else
namespace memmon::habana {
    class HlmlDeviceQuery;
}
#endif
