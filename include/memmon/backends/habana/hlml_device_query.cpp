#if !(MEMMON_ENABLE_HABANA && MEMMON_HAS_HLML)
#error "hlml_device_query.cpp should only be compiled when MEMMON_ENABLE_HABANA && MEMMON_HAS_HLML are true."
#endif

#include "memmon/backends/habana/hlml_device_query.hpp"
#include "memmon/core/aggregate_data.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace memmon::habana {
    // hlml.h ships no error-string helper.
    std::string HlmlDeviceQuery::hlmlErrorToString(hlml_return_t r) {
        return "hlml error " + std::to_string(static_cast<int>(r));
    }

    bool HlmlDeviceQuery::probe(std::string* reason) {
        hlml_return_t r = hlml_init();
        if (r != HLML_SUCCESS) {
            if (reason) *reason = "hlml_init failed: " + hlmlErrorToString(r);
            return false;
        }

        unsigned int count = 0;
        r = hlml_device_get_count(&count);
        hlml_shutdown();
        if (r != HLML_SUCCESS || count == 0) {
            if (reason) *reason = "no HLML devices found";
            return false;
        }
        return true;
    }

    HlmlDeviceQuery::HlmlDeviceQuery() {
        hlml_return_t r = hlml_init();
        if (r != HLML_SUCCESS) {
            initError_ = "hlml_init failed: " + hlmlErrorToString(r);
            return;
        }
        initialized_ = true;
    }

    HlmlDeviceQuery::~HlmlDeviceQuery() {
        if (initialized_) {
            hlml_shutdown();
            initialized_ = false;
        }
    }

    bool HlmlDeviceQuery::isAvailable(std::string* reason) const {
        if (!initialized_) {
            if (reason) *reason = initError_;
            return false;
        }

        unsigned int count = 0;
        if (hlml_device_get_count(&count) != HLML_SUCCESS || count == 0) {
            if (reason) *reason = "no HLML devices found";
            return false;
        }
        return true;
    }

    void HlmlDeviceQuery::check(hlml_return_t r, const char* what) const {
        if (r == HLML_SUCCESS) return;
        throw DeviceQueryError(std::string(what) + " failed: " + hlmlErrorToString(r));
    }

    hlml_device_t HlmlDeviceQuery::handle(const DeviceRef& device) const {
        if (!initialized_) throw DeviceQueryError(initError_);

        hlml_device_t dev{};
        const unsigned int index = device.index ? static_cast<unsigned int>(*device.index) : 0u;
        check(hlml_device_get_handle_by_index(index, &dev), "hlml_device_get_handle_by_index");
        return dev;
    }

    hlml_memory_t HlmlDeviceQuery::memory(const DeviceRef& device) const {
        hlml_memory_t mem{};
        check(hlml_device_get_memory_info(handle(device), &mem), "hlml_device_get_memory_info");
        return mem;
    }

    MemInfo HlmlDeviceQuery::memInfo(const DeviceRef& device) {
        const hlml_memory_t mem = memory(device);

        {
            std::lock_guard lk(peakMu_);
            usedPeak_ = std::max(usedPeak_, static_cast<int64_t>(mem.used));
        }
        return MemInfo{static_cast<int64_t>(mem.free), static_cast<int64_t>(mem.total)};
    }

    AllocatorStats HlmlDeviceQuery::allocatorStats(const DeviceRef& device) {
        const hlml_memory_t mem = memory(device);
        const auto used = static_cast<int64_t>(mem.used);

        std::lock_guard lk(peakMu_);
        usedPeak_ = std::max(usedPeak_, used);

        AllocatorStats out;
        out[keys::kActive]       = used;
        out[keys::kActivePeak]   = usedPeak_;
        out[keys::kReserved]     = used;
        out[keys::kReservedPeak] = usedPeak_;
        out[keys::kTotalMemory]  = static_cast<int64_t>(mem.total);
        return out;
    }

    void HlmlDeviceQuery::resetPeakStats(const DeviceRef&) {
        std::lock_guard lk(peakMu_);
        usedPeak_ = 0;
    }

    std::string HlmlDeviceQuery::memorySummary(const DeviceRef& device) {
        const hlml_device_t dev = handle(device);

        char name[96]{};
        if (hlml_device_get_name(dev, name, sizeof(name)) != HLML_SUCCESS) name[0] = '\0';

        hlml_memory_t mem{};
        check(hlml_device_get_memory_info(dev, &mem), "hlml_device_get_memory_info");

        std::ostringstream oss;
        oss << "HLML memory summary for " << device.toString();
        if (name[0] != '\0') oss << " (" << name << ")";
        oss << ": "
            << toMiBCeil(static_cast<int64_t>(mem.used)) << " MiB used, "
            << toMiBCeil(static_cast<int64_t>(mem.free)) << " MiB free, "
            << toMiBCeil(static_cast<int64_t>(mem.total)) << " MiB total";
        return oss.str();
    }
} // namespace memmon::habana
