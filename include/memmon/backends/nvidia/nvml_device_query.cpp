#if !(MEMMON_ENABLE_NVIDIA && MEMMON_HAS_NVML)
#error "nvml_device_query.cpp should only be compiled when MEMMON_ENABLE_NVIDIA && MEMMON_HAS_NVML are true."
#endif

#include "memmon/backends/nvidia/nvml_device_query.hpp"
#include "memmon/core/aggregate_data.hpp"
#include "memmon/core/common.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace memmon::nvidia {
    std::string NvmlDeviceQuery::nvmlErrorToString(nvmlReturn_t r) {
        const char* s = nvmlErrorString(r);
        return s ? std::string(s) : std::string("unknown nvml error");
    }

    bool NvmlDeviceQuery::probe(std::string* reason) {
        // If NVML is linked, the best probe is: can we init?
        nvmlReturn_t r = nvmlInit_v2();
        if (r != NVML_SUCCESS) {
            if (reason) *reason = "nvmlInit_v2 failed: " + nvmlErrorToString(r);
            return false;
        }
        nvmlShutdown();
        return true;
    }

    NvmlDeviceQuery::NvmlDeviceQuery() {
        nvmlReturn_t r = nvmlInit_v2();
        if (r != NVML_SUCCESS) {
            initError_ = "nvmlInit_v2 failed: " + nvmlErrorToString(r);
            return;
        }
        initialized_ = true;
    }

    NvmlDeviceQuery::~NvmlDeviceQuery() {
        if (initialized_) {
            nvmlShutdown();
            initialized_ = false;
        }
    }

    bool NvmlDeviceQuery::isAvailable(std::string* reason) const {
        if (!initialized_) {
            if (reason) *reason = initError_;
            return false;
        }

        unsigned int count = 0;
        if (nvmlDeviceGetCount_v2(&count) != NVML_SUCCESS || count == 0) {
            if (reason) *reason = "no NVML devices found";
            return false;
        }
        return true;
    }

    void NvmlDeviceQuery::check(nvmlReturn_t r, const char* what) const {
        if (r == NVML_SUCCESS) return;
        throw DeviceQueryError(std::string(what) + " failed: " + nvmlErrorToString(r));
    }

    nvmlDevice_t NvmlDeviceQuery::handle(const DeviceRef& device) const {
        if (!initialized_) throw DeviceQueryError(initError_);

        nvmlDevice_t dev{};
        const unsigned int index = device.index ? static_cast<unsigned int>(*device.index) : 0u;
        check(nvmlDeviceGetHandleByIndex_v2(index, &dev), "nvmlDeviceGetHandleByIndex_v2");
        return dev;
    }

    MemInfo NvmlDeviceQuery::memInfo(const DeviceRef& device) {
        nvmlMemory_t mem{};
        check(nvmlDeviceGetMemoryInfo(handle(device), &mem), "nvmlDeviceGetMemoryInfo");

        {
            std::lock_guard lk(peakMu_);
            reservedPeak_ = std::max(reservedPeak_, static_cast<int64_t>(mem.used));
        }
        return MemInfo{static_cast<int64_t>(mem.free), static_cast<int64_t>(mem.total)};
    }

    AllocatorStats NvmlDeviceQuery::allocatorStats(const DeviceRef& device) {
        const nvmlDevice_t dev = handle(device);

        nvmlMemory_t mem{};
        check(nvmlDeviceGetMemoryInfo(dev, &mem), "nvmlDeviceGetMemoryInfo");

        // First call sizes the buffer; the process list can grow in between.
        std::vector<nvmlProcessInfo_t> procs;
        unsigned int count = 0;
        nvmlReturn_t r = nvmlDeviceGetComputeRunningProcesses(dev, &count, nullptr);
        while (r == NVML_ERROR_INSUFFICIENT_SIZE) {
            procs.resize(count + 4);
            count = static_cast<unsigned int>(procs.size());
            r = nvmlDeviceGetComputeRunningProcesses(dev, &count, procs.data());
        }
        check(r, "nvmlDeviceGetComputeRunningProcesses");
        procs.resize(count);

        const auto pid = static_cast<unsigned int>(detail::getPid());
        int64_t ours = 0;
        for (const auto& p : procs) {
            if (p.pid == pid && p.usedGpuMemory != NVML_VALUE_NOT_AVAILABLE) {
                ours += static_cast<int64_t>(p.usedGpuMemory);
            }
        }

        std::lock_guard lk(peakMu_);
        const auto used = static_cast<int64_t>(mem.used);
        activePeak_ = std::max(activePeak_, ours);
        reservedPeak_ = std::max(reservedPeak_, used);

        AllocatorStats out;
        out[keys::kActive]       = ours;
        out[keys::kActivePeak]   = activePeak_;
        out[keys::kReserved]     = used;
        out[keys::kReservedPeak] = reservedPeak_;
        out[keys::kNumProcesses] = static_cast<int64_t>(procs.size());
        return out;
    }

    void NvmlDeviceQuery::resetPeakStats(const DeviceRef&) {
        std::lock_guard lk(peakMu_);
        activePeak_ = 0;
        reservedPeak_ = 0;
    }

    std::string NvmlDeviceQuery::memorySummary(const DeviceRef& device) {
        const nvmlDevice_t dev = handle(device);

        char name[NVML_DEVICE_NAME_BUFFER_SIZE]{};
        nvmlDeviceGetName(dev, name, sizeof(name));

        nvmlMemory_t mem{};
        check(nvmlDeviceGetMemoryInfo(dev, &mem), "nvmlDeviceGetMemoryInfo");

        std::ostringstream oss;
        oss << "NVML memory summary for " << device.toString() << " (" << name << "): "
            << toMiBCeil(static_cast<int64_t>(mem.used)) << " MiB used, "
            << toMiBCeil(static_cast<int64_t>(mem.free)) << " MiB free, "
            << toMiBCeil(static_cast<int64_t>(mem.total)) << " MiB total";
        return oss.str();
    }
} // namespace memmon::nvidia
