#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include "memmon/core/device.hpp"

namespace memmon {

    struct MemInfo {
        int64_t freeBytes = 0;
        int64_t totalBytes = 0;
    };

    // Allocator counters, already named after the recognized aggregate keys
    // (active, active_peak, reserved, reserved_peak, plus family extras).
    using AllocatorStats = std::map<std::string, int64_t>;

    /**
     * @brief Raised by a device query when the driver or runtime reports a failure.
     */
    class DeviceQueryError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Interface for family-specific device memory queries.
     *
     * Bindings implement this interface on top of a vendor API (e.g., the
     * CUDA runtime or NVML). The monitor only ever talks to a device through it.
     */
    class IDeviceQuery {
    public:
        virtual ~IDeviceQuery() = default;

        /**
         * @brief Device family this binding serves, matched against DeviceRef::type.
         */
        virtual std::string family() const = 0;

        /**
         * @brief Whether the underlying API can be used at all.
         * @param reason Receives a description when unavailable (may be null)
         */
        virtual bool isAvailable(std::string* reason = nullptr) const = 0;

        /**
         * @brief Free and total device memory in bytes.
         */
        virtual MemInfo memInfo(const DeviceRef& device) = 0;

        /**
         * @brief Accumulated allocator statistics.
         */
        virtual AllocatorStats allocatorStats(const DeviceRef& device) = 0;

        /**
         * @brief Resets the peak counters reported by allocatorStats().
         */
        virtual void resetPeakStats(const DeviceRef& device) = 0;

        /**
         * @brief Native counters for diagnostics. Empty when the family has none.
         */
        virtual std::map<std::string, int64_t> rawStats(const DeviceRef&) { return {}; }

        /**
         * @brief Human-readable memory summary. Empty when unsupported.
         */
        virtual std::string memorySummary(const DeviceRef&) { return {}; }
    };

} // namespace memmon
