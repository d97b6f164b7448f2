#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace memmon {

    // Metric name -> bytes (or a count for the allocator counters).
    using AggregateData = std::map<std::string, int64_t>;

    namespace keys {
        inline constexpr const char* kMinFree      = "min_free";
        inline constexpr const char* kFree         = "free";
        inline constexpr const char* kTotal        = "total";
        inline constexpr const char* kActive       = "active";
        inline constexpr const char* kActivePeak   = "active_peak";
        inline constexpr const char* kReserved     = "reserved";
        inline constexpr const char* kReservedPeak = "reserved_peak";
        inline constexpr const char* kSystemPeak   = "system_peak";

        // Family extras
        inline constexpr const char* kTotalMemory  = "total_memory";
        inline constexpr const char* kNumAllocs    = "num_allocs";
        inline constexpr const char* kNumFrees     = "num_frees";
        inline constexpr const char* kNumProcesses = "num_processes";
    }

    /**
     * @brief Value stored under @p key, or 0 when absent.
     */
    int64_t valueOr(const AggregateData& data, const std::string& key, int64_t fallback = 0);

    /**
     * @brief Bytes to mebibytes, rounded up (ceil(bytes / 2^20)).
     */
    int64_t toMiBCeil(int64_t bytes);

} // namespace memmon
