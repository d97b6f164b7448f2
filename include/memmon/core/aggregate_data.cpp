#include "memmon/core/aggregate_data.hpp"

namespace memmon {

    int64_t valueOr(const AggregateData& data, const std::string& key, const int64_t fallback) {
        const auto it = data.find(key);
        return it == data.end() ? fallback : it->second;
    }

    int64_t toMiBCeil(const int64_t bytes) {
        constexpr int64_t kMiB = 1024ll * 1024ll;
        if (bytes >= 0) {
            return bytes / kMiB + (bytes % kMiB != 0 ? 1 : 0);
        }
        // integer division already truncates towards zero, which is the ceiling for negatives
        return bytes / kMiB;
    }

} // namespace memmon
