#pragma once
#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "memmon/core/aggregate_data.hpp"
#include "memmon/core/device.hpp"
#include "memmon/core/device_query.hpp"

namespace memmon {

    enum class MonitorState : uint8_t {
        Disabled,
        Idle,
        Sampling
    };

    const char* toString(MonitorState state);

    struct MonitorOptions {
        double pollRate = 8.0;          // samples per second, <= 0 or non-finite takes the baseline only
        std::string name = "memmon";    // label used in diagnostics
    };

    /**
     * @brief Tracks free device memory in the background between monitor() and stop().
     *
     * A detached worker waits on a gate while idle and polls the device while an
     * episode is running, lowering min_free as it goes. read() refreshes the
     * remaining figures on the caller's thread. If the device cannot be queried
     * at construction the monitor is disabled for good and every call is a no-op.
     *
     * Calls are expected from a single controlling thread; the worker is the only
     * other party touching the aggregate map.
     */
    class MemoryMonitor {
    public:
        MemoryMonitor(DeviceRef device,
                      std::shared_ptr<IDeviceQuery> query,
                      MonitorOptions opts = {});

        /**
         * @brief Signals the worker and returns without joining it.
         */
        ~MemoryMonitor();

        MemoryMonitor(const MemoryMonitor&) = delete;
        MemoryMonitor& operator=(const MemoryMonitor&) = delete;

        /**
         * @brief Starts an episode: resets peaks, clears the map and records the
         * baseline min_free. No-op while disabled or already sampling.
         */
        void monitor();

        /**
         * @brief Ends the episode (if any) and returns a final read().
         */
        AggregateData stop();

        /**
         * @brief Queries the device and returns the updated aggregates.
         *
         * Rethrows a device error raised on the worker since the last call.
         * Returns the map untouched when disabled.
         */
        AggregateData read();

        /**
         * @brief Prints the aggregates in MiB, plus raw statistics and a summary
         * when the binding provides them. Does not modify the monitor.
         */
        void dumpDebug(std::ostream& os = std::cout) const;

        bool disabled() const { return state() == MonitorState::Disabled; }
        MonitorState state() const;

        const DeviceRef& device() const;
        const MonitorOptions& options() const;

    private:
        struct Shared;

        static void probe_(Shared& s);
        static void runLoop_(const std::shared_ptr<Shared>& s);
        static void rethrowWorkerError_(Shared& s);

        std::shared_ptr<Shared> shared_;
    };

} // namespace memmon
