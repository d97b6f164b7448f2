#include "memmon/core/memory_monitor.hpp"
#include "memmon/core/debug_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace memmon {

    namespace {
        // Longest wait between two samples. Slower rates are clamped so the
        // interval stays representable in the clock's tick type.
        constexpr std::chrono::hours kMaxPollInterval{24};

        bool samplingEnabled(const double pollRate) {
            return std::isfinite(pollRate) && pollRate > 0;
        }

        std::chrono::nanoseconds pollInterval(const double pollRate) {
            const double seconds = std::min(1.0 / pollRate,
                                            std::chrono::duration<double>(kMaxPollInterval).count());
            return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(seconds));
        }
    } // namespace

    // State shared with the detached worker. The worker holds its own reference,
    // so it stays valid after the monitor is destroyed.
    struct MemoryMonitor::Shared {
        DeviceRef device;
        std::shared_ptr<IDeviceQuery> query;
        MonitorOptions opts;

        std::atomic<MonitorState> state{MonitorState::Idle};

        // gate
        std::mutex gateMu;
        std::condition_variable gateCv;
        bool gateOpen = false;
        bool shutdown = false;

        // Held only while touching the map, never across a device query.
        std::mutex dataMu;
        AggregateData data;
        uint64_t episode = 0;
        std::exception_ptr workerError;
    };

    const char* toString(const MonitorState state) {
        switch (state) {
            case MonitorState::Disabled: return "disabled";
            case MonitorState::Idle:     return "idle";
            case MonitorState::Sampling: return "sampling";
        }
        return "unknown";
    }

    MemoryMonitor::MemoryMonitor(DeviceRef device,
                                 std::shared_ptr<IDeviceQuery> query,
                                 MonitorOptions opts)
        : shared_(std::make_shared<Shared>()) {
        shared_->device = std::move(device);
        shared_->query = std::move(query);
        shared_->opts = std::move(opts);

        try {
            probe_(*shared_);
            std::thread([s = shared_] { runLoop_(s); }).detach();
            MEMMON_LOG_DEBUG(shared_->opts.name, ": monitoring ", shared_->device.toString(),
                             " at ", shared_->opts.pollRate, " samples/s");
        } catch (const std::exception& e) {
            MEMMON_LOG_WARN(shared_->opts.name, ": caught exception '", e.what(), "', memory monitor disabled");
            shared_->state.store(MonitorState::Disabled);
        } catch (...) {
            MEMMON_LOG_WARN(shared_->opts.name, ": caught unknown exception, memory monitor disabled");
            shared_->state.store(MonitorState::Disabled);
        }
    }

    MemoryMonitor::~MemoryMonitor() {
        {
            std::lock_guard lk(shared_->gateMu);
            shared_->shutdown = true;
            shared_->gateOpen = false;
        }
        shared_->gateCv.notify_all();
    }

    void MemoryMonitor::probe_(Shared& s) {
        if (!s.query || s.query->family() != s.device.type) {
            throw DeviceQueryError("Unsupported device type '" + s.device.type + "'");
        }

        std::string reason;
        if (!s.query->isAvailable(&reason)) {
            throw DeviceQueryError(reason.empty() ? "device query unavailable" : reason);
        }

        s.query->memInfo(s.device);
        s.query->allocatorStats(s.device);
    }

    void MemoryMonitor::runLoop_(const std::shared_ptr<Shared>& s) {
        std::unique_lock lk(s->gateMu);
        while (true) {
            s->gateCv.wait(lk, [&] { return s->gateOpen || s->shutdown; });
            if (s->shutdown) return;

            // gate only opens with a finite positive rate
            const std::chrono::nanoseconds interval = pollInterval(s->opts.pollRate);

            while (s->gateOpen && !s->shutdown) {
                lk.unlock();
                uint64_t episode = 0;
                {
                    std::lock_guard dl(s->dataMu);
                    episode = s->episode;
                }

                std::exception_ptr err;
                try {
                    const MemInfo mi = s->query->memInfo(s->device);
                    std::lock_guard dl(s->dataMu);
                    // a sample that straddles stop() and the next monitor() is dropped
                    if (s->episode == episode) {
                        auto& minFree = s->data[keys::kMinFree];
                        minFree = std::min(minFree, mi.freeBytes);
                    }
                } catch (const std::exception& e) {
                    MEMMON_LOG_ERROR(s->opts.name, ": device query failed while sampling: ", e.what());
                    err = std::current_exception();
                } catch (...) {
                    MEMMON_LOG_ERROR(s->opts.name, ": device query failed while sampling");
                    err = std::current_exception();
                }

                lk.lock();

                if (err) {
                    // Decided while holding the gate: a monitor() that started a
                    // new episode since this sample either bumped the counter
                    // already or cannot open the gate until we are done.
                    bool current = false;
                    {
                        std::lock_guard dl(s->dataMu);
                        current = s->episode == episode;
                        if (current) s->workerError = err;
                    }
                    if (current) {
                        s->gateOpen = false;
                        s->state.store(MonitorState::Idle);
                        break;
                    }
                }

                s->gateCv.wait_for(lk, interval, [&] { return !s->gateOpen || s->shutdown; });
            }
        }
    }

    void MemoryMonitor::rethrowWorkerError_(Shared& s) {
        std::exception_ptr err;
        {
            std::lock_guard lk(s.dataMu);
            err = std::exchange(s.workerError, nullptr);
        }
        if (err) std::rethrow_exception(err);
    }

    void MemoryMonitor::monitor() {
        Shared& s = *shared_;
        if (s.state.load() != MonitorState::Idle) return;

        s.query->resetPeakStats(s.device);
        const MemInfo baseline = s.query->memInfo(s.device);
        {
            std::lock_guard lk(s.dataMu);
            s.data.clear();
            s.data[keys::kMinFree] = baseline.freeBytes;
            s.workerError = nullptr;
            ++s.episode;
        }

        if (!samplingEnabled(s.opts.pollRate)) {
            MEMMON_LOG_DEBUG(s.opts.name, ": sampling disabled, baseline min_free=", baseline.freeBytes);
            return;
        }

        {
            std::lock_guard lk(s.gateMu);
            s.gateOpen = true;
            s.state.store(MonitorState::Sampling);
        }
        s.gateCv.notify_all();
    }

    AggregateData MemoryMonitor::stop() {
        Shared& s = *shared_;
        {
            std::lock_guard lk(s.gateMu);
            if (s.gateOpen) {
                s.gateOpen = false;
                s.state.store(MonitorState::Idle);
            }
        }
        s.gateCv.notify_all();
        return read();
    }

    AggregateData MemoryMonitor::read() {
        Shared& s = *shared_;
        if (s.state.load() == MonitorState::Disabled) {
            std::lock_guard lk(s.dataMu);
            return s.data;
        }

        rethrowWorkerError_(s);

        const MemInfo mi = s.query->memInfo(s.device);
        const AllocatorStats stats = s.query->allocatorStats(s.device);

        std::lock_guard lk(s.dataMu);
        for (const auto& [key, value] : stats) {
            if (key == keys::kMinFree) continue;
            s.data[key] = value;
        }
        s.data[keys::kFree] = mi.freeBytes;
        s.data[keys::kTotal] = mi.totalBytes;
        s.data[keys::kSystemPeak] = mi.totalBytes - s.data[keys::kMinFree];
        return s.data;
    }

    void MemoryMonitor::dumpDebug(std::ostream& os) const {
        Shared& s = *shared_;
        AggregateData snapshot;
        {
            std::lock_guard lk(s.dataMu);
            snapshot = s.data;
        }

        os << s.opts.name << " recorded data:\n";
        for (const auto& [key, value] : snapshot) {
            os << key << ' ' << toMiBCeil(value) << '\n';
        }

        if (s.state.load() == MonitorState::Disabled) {
            os.flush();
            return;
        }

        const auto raw = s.query->rawStats(s.device);
        if (!raw.empty()) {
            os << s.opts.name << " raw memory stats:\n";
            for (const auto& [key, value] : raw) {
                if (key.find("bytes") == std::string::npos) continue;
                if (key.find("peak") != std::string::npos) os << '\t';
                os << key << ' ' << toMiBCeil(value) << '\n';
            }
        }

        if (const std::string summary = s.query->memorySummary(s.device); !summary.empty()) {
            os << summary << '\n';
        }
        os.flush();
    }

    MonitorState MemoryMonitor::state() const {
        return shared_->state.load();
    }

    const DeviceRef& MemoryMonitor::device() const {
        return shared_->device;
    }

    const MonitorOptions& MemoryMonitor::options() const {
        return shared_->opts;
    }

} // namespace memmon
