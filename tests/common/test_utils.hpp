#pragma once
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "memmon/core/device_query.hpp"

#if MEMMON_HAS_CUDA
#include <cuda_runtime.h>
#endif

// Helper to check if we are on an NVIDIA machine
inline bool isNvidiaGpuAvailable() {
#if MEMMON_HAS_CUDA
    int deviceCount = 0;
    cudaError_t error = cudaGetDeviceCount(&deviceCount);

    if (error != cudaSuccess || deviceCount == 0) {
        cudaGetLastError();
        return false;
    }
    return true;
#else
    return false;
#endif
}

// Macro to skip test if GPU is missing
#define SKIP_IF_NO_CUDA() \
    if (!isNvidiaGpuAvailable()) { \
        GTEST_SKIP() << "No NVIDIA GPU detected. Skipping backend test."; \
    }

/**
 * Device query driven by a script of free-memory values. Call N (counted from
 * the last rewind()) returns script[N]; once the script runs out the last value
 * repeats.
 */
class FakeDeviceQuery : public memmon::IDeviceQuery {
public:
    explicit FakeDeviceQuery(std::vector<int64_t> freeScript,
                             int64_t total = 1000,
                             std::string family = "cuda")
        : script_(std::move(freeScript)), total_(total), family_(std::move(family)) {}

    std::string family() const override { return family_; }

    bool isAvailable(std::string* reason) const override {
        std::lock_guard lk(mu_);
        if (!unavailableReason_.empty()) {
            if (reason) *reason = unavailableReason_;
            return false;
        }
        return true;
    }

    memmon::MemInfo memInfo(const memmon::DeviceRef&) override {
        std::unique_lock lk(mu_);
        if (failMemInfo_) {
            throw memmon::DeviceQueryError("injected memInfo failure");
        }
        if (failingCall_ && *failingCall_ == memInfoCalls_) {
            failingCall_.reset();
            ++memInfoCalls_;
            cv_.notify_all();
            cv_.wait(lk, [&] { return !holdFailure_; });
            throw memmon::DeviceQueryError("injected memInfo failure");
        }
        int64_t freeBytes = total_;
        if (!script_.empty()) {
            freeBytes = script_[std::min(memInfoCalls_, script_.size() - 1)];
        }
        ++memInfoCalls_;
        cv_.notify_all();
        return memmon::MemInfo{freeBytes, total_};
    }

    memmon::AllocatorStats allocatorStats(const memmon::DeviceRef&) override {
        std::lock_guard lk(mu_);
        if (failAllocatorStats_) {
            throw memmon::DeviceQueryError("injected allocatorStats failure");
        }
        return stats_;
    }

    void resetPeakStats(const memmon::DeviceRef&) override {
        std::lock_guard lk(mu_);
        ++resetPeakCalls_;
    }

    std::map<std::string, int64_t> rawStats(const memmon::DeviceRef&) override {
        std::lock_guard lk(mu_);
        return raw_;
    }

    std::string memorySummary(const memmon::DeviceRef&) override {
        std::lock_guard lk(mu_);
        return summary_;
    }

    // --- test controls ---

    void rewind() {
        std::lock_guard lk(mu_);
        memInfoCalls_ = 0;
    }

    void setUnavailable(std::string reason) {
        std::lock_guard lk(mu_);
        unavailableReason_ = std::move(reason);
    }

    void setFailMemInfo(bool fail) {
        std::lock_guard lk(mu_);
        failMemInfo_ = fail;
    }

    // Call number n (counted like the script) throws. With hold set, that call
    // blocks until releaseFailure() before throwing.
    void failCall(size_t n, bool hold = false) {
        std::lock_guard lk(mu_);
        failingCall_ = n;
        holdFailure_ = hold;
    }

    void releaseFailure() {
        {
            std::lock_guard lk(mu_);
            holdFailure_ = false;
        }
        cv_.notify_all();
    }

    void setFailAllocatorStats(bool fail) {
        std::lock_guard lk(mu_);
        failAllocatorStats_ = fail;
    }

    void setAllocatorStats(memmon::AllocatorStats stats) {
        std::lock_guard lk(mu_);
        stats_ = std::move(stats);
    }

    void setRawStats(std::map<std::string, int64_t> raw, std::string summary) {
        std::lock_guard lk(mu_);
        raw_ = std::move(raw);
        summary_ = std::move(summary);
    }

    size_t memInfoCalls() const {
        std::lock_guard lk(mu_);
        return memInfoCalls_;
    }

    size_t resetPeakCalls() const {
        std::lock_guard lk(mu_);
        return resetPeakCalls_;
    }

    bool waitForMemInfoCalls(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lk(mu_);
        return cv_.wait_for(lk, timeout, [&] { return memInfoCalls_ >= n; });
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;

    std::vector<int64_t> script_;
    int64_t total_;
    std::string family_;

    std::string unavailableReason_;
    bool failMemInfo_ = false;
    bool failAllocatorStats_ = false;
    std::optional<size_t> failingCall_;
    bool holdFailure_ = false;

    memmon::AllocatorStats stats_{
        {"active", 100}, {"active_peak", 150}, {"reserved", 200}, {"reserved_peak", 250}};
    std::map<std::string, int64_t> raw_;
    std::string summary_;

    size_t memInfoCalls_ = 0;
    size_t resetPeakCalls_ = 0;
};

// Polls until pred() holds or the timeout expires.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}
