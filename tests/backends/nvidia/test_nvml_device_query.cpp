#include <gtest/gtest.h>
#include "common/test_utils.hpp"
#include "memmon/backends/nvidia/nvml_device_query.hpp"

#if MEMMON_ENABLE_NVIDIA && MEMMON_HAS_NVML

class NvmlDeviceQueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        SKIP_IF_NO_CUDA();
        std::string reason;
        if (!memmon::nvidia::NvmlDeviceQuery::probe(&reason)) {
            GTEST_SKIP() << "NVML not available: " << reason;
        }
    }
};

TEST_F(NvmlDeviceQueryTest, Availability) {
    memmon::nvidia::NvmlDeviceQuery query;
    EXPECT_TRUE(query.isAvailable());
    EXPECT_EQ(query.family(), "cuda");
}

TEST_F(NvmlDeviceQueryTest, MemInfoAndStats) {
    memmon::nvidia::NvmlDeviceQuery query;
    const memmon::DeviceRef dev("cuda", 0);

    const auto mi = query.memInfo(dev);
    EXPECT_GT(mi.totalBytes, 0);
    EXPECT_LE(mi.freeBytes, mi.totalBytes);

    const auto stats = query.allocatorStats(dev);
    EXPECT_GE(stats.at("reserved_peak"), stats.at("reserved"));
    EXPECT_GE(stats.at("active_peak"), stats.at("active"));
    EXPECT_GE(stats.at("num_processes"), 0);
}

TEST_F(NvmlDeviceQueryTest, ResetClearsPeaks) {
    memmon::nvidia::NvmlDeviceQuery query;
    const memmon::DeviceRef dev("cuda", 0);

    query.allocatorStats(dev);
    query.resetPeakStats(dev);
    const auto stats = query.allocatorStats(dev);
    // peaks restart from the current reading
    EXPECT_EQ(stats.at("reserved_peak"), stats.at("reserved"));
}

TEST_F(NvmlDeviceQueryTest, BadIndexThrows) {
    memmon::nvidia::NvmlDeviceQuery query;
    EXPECT_THROW(query.memInfo(memmon::DeviceRef("cuda", 4096)), memmon::DeviceQueryError);
}

#endif
