#include <gtest/gtest.h>
#include "memmon/memmon.hpp"

#include <memory>
#include <stdexcept>
#include <string>

TEST(CoreLogic, InitOptionsDefault) {
    memmon::InitOptions opts;
    EXPECT_EQ(opts.name, "memmon");
    EXPECT_DOUBLE_EQ(opts.pollRate, 8.0);
    EXPECT_EQ(opts.backend, memmon::BackendKind::Auto);
    EXPECT_FALSE(opts.enableDebugOutput);
}

TEST(CoreLogic, BackendKindEnum) {
    EXPECT_EQ(static_cast<int>(memmon::BackendKind::Auto), 0);
    EXPECT_EQ(static_cast<int>(memmon::BackendKind::CudaRuntime), 1);
}

TEST(CoreLogic, NoneBackendYieldsNoQuery) {
    std::string reason;
    EXPECT_EQ(memmon::createDeviceQuery(memmon::BackendKind::None, memmon::DeviceRef("cuda"), &reason), nullptr);
    EXPECT_FALSE(reason.empty());
}

TEST(CoreLogic, AutoBackendForHpuUsesHlml) {
    std::string reason;
    auto query = memmon::createDeviceQuery(memmon::BackendKind::Auto, memmon::DeviceRef("hpu", 0), &reason);
#if MEMMON_ENABLE_HABANA && MEMMON_HAS_HLML
    ASSERT_NE(query, nullptr);
    EXPECT_EQ(query->family(), "hpu");
#else
    EXPECT_EQ(query, nullptr);
    EXPECT_NE(reason.find("HLML"), std::string::npos);
#endif
}

TEST(CoreLogic, HpuMonitorWithoutDeviceIsDisabled) {
    memmon::InitOptions opts;
    opts.backend = memmon::BackendKind::Hlml;

    std::unique_ptr<memmon::MemoryMonitor> mon;
    ASSERT_NO_THROW(mon = memmon::makeMonitor("hpu", opts));
    EXPECT_EQ(mon->device(), memmon::DeviceRef("hpu"));
    if (!memmon::probeHlml().available) {
        EXPECT_TRUE(mon->disabled());
        EXPECT_TRUE(mon->read().empty());
    }
}

TEST(CoreLogic, MakeMonitorWithoutBackendIsDisabled) {
    memmon::InitOptions opts;
    opts.backend = memmon::BackendKind::None;

    std::unique_ptr<memmon::MemoryMonitor> mon;
    ASSERT_NO_THROW(mon = memmon::makeMonitor("cuda:0", opts));
    EXPECT_TRUE(mon->disabled());
    EXPECT_EQ(mon->device(), memmon::DeviceRef("cuda", 0));
    EXPECT_EQ(mon->options().name, "memmon");

    mon->monitor();
    EXPECT_TRUE(mon->stop().empty());
}

TEST(CoreLogic, MakeMonitorRejectsMalformedDevice) {
    memmon::InitOptions opts;
    opts.backend = memmon::BackendKind::None;
    EXPECT_THROW(memmon::makeMonitor("cuda:x", opts), std::invalid_argument);
}

TEST(CoreLogic, ProbesReportReasonWhenUnavailable) {
    const auto cuda = memmon::probeCudaRuntime();
    if (!cuda.available) EXPECT_FALSE(cuda.reason.empty());

    const auto nvml = memmon::probeNvml();
    if (!nvml.available) EXPECT_FALSE(nvml.reason.empty());

    const auto hlml = memmon::probeHlml();
    if (!hlml.available) EXPECT_FALSE(hlml.reason.empty());
}
