#include <gtest/gtest.h>
#include "memmon/core/device.hpp"

#include <stdexcept>

using memmon::DeviceRef;

TEST(DeviceRefTest, ParseTypeOnly) {
    const DeviceRef d = DeviceRef::parse("cuda");
    EXPECT_EQ(d.type, "cuda");
    EXPECT_FALSE(d.index.has_value());
    EXPECT_EQ(d.toString(), "cuda");
}

TEST(DeviceRefTest, ParseWithIndex) {
    const DeviceRef d = DeviceRef::parse("hpu:3");
    EXPECT_EQ(d.type, "hpu");
    ASSERT_TRUE(d.index.has_value());
    EXPECT_EQ(*d.index, 3);
    EXPECT_EQ(d.toString(), "hpu:3");
    EXPECT_EQ(d, DeviceRef("hpu", 3));
    EXPECT_NE(d, DeviceRef("hpu"));
}

TEST(DeviceRefTest, RejectsMalformed) {
    EXPECT_THROW(DeviceRef::parse(""), std::invalid_argument);
    EXPECT_THROW(DeviceRef::parse(":0"), std::invalid_argument);
    EXPECT_THROW(DeviceRef::parse("cuda:"), std::invalid_argument);
    EXPECT_THROW(DeviceRef::parse("cuda:-1"), std::invalid_argument);
    EXPECT_THROW(DeviceRef::parse("cuda:one"), std::invalid_argument);
    EXPECT_THROW(DeviceRef::parse("cuda:99999999999"), std::invalid_argument);
}
