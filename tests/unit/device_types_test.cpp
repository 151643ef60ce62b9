#include "device/device_types.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace pixoogate::device;

TEST(DeviceTypesTest, TimeGateSpellings) {
    EXPECT_EQ(normalize_device_type("timegate"), DeviceType::TIME_GATE);
    EXPECT_EQ(normalize_device_type("time_gate"), DeviceType::TIME_GATE);
    EXPECT_EQ(normalize_device_type("Time-Gate"), DeviceType::TIME_GATE);
    EXPECT_EQ(normalize_device_type("  TIME GATE "), DeviceType::TIME_GATE);
}

TEST(DeviceTypesTest, AutoIsKept) {
    EXPECT_EQ(normalize_device_type("auto"), DeviceType::AUTO);
    EXPECT_EQ(normalize_device_type(" AUTO"), DeviceType::AUTO);
}

TEST(DeviceTypesTest, EverythingElseIsPixoo) {
    EXPECT_EQ(normalize_device_type(""), DeviceType::PIXOO);
    EXPECT_EQ(normalize_device_type("pixoo"), DeviceType::PIXOO);
    EXPECT_EQ(normalize_device_type("pixoo64"), DeviceType::PIXOO);
    EXPECT_EQ(normalize_device_type("time gate 2"), DeviceType::PIXOO);
    EXPECT_EQ(normalize_device_type("   "), DeviceType::PIXOO);
}

TEST(DeviceTypesTest, NormalizationIsIdempotent) {
    const std::vector<std::string> inputs = {"", "pixoo", "Time-Gate", "timegate", "AUTO", "garbage", " auto "};
    for (const auto &input : inputs) {
        DeviceType once = normalize_device_type(input);
        EXPECT_EQ(normalize_device_type(device_type_to_string(once)), once) << "input: '" << input << "'";
        EXPECT_EQ(normalize_device_type(once), once);
    }
}

TEST(DeviceTypesTest, ToString) {
    EXPECT_EQ(device_type_to_string(DeviceType::PIXOO), "pixoo");
    EXPECT_EQ(device_type_to_string(DeviceType::TIME_GATE), "time_gate");
    EXPECT_EQ(device_type_to_string(DeviceType::AUTO), "auto");
}
