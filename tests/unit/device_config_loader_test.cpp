#include "device/device_config_loader.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace pixoogate::device;

class DeviceConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        defaults.host = "192.168.1.50";
        defaults.device_type = DeviceType::AUTO;
        defaults.screen_size = 64;
        defaults.debug = false;
        defaults.connection_retries = 10;
    }

    std::vector<DeviceContext> load_ok(const std::string &json) {
        std::vector<DeviceContext> devices;
        std::string error;
        EXPECT_TRUE(load_devices(json, defaults, devices, error)) << "Error: " << error;
        return devices;
    }

    DeviceDefaults defaults;
};

TEST_F(DeviceConfigLoaderTest, TwoDevicesWithDefaults) {
    auto devices = load_ok(R"([{"host":"10.0.0.5","key":"wall"},{"host":"10.0.0.6","device_type":"timegate"}])");

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].key, "wall");
    EXPECT_EQ(devices[0].host, "10.0.0.5");
    EXPECT_EQ(devices[0].device_type, DeviceType::AUTO);
    EXPECT_EQ(devices[0].screen_size, 64);
    EXPECT_EQ(devices[0].connection_retries, 10);

    EXPECT_EQ(devices[1].key, "10.0.0.6");
    EXPECT_EQ(devices[1].device_type, DeviceType::TIME_GATE);
}

TEST_F(DeviceConfigLoaderTest, KeyFallsBackToNameThenHost) {
    auto devices = load_ok(R"([
        {"host":"10.0.0.1","name":"Kitchen"},
        {"host":"10.0.0.2","key":"","name":"Hall"},
        {"host":"10.0.0.3","key":null,"name":false}
    ])");

    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].key, "Kitchen");
    ASSERT_TRUE(devices[0].name.has_value());
    EXPECT_EQ(*devices[0].name, "Kitchen");
    EXPECT_EQ(devices[1].key, "Hall");
    EXPECT_EQ(devices[2].key, "10.0.0.3");
    EXPECT_FALSE(devices[2].name.has_value());
}

TEST_F(DeviceConfigLoaderTest, DuplicateKeysGetSuffixesInOrder) {
    auto devices = load_ok(R"([
        {"host":"10.0.0.1","key":"panel"},
        {"host":"10.0.0.2","key":"panel"},
        {"host":"10.0.0.3","key":"PANEL"},
        {"host":"10.0.0.4","key":"panel-2"}
    ])");

    ASSERT_EQ(devices.size(), 4u);
    EXPECT_EQ(devices[0].key, "panel");
    EXPECT_EQ(devices[1].key, "panel-2");
    EXPECT_EQ(devices[2].key, "PANEL-3");
    EXPECT_EQ(devices[3].key, "panel-2-2");
}

TEST_F(DeviceConfigLoaderTest, KeysArePairwiseUnique) {
    auto devices = load_ok(R"([
        {"host":"a"},{"host":"a"},{"host":"a"},{"host":"b","key":"a"},{"host":"c","key":"a-2"}
    ])");

    ASSERT_EQ(devices.size(), 5u);
    std::set<std::string> keys;
    for (const auto &d : devices) {
        keys.insert(d.key);
    }
    EXPECT_EQ(keys.size(), devices.size());
    EXPECT_EQ(devices[0].key, "a");
    EXPECT_EQ(devices[1].key, "a-2");
    EXPECT_EQ(devices[2].key, "a-3");
    EXPECT_EQ(devices[3].key, "a-4");
}

TEST_F(DeviceConfigLoaderTest, InvalidEntriesAreDropped) {
    auto devices = load_ok(R"([
        "10.0.0.1",
        42,
        {"key":"nohost"},
        {"host":"   "},
        {"host":null},
        {"host":"10.0.0.9","key":"ok"}
    ])");

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].key, "ok");
}

TEST_F(DeviceConfigLoaderTest, MalformedFieldsFallBackToDefaults) {
    auto devices = load_ok(R"([
        {"host":"10.0.0.1","screen_size":"abc","connection_retries":"x","debug":"nope"},
        {"host":"10.0.0.2","screen_size":-5,"connection_retries":-1},
        {"host":"10.0.0.3","screen_size":"32","connection_retries":" 3 ","debug":"YES"},
        {"host":"10.0.0.4","screen_size":16.9,"debug":1,"device_type":7}
    ])");

    ASSERT_EQ(devices.size(), 4u);
    EXPECT_EQ(devices[0].screen_size, 64);
    EXPECT_EQ(devices[0].connection_retries, 10);
    EXPECT_FALSE(devices[0].debug);

    EXPECT_EQ(devices[1].screen_size, 64);
    EXPECT_EQ(devices[1].connection_retries, 10);

    EXPECT_EQ(devices[2].screen_size, 32);
    EXPECT_EQ(devices[2].connection_retries, 3);
    EXPECT_TRUE(devices[2].debug);

    EXPECT_EQ(devices[3].screen_size, 16);
    EXPECT_TRUE(devices[3].debug);
    EXPECT_EQ(devices[3].device_type, DeviceType::AUTO);
}

TEST_F(DeviceConfigLoaderTest, RetriesAcceptFullIntRange) {
    auto devices = load_ok(R"([
        {"host":"10.0.0.1","connection_retries":2147483647},
        {"host":"10.0.0.2","connection_retries":2147483648}
    ])");

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].connection_retries, 2147483647);
    EXPECT_EQ(devices[1].connection_retries, 10);
}

TEST_F(DeviceConfigLoaderTest, NumericHostIsStringified) {
    auto devices = load_ok(R"([{"host":12345}])");
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].host, "12345");
    EXPECT_EQ(devices[0].key, "12345");
}

TEST_F(DeviceConfigLoaderTest, AbsentJsonUsesSingleHostMode) {
    std::vector<DeviceContext> devices;
    std::string error;
    ASSERT_TRUE(load_devices(std::nullopt, defaults, devices, error)) << error;

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].key, "192.168.1.50");
    EXPECT_EQ(devices[0].host, "192.168.1.50");
    EXPECT_EQ(devices[0].device_type, DeviceType::AUTO);
}

TEST_F(DeviceConfigLoaderTest, BlankOrEmptyListUsesSingleHostMode) {
    EXPECT_EQ(load_ok("   ").size(), 1u);
    EXPECT_EQ(load_ok("[]").size(), 1u);

    auto devices = load_ok(R"([{"host":""}])");
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].host, "192.168.1.50");
}

TEST_F(DeviceConfigLoaderTest, InvalidJsonFails) {
    std::vector<DeviceContext> devices;
    std::string error;
    EXPECT_FALSE(load_devices(std::string("[{"), defaults, devices, error));
    EXPECT_NE(error.find("PIXOO_DEVICES_JSON is not valid JSON"), std::string::npos) << error;
}

TEST_F(DeviceConfigLoaderTest, NonArrayJsonFails) {
    std::vector<DeviceContext> devices;
    std::string error;
    EXPECT_FALSE(load_devices(std::string(R"({"host":"10.0.0.1"})"), defaults, devices, error));
    EXPECT_EQ(error, "PIXOO_DEVICES_JSON must be a JSON array");
}

TEST_F(DeviceConfigLoaderTest, SingleHostModeWithoutHostFails) {
    defaults.host = "";
    std::vector<DeviceContext> devices;
    std::string error;
    EXPECT_FALSE(load_devices(std::nullopt, defaults, devices, error));
    EXPECT_EQ(error, "PIXOO_HOST is required when PIXOO_DEVICES_JSON provides no devices");
}

TEST(CoercionTest, Integers) {
    EXPECT_EQ(coerce_int(nlohmann::json(7), 1), 7);
    EXPECT_EQ(coerce_int(nlohmann::json(7.8), 1), 7);
    EXPECT_EQ(coerce_int(nlohmann::json(true), 5), 1);
    EXPECT_EQ(coerce_int(nlohmann::json("-12"), 1), -12);
    EXPECT_EQ(coerce_int(nlohmann::json("+4"), 1), 4);
    EXPECT_EQ(coerce_int(nlohmann::json("4.5"), 1), 1);
    EXPECT_EQ(coerce_int(nlohmann::json(nullptr), 9), 9);
    EXPECT_EQ(coerce_int(nlohmann::json::array(), 9), 9);
    EXPECT_EQ(coerce_int(std::string("99999999999"), 3), 3);
}

TEST(CoercionTest, Booleans) {
    for (const char *truthy : {"1", "true", "YES", " y ", "On"}) {
        EXPECT_TRUE(coerce_bool(std::string(truthy), false)) << truthy;
    }
    for (const char *falsy : {"0", "false", "no", "", "maybe"}) {
        EXPECT_FALSE(coerce_bool(std::string(falsy), true)) << falsy;
    }
    EXPECT_TRUE(coerce_bool(nlohmann::json(nullptr), true));
    EXPECT_FALSE(coerce_bool(nlohmann::json(0), true));
    EXPECT_TRUE(coerce_bool(nlohmann::json(2.5), false));
    EXPECT_TRUE(coerce_bool(nlohmann::json::array({1}), false));
    EXPECT_FALSE(coerce_bool(nlohmann::json::object(), true));
}
