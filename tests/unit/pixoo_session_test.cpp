#include "device/pixoo_session.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mocks/mock_device_transport.hpp"

using namespace pixoogate;
using namespace pixoogate::tests;
using namespace testing;
using json = nlohmann::json;

class PixooSessionTest : public Test {
protected:
    void SetUp() override {
        ON_CALL(transport, post_command(_, _)).WillByDefault(Invoke([this](const std::string &, const json &payload) {
            sent.push_back(payload);
            return transport_ok();
        }));
    }

    NiceMock<MockDeviceTransport> transport;
    std::vector<json> sent;
};

TEST_F(PixooSessionTest, BufferStartsBlack) {
    device::PixooSession session("10.0.0.5", 16, false, transport);
    auto buffer = session.buffer();
    ASSERT_EQ(buffer.size(), 16u * 16u * 3u);
    for (auto byte : buffer) {
        EXPECT_EQ(byte, 0);
    }
}

TEST_F(PixooSessionTest, DrawPixelIgnoresOutOfBounds) {
    device::PixooSession session("10.0.0.5", 16, false, transport);
    session.draw_pixel(1, 2, {10, 20, 30});
    session.draw_pixel(-1, 0, {255, 255, 255});
    session.draw_pixel(16, 0, {255, 255, 255});

    auto buffer = session.buffer();
    size_t index = (2 * 16 + 1) * 3;
    EXPECT_EQ(buffer[index], 10);
    EXPECT_EQ(buffer[index + 1], 20);
    EXPECT_EQ(buffer[index + 2], 30);
    EXPECT_EQ(buffer[0], 0);
}

TEST_F(PixooSessionTest, DrawLineDiagonal) {
    device::PixooSession session("10.0.0.5", 8, false, transport);
    session.draw_line(0, 0, 3, 3, {1, 1, 1});
    auto buffer = session.buffer();
    for (int i = 0; i <= 3; ++i) {
        EXPECT_EQ(buffer[(i * 8 + i) * 3], 1) << "pixel " << i;
    }
    EXPECT_EQ(buffer[(0 * 8 + 1) * 3], 0);
}

TEST_F(PixooSessionTest, OutlineRectangleLeavesInteriorEmpty) {
    device::PixooSession session("10.0.0.5", 8, false, transport);
    session.draw_rectangle(4, 4, 1, 1, {9, 9, 9}, false);
    auto buffer = session.buffer();
    EXPECT_EQ(buffer[(1 * 8 + 1) * 3], 9);
    EXPECT_EQ(buffer[(4 * 8 + 4) * 3], 9);
    EXPECT_EQ(buffer[(2 * 8 + 2) * 3], 0);

    session.draw_rectangle(1, 1, 4, 4, {7, 7, 7}, true);
    EXPECT_EQ(session.buffer()[(2 * 8 + 2) * 3], 7);
}

TEST_F(PixooSessionTest, FirstPushResetsCounter) {
    device::PixooSession session("10.0.0.5", 2, false, transport);
    session.fill({255, 0, 0});

    auto result = session.push();
    ASSERT_TRUE(result.ok()) << result.error;

    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0], (json{{"Command", "Draw/ResetHttpGifId"}}));
    EXPECT_EQ(sent[1]["Command"], "Draw/SendHttpGif");
    EXPECT_EQ(sent[1]["PicNum"], 1);
    EXPECT_EQ(sent[1]["PicWidth"], 2);
    EXPECT_EQ(sent[1]["PicOffset"], 0);
    EXPECT_EQ(sent[1]["PicID"], 1);
    EXPECT_EQ(sent[1]["PicSpeed"], 1000);
    // 4 red pixels: FF0000 x4
    EXPECT_EQ(sent[1]["PicData"], "/wAA/wAA/wAA/wAA");

    ASSERT_TRUE(session.push().ok());
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[2]["PicID"], 2);
}

TEST_F(PixooSessionTest, CounterResetsAtLimit) {
    device::PixooSession session("10.0.0.5", 2, false, transport);
    for (int i = 0; i < device::PixooSession::kRefreshCounterLimit; ++i) {
        ASSERT_TRUE(session.push().ok());
    }
    EXPECT_EQ(session.counter(), device::PixooSession::kRefreshCounterLimit);

    sent.clear();
    ASSERT_TRUE(session.push().ok());
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0]["Command"], "Draw/ResetHttpGifId");
    EXPECT_EQ(sent[1]["PicID"], 1);
}

TEST_F(PixooSessionTest, ControlCommands) {
    device::PixooSession session("10.0.0.5", 64, false, transport);
    session.set_brightness(150);
    session.set_channel(2);
    session.set_clock(42);
    session.set_face(1);
    session.set_visualizer(3);
    session.set_screen(false);

    ASSERT_EQ(sent.size(), 6u);
    EXPECT_EQ(sent[0], (json{{"Command", "Channel/SetBrightness"}, {"Brightness", 100}}));
    EXPECT_EQ(sent[1], (json{{"Command", "Channel/SetIndex"}, {"SelectIndex", 2}}));
    EXPECT_EQ(sent[2], (json{{"Command", "Channel/SetClockSelectId"}, {"ClockId", 42}}));
    EXPECT_EQ(sent[3], (json{{"Command", "Channel/SetCustomPageIndex"}, {"CustomPageIndex", 1}}));
    EXPECT_EQ(sent[4], (json{{"Command", "Channel/SetEqPosition"}, {"EqPosition", 3}}));
    EXPECT_EQ(sent[5], (json{{"Command", "Channel/OnOffScreen"}, {"OnOff", 0}}));
}

TEST_F(PixooSessionTest, SendText) {
    device::PixooSession session("10.0.0.5", 64, false, transport);
    device::PixooText text;
    text.text = "hi";
    text.color = "#00FF00";
    session.send_text(text);

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["Command"], "Draw/SendHttpText");
    EXPECT_EQ(sent[0]["TextString"], "hi");
    EXPECT_EQ(sent[0]["color"], "#00FF00");
    EXPECT_EQ(sent[0]["TextWidth"], 64);
}

TEST_F(PixooSessionTest, NonZeroErrorCodeIsDeviceError) {
    EXPECT_CALL(transport, post_command(_, _)).WillOnce(Return(transport_ok({{"error_code", 1}})));

    device::PixooSession session("10.0.0.5", 64, false, transport);
    auto result = session.set_channel(1);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status, device::TransportStatus::DEVICE_ERROR);
}

TEST_F(PixooSessionTest, FailedResetSkipsFrame) {
    EXPECT_CALL(transport, post_command(_, _))
        .WillOnce(Return(transport_failure(device::TransportStatus::CONNECTION_ERROR, "refused")));

    device::PixooSession session("10.0.0.5", 2, false, transport);
    auto result = session.push();
    EXPECT_EQ(result.status, device::TransportStatus::CONNECTION_ERROR);
    EXPECT_EQ(session.counter(), 0);
}

TEST_F(PixooSessionTest, FullWhiteFrameEncodesEveryByte) {
    device::PixooSession session("10.0.0.5", 64, false, transport);
    session.fill({255, 255, 255});
    ASSERT_TRUE(session.push().ok());

    ASSERT_EQ(sent.size(), 2u);
    // 64 * 64 * 3 bytes of 0xFF: 4096 groups of "////"
    EXPECT_EQ(sent[1]["PicData"], std::string(64 * 64 * 4, '/'));
}

TEST_F(PixooSessionTest, SinglePixelFrameEncoding) {
    device::PixooSession session("10.0.0.5", 1, false, transport);
    session.fill({1, 2, 3});
    ASSERT_TRUE(session.push().ok());
    EXPECT_EQ(sent[1]["PicData"], "AQID");
}

TEST_F(PixooSessionTest, DebugRawCommandWithoutStringNameIsForwarded) {
    device::PixooSession session("10.0.0.5", 64, true, transport);
    json command = {{"Command", 7}, {"Value", 1}};

    auto result = session.send_command(command);
    EXPECT_TRUE(result.ok()) << result.error;
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0], command);
}
