#include "pixoo_session.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <utility>

#include "logging/logger.hpp"

namespace pixoogate {
namespace device {

namespace {
const std::string base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

std::string base64_encode(const std::vector<uint8_t> &bytes) {
    std::string encoded;
    encoded.reserve(((bytes.size() + 2) / 3) * 4);
    // Only the low (bits + 6) bits of val are ever pending
    uint32_t val = 0;
    int bits = -6;

    for (uint8_t c : bytes) {
        val = ((val << 8) | c) & 0xFFFFu;
        bits += 8;
        while (bits >= 0) {
            encoded.push_back(base64_chars[(val >> bits) & 0x3F]);
            bits -= 6;
        }
    }
    if (bits > -6) {
        encoded.push_back(base64_chars[((val << 8) >> (bits + 8)) & 0x3F]);
    }
    while ((encoded.size() % 4) != 0) {
        encoded.push_back('=');
    }
    return encoded;
}
}  // namespace

PixooSession::PixooSession(std::string host, int screen_size, bool debug, IDeviceTransport &transport)
    : host_(std::move(host)),
      screen_size_(screen_size),
      debug_(debug),
      transport_(transport),
      buffer_(static_cast<size_t>(screen_size) * static_cast<size_t>(screen_size) * 3, 0) {}

void PixooSession::fill(const Rgb &color) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i + 2 < buffer_.size(); i += 3) {
        buffer_[i] = color.r;
        buffer_[i + 1] = color.g;
        buffer_[i + 2] = color.b;
    }
}

void PixooSession::draw_pixel(int x, int y, const Rgb &color) {
    std::lock_guard<std::mutex> lock(mutex_);
    set_pixel_locked(x, y, color);
}

void PixooSession::draw_line(int x0, int y0, int x1, int y1, const Rgb &color) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Bresenham, all octants
    int dx = std::abs(x1 - x0);
    int dy = -std::abs(y1 - y0);
    int sx = x0 < x1 ? 1 : -1;
    int sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;

    while (true) {
        set_pixel_locked(x0, y0, color);
        if (x0 == x1 && y0 == y1) {
            break;
        }
        int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0 += sy;
        }
    }
}

void PixooSession::draw_rectangle(int x0, int y0, int x1, int y1, const Rgb &color, bool filled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (x0 > x1) std::swap(x0, x1);
    if (y0 > y1) std::swap(y0, y1);

    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            if (filled || y == y0 || y == y1 || x == x0 || x == x1) {
                set_pixel_locked(x, y, color);
            }
        }
    }
}

void PixooSession::set_pixel_locked(int x, int y, const Rgb &color) {
    if (x < 0 || y < 0 || x >= screen_size_ || y >= screen_size_) {
        return;
    }
    size_t index = (static_cast<size_t>(y) * static_cast<size_t>(screen_size_) + static_cast<size_t>(x)) * 3;
    buffer_[index] = color.r;
    buffer_[index + 1] = color.g;
    buffer_[index + 2] = color.b;
}

TransportResult PixooSession::push() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!counter_synced_ || counter_ >= kRefreshCounterLimit) {
        auto reset = send({{"Command", "Draw/ResetHttpGifId"}});
        if (!reset.ok()) {
            return reset;
        }
        counter_ = 0;
        counter_synced_ = true;
    }

    ++counter_;
    nlohmann::json payload = {{"Command", "Draw/SendHttpGif"},
                              {"PicNum", 1},
                              {"PicWidth", screen_size_},
                              {"PicOffset", 0},
                              {"PicID", counter_},
                              {"PicSpeed", kFrameSpeedMs},
                              {"PicData", base64_encode(buffer_)}};
    return send(payload);
}

TransportResult PixooSession::set_brightness(int brightness) {
    return send({{"Command", "Channel/SetBrightness"}, {"Brightness", std::clamp(brightness, 0, 100)}});
}

TransportResult PixooSession::set_channel(int channel) {
    return send({{"Command", "Channel/SetIndex"}, {"SelectIndex", channel}});
}

TransportResult PixooSession::set_clock(int clock_id) {
    return send({{"Command", "Channel/SetClockSelectId"}, {"ClockId", clock_id}});
}

TransportResult PixooSession::set_face(int face_index) {
    return send({{"Command", "Channel/SetCustomPageIndex"}, {"CustomPageIndex", face_index}});
}

TransportResult PixooSession::set_visualizer(int position) {
    return send({{"Command", "Channel/SetEqPosition"}, {"EqPosition", position}});
}

TransportResult PixooSession::set_screen(bool on) {
    return send({{"Command", "Channel/OnOffScreen"}, {"OnOff", on ? 1 : 0}});
}

TransportResult PixooSession::send_text(const PixooText &text) {
    nlohmann::json payload = {{"Command", "Draw/SendHttpText"},
                              {"TextId", text.text_id},
                              {"x", text.x},
                              {"y", text.y},
                              {"dir", text.direction},
                              {"font", text.font},
                              {"TextWidth", text.text_width},
                              {"speed", text.speed},
                              {"TextString", text.text},
                              {"color", text.color},
                              {"align", text.align}};
    return send(payload);
}

TransportResult PixooSession::send_command(const nlohmann::json &command) { return send(command); }

std::vector<uint8_t> PixooSession::buffer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

int PixooSession::counter() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counter_;
}

TransportResult PixooSession::send(const nlohmann::json &payload) {
    if (debug_) {
        auto command = payload.find("Command");
        const bool named = command != payload.end() && command->is_string();
        LOG_INFO("[Pixoo " << host_ << "] -> " << (named ? command->get<std::string>() : std::string("<raw>")));
    }

    auto result = transport_.post_command(host_, payload);
    if (!result.ok()) {
        LOG_WARN("[Pixoo " << host_ << "] " << transport_status_to_string(result.status) << ": " << result.error);
        return result;
    }

    if (result.body.is_object() && result.body.contains("error_code") && result.body["error_code"].is_number() &&
        result.body["error_code"].get<int>() != 0) {
        result.status = TransportStatus::DEVICE_ERROR;
        result.error = "Device returned error_code " + std::to_string(result.body["error_code"].get<int>());
        LOG_WARN("[Pixoo " << host_ << "] " << result.error);
    } else if (debug_) {
        LOG_INFO("[Pixoo " << host_ << "] <- " << result.body.dump());
    }
    return result;
}

}  // namespace device
}  // namespace pixoogate
