#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "device_transport.hpp"

namespace pixoogate {
namespace device {

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

// Scrolling text overlay (Draw/SendHttpText on a Pixoo panel)
struct PixooText {
    int text_id = 1;
    int x = 0;
    int y = 0;
    int direction = 0;
    int font = 0;
    int text_width = 64;
    std::string text;
    int speed = 10;
    std::string color = "#FFFFFF";
    int align = 1;
};

// Interface for PixooSession to enable mocking
class IPixooSession {
public:
    virtual ~IPixooSession() = default;

    virtual const std::string &host() const = 0;
    virtual int screen_size() const = 0;

    // Frame buffer (local until push())
    virtual void fill(const Rgb &color) = 0;
    virtual void draw_pixel(int x, int y, const Rgb &color) = 0;
    virtual void draw_line(int x0, int y0, int x1, int y1, const Rgb &color) = 0;
    virtual void draw_rectangle(int x0, int y0, int x1, int y1, const Rgb &color, bool filled) = 0;

    // Device operations
    virtual TransportResult push() = 0;
    virtual TransportResult set_brightness(int brightness) = 0;
    virtual TransportResult set_channel(int channel) = 0;
    virtual TransportResult set_clock(int clock_id) = 0;
    virtual TransportResult set_face(int face_index) = 0;
    virtual TransportResult set_visualizer(int position) = 0;
    virtual TransportResult set_screen(bool on) = 0;
    virtual TransportResult send_text(const PixooText &text) = 0;
    virtual TransportResult send_command(const nlohmann::json &command) = 0;
};

}  // namespace device
}  // namespace pixoogate
