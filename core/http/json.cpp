#include "json.hpp"

#include <cmath>
#include <cstdio>
#include <limits>

namespace pixoogate {
namespace http {

namespace {
constexpr size_t kMaxPixooTextLength = 512;

size_t utf8_length(const std::string &s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}
}  // namespace

nlohmann::json encode_device_info(const device::DeviceContext &device) {
    nlohmann::json j = {{"key", device.key},
                        {"host", device.host},
                        {"device_type", device::device_type_to_string(device.device_type)},
                        {"screen_size", device.screen_size},
                        {"connected", device.has_session()}};
    if (device.name.has_value()) {
        j["name"] = *device.name;
    }
    return j;
}

bool decode_int_field(const nlohmann::json &body, const std::string &name, std::optional<int> fallback, int min,
                      int max, int &out, std::string &error) {
    auto it = body.find(name);
    if (it == body.end()) {
        if (!fallback.has_value()) {
            error = "Field required: " + name;
            return false;
        }
        out = *fallback;
        return true;
    }

    long long value = 0;
    if (it->is_number_integer()) {
        value = it->get<long long>();
    } else if (it->is_number_float() && std::isfinite(it->get<double>()) &&
               std::trunc(it->get<double>()) == it->get<double>() &&
               std::fabs(it->get<double>()) <= static_cast<double>(std::numeric_limits<int>::max())) {
        value = static_cast<long long>(it->get<double>());
    } else {
        error = name + " must be an integer";
        return false;
    }

    if (value < min || value > max) {
        error = name + " must be between " + std::to_string(min) + " and " + std::to_string(max);
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool decode_bool_field(const nlohmann::json &body, const std::string &name, bool fallback, bool &out,
                       std::string &error) {
    auto it = body.find(name);
    if (it == body.end()) {
        out = fallback;
        return true;
    }
    if (!it->is_boolean()) {
        error = name + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool decode_rgb(const nlohmann::json &body, device::Rgb &out, std::string &error) {
    int r = 0;
    int g = 0;
    int b = 0;
    if (!decode_int_field(body, "r", 0, 0, 255, r, error) || !decode_int_field(body, "g", 0, 0, 255, g, error) ||
        !decode_int_field(body, "b", 0, 0, 255, b, error)) {
        return false;
    }
    out.r = static_cast<uint8_t>(r);
    out.g = static_cast<uint8_t>(g);
    out.b = static_cast<uint8_t>(b);
    return true;
}

bool decode_pixoo_text(const nlohmann::json &body, device::PixooText &out, std::string &error) {
    auto text_it = body.find("text");
    if (text_it == body.end()) {
        error = "Field required: text";
        return false;
    }
    if (!text_it->is_string()) {
        error = "text must be a string";
        return false;
    }
    out.text = text_it->get<std::string>();
    if (utf8_length(out.text) > kMaxPixooTextLength) {
        error = "text must be at most " + std::to_string(kMaxPixooTextLength) + " characters";
        return false;
    }

    device::Rgb color{255, 255, 255};
    if (body.contains("r") || body.contains("g") || body.contains("b")) {
        if (!decode_rgb(body, color, error)) {
            return false;
        }
    }
    out.color = rgb_to_hex(color);

    constexpr int kMax = std::numeric_limits<int>::max();
    return decode_int_field(body, "x", 0, 0, kMax, out.x, error) &&
           decode_int_field(body, "y", 0, 0, kMax, out.y, error) &&
           decode_int_field(body, "identifier", 1, 0, 19, out.text_id, error) &&
           decode_int_field(body, "font", 2, 0, 7, out.font, error) &&
           decode_int_field(body, "width", 64, 16, 64, out.text_width, error) &&
           decode_int_field(body, "movement_speed", 0, 0, kMax, out.speed, error) &&
           decode_int_field(body, "direction", 0, 0, 1, out.direction, error) &&
           decode_int_field(body, "align", 1, 1, 3, out.align, error);
}

std::string rgb_to_hex(const device::Rgb &color) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", color.r, color.g, color.b);
    return buf;
}

}  // namespace http
}  // namespace pixoogate
