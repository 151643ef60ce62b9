#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "device/device_context.hpp"
#include "device/i_pixoo_session.hpp"

namespace pixoogate {
namespace http {

/**
 * @brief JSON encoding/decoding for the Pixoo REST surface
 *
 * Decoders follow one convention: absent fields take the fallback, present
 * fields must be integers (or integral floats) within range. Booleans are
 * not integers here. On failure `error` names the offending field.
 */

nlohmann::json encode_device_info(const device::DeviceContext &device);

bool decode_int_field(const nlohmann::json &body, const std::string &name, std::optional<int> fallback, int min,
                      int max, int &out, std::string &error);
bool decode_bool_field(const nlohmann::json &body, const std::string &name, bool fallback, bool &out,
                       std::string &error);

// r, g, b in 0-255, each defaulting to 0
bool decode_rgb(const nlohmann::json &body, device::Rgb &out, std::string &error);

// Body of POST /send/text
bool decode_pixoo_text(const nlohmann::json &body, device::PixooText &out, std::string &error);

std::string rgb_to_hex(const device::Rgb &color);

}  // namespace http
}  // namespace pixoogate
