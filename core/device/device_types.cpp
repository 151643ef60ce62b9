#include "device_types.hpp"

#include <algorithm>
#include <cctype>

namespace pixoogate {
namespace device {

namespace {
std::string trim(const std::string &s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}
}  // namespace

DeviceType normalize_device_type(const std::string &value) {
    std::string normalized = trim(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    std::replace(normalized.begin(), normalized.end(), ' ', '_');

    if (normalized == "timegate" || normalized == "time_gate") {
        return DeviceType::TIME_GATE;
    }
    if (normalized == "auto") {
        return DeviceType::AUTO;
    }
    return DeviceType::PIXOO;
}

std::string device_type_to_string(DeviceType type) {
    switch (type) {
        case DeviceType::PIXOO:
            return "pixoo";
        case DeviceType::TIME_GATE:
            return "time_gate";
        case DeviceType::AUTO:
            return "auto";
        default:
            return "pixoo";
    }
}

}  // namespace device
}  // namespace pixoogate
