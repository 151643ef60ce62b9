#ifndef PIXOOGATE_DEVICE_DEVICE_TYPES_HPP
#define PIXOOGATE_DEVICE_DEVICE_TYPES_HPP

#include <string>

namespace pixoogate {
namespace device {

// PIXOO devices need a live session; TIME_GATE devices are plain stateless HTTP.
// AUTO only exists between configuration loading and registry initialization.
enum class DeviceType { PIXOO, TIME_GATE, AUTO };

// Trim, lower-case, '-' and ' ' -> '_'; "timegate"/"time_gate" -> TIME_GATE,
// "auto" -> AUTO, anything else (including empty) -> PIXOO.
DeviceType normalize_device_type(const std::string &value);

// Identity: normalizing an already normalized type is a no-op.
inline DeviceType normalize_device_type(DeviceType type) { return type; }

// Wire/config spelling: "pixoo", "time_gate", "auto"
std::string device_type_to_string(DeviceType type);

}  // namespace device
}  // namespace pixoogate

#endif  // PIXOOGATE_DEVICE_DEVICE_TYPES_HPP
