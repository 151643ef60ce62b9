#include "commands.hpp"

#include <cmath>
#include <limits>
#include <type_traits>

namespace pixoogate {
namespace timegate {

namespace {
constexpr size_t kMaxTextLength = 512;

// Characters, not bytes: count UTF-8 lead bytes
size_t utf8_length(const std::string &s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

// Reads fields off a request body, keeping the first error
class BodyReader {
public:
    explicit BodyReader(const nlohmann::json &body) : body_(body) {}

    bool ok() const { return error_.empty(); }
    const std::string &error() const { return error_; }

    int integer(const char *name, std::optional<int> fallback, std::optional<int> min = std::nullopt,
                std::optional<int> max = std::nullopt) {
        auto value = optional_integer(name, false);
        if (!ok()) {
            return 0;
        }
        if (!value.has_value()) {
            if (!fallback.has_value()) {
                fail(std::string("Field required: ") + name);
                return 0;
            }
            return *fallback;
        }
        check_range(name, *value, min, max);
        return *value;
    }

    // Absent or null -> nullopt
    std::optional<int> optional_integer(const char *name, bool null_allowed = true) {
        auto it = body_.find(name);
        if (it == body_.end()) {
            return std::nullopt;
        }
        if (it->is_null() && null_allowed) {
            return std::nullopt;
        }
        if (it->is_number_integer()) {
            auto v = it->get<long long>();
            if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
                fail(std::string(name) + " is out of range");
                return std::nullopt;
            }
            return static_cast<int>(v);
        }
        if (it->is_number_unsigned()) {
            fail(std::string(name) + " is out of range");
            return std::nullopt;
        }
        if (it->is_number_float()) {
            double v = it->get<double>();
            if (std::isfinite(v) && std::trunc(v) == v && v >= std::numeric_limits<int>::min() &&
                v <= std::numeric_limits<int>::max()) {
                return static_cast<int>(v);
            }
        }
        fail(std::string(name) + " must be an integer");
        return std::nullopt;
    }

    std::string string(const char *name, std::optional<std::string> fallback,
                       std::optional<size_t> max_length = std::nullopt) {
        auto it = body_.find(name);
        if (it == body_.end()) {
            if (!fallback.has_value()) {
                fail(std::string("Field required: ") + name);
                return {};
            }
            return *fallback;
        }
        if (!it->is_string()) {
            fail(std::string(name) + " must be a string");
            return {};
        }
        auto value = it->get<std::string>();
        if (max_length.has_value() && utf8_length(value) > *max_length) {
            fail(std::string(name) + " must be at most " + std::to_string(*max_length) + " characters");
        }
        return value;
    }

    std::vector<std::string> string_list(const char *name) {
        std::vector<std::string> result;
        const auto *list = required_array(name);
        if (list == nullptr) {
            return result;
        }
        for (const auto &item : *list) {
            if (!item.is_string()) {
                fail(std::string(name) + " must be a list of strings");
                return {};
            }
            result.push_back(item.get<std::string>());
        }
        return result;
    }

    std::vector<nlohmann::json> object_list(const char *name) {
        std::vector<nlohmann::json> result;
        const auto *list = required_array(name);
        if (list == nullptr) {
            return result;
        }
        for (const auto &item : *list) {
            if (!item.is_object()) {
                fail(std::string(name) + " must be a list of objects");
                return {};
            }
            result.push_back(item);
        }
        return result;
    }

    nlohmann::json object(const char *name) {
        auto it = body_.find(name);
        if (it == body_.end()) {
            fail(std::string("Field required: ") + name);
            return nullptr;
        }
        if (!it->is_object()) {
            fail(std::string(name) + " must be an object");
            return nullptr;
        }
        return *it;
    }

    LcdArray lcd_array(const char *name) {
        auto it = body_.find(name);
        if (it == body_.end()) {
            return kAllScreens;
        }
        LcdArray out = kAllScreens;
        std::string lcd_error;
        if (!decode_lcd_array(*it, out, lcd_error)) {
            fail(lcd_error);
        }
        return out;
    }

private:
    const nlohmann::json *required_array(const char *name) {
        auto it = body_.find(name);
        if (it == body_.end()) {
            fail(std::string("Field required: ") + name);
            return nullptr;
        }
        if (!it->is_array()) {
            fail(std::string(name) + " must be a list");
            return nullptr;
        }
        return &*it;
    }

    void check_range(const char *name, int value, std::optional<int> min, std::optional<int> max) {
        if (min.has_value() && max.has_value() && (value < *min || value > *max)) {
            fail(std::string(name) + " must be between " + std::to_string(*min) + " and " + std::to_string(*max));
        } else if (min.has_value() && value < *min) {
            fail(std::string(name) + " must be >= " + std::to_string(*min));
        } else if (max.has_value() && value > *max) {
            fail(std::string(name) + " must be <= " + std::to_string(*max));
        }
    }

    void fail(const std::string &message) {
        if (error_.empty()) {
            error_ = message;
        }
    }

    const nlohmann::json &body_;
    std::string error_;
};

Command decode_send_gif(BodyReader &reader) {
    SendGif cmd;
    cmd.lcd_array = reader.lcd_array("lcd_array");
    cmd.pic_num = reader.integer("pic_num", std::nullopt, 1, 60);
    cmd.pic_width = reader.optional_integer("pic_width");
    cmd.pic_offset = reader.integer("pic_offset", std::nullopt, 0);
    cmd.pic_id = reader.integer("pic_id", std::nullopt, 1);
    cmd.pic_speed = reader.integer("pic_speed", std::nullopt, 1);
    cmd.pic_data = reader.string("pic_data", std::nullopt);
    return cmd;
}

Command decode_send_text(BodyReader &reader) {
    SendText cmd;
    cmd.lcd_index = reader.integer("lcd_index", std::nullopt, 0, 4);
    cmd.text_id = reader.integer("text_id", 1, 0, 20);
    cmd.x = reader.integer("x", 0, 0);
    cmd.y = reader.integer("y", 0, 0);
    cmd.direction = reader.integer("direction", 0, 0, 1);
    cmd.font = reader.integer("font", 0, 0, 7);
    cmd.text_width = reader.integer("text_width", 56, 16, 64);
    cmd.text = reader.string("text", std::nullopt, kMaxTextLength);
    cmd.speed = reader.integer("speed", 10, 0);
    cmd.color = reader.string("color", std::string("#FFFFFF"));
    cmd.align = reader.integer("align", 1, 1, 3);
    return cmd;
}

Command decode_play_gif(BodyReader &reader) {
    PlayGif cmd;
    cmd.lcd_array = reader.lcd_array("lcd_array");
    cmd.file_names = reader.string_list("file_name");
    return cmd;
}

nlohmann::json lcd_to_json(const LcdArray &lcd) { return nlohmann::json(std::vector<int>(lcd.begin(), lcd.end())); }
}  // namespace

bool decode_lcd_array(const nlohmann::json &value, LcdArray &out, std::string &error) {
    if (!value.is_array()) {
        error = "lcd_array must be a list of integers";
        return false;
    }
    if (value.size() != out.size()) {
        error = "lcd_array must contain 5 items.";
        return false;
    }
    for (size_t i = 0; i < out.size(); ++i) {
        const auto &flag = value[i];
        if (!flag.is_number_integer() && !flag.is_number_unsigned()) {
            error = "lcd_array must be a list of integers";
            return false;
        }
        auto v = flag.get<long long>();
        if (v != 0 && v != 1) {
            error = "lcd_array values must be 0 or 1.";
            return false;
        }
        out[i] = static_cast<int>(v);
    }
    return true;
}

CommandDecodeResult decode_command(Operation op, const nlohmann::json &body) {
    CommandDecodeResult result;

    if (op == Operation::RESET_GIF_ID) {
        result.success = true;
        result.status_code = http::StatusCode::OK;
        result.command = ResetGifId{};
        return result;
    }

    if (!body.is_object()) {
        result.error_message = "Request body must be a JSON object";
        return result;
    }

    BodyReader reader(body);
    switch (op) {
        case Operation::SEND_GIF:
            result.command = decode_send_gif(reader);
            break;
        case Operation::SEND_TEXT:
            result.command = decode_send_text(reader);
            break;
        case Operation::PLAY_GIF:
            result.command = decode_play_gif(reader);
            break;
        case Operation::SET_BRIGHTNESS:
            result.command = SetBrightness{reader.integer("brightness", std::nullopt, 0, 100)};
            break;
        case Operation::COMMAND_LIST:
            result.command = CommandList{reader.object_list("command_list")};
            break;
        case Operation::RAW_COMMAND:
            result.command = RawCommand{reader.object("command")};
            break;
        default:
            result.error_message = "Unsupported operation";
            return result;
    }

    if (!reader.ok()) {
        result.error_message = reader.error();
        return result;
    }

    result.success = true;
    result.status_code = http::StatusCode::OK;
    return result;
}

nlohmann::json to_wire(const Command &command, int screen_size) {
    return std::visit(
        [screen_size](const auto &cmd) -> nlohmann::json {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, SendGif>) {
                // 0 is treated like "unset", as the device has no zero-width panel
                int width = cmd.pic_width.value_or(0) > 0 ? *cmd.pic_width : screen_size;
                return {{"Command", "Draw/SendHttpGif"}, {"LcdArray", lcd_to_json(cmd.lcd_array)},
                        {"PicNum", cmd.pic_num},         {"PicWidth", width},
                        {"PicOffset", cmd.pic_offset},   {"PicID", cmd.pic_id},
                        {"PicSpeed", cmd.pic_speed},     {"PicData", cmd.pic_data}};
            } else if constexpr (std::is_same_v<T, SendText>) {
                return {{"Command", "Draw/SendHttpText"},
                        {"LcdIndex", cmd.lcd_index},
                        {"TextId", cmd.text_id},
                        {"x", cmd.x},
                        {"y", cmd.y},
                        {"dir", cmd.direction},
                        {"font", cmd.font},
                        {"TextWidth", cmd.text_width},
                        {"TextString", cmd.text},
                        {"speed", cmd.speed},
                        {"color", cmd.color},
                        {"align", cmd.align}};
            } else if constexpr (std::is_same_v<T, PlayGif>) {
                return {{"Command", "Device/PlayGif"},
                        {"LcdArray", lcd_to_json(cmd.lcd_array)},
                        {"FileName", cmd.file_names}};
            } else if constexpr (std::is_same_v<T, SetBrightness>) {
                return {{"Command", "Channel/SetBrightness"}, {"Brightness", cmd.brightness}};
            } else if constexpr (std::is_same_v<T, ResetGifId>) {
                return {{"Command", "Draw/ResetHttpGifId"}};
            } else if constexpr (std::is_same_v<T, CommandList>) {
                return {{"Command", "Draw/CommandList"}, {"CommandList", cmd.commands}};
            } else {
                return cmd.payload;
            }
        },
        command);
}

std::string command_name(const Command &command) {
    if (const auto *raw = std::get_if<RawCommand>(&command)) {
        if (raw->payload.is_object() && raw->payload.contains("Command") && raw->payload["Command"].is_string()) {
            return raw->payload["Command"].get<std::string>();
        }
        return "raw";
    }
    return to_wire(command, 0)["Command"].get<std::string>();
}

std::string operation_to_string(Operation op) {
    switch (op) {
        case Operation::SEND_GIF:
            return "send-gif";
        case Operation::SEND_TEXT:
            return "send-text";
        case Operation::PLAY_GIF:
            return "play-gif";
        case Operation::SET_BRIGHTNESS:
            return "set-brightness";
        case Operation::RESET_GIF_ID:
            return "reset-gif-id";
        case Operation::COMMAND_LIST:
            return "command-list";
        case Operation::RAW_COMMAND:
            return "command";
        default:
            return "unknown";
    }
}

}  // namespace timegate
}  // namespace pixoogate
