#ifndef PIXOOGATE_TIMEGATE_COMMANDS_HPP
#define PIXOOGATE_TIMEGATE_COMMANDS_HPP

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "http/errors.hpp"

namespace pixoogate {
namespace timegate {

// One flag per Time-Gate screen, each 0 or 1
using LcdArray = std::array<int, 5>;
constexpr LcdArray kAllScreens{1, 1, 1, 1, 1};

// Draw/SendHttpGif: one frame of an animation
struct SendGif {
    LcdArray lcd_array = kAllScreens;
    int pic_num = 1;                // 1-60
    std::optional<int> pic_width;   // device screen size when unset
    int pic_offset = 0;             // >= 0
    int pic_id = 1;                 // >= 1
    int pic_speed = 1;              // >= 1, ms per frame
    std::string pic_data;           // base64 JPEG, opaque here
};

// Draw/SendHttpText
struct SendText {
    int lcd_index = 0;              // 0-4
    int text_id = 1;                // 0-20
    int x = 0;
    int y = 0;
    int direction = 0;              // 0 left, 1 right
    int font = 0;                   // 0-7
    int text_width = 56;            // 16-64
    std::string text;               // <= 512 characters
    int speed = 10;
    std::string color = "#FFFFFF";
    int align = 1;                  // 1 left, 2 center, 3 right
};

// Device/PlayGif
struct PlayGif {
    LcdArray lcd_array = kAllScreens;
    std::vector<std::string> file_names;
};

// Channel/SetBrightness
struct SetBrightness {
    int brightness = 0;             // 0-100
};

// Draw/ResetHttpGifId
struct ResetGifId {};

// Draw/CommandList: entries are forwarded verbatim
struct CommandList {
    std::vector<nlohmann::json> commands;
};

// Caller-supplied payload, forwarded verbatim and unvalidated
struct RawCommand {
    nlohmann::json payload;
};

using Command = std::variant<SendGif, SendText, PlayGif, SetBrightness, ResetGifId, CommandList, RawCommand>;

enum class Operation { SEND_GIF, SEND_TEXT, PLAY_GIF, SET_BRIGHTNESS, RESET_GIF_ID, COMMAND_LIST, RAW_COMMAND };

struct CommandDecodeResult {
    bool success = false;
    http::StatusCode status_code = http::StatusCode::VALIDATION_FAILED;
    std::string error_message;
    Command command;
};

/**
 * @brief Decode and validate a request body for one operation
 *
 * Applies field defaults and range checks. Failures carry VALIDATION_FAILED
 * (422) and name the offending field; nothing is sent on failure.
 * RESET_GIF_ID accepts any body (including null).
 */
CommandDecodeResult decode_command(Operation op, const nlohmann::json &body);

// lcd_array: exactly 5 integers, each 0 or 1
bool decode_lcd_array(const nlohmann::json &value, LcdArray &out, std::string &error);

// Wire JSON for a command; screen_size fills an unset PicWidth
nlohmann::json to_wire(const Command &command, int screen_size);

// Protocol discriminator ("Draw/SendHttpGif", ...; RawCommand reports its own "Command" or "raw")
std::string command_name(const Command &command);

std::string operation_to_string(Operation op);

}  // namespace timegate
}  // namespace pixoogate

#endif  // PIXOOGATE_TIMEGATE_COMMANDS_HPP
