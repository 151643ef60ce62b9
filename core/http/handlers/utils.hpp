#pragma once

#include <optional>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../../control/device_resolver.hpp"
#include "../errors.hpp"

namespace pixoogate
{
    namespace http
    {

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(dump_json(body), "application/json");
        }

        // Helper: Send JSON error body
        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

        // Helper: First non-empty value of a query parameter, then a header
        inline std::optional<std::string> hint_from_request(const httplib::Request &req, const char *param,
                                                            const char *header)
        {
            if (req.has_param(param) && !req.get_param_value(param).empty())
            {
                return req.get_param_value(param);
            }
            if (req.has_header(header) && !req.get_header_value(header).empty())
            {
                return req.get_header_value(header);
            }
            return std::nullopt;
        }

        // Helper: Device hints from ?device= / ?host=, falling back to X-Pixoo-Device / X-Pixoo-Host
        inline control::DeviceSelector selector_from_request(const httplib::Request &req)
        {
            control::DeviceSelector selector;
            selector.device = hint_from_request(req, "device", "X-Pixoo-Device");
            selector.host = hint_from_request(req, "host", "X-Pixoo-Host");
            return selector;
        }

        // Helper: Parse request body; an empty body reads as {} when allowed.
        // Sends the 422 response itself on failure.
        inline bool parse_body(const httplib::Request &req, httplib::Response &res, nlohmann::json &body,
                               bool allow_empty = false)
        {
            if (req.body.empty() && allow_empty)
            {
                body = nlohmann::json::object();
                return true;
            }

            try
            {
                body = nlohmann::json::parse(req.body);
            }
            catch (const std::exception &e)
            {
                send_error(res, StatusCode::VALIDATION_FAILED, std::string("Invalid JSON: ") + e.what());
                return false;
            }
            return true;
        }

    } // namespace http
} // namespace pixoogate
