#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace pixoogate
{
    namespace http
    {

        /**
         * @brief Gateway status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400 (bad JSON body, device type mismatch)
         * - UPSTREAM_FAILED -> HTTP 400 (device unreachable or answered non-2xx)
         * - NOT_FOUND -> HTTP 404
         * - VALIDATION_FAILED -> HTTP 422 (field missing, wrong type, out of range)
         * - UNAVAILABLE -> HTTP 503 (registry or device session not ready)
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            UPSTREAM_FAILED,
            NOT_FOUND,
            VALIDATION_FAILED,
            UNAVAILABLE,
            INTERNAL
        };

        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
            case StatusCode::UPSTREAM_FAILED:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::VALIDATION_FAILED:
                return 422;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::INTERNAL:
                return 500;
            default:
                return 500;
            }
        }

        inline std::string status_code_to_string(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::UPSTREAM_FAILED:
                return "UPSTREAM_FAILED";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::VALIDATION_FAILED:
                return "VALIDATION_FAILED";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            default:
                return "INTERNAL";
            }
        }

        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        /**
         * @brief Build a complete JSON error response
         *
         * "detail" carries the human-readable reason; "status" mirrors it with
         * the machine-readable code.
         */
        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            return {
                {"detail", message},
                {"status", make_status(code, message)}};
        }

        /**
         * @brief Serialize a response body
         *
         * Messages may echo request paths or hints that are not valid UTF-8;
         * such bytes are written as U+FFFD instead of throwing.
         */
        inline std::string dump_json(const nlohmann::json &body)
        {
            return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

    } // namespace http
} // namespace pixoogate
