// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

#include "hv/json.hpp"

namespace wit {

using json = nlohmann::json;

/**
 * @brief Error codes carried by CommandResult::error_code()
 */
namespace error_code {
constexpr const char* CONNECTION_ERROR = "CONNECTION_ERROR"; ///< Not connected / unreachable
constexpr const char* TIMEOUT = "TIMEOUT";                   ///< Transport call timed out
constexpr const char* COMMAND_ERROR = "COMMAND_ERROR";       ///< Device rejected the command
constexpr const char* REQUEST_ERROR = "REQUEST_ERROR";       ///< Non-2xx HTTP status
constexpr const char* PARSE_ERROR = "PARSE_ERROR";           ///< Malformed device response
constexpr const char* HANDSHAKE_FAILED = "HANDSHAKE_FAILED"; ///< Identification rejected
constexpr const char* INVALID_STATE = "INVALID_STATE";       ///< State-machine guard violation
constexpr const char* INVALID_ZONE = "INVALID_ZONE";
constexpr const char* INVALID_AXIS = "INVALID_AXIS";
constexpr const char* INVALID_PARAMETER = "INVALID_PARAMETER";
constexpr const char* NOT_SUPPORTED = "NOT_SUPPORTED";
} // namespace error_code

/**
 * @brief Outcome of every Connection and Machine operation
 *
 * Only constructible through success() and error(). A successful result
 * carries a JSON object payload and no error message; a failed result carries
 * a message, an optional code and an empty payload.
 *
 * @code
 * CommandResult r = machine.pause();
 * if (!r.ok()) {
 *     spdlog::warn("pause failed: {} ({})", r.error_message(), r.error_code());
 * }
 * @endcode
 */
class CommandResult {
  public:
    static CommandResult success(json data = json::object()) {
        if (!data.is_object()) {
            data = json{{"value", std::move(data)}};
        }
        return CommandResult(true, std::move(data), std::string(), std::string());
    }

    static CommandResult error(std::string message, std::string code = std::string()) {
        return CommandResult(false, json::object(), std::move(message), std::move(code));
    }

    bool ok() const {
        return success_;
    }

    explicit operator bool() const {
        return success_;
    }

    const json& data() const {
        return data_;
    }

    /// Empty for successful results
    const std::string& error_message() const {
        return error_message_;
    }

    /// Empty when the failure has no specific code
    const std::string& error_code() const {
        return error_code_;
    }

    bool has_error_code(const char* code) const {
        return !success_ && error_code_ == code;
    }

    /// Shape handed to the web layer: {"success", "data"} or {"success", "error", "code"}
    json to_json() const {
        if (success_) {
            return {{"success", true}, {"data", data_}};
        }
        json j = {{"success", false}, {"error", error_message_}};
        if (!error_code_.empty()) {
            j["code"] = error_code_;
        }
        return j;
    }

  private:
    CommandResult(bool success, json data, std::string message, std::string code)
        : success_(success), data_(std::move(data)), error_message_(std::move(message)),
          error_code_(std::move(code)) {}

    bool success_;
    json data_;
    std::string error_message_;
    std::string error_code_;
};

} // namespace wit
