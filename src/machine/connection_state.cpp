// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_state.h"

namespace wit {

void ConnectionState::mark_success() {
    last_success_at_ = Clock::now();
    last_error_.reset();
    retry_count_ = 0;
    total_commands_++;
}

void ConnectionState::mark_failure(const std::string& error) {
    last_error_ = error;
    retry_count_++;
    total_commands_++;
    failed_commands_++;
}

bool ConnectionState::is_healthy(std::chrono::seconds timeout) const {
    if (!connected_ || !last_success_at_) {
        return false;
    }
    // A failure after the last success makes the link unhealthy until the next success
    if (last_error_) {
        return false;
    }
    auto age = std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - *last_success_at_);
    return age <= timeout;
}

void ConnectionState::reset_for_reconnect() {
    connected_ = false;
    last_error_.reset();
    retry_count_ = 0;
    last_success_at_.reset();
}

nlohmann::json ConnectionState::to_json() const {
    nlohmann::json j = {{"connected", connected_},
                        {"retry_count", retry_count_},
                        {"total_commands", total_commands_},
                        {"failed_commands", failed_commands_}};
    j["last_error"] = last_error_ ? nlohmann::json(*last_error_) : nlohmann::json(nullptr);
    if (last_success_at_) {
        j["seconds_since_success"] =
            std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - *last_success_at_)
                .count();
    } else {
        j["seconds_since_success"] = nullptr;
    }
    return j;
}

} // namespace wit
