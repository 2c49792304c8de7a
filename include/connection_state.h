// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "hv/json.hpp"

namespace wit {

/**
 * @brief Health and retry bookkeeping for one Connection
 *
 * Pure data plus counters, no I/O. Owned by exactly one Connection, which is
 * the only writer: every I/O attempt finishes with exactly one call to
 * mark_success() or mark_failure().
 *
 * Not thread-safe; a Connection serializes its own I/O.
 */
class ConnectionState {
  public:
    using Clock = std::chrono::steady_clock;

    ConnectionState() = default;

    /// Record a completed exchange: clears last_error, resets retry_count
    void mark_success();

    /// Record a failed exchange: sets last_error, bumps retry and failure counters
    void mark_failure(const std::string& error);

    /**
     * @brief Check connection health
     *
     * @param timeout Maximum age of the last successful exchange
     * @return true iff connected and the last success is no older than @p timeout
     *         (compared in whole seconds)
     */
    bool is_healthy(std::chrono::seconds timeout = std::chrono::seconds(30)) const;

    /**
     * @brief Prepare for a fresh connect() on the same transport
     *
     * Clears connected, last_error, retry_count and last_success_at.
     * total_commands and failed_commands are cumulative and survive.
     */
    void reset_for_reconnect();

    void set_connected(bool connected) {
        connected_ = connected;
    }

    bool connected() const {
        return connected_;
    }
    const std::optional<std::string>& last_error() const {
        return last_error_;
    }
    uint32_t retry_count() const {
        return retry_count_;
    }
    uint64_t total_commands() const {
        return total_commands_;
    }
    uint64_t failed_commands() const {
        return failed_commands_;
    }
    const std::optional<Clock::time_point>& last_success_at() const {
        return last_success_at_;
    }

    /// Snapshot for diagnostics (seconds_since_success is null before the first success)
    nlohmann::json to_json() const;

  private:
    bool connected_ = false;
    std::optional<std::string> last_error_;
    uint32_t retry_count_ = 0;
    uint64_t total_commands_ = 0;
    uint64_t failed_commands_ = 0;
    std::optional<Clock::time_point> last_success_at_;
};

} // namespace wit
