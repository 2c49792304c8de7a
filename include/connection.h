// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_result.h"
#include "connection_state.h"

#include <string>

namespace wit {

/**
 * @brief Transport tag for the closed set of Connection variants
 */
enum class ConnectionKind {
    SERIAL,    ///< Byte-stream line protocol (SerialConnection)
    HTTP,      ///< Generic REST API (HttpConnection)
    OCTOPRINT, ///< OctoPrint-flavoured REST API (OctoPrintConnection)
};

const char* to_string(ConnectionKind kind);

/**
 * @brief Abstract transport binding to one physical or virtual device
 *
 * Contract shared by every variant:
 * - connect()/disconnect() never throw; failure is a false return
 * - send_command() fails fast with error_code::CONNECTION_ERROR while
 *   is_connected() is false and performs no I/O in that case
 * - every call that performs I/O finishes with exactly one
 *   state().mark_success() or mark_failure()
 *
 * A Connection is exclusively owned by one Machine. Reconnecting to a
 * different device means building a new Connection.
 */
class Connection {
  public:
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    virtual bool connect() = 0;
    virtual bool disconnect() = 0;
    virtual bool is_connected() const = 0;

    /**
     * @brief Send one protocol command
     *
     * @param command Serial: a G-code/GRBL line. HTTP: "METHOD /path" or "/path" (GET)
     * @param params Serial: inline words (K<value>). HTTP: JSON body or query string
     */
    virtual CommandResult send_command(const std::string& command,
                                       const json& params = json::object()) = 0;

    virtual ConnectionKind kind() const = 0;

    const std::string& id() const {
        return id_;
    }

    /// Health counters; composed variants report their inner transport's state
    virtual const ConnectionState& state() const {
        return state_;
    }

  protected:
    explicit Connection(std::string id) : id_(std::move(id)) {}

    ConnectionState& mutable_state() {
        return state_;
    }

  private:
    std::string id_;
    ConnectionState state_;
};

} // namespace wit
