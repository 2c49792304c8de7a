// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "http_connection.h"

#include <memory>
#include <string>

namespace wit {

/**
 * @brief OctoPrint REST transport with job-control verbs
 *
 * Wraps an HttpConnection rather than deriving from it; every call, including
 * the job verbs, is forwarded to the inner connection, so state() reports the
 * inner connection's counters.
 *
 * Job control uses OctoPrint's fixed envelope on POST /api/job:
 * - pause:  {"command":"pause","action":"pause"}
 * - resume: {"command":"pause","action":"resume"}
 * - cancel: {"command":"cancel"}
 */
class OctoPrintConnection : public Connection {
  public:
    /**
     * @param options Base URL and API key; probe_path is forced to /api/version
     * @param transport Request executor; nullptr selects the libhv transport
     */
    explicit OctoPrintConnection(HttpOptions options,
                                 std::shared_ptr<HttpTransport> transport = nullptr);

    /// Generic probe, then GET /api/server to log the server version
    bool connect() override;
    bool disconnect() override;
    bool is_connected() const override;
    CommandResult send_command(const std::string& command,
                               const json& params = json::object()) override;

    ConnectionKind kind() const override {
        return ConnectionKind::OCTOPRINT;
    }

    const ConnectionState& state() const override {
        return http_.state();
    }

    CommandResult pause_job();
    CommandResult resume_job();
    CommandResult cancel_job();

    /// Start the currently selected file
    CommandResult start_job();

    /// Select a file from local storage and start printing it
    CommandResult select_and_print(const std::string& filename);

    CommandResult get_printer_state();
    CommandResult get_job_info();

    CommandResult upload(const std::string& filename, const std::string& content);

    /// Version string reported by /api/server during connect(); empty if unknown
    const std::string& server_version() const {
        return server_version_;
    }

  private:
    HttpConnection http_;
    std::string server_version_;
};

} // namespace wit
