// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "octoprint_connection.h"

#include <spdlog/spdlog.h>

namespace wit {

namespace {

HttpOptions with_octoprint_probe(HttpOptions options) {
    options.probe_path = "/api/version";
    return options;
}

} // namespace

OctoPrintConnection::OctoPrintConnection(HttpOptions options,
                                         std::shared_ptr<HttpTransport> transport)
    : Connection("octoprint_" + options.base_url),
      http_(with_octoprint_probe(std::move(options)), std::move(transport)) {}

bool OctoPrintConnection::connect() {
    if (!http_.connect()) {
        return false;
    }

    auto info = http_.send_command("GET /api/server");
    if (info.ok() && info.data().contains("version") && info.data()["version"].is_string()) {
        server_version_ = info.data()["version"].get<std::string>();
        spdlog::info("[OctoPrintConnection] {} runs OctoPrint {}", http_.options().base_url,
                     server_version_);
    } else {
        // Pre-1.5 servers have no /api/server; the probe already succeeded
        spdlog::debug("[OctoPrintConnection] Server info unavailable: {}", info.error_message());
    }
    return true;
}

bool OctoPrintConnection::disconnect() {
    return http_.disconnect();
}

bool OctoPrintConnection::is_connected() const {
    return http_.is_connected();
}

CommandResult OctoPrintConnection::send_command(const std::string& command, const json& params) {
    return http_.send_command(command, params);
}

CommandResult OctoPrintConnection::pause_job() {
    return http_.send_command("POST /api/job", {{"command", "pause"}, {"action", "pause"}});
}

CommandResult OctoPrintConnection::resume_job() {
    return http_.send_command("POST /api/job", {{"command", "pause"}, {"action", "resume"}});
}

CommandResult OctoPrintConnection::cancel_job() {
    return http_.send_command("POST /api/job", {{"command", "cancel"}});
}

CommandResult OctoPrintConnection::start_job() {
    return http_.send_command("POST /api/job", {{"command", "start"}});
}

CommandResult OctoPrintConnection::select_and_print(const std::string& filename) {
    return http_.send_command("POST /api/files/local/" + url_encode(filename),
                              {{"command", "select"}, {"print", true}});
}

CommandResult OctoPrintConnection::get_printer_state() {
    return http_.send_command("GET /api/printer");
}

CommandResult OctoPrintConnection::get_job_info() {
    return http_.send_command("GET /api/job");
}

CommandResult OctoPrintConnection::upload(const std::string& filename, const std::string& content) {
    return http_.upload("/api/files/local", filename, content);
}

} // namespace wit
