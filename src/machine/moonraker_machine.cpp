// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file moonraker_machine.cpp
 * @brief Machine commands over Moonraker's HTTP API
 *
 * @pattern Print verbs under /printer/print/, motion and heaters as G-code
 *          scripts, file operations under /server/files/
 * @gotchas Every Moonraker reply wraps its payload in {"result": ...}
 */

#include "moonraker_machine.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace wit {

namespace {

const CapabilitySet kMoonrakerTransportCaps = {
    MachineCapability::START,        MachineCapability::PAUSE,
    MachineCapability::RESUME,       MachineCapability::CANCEL,
    MachineCapability::TEMP_HOTEND,  MachineCapability::TEMP_BED,
    MachineCapability::TEMP_CHAMBER, MachineCapability::HOME,
    MachineCapability::JOG,          MachineCapability::UPLOAD,
    MachineCapability::LIST_FILES,   MachineCapability::DELETE_FILE,
    MachineCapability::PROGRESS,     MachineCapability::CAMERA,
    MachineCapability::EMERGENCY_STOP,
};

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

const json& unwrap_result(const json& data) {
    if (data.contains("result")) {
        return data["result"];
    }
    return data;
}

std::optional<double> number_at(const json& status, const char* object, const char* field) {
    if (status.contains(object) && status[object].is_object() &&
        status[object].contains(field) && status[object][field].is_number()) {
        return status[object][field].get<double>();
    }
    return std::nullopt;
}

} // namespace

HttpOptions moonraker_http_options(std::string base_url, std::string api_key) {
    HttpOptions options;
    options.base_url = std::move(base_url);
    options.api_key = std::move(api_key);
    options.probe_path = "/server/info";
    return options;
}

MoonrakerMachine::MoonrakerMachine(std::string id, std::unique_ptr<HttpConnection> connection,
                                   MachineType type)
    : MoonrakerMachine(std::move(id), type, connection.release()) {}

MoonrakerMachine::MoonrakerMachine(std::string id, MachineType type, HttpConnection* connection)
    : Machine(std::move(id), type, std::unique_ptr<Connection>(connection),
              kMoonrakerTransportCaps),
      http_(connection) {
    if (!http_) {
        throw std::invalid_argument("MoonrakerMachine requires a connection");
    }
}

CommandResult MoonrakerMachine::run_gcode(const std::string& script) {
    spdlog::debug("[MoonrakerMachine] {}: gcode '{}'", id(), script);
    return http_->send_command("POST /printer/gcode/script", {{"script", script}});
}

CommandResult MoonrakerMachine::query_objects(const json& objects) {
    auto result = http_->send_command("GET /printer/objects/query", objects);
    if (!result) {
        return result;
    }
    const json& payload = unwrap_result(result.data());
    if (!payload.contains("status") || !payload["status"].is_object()) {
        return CommandResult::error("No status in objects query reply", error_code::PARSE_ERROR);
    }
    return CommandResult::success(payload["status"]);
}

// ============================================================================
// Job control
// ============================================================================

CommandResult MoonrakerMachine::do_start(const std::string& file) {
    if (file.empty()) {
        return CommandResult::error("Moonraker requires a file to start",
                                    error_code::INVALID_PARAMETER);
    }
    return http_->send_command("POST /printer/print/start", {{"filename", file}});
}

CommandResult MoonrakerMachine::do_pause() {
    return http_->send_command("POST /printer/print/pause");
}

CommandResult MoonrakerMachine::do_resume() {
    return http_->send_command("POST /printer/print/resume");
}

CommandResult MoonrakerMachine::do_cancel() {
    return http_->send_command("POST /printer/print/cancel");
}

CommandResult MoonrakerMachine::do_emergency_stop() {
    return http_->send_command("POST /printer/emergency_stop");
}

// ============================================================================
// Motion and temperature
// ============================================================================

CommandResult MoonrakerMachine::do_home(const std::vector<std::string>& axes) {
    std::string script = "G28";
    for (const auto& axis : axes) {
        script += " " + upper(axis);
    }
    return run_gcode(script);
}

CommandResult MoonrakerMachine::do_jog(const std::string& axis, double distance,
                                       std::optional<double> speed) {
    std::string move = fmt::format("G1 {}{}", upper(axis), distance);
    if (speed) {
        move += fmt::format(" F{}", *speed);
    }
    // One script so Klipper restores absolute mode even if the move is rejected mid-way
    return run_gcode("G91\n" + move + "\nG90");
}

CommandResult MoonrakerMachine::do_set_temperature(const std::string& zone, double target) {
    const char* heater = "extruder";
    if (zone == "bed") {
        heater = "heater_bed";
    } else if (zone == "chamber") {
        heater = "chamber";
    }
    return run_gcode(fmt::format("SET_HEATER_TEMPERATURE HEATER={} TARGET={}", heater, target));
}

// ============================================================================
// Queries
// ============================================================================

CommandResult MoonrakerMachine::get_temperatures() {
    auto status = query_objects({{"extruder", "temperature,target"},
                                 {"heater_bed", "temperature,target"}});
    if (!status) {
        return status;
    }

    json temps = json::object();
    const std::pair<const char*, const char*> heaters[] = {{"extruder", "hotend"},
                                                           {"heater_bed", "bed"}};
    for (const auto& [object, zone] : heaters) {
        auto current = number_at(status.data(), object, "temperature");
        if (current) {
            temps[zone] = {*current, number_at(status.data(), object, "target").value_or(0.0)};
        }
    }
    return CommandResult::success(temps);
}

CommandResult MoonrakerMachine::get_progress() {
    auto status = query_objects({{"virtual_sdcard", "progress"}});
    if (!status) {
        return status;
    }
    auto fraction = number_at(status.data(), "virtual_sdcard", "progress");
    if (!fraction) {
        return CommandResult::success({{"progress", nullptr}});
    }
    return CommandResult::success({{"progress", *fraction * 100.0}});
}

CommandResult MoonrakerMachine::get_time_remaining() {
    auto status =
        query_objects({{"virtual_sdcard", "progress"}, {"print_stats", "print_duration"}});
    if (!status) {
        return status;
    }
    auto fraction = number_at(status.data(), "virtual_sdcard", "progress");
    auto elapsed = number_at(status.data(), "print_stats", "print_duration");
    if (!fraction || !elapsed || *fraction <= 0.0) {
        return CommandResult::success({{"time_remaining", nullptr}});
    }
    // Linear extrapolation from file progress
    double total = *elapsed / *fraction;
    return CommandResult::success(
        {{"time_remaining", static_cast<long long>(std::max(0.0, total - *elapsed))}});
}

CommandResult MoonrakerMachine::get_current_job() {
    PrinterState state = get_current_state();
    if (state != PrinterState::PRINTING && state != PrinterState::PAUSED) {
        return CommandResult::success({{"job", nullptr}});
    }

    auto status = query_objects({{"print_stats", "filename,state,print_duration"},
                                 {"virtual_sdcard", "progress"}});
    if (!status) {
        return status;
    }
    const json& s = status.data();

    json info = {{"file", current_file()}, {"state", to_string(state)}, {"progress", nullptr}};
    if (s.contains("print_stats") && s["print_stats"].is_object()) {
        const auto& ps = s["print_stats"];
        if (ps.contains("filename") && ps["filename"].is_string()) {
            info["file"] = ps["filename"];
        }
        if (ps.contains("state") && ps["state"].is_string()) {
            info["server_state"] = ps["state"];
        }
        info["print_duration"] = ps.value("print_duration", json(nullptr));
    }
    if (auto fraction = number_at(s, "virtual_sdcard", "progress")) {
        info["progress"] = *fraction * 100.0;
    }
    return CommandResult::success({{"job", info}});
}

// ============================================================================
// Files
// ============================================================================

CommandResult MoonrakerMachine::upload_file(const std::string& path, const std::string& content) {
    if (path.empty()) {
        return CommandResult::error("File path required", error_code::INVALID_PARAMETER);
    }

    std::map<std::string, std::string> fields = {{"root", "gcodes"}};
    std::string filename = path;
    auto slash = path.rfind('/');
    if (slash != std::string::npos) {
        fields["path"] = path.substr(0, slash);
        filename = path.substr(slash + 1);
    }
    return http_->upload("/server/files/upload", filename, content, fields);
}

CommandResult MoonrakerMachine::list_files(const std::string& path) {
    auto result = http_->send_command("GET /server/files/list", {{"root", "gcodes"}});
    if (!result) {
        return result;
    }

    const json& payload = unwrap_result(result.data());
    json files = json::array();
    if (payload.is_array()) {
        for (const auto& f : payload) {
            if (!f.is_object() || !f.contains("path") || !f["path"].is_string()) {
                continue;
            }
            std::string name = f["path"].get<std::string>();
            if (!path.empty() && name.rfind(path, 0) != 0) {
                continue;
            }
            json entry = {{"name", name}};
            if (f.contains("size") && f["size"].is_number()) {
                entry["size"] = f["size"];
            }
            if (f.contains("modified") && f["modified"].is_number()) {
                entry["modified"] = f["modified"];
            }
            files.push_back(entry);
        }
    }
    return CommandResult::success({{"files", files}});
}

CommandResult MoonrakerMachine::delete_file(const std::string& path) {
    if (path.empty()) {
        return CommandResult::error("File path required", error_code::INVALID_PARAMETER);
    }
    return http_->send_command("DELETE /server/files/gcodes/" + url_encode(path));
}

} // namespace wit
