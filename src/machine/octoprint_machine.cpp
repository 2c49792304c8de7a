// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "octoprint_machine.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace wit {

namespace {

const CapabilitySet kOctoPrintTransportCaps = {
    MachineCapability::START,        MachineCapability::PAUSE,
    MachineCapability::RESUME,       MachineCapability::CANCEL,
    MachineCapability::TEMP_HOTEND,  MachineCapability::TEMP_BED,
    MachineCapability::TEMP_CHAMBER, MachineCapability::HOME,
    MachineCapability::JOG,          MachineCapability::UPLOAD,
    MachineCapability::LIST_FILES,   MachineCapability::DELETE_FILE,
    MachineCapability::PROGRESS,     MachineCapability::CAMERA,
    MachineCapability::EMERGENCY_STOP,
};

/// {"actual": a, "target": t} -> [a, t]; null when either is missing
json temperature_pair(const json& node) {
    if (!node.is_object() || !node.contains("actual") || !node["actual"].is_number()) {
        return nullptr;
    }
    double target = node.contains("target") && node["target"].is_number()
                        ? node["target"].get<double>()
                        : 0.0;
    return json::array({node["actual"].get<double>(), target});
}

} // namespace

OctoPrintMachine::OctoPrintMachine(std::string id, std::unique_ptr<OctoPrintConnection> connection,
                                   MachineType type, ConnectionProtocol protocol)
    : OctoPrintMachine(std::move(id), type, protocol, connection.release()) {}

OctoPrintMachine::OctoPrintMachine(std::string id, MachineType type, ConnectionProtocol protocol,
                                   OctoPrintConnection* connection)
    : Machine(std::move(id), type, std::unique_ptr<Connection>(connection),
              kOctoPrintTransportCaps),
      octo_(connection), protocol_(protocol) {
    if (!octo_) {
        throw std::invalid_argument("OctoPrintMachine requires a connection");
    }
}

// ============================================================================
// Job control
// ============================================================================

CommandResult OctoPrintMachine::do_start(const std::string& file) {
    return file.empty() ? octo_->start_job() : octo_->select_and_print(file);
}

CommandResult OctoPrintMachine::do_pause() {
    return octo_->pause_job();
}

CommandResult OctoPrintMachine::do_resume() {
    return octo_->resume_job();
}

CommandResult OctoPrintMachine::do_cancel() {
    return octo_->cancel_job();
}

CommandResult OctoPrintMachine::do_emergency_stop() {
    return octo_->send_command("POST /api/printer/command", {{"commands", json::array({"M112"})}});
}

// ============================================================================
// Motion and temperature
// ============================================================================

CommandResult OctoPrintMachine::do_home(const std::vector<std::string>& axes) {
    json list = axes.empty() ? json::array({"x", "y", "z"}) : json(axes);
    return octo_->send_command("POST /api/printer/printhead",
                               {{"command", "home"}, {"axes", list}});
}

CommandResult OctoPrintMachine::do_jog(const std::string& axis, double distance,
                                       std::optional<double> speed) {
    if (axis == "e") {
        // Extruder moves go through the tool endpoint
        return octo_->send_command("POST /api/printer/tool",
                                   {{"command", "extrude"}, {"amount", distance}});
    }

    json body = {{"command", "jog"}, {axis, distance}};
    if (speed) {
        body["speed"] = *speed;
    }
    return octo_->send_command("POST /api/printer/printhead", body);
}

CommandResult OctoPrintMachine::do_set_temperature(const std::string& zone, double target) {
    if (zone == "hotend") {
        return octo_->send_command("POST /api/printer/tool",
                                   {{"command", "target"}, {"targets", {{"tool0", target}}}});
    }
    if (zone == "bed") {
        return octo_->send_command("POST /api/printer/bed",
                                   {{"command", "target"}, {"target", target}});
    }
    return octo_->send_command("POST /api/printer/chamber",
                               {{"command", "target"}, {"target", target}});
}

// ============================================================================
// Queries
// ============================================================================

CommandResult OctoPrintMachine::get_temperatures() {
    auto printer = octo_->get_printer_state();
    if (!printer) {
        return printer;
    }

    const auto& data = printer.data();
    if (!data.contains("temperature") || !data["temperature"].is_object()) {
        return CommandResult::error("No temperature block in /api/printer reply",
                                    error_code::PARSE_ERROR);
    }

    const auto& t = data["temperature"];
    json temps = json::object();
    const std::pair<const char*, const char*> zones[] = {
        {"tool0", "hotend"}, {"bed", "bed"}, {"chamber", "chamber"}};
    for (const auto& [key, zone] : zones) {
        if (t.contains(key)) {
            json pair = temperature_pair(t[key]);
            if (!pair.is_null()) {
                temps[zone] = pair;
            }
        }
    }
    return CommandResult::success(temps);
}

CommandResult OctoPrintMachine::get_progress() {
    auto job = octo_->get_job_info();
    if (!job) {
        return job;
    }
    const auto& data = job.data();
    json completion = data.contains("progress") && data["progress"].is_object()
                          ? data["progress"].value("completion", json(nullptr))
                          : json(nullptr);
    return CommandResult::success({{"progress", completion.is_number() ? completion : nullptr}});
}

CommandResult OctoPrintMachine::get_time_remaining() {
    auto job = octo_->get_job_info();
    if (!job) {
        return job;
    }
    const auto& data = job.data();
    json left = data.contains("progress") && data["progress"].is_object()
                    ? data["progress"].value("printTimeLeft", json(nullptr))
                    : json(nullptr);
    return CommandResult::success({{"time_remaining", left.is_number() ? left : nullptr}});
}

CommandResult OctoPrintMachine::get_current_job() {
    PrinterState state = get_current_state();
    if (state != PrinterState::PRINTING && state != PrinterState::PAUSED) {
        return CommandResult::success({{"job", nullptr}});
    }

    auto job = octo_->get_job_info();
    if (!job) {
        return job;
    }
    const auto& data = job.data();

    json info = {{"file", current_file()}, {"state", to_string(state)}};
    if (data.contains("job") && data["job"].is_object()) {
        const auto& j = data["job"];
        if (j.contains("file") && j["file"].is_object() && j["file"].contains("name") &&
            j["file"]["name"].is_string()) {
            info["file"] = j["file"]["name"];
        }
        info["estimated_print_time"] = j.value("estimatedPrintTime", json(nullptr));
    }
    if (data.contains("progress") && data["progress"].is_object()) {
        info["progress"] = data["progress"].value("completion", json(nullptr));
        info["time_remaining"] = data["progress"].value("printTimeLeft", json(nullptr));
    }
    if (data.contains("state") && data["state"].is_string()) {
        info["server_state"] = data["state"];
    }
    return CommandResult::success({{"job", info}});
}

CommandResult OctoPrintMachine::get_reported_state() {
    auto printer = octo_->get_printer_state();
    if (!printer) {
        return printer;
    }
    const auto& data = printer.data();
    if (!data.contains("state") || !data["state"].is_object() ||
        !data["state"].contains("text") || !data["state"]["text"].is_string()) {
        return CommandResult::error("No state text in /api/printer reply",
                                    error_code::PARSE_ERROR);
    }
    std::string text = data["state"]["text"].get<std::string>();
    PrinterState reported = normalize_printer_state(text, PrinterState::ERROR);
    return CommandResult::success({{"text", text}, {"state", to_string(reported)}});
}

// ============================================================================
// Files
// ============================================================================

CommandResult OctoPrintMachine::upload_file(const std::string& path, const std::string& content) {
    if (path.empty()) {
        return CommandResult::error("File path required", error_code::INVALID_PARAMETER);
    }
    return octo_->upload(path, content);
}

CommandResult OctoPrintMachine::list_files(const std::string& path) {
    auto result = octo_->send_command(path.empty() ? "GET /api/files"
                                                   : "GET /api/files/local/" + url_encode(path));
    if (!result) {
        return result;
    }

    const auto& data = result.data();
    json files = json::array();
    const json* source = nullptr;
    if (data.contains("files") && data["files"].is_array()) {
        source = &data["files"];
    } else if (data.contains("children") && data["children"].is_array()) {
        source = &data["children"];
    }
    if (source) {
        for (const auto& f : *source) {
            if (!f.is_object()) {
                continue;
            }
            std::string name;
            if (f.contains("path") && f["path"].is_string()) {
                name = f["path"].get<std::string>();
            } else if (f.contains("name") && f["name"].is_string()) {
                name = f["name"].get<std::string>();
            } else {
                continue;
            }
            json entry = {{"name", name}};
            if (f.contains("size") && f["size"].is_number()) {
                entry["size"] = f["size"];
            }
            if (f.contains("type") && f["type"].is_string()) {
                entry["type"] = f["type"];
            }
            files.push_back(entry);
        }
    }
    return CommandResult::success({{"files", files}});
}

CommandResult OctoPrintMachine::delete_file(const std::string& path) {
    if (path.empty()) {
        return CommandResult::error("File path required", error_code::INVALID_PARAMETER);
    }
    return octo_->send_command("DELETE /api/files/local/" + url_encode(path));
}

} // namespace wit
