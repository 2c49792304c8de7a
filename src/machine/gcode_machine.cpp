// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file gcode_machine.cpp
 * @brief Machine commands as Marlin G-code / GRBL lines
 *
 * @gotchas Marlin reports SD progress and temperatures on the "ok" line or on
 *          the lines before it depending on build options; parsers scan all
 *          reply lines of the exchange
 */

#include "gcode_machine.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace wit {

namespace {

const CapabilitySet kGcodeTransportCaps = {
    MachineCapability::START,        MachineCapability::PAUSE,
    MachineCapability::RESUME,       MachineCapability::CANCEL,
    MachineCapability::TEMP_HOTEND,  MachineCapability::TEMP_BED,
    MachineCapability::TEMP_CHAMBER, MachineCapability::HOME,
    MachineCapability::JOG,          MachineCapability::PROGRESS,
    MachineCapability::LIST_FILES,   MachineCapability::DELETE_FILE,
    MachineCapability::EMERGENCY_STOP,
};

const CapabilitySet kGrblTransportCaps = {
    MachineCapability::HOME,
    MachineCapability::JOG,
    MachineCapability::EMERGENCY_STOP,
};

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

GcodeMachine::GcodeMachine(std::string id, std::unique_ptr<SerialConnection> connection,
                           MachineType type)
    : GcodeMachine(std::move(id), type, connection.release()) {}

GcodeMachine::GcodeMachine(std::string id, MachineType type, SerialConnection* connection)
    : Machine(std::move(id), type, std::unique_ptr<Connection>(connection),
              transport_capabilities(connection)),
      serial_(connection) {}

CapabilitySet GcodeMachine::transport_capabilities(const SerialConnection* connection) {
    if (!connection) {
        throw std::invalid_argument("GcodeMachine requires a serial connection");
    }
    return connection->options().dialect == SerialDialect::GRBL ? kGrblTransportCaps
                                                                : kGcodeTransportCaps;
}

ConnectionProtocol GcodeMachine::protocol() const {
    return is_grbl() ? ConnectionProtocol::SERIAL_GRBL : ConnectionProtocol::SERIAL_GCODE;
}

std::vector<std::string> GcodeMachine::response_lines(const CommandResult& result) {
    std::vector<std::string> lines;
    const auto& data = result.data();
    if (data.contains("response") && data["response"].is_array()) {
        for (const auto& line : data["response"]) {
            if (line.is_string()) {
                lines.push_back(line.get<std::string>());
            }
        }
    }
    return lines;
}

// ============================================================================
// Job control
// ============================================================================

CommandResult GcodeMachine::do_start(const std::string& file) {
    if (!file.empty()) {
        auto select = serial_->send_command("M23 " + file);
        if (!select) {
            return select;
        }
        // Marlin acknowledges a missing file with "open failed" followed by a plain "ok"
        for (const auto& line : response_lines(select)) {
            if (line.find("open failed") != std::string::npos) {
                return CommandResult::error("File not found on SD card: " + file,
                                            error_code::COMMAND_ERROR);
            }
        }
    }
    return serial_->send_command("M24");
}

CommandResult GcodeMachine::do_pause() {
    return serial_->send_command("M25");
}

CommandResult GcodeMachine::do_resume() {
    return serial_->send_command("M24");
}

CommandResult GcodeMachine::do_cancel() {
    auto paused = serial_->send_command("M25");
    if (!paused) {
        spdlog::warn("[GcodeMachine] {}: M25 before abort failed: {}", id(),
                     paused.error_message());
    }
    return serial_->send_command("M524");
}

CommandResult GcodeMachine::do_emergency_stop() {
    return serial_->send_command(is_grbl() ? "!" : "M112");
}

// ============================================================================
// Motion and temperature
// ============================================================================

CommandResult GcodeMachine::do_home(const std::vector<std::string>& axes) {
    if (is_grbl()) {
        return serial_->send_command("$H");
    }
    std::string line = "G28";
    for (const auto& axis : axes) {
        line += " " + upper(axis);
    }
    return serial_->send_command(line);
}

CommandResult GcodeMachine::do_jog(const std::string& axis, double distance,
                                   std::optional<double> speed) {
    if (is_grbl()) {
        // GRBL jogs need a feed rate; 1000 mm/min is a conservative default
        return serial_->send_command(
            fmt::format("$J=G91 {}{} F{}", upper(axis), distance, speed.value_or(1000.0)));
    }

    auto relative = serial_->send_command("G91");
    if (!relative) {
        return relative;
    }

    std::string move = fmt::format("G1 {}{}", upper(axis), distance);
    if (speed) {
        move += fmt::format(" F{}", *speed);
    }
    auto result = serial_->send_command(move);

    auto absolute = serial_->send_command("G90");
    if (!absolute) {
        spdlog::error("[GcodeMachine] {}: failed to restore absolute positioning: {}", id(),
                      absolute.error_message());
        if (result) {
            return absolute;
        }
    }
    return result;
}

CommandResult GcodeMachine::do_set_temperature(const std::string& zone, double target) {
    const char* code = "M104";
    if (zone == "bed") {
        code = "M140";
    } else if (zone == "chamber") {
        code = "M141";
    }
    return serial_->send_command(fmt::format("{} S{}", code, target));
}

// ============================================================================
// Queries
// ============================================================================

CommandResult GcodeMachine::get_temperatures() {
    if (is_grbl()) {
        return CommandResult::error("No heaters on a GRBL controller", error_code::NOT_SUPPORTED);
    }

    auto result = serial_->send_command("M105");
    if (!result) {
        return result;
    }

    json temps = json::object();
    for (const auto& line : response_lines(result)) {
        json parsed = parse_temperature_report(line);
        for (auto it = parsed.begin(); it != parsed.end(); ++it) {
            temps[it.key()] = it.value();
        }
    }
    if (temps.empty()) {
        return CommandResult::error("No temperature report in M105 reply",
                                    error_code::PARSE_ERROR);
    }
    return CommandResult::success(temps);
}

CommandResult GcodeMachine::get_progress() {
    if (is_grbl()) {
        return CommandResult::error("No job progress on a GRBL controller",
                                    error_code::NOT_SUPPORTED);
    }

    auto result = serial_->send_command("M27");
    if (!result) {
        return result;
    }

    for (const auto& line : response_lines(result)) {
        if (auto pct = parse_sd_progress(line)) {
            return CommandResult::success({{"progress", *pct}});
        }
    }
    return CommandResult::success({{"progress", nullptr}});
}

CommandResult GcodeMachine::get_time_remaining() {
    // Marlin has no portable remaining-time query
    return CommandResult::success({{"time_remaining", nullptr}});
}

CommandResult GcodeMachine::get_current_job() {
    PrinterState state = get_current_state();
    if (state != PrinterState::PRINTING && state != PrinterState::PAUSED) {
        return CommandResult::success({{"job", nullptr}});
    }

    json job = {{"file", current_file()}, {"state", to_string(state)}, {"progress", nullptr}};
    auto progress = get_progress();
    if (progress) {
        job["progress"] = progress.data()["progress"];
    }
    return CommandResult::success({{"job", job}});
}

// ============================================================================
// Files
// ============================================================================

CommandResult GcodeMachine::upload_file(const std::string& /*path*/,
                                        const std::string& /*content*/) {
    return CommandResult::error("File upload not supported over serial",
                                error_code::NOT_SUPPORTED);
}

CommandResult GcodeMachine::list_files(const std::string& path) {
    if (!has_capability(MachineCapability::LIST_FILES)) {
        return CommandResult::error("File listing not supported", error_code::NOT_SUPPORTED);
    }

    auto result = serial_->send_command(path.empty() ? "M20" : "M20 " + path);
    if (!result) {
        return result;
    }
    return CommandResult::success({{"files", parse_file_list(response_lines(result))}});
}

CommandResult GcodeMachine::delete_file(const std::string& path) {
    if (!has_capability(MachineCapability::DELETE_FILE)) {
        return CommandResult::error("File deletion not supported", error_code::NOT_SUPPORTED);
    }
    if (path.empty()) {
        return CommandResult::error("File path required", error_code::INVALID_PARAMETER);
    }
    return serial_->send_command("M30 " + path);
}

} // namespace wit
