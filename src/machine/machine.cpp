// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "machine.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>

namespace wit {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

CapabilitySet intersect(const CapabilitySet& a, const CapabilitySet& b) {
    CapabilitySet out;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                          std::inserter(out, out.begin()));
    return out;
}

} // namespace

Machine::Machine(std::string id, MachineType type, std::unique_ptr<Connection> connection,
                 const CapabilitySet& transport_capabilities)
    : id_(std::move(id)), machine_type_(type), connection_(std::move(connection)),
      capabilities_(intersect(default_capabilities(type), transport_capabilities)) {
    // Emergency stop must never be filtered away
    capabilities_.insert(MachineCapability::EMERGENCY_STOP);
}

void Machine::transition(PrinterState from, PrinterState to) {
    state_.store(to);
    spdlog::info("[Machine] {}: {} -> {}", id_, to_string(from), to_string(to));
}

CommandResult Machine::require_capability(MachineCapability capability, const char* what) const {
    if (!has_capability(capability)) {
        return CommandResult::error(std::string(what) + " not supported by this machine",
                                    error_code::NOT_SUPPORTED);
    }
    return CommandResult::success();
}

bool Machine::connect() {
    if (!connection_->connect()) {
        spdlog::warn("[Machine] {}: connect failed", id_);
        return false;
    }
    PrinterState current = state_.load();
    if (current == PrinterState::DISCONNECTED) {
        transition(current, PrinterState::IDLE);
    }
    on_connected();
    return true;
}

bool Machine::disconnect() {
    bool ok = connection_->disconnect();
    PrinterState current = state_.load();
    if (current == PrinterState::IDLE) {
        transition(current, PrinterState::DISCONNECTED);
    }
    return ok;
}

CommandResult Machine::start(const std::string& file) {
    PrinterState current = state_.load();
    if (current != PrinterState::IDLE) {
        return CommandResult::error("Cannot start: not idle", error_code::INVALID_STATE);
    }
    if (auto r = require_capability(MachineCapability::START, "start"); !r) {
        return r;
    }

    auto result = do_start(file);
    if (result) {
        current_file_ = file;
        transition(current, PrinterState::PRINTING);
    }
    return result;
}

CommandResult Machine::pause() {
    PrinterState current = state_.load();
    if (current != PrinterState::PRINTING) {
        return CommandResult::error("Cannot pause: not printing", error_code::INVALID_STATE);
    }
    if (auto r = require_capability(MachineCapability::PAUSE, "pause"); !r) {
        return r;
    }

    auto result = do_pause();
    if (result) {
        transition(current, PrinterState::PAUSED);
    }
    return result;
}

CommandResult Machine::resume() {
    PrinterState current = state_.load();
    if (current != PrinterState::PAUSED) {
        return CommandResult::error("Cannot resume: not paused", error_code::INVALID_STATE);
    }
    if (auto r = require_capability(MachineCapability::RESUME, "resume"); !r) {
        return r;
    }

    auto result = do_resume();
    if (result) {
        transition(current, PrinterState::PRINTING);
    }
    return result;
}

CommandResult Machine::cancel() {
    PrinterState current = state_.load();
    if (current != PrinterState::PRINTING && current != PrinterState::PAUSED) {
        return CommandResult::error("Cannot cancel: not printing or paused",
                                    error_code::INVALID_STATE);
    }
    if (auto r = require_capability(MachineCapability::CANCEL, "cancel"); !r) {
        return r;
    }

    auto result = do_cancel();
    if (result) {
        current_file_.clear();
        transition(current, PrinterState::CANCELLED);
    }
    return result;
}

CommandResult Machine::emergency_stop() {
    PrinterState previous = state_.exchange(PrinterState::ERROR);
    spdlog::warn("[Machine] {}: EMERGENCY STOP (was {})", id_, to_string(previous));

    auto result = do_emergency_stop();
    if (!result) {
        spdlog::error("[Machine] {}: emergency stop not acknowledged: {}", id_,
                      result.error_message());
    }
    return CommandResult::success({{"transport_acknowledged", result.ok()},
                                   {"transport_error", result.error_message()},
                                   {"previous_state", to_string(previous)}});
}

CommandResult Machine::home(const std::vector<std::string>& axes) {
    if (auto r = require_capability(MachineCapability::HOME, "home"); !r) {
        return r;
    }

    std::vector<std::string> normalized;
    for (const auto& axis : axes) {
        std::string a = lower(axis);
        if (a != "x" && a != "y" && a != "z") {
            return CommandResult::error("Invalid home axis: " + axis, error_code::INVALID_AXIS);
        }
        if (std::find(normalized.begin(), normalized.end(), a) == normalized.end()) {
            normalized.push_back(a);
        }
    }
    return do_home(normalized);
}

CommandResult Machine::jog(const std::string& axis, double distance,
                           std::optional<double> speed) {
    if (auto r = require_capability(MachineCapability::JOG, "jog"); !r) {
        return r;
    }

    std::string a = lower(axis);
    if (a != "x" && a != "y" && a != "z" && a != "e") {
        return CommandResult::error("Invalid jog axis: " + axis, error_code::INVALID_AXIS);
    }
    if (!std::isfinite(distance)) {
        return CommandResult::error("Jog distance must be finite", error_code::INVALID_PARAMETER);
    }
    if (speed && (!std::isfinite(*speed) || *speed <= 0)) {
        return CommandResult::error("Jog speed must be positive", error_code::INVALID_PARAMETER);
    }
    return do_jog(a, distance, speed);
}

CommandResult Machine::set_temperature(const std::string& zone, double target) {
    std::string z = lower(zone);
    MachineCapability capability;
    if (z == "hotend") {
        capability = MachineCapability::TEMP_HOTEND;
    } else if (z == "bed") {
        capability = MachineCapability::TEMP_BED;
    } else if (z == "chamber") {
        capability = MachineCapability::TEMP_CHAMBER;
    } else {
        return CommandResult::error("Unknown zone: " + zone, error_code::INVALID_ZONE);
    }

    if (!std::isfinite(target) || target < 0 || target > kMaxTemperatureTarget) {
        return CommandResult::error("Temperature target out of range (0-500)",
                                    error_code::INVALID_PARAMETER);
    }
    if (auto r = require_capability(capability, "temperature zone"); !r) {
        return r;
    }
    return do_set_temperature(z, target);
}

json Machine::get_info() const {
    json caps = json::array();
    for (auto c : capabilities_) {
        caps.push_back(to_string(c));
    }
    return {{"id", id_},
            {"machine_type", to_string(machine_type_)},
            {"protocol", to_string(protocol())},
            {"state", to_string(state_.load())},
            {"capabilities", caps},
            {"connection",
             {{"id", connection_->id()},
              {"kind", to_string(connection_->kind())},
              {"healthy", connection_->state().is_healthy()},
              {"state", connection_->state().to_json()}}}};
}

} // namespace wit
