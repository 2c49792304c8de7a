// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file serial_connection.cpp
 * @brief G-code / GRBL line protocol over a SerialPort
 *
 * @threading All port I/O happens under io_mutex_; callers may use one
 *            SerialConnection from several threads but commands never interleave
 * @gotchas Marlin answers M112 by halting without "ok"; GRBL's "?" status query is
 *          a realtime command answered by a "<...>" line and no "ok"
 */

#include "serial_connection.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace wit {

namespace {

constexpr int kHandshakeAttempts = 3;

// Marlin follows "Error:..." with its own "ok"; GRBL's "error:N" replaces it
constexpr std::chrono::milliseconds kErrorDrainGrace{200};

bool starts_with_ci(const std::string& s, const char* prefix) {
    size_t n = std::char_traits<char>::length(prefix);
    if (s.size() < n) {
        return false;
    }
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& s) {
    auto start =
        std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                   return std::isspace(c);
               }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool is_ok_line(const std::string& line) {
    return line == "ok" || starts_with_ci(line, "ok ");
}

/// Extract the device's complaint from an error line, or nullopt if the line is not one
std::optional<std::string> error_text(const std::string& line) {
    if (starts_with_ci(line, "error:")) {
        std::string msg = trim(line.substr(6));
        return msg.empty() ? line : msg;
    }
    if (starts_with_ci(line, "!!") || starts_with_ci(line, "alarm:")) {
        return line;
    }
    return std::nullopt;
}

bool is_busy_line(const std::string& line) {
    return starts_with_ci(line, "echo:busy") || starts_with_ci(line, "busy:");
}

} // namespace

SerialConnection::SerialConnection(std::string device, SerialOptions options,
                                   std::unique_ptr<SerialPort> port)
    : Connection("serial_" + device), device_(std::move(device)), options_(options),
      port_(port ? std::move(port) : std::make_unique<PosixSerialPort>()) {}

SerialConnection::~SerialConnection() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (port_->is_open()) {
        port_->close();
    }
}

std::vector<SerialPortInfo> SerialConnection::list_ports() {
    auto enumerator = SerialPortEnumerator::create();
    return list_ports(*enumerator);
}

std::vector<SerialPortInfo> SerialConnection::list_ports(SerialPortEnumerator& enumerator) {
    return enumerator.list_ports();
}

bool SerialConnection::connected_locked() const {
    return port_->is_open() && state().connected();
}

bool SerialConnection::is_connected() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return connected_locked();
}

bool SerialConnection::connect() {
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (connected_locked()) {
        return true;
    }

    mutable_state().reset_for_reconnect();
    firmware_info_.clear();

    std::string error;
    if (!port_->open(device_, options_.baud_rate, options_.read_timeout, error)) {
        spdlog::error("[SerialConnection] Failed to open {}: {}", device_, error);
        mutable_state().mark_failure(error);
        return false;
    }

    port_->flush_buffers();

    if (!perform_handshake(error)) {
        spdlog::warn("[SerialConnection] {} rejected: {}", device_, error);
        port_->close();
        mutable_state().mark_failure(std::string(error_code::HANDSHAKE_FAILED) + ": " + error);
        return false;
    }

    mutable_state().set_connected(true);
    mutable_state().mark_success();

    auto fw = firmware_info_.find("FIRMWARE_NAME");
    spdlog::info("[SerialConnection] Connected to {} at {} baud ({})", device_,
                 options_.baud_rate, fw != firmware_info_.end() ? fw->second : "unknown firmware");
    return true;
}

bool SerialConnection::disconnect() {
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (port_->is_open()) {
        port_->close();
    }
    mutable_state().set_connected(false);
    spdlog::info("[SerialConnection] Disconnected from {}", device_);
    return true;
}

bool SerialConnection::perform_handshake(std::string& error) {
    const bool grbl = options_.dialect == SerialDialect::GRBL;
    const char* ident_cmd = grbl ? "$I" : "M115";

    auto deadline = std::chrono::steady_clock::now() + options_.handshake_timeout;
    bool identified = false;

    for (int attempt = 0; attempt < kHandshakeAttempts; ++attempt) {
        if (!port_->write_line(ident_cmd, error)) {
            return false;
        }
        spdlog::debug("[SerialConnection] {} -> {} (attempt {})", device_, ident_cmd,
                      attempt + 1);

        while (std::chrono::steady_clock::now() < deadline) {
            std::string read_error;
            auto line = port_->read_line(read_error);
            if (!line) {
                if (!read_error.empty()) {
                    error = read_error;
                    return false;
                }
                break; // quiet period: resend the identification command
            }

            std::string text = trim(*line);
            if (text.empty()) {
                continue;
            }
            spdlog::trace("[SerialConnection] {} <- {}", device_, text);

            if (!grbl) {
                auto info = parse_firmware_info(text);
                if (!info.empty()) {
                    firmware_info_ = std::move(info);
                    identified = true;
                    continue;
                }
            } else if (starts_with_ci(text, "[VER:") || starts_with_ci(text, "Grbl ")) {
                firmware_info_["FIRMWARE_NAME"] = text;
                identified = true;
                continue;
            }

            if (is_ok_line(text)) {
                if (identified) {
                    return true;
                }
                error = std::string("Reply to ") + ident_cmd + " carried no identification";
                return false;
            }
            if (auto err = error_text(text)) {
                error = "Identification rejected: " + *err;
                return false;
            }
            // Boot banners, echo: lines and capability reports are ignored
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    error = std::string("No reply to ") + ident_cmd;
    return false;
}

CommandResult SerialConnection::send_command(const std::string& command, const json& params) {
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (!connected_locked()) {
        return CommandResult::error("Not connected", error_code::CONNECTION_ERROR);
    }

    std::string line = command;
    std::string words = format_gcode_params(params);
    if (!words.empty()) {
        line += " " + words;
    }

    return exchange(line, options_.command_timeout);
}

CommandResult SerialConnection::exchange(const std::string& line,
                                         std::chrono::milliseconds timeout) {
    // Late replies to an earlier command must not be read as this one's
    port_->discard_input();

    std::string error;
    if (!port_->write_line(line, error)) {
        spdlog::error("[SerialConnection] Write to {} failed: {}", device_, error);
        mutable_state().mark_failure(error);
        port_->close();
        mutable_state().set_connected(false);
        return CommandResult::error(error, error_code::CONNECTION_ERROR);
    }
    spdlog::debug("[SerialConnection] {} -> {}", device_, line);

    const bool realtime_status = (line == "?");
    std::vector<std::string> response;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        std::string read_error;
        auto reply = port_->read_line(read_error);
        if (!reply) {
            if (!read_error.empty()) {
                spdlog::error("[SerialConnection] Read from {} failed: {}", device_, read_error);
                mutable_state().mark_failure(read_error);
                port_->close();
                mutable_state().set_connected(false);
                return CommandResult::error(read_error, error_code::CONNECTION_ERROR);
            }
            continue;
        }

        std::string text = trim(*reply);
        if (text.empty()) {
            continue;
        }
        spdlog::trace("[SerialConnection] {} <- {}", device_, text);

        if (is_busy_line(text)) {
            deadline = std::chrono::steady_clock::now() + timeout;
            continue;
        }

        if (auto err = error_text(text)) {
            drain_after_error(std::min(kErrorDrainGrace, timeout));
            mutable_state().mark_failure(*err);
            return CommandResult::error(*err, error_code::COMMAND_ERROR);
        }

        response.push_back(text);

        if (is_ok_line(text) || (realtime_status && text.front() == '<')) {
            mutable_state().mark_success();
            return CommandResult::success({{"command", line}, {"response", response}});
        }
    }

    spdlog::warn("[SerialConnection] {} timed out waiting for reply to '{}'", device_, line);
    mutable_state().mark_failure("Command timeout");
    return CommandResult::error("Command timeout", error_code::TIMEOUT);
}

void SerialConnection::drain_after_error(std::chrono::milliseconds grace) {
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        std::string read_error;
        auto reply = port_->read_line(read_error);
        if (!reply) {
            if (!read_error.empty()) {
                return;
            }
            continue;
        }
        std::string text = trim(*reply);
        if (is_ok_line(text)) {
            return;
        }
        spdlog::trace("[SerialConnection] {} <- {} (after error)", device_, text);
    }
}

// ============================================================================
// Reply parsers
// ============================================================================

std::string format_gcode_params(const json& params) {
    if (!params.is_object() || params.empty()) {
        return "";
    }

    std::ostringstream out;
    bool first = true;
    for (auto it = params.begin(); it != params.end(); ++it) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << it.key();
        const auto& v = it.value();
        if (v.is_string()) {
            out << v.get<std::string>();
        } else if (v.is_number_integer()) {
            out << v.get<long long>();
        } else if (v.is_number()) {
            out << v.get<double>();
        } else if (v.is_boolean()) {
            out << (v.get<bool>() ? 1 : 0);
        }
    }
    return out.str();
}

std::map<std::string, std::string> parse_firmware_info(const std::string& line) {
    static const std::regex key_re(R"((^|\s)([A-Z][A-Z0-9_]*):)");

    struct KeyPos {
        std::string key;
        size_t key_start;
        size_t value_start;
    };
    std::vector<KeyPos> keys;

    for (auto it = std::sregex_iterator(line.begin(), line.end(), key_re);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        size_t key_start = static_cast<size_t>(m.position(2));
        keys.push_back({m.str(2), key_start, key_start + m.length(2) + 1});
    }

    std::map<std::string, std::string> info;
    for (size_t i = 0; i < keys.size(); ++i) {
        size_t end = (i + 1 < keys.size()) ? keys[i + 1].key_start : line.size();
        info[keys[i].key] = trim(line.substr(keys[i].value_start, end - keys[i].value_start));
    }

    if (info.find("FIRMWARE_NAME") == info.end()) {
        return {};
    }
    return info;
}

json parse_temperature_report(const std::string& line) {
    static const std::regex temp_re(R"((T\d?|B|C):\s*(-?[\d.]+)\s*/\s*(-?[\d.]+))");

    json temps = json::object();
    for (auto it = std::sregex_iterator(line.begin(), line.end(), temp_re);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        std::string tag = m.str(1);
        std::string zone;
        if (tag == "B") {
            zone = "bed";
        } else if (tag == "C") {
            zone = "chamber";
        } else if (tag == "T" || tag == "T0") {
            zone = "hotend";
        } else {
            zone = "hotend" + tag.substr(1);
        }
        if (temps.contains(zone)) {
            continue;
        }
        try {
            temps[zone] = {std::stod(m.str(2)), std::stod(m.str(3))};
        } catch (const std::exception&) {
            spdlog::trace("[SerialConnection] Unparseable temperature '{}'", m.str(0));
        }
    }
    return temps;
}

json parse_position_report(const std::string& line) {
    static const std::regex pos_re(R"(([XYZE]):\s*(-?[\d.]+))");

    // Marlin appends stepper counts after "Count"; only the first block is the position
    std::string head = line.substr(0, line.find("Count"));

    json pos = json::object();
    for (auto it = std::sregex_iterator(head.begin(), head.end(), pos_re);
         it != std::sregex_iterator(); ++it) {
        std::string axis(1, static_cast<char>(std::tolower(it->str(1)[0])));
        try {
            pos[axis] = std::stod(it->str(2));
        } catch (const std::exception&) {
            return json::object();
        }
    }
    return pos;
}

json parse_grbl_status(const std::string& line) {
    static const std::regex status_re(
        R"(<([^|,>]+)[|,](?:MPos|WPos):(-?[\d.]+),(-?[\d.]+),(-?[\d.]+))");

    std::smatch m;
    if (!std::regex_search(line, m, status_re)) {
        return json::object();
    }
    try {
        return {{"state", m.str(1)},
                {"mpos",
                 {{"x", std::stod(m.str(2))}, {"y", std::stod(m.str(3))},
                  {"z", std::stod(m.str(4))}}}};
    } catch (const std::exception&) {
        return json::object();
    }
}

std::optional<double> parse_sd_progress(const std::string& line) {
    static const std::regex sd_re(R"(SD printing byte (\d+)\s*/\s*(\d+))");

    std::smatch m;
    if (!std::regex_search(line, m, sd_re)) {
        return std::nullopt;
    }
    try {
        double done = std::stod(m.str(1));
        double total = std::stod(m.str(2));
        if (total <= 0) {
            return 0.0;
        }
        return std::min(100.0, done * 100.0 / total);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

json parse_file_list(const std::vector<std::string>& lines) {
    json files = json::array();
    bool in_list = false;

    for (const auto& raw : lines) {
        std::string line = trim(raw);
        if (starts_with_ci(line, "Begin file list")) {
            in_list = true;
            continue;
        }
        if (starts_with_ci(line, "End file list")) {
            break;
        }
        if (!in_list || line.empty()) {
            continue;
        }

        json entry = {{"name", line}};
        auto space = line.rfind(' ');
        if (space != std::string::npos) {
            std::string size_str = line.substr(space + 1);
            if (!size_str.empty() &&
                std::all_of(size_str.begin(), size_str.end(),
                            [](unsigned char c) { return std::isdigit(c); })) {
                entry["name"] = line.substr(0, space);
                entry["size"] = std::stoull(size_str);
            }
        }
        files.push_back(entry);
    }
    return files;
}

} // namespace wit
