// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection.h"
#include "serial_port.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wit {

/**
 * @brief Line protocol spoken on the serial link
 */
enum class SerialDialect {
    GCODE, ///< Marlin/RepRap: M115 identification, "ok"/"Error:" replies
    GRBL,  ///< GRBL: $I identification, "ok"/"error:N" replies
};

struct SerialOptions {
    uint32_t baud_rate = 115200;
    std::chrono::milliseconds read_timeout{2000};    ///< Applied at open time
    std::chrono::milliseconds command_timeout{5000}; ///< Max wait for "ok" per command
    std::chrono::milliseconds handshake_timeout{8000};
    SerialDialect dialect = SerialDialect::GCODE;
};

/**
 * @brief Serial (USB-CDC / UART) transport for G-code and GRBL controllers
 *
 * connect() clears both buffers and then requires a well-formed reply to the
 * identification command before reporting success, so a modem or GPS receiver
 * that happens to sit on a ttyUSB node is rejected.
 *
 * send_command() is serialized by an internal mutex: one command line in
 * flight at a time, replies collected until "ok", an error line, or
 * command_timeout.
 */
class SerialConnection : public Connection {
  public:
    /**
     * @param device Device path (e.g., "/dev/ttyACM0")
     * @param options Line speed, timeouts and dialect
     * @param port Port implementation; nullptr selects PosixSerialPort
     */
    SerialConnection(std::string device, SerialOptions options = {},
                     std::unique_ptr<SerialPort> port = nullptr);
    ~SerialConnection() override;

    bool connect() override;
    bool disconnect() override;
    bool is_connected() const override;
    CommandResult send_command(const std::string& command,
                               const json& params = json::object()) override;

    ConnectionKind kind() const override {
        return ConnectionKind::SERIAL;
    }

    const std::string& device() const {
        return device_;
    }
    const SerialOptions& options() const {
        return options_;
    }

    /// Firmware identification fields from the handshake (e.g., FIRMWARE_NAME, MACHINE_TYPE)
    const std::map<std::string, std::string>& firmware_info() const {
        return firmware_info_;
    }

    /**
     * @brief List serial ports on this host
     *
     * Pure query for the manual-setup picklist; no port is opened.
     */
    static std::vector<SerialPortInfo> list_ports();
    static std::vector<SerialPortInfo> list_ports(SerialPortEnumerator& enumerator);

  private:
    bool connected_locked() const;
    bool perform_handshake(std::string& error);

    /// Write one line and collect replies; caller holds io_mutex_
    CommandResult exchange(const std::string& line, std::chrono::milliseconds timeout);
    /// Consume the "ok" that trails an error line, waiting at most @p grace
    void drain_after_error(std::chrono::milliseconds grace);

    std::string device_;
    SerialOptions options_;
    std::unique_ptr<SerialPort> port_;
    std::map<std::string, std::string> firmware_info_;
    mutable std::mutex io_mutex_;
};

// ============================================================================
// Reply parsers (stateless, shared by GcodeMachine and the tests)
// ============================================================================

/// Format params as inline G-code words: {"X":10,"F":300} -> "X10 F300"
std::string format_gcode_params(const json& params);

/**
 * @brief Parse an M115 reply line into key/value pairs
 *
 * "FIRMWARE_NAME:Marlin 2.1.2 (Github) SOURCE_CODE_URL:... MACHINE_TYPE:MK3S"
 * Keys are upper-case tokens ending in ':'; values run to the next key.
 *
 * @return Empty map when the line carries no FIRMWARE_NAME
 */
std::map<std::string, std::string> parse_firmware_info(const std::string& line);

/**
 * @brief Parse an M105 temperature report
 *
 * "ok T:210.3 /215.0 B:60.1 /60.0 C:30.0 /0.0 @:127"
 * Produces {"hotend": [current, target], "bed": [...], "chamber": [...]};
 * zones missing from the line are omitted.
 */
json parse_temperature_report(const std::string& line);

/// "X:10.00 Y:20.00 Z:5.00 E:0.00 Count ..." -> {"x":10,"y":20,"z":5,"e":0}
json parse_position_report(const std::string& line);

/// "<Idle|MPos:0.000,0.000,0.000|FS:0,0>" -> {"state":"Idle","mpos":{...}}
json parse_grbl_status(const std::string& line);

/// "SD printing byte 1234/5678" -> percent (0..100); nullopt for "Not SD printing"
std::optional<double> parse_sd_progress(const std::string& line);

/// Lines between "Begin file list" and "End file list" -> [{"name","size"}]
json parse_file_list(const std::vector<std::string>& lines);

} // namespace wit
