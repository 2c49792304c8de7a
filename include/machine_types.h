// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file machine_types.h
 * @brief Enumerations shared by connections, machines and discovery
 *
 * Every enum has a stable wire string (used in discovery metadata, config
 * files and the JSON handed to the web layer). Unknown strings map to the
 * UNKNOWN member rather than failing.
 */

#include <set>
#include <string>

namespace wit {

enum class MachineType {
    UNKNOWN,
    PRINTER_3D_FDM,
    PRINTER_3D_COREXY,
    PRINTER_3D_DELTA,
    PRINTER_3D_SLA,
    CNC_MILL_3AXIS,
    CNC_ROUTER,
    LASER_DIODE,
    LASER_CO2,
};

enum class ConnectionProtocol {
    UNKNOWN,
    SERIAL_GCODE, ///< RepRap/Marlin style line protocol
    SERIAL_GRBL,  ///< GRBL CNC controllers
    HTTP_REST,    ///< Generic REST API
    OCTOPRINT,
    MOONRAKER,
    PRUSALINK,
    DUET_RRF,
};

enum class MachineCapability {
    START,
    PAUSE,
    RESUME,
    CANCEL,
    TEMP_HOTEND,
    TEMP_BED,
    TEMP_CHAMBER,
    HOME,
    JOG,
    UPLOAD,
    DELETE_FILE,
    LIST_FILES,
    PROGRESS,
    CAMERA,
    EMERGENCY_STOP,
};

/**
 * @brief Job lifecycle state of a Machine
 *
 * Idle -> Printing -> {Paused, Cancelled, Error}, Paused -> {Printing, Cancelled}.
 * Error and Cancelled are terminal for the lifetime of a Machine object.
 */
enum class PrinterState {
    DISCONNECTED,
    IDLE,
    PRINTING,
    PAUSED,
    CANCELLED,
    ERROR,
};

using CapabilitySet = std::set<MachineCapability>;

const char* to_string(MachineType type);
const char* to_string(ConnectionProtocol protocol);
const char* to_string(MachineCapability capability);
const char* to_string(PrinterState state);

MachineType machine_type_from_string(const std::string& str);
ConnectionProtocol protocol_from_string(const std::string& str);

/// @return false if the string names no known capability
bool capability_from_string(const std::string& str, MachineCapability& out);

/// @return true for the serial line protocols
bool is_serial_protocol(ConnectionProtocol protocol);

/**
 * @brief Capabilities a machine of this type advertises by default
 *
 * The concrete Machine variant intersects this with what its transport can do.
 */
CapabilitySet default_capabilities(MachineType type);

/**
 * @brief Map a vendor state string to a normalized PrinterState
 *
 * Understands OctoPrint ("Operational", "Printing", "Paused", "Error", ...)
 * and Klipper/Moonraker ("standby", "printing", "paused", "cancelled",
 * "complete", "error") vocabularies, case-insensitively. Unrecognized
 * strings return @p fallback.
 */
PrinterState normalize_printer_state(const std::string& vendor_state,
                                     PrinterState fallback = PrinterState::IDLE);

} // namespace wit
