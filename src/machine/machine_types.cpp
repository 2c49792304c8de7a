// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "machine_types.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace wit {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const CapabilitySet kJobControl = {MachineCapability::START, MachineCapability::PAUSE,
                                   MachineCapability::RESUME, MachineCapability::CANCEL,
                                   MachineCapability::EMERGENCY_STOP};

} // namespace

const char* to_string(MachineType type) {
    switch (type) {
    case MachineType::PRINTER_3D_FDM:
        return "3d_printer_fdm";
    case MachineType::PRINTER_3D_COREXY:
        return "3d_printer_corexy";
    case MachineType::PRINTER_3D_DELTA:
        return "3d_printer_delta";
    case MachineType::PRINTER_3D_SLA:
        return "3d_printer_sla";
    case MachineType::CNC_MILL_3AXIS:
        return "cnc_mill_3axis";
    case MachineType::CNC_ROUTER:
        return "cnc_router";
    case MachineType::LASER_DIODE:
        return "laser_diode";
    case MachineType::LASER_CO2:
        return "laser_co2";
    case MachineType::UNKNOWN:
        break;
    }
    return "unknown";
}

const char* to_string(ConnectionProtocol protocol) {
    switch (protocol) {
    case ConnectionProtocol::SERIAL_GCODE:
        return "serial_gcode";
    case ConnectionProtocol::SERIAL_GRBL:
        return "serial_grbl";
    case ConnectionProtocol::HTTP_REST:
        return "http_rest";
    case ConnectionProtocol::OCTOPRINT:
        return "octoprint";
    case ConnectionProtocol::MOONRAKER:
        return "moonraker";
    case ConnectionProtocol::PRUSALINK:
        return "prusalink";
    case ConnectionProtocol::DUET_RRF:
        return "duet_rrf";
    case ConnectionProtocol::UNKNOWN:
        break;
    }
    return "unknown";
}

const char* to_string(MachineCapability capability) {
    switch (capability) {
    case MachineCapability::START:
        return "start";
    case MachineCapability::PAUSE:
        return "pause";
    case MachineCapability::RESUME:
        return "resume";
    case MachineCapability::CANCEL:
        return "cancel";
    case MachineCapability::TEMP_HOTEND:
        return "temp_hotend";
    case MachineCapability::TEMP_BED:
        return "temp_bed";
    case MachineCapability::TEMP_CHAMBER:
        return "temp_chamber";
    case MachineCapability::HOME:
        return "home";
    case MachineCapability::JOG:
        return "jog";
    case MachineCapability::UPLOAD:
        return "upload";
    case MachineCapability::DELETE_FILE:
        return "delete";
    case MachineCapability::LIST_FILES:
        return "list_files";
    case MachineCapability::PROGRESS:
        return "progress";
    case MachineCapability::CAMERA:
        return "camera";
    case MachineCapability::EMERGENCY_STOP:
        return "emergency_stop";
    }
    return "unknown";
}

const char* to_string(PrinterState state) {
    switch (state) {
    case PrinterState::DISCONNECTED:
        return "disconnected";
    case PrinterState::IDLE:
        return "idle";
    case PrinterState::PRINTING:
        return "printing";
    case PrinterState::PAUSED:
        return "paused";
    case PrinterState::CANCELLED:
        return "cancelled";
    case PrinterState::ERROR:
        return "error";
    }
    return "unknown";
}

MachineType machine_type_from_string(const std::string& str) {
    static const std::unordered_map<std::string, MachineType> table = {
        {"3d_printer_fdm", MachineType::PRINTER_3D_FDM},
        {"fdm", MachineType::PRINTER_3D_FDM},
        {"3d_printer_corexy", MachineType::PRINTER_3D_COREXY},
        {"corexy", MachineType::PRINTER_3D_COREXY},
        {"3d_printer_delta", MachineType::PRINTER_3D_DELTA},
        {"delta", MachineType::PRINTER_3D_DELTA},
        {"3d_printer_sla", MachineType::PRINTER_3D_SLA},
        {"sla", MachineType::PRINTER_3D_SLA},
        {"cnc_mill_3axis", MachineType::CNC_MILL_3AXIS},
        {"cnc", MachineType::CNC_MILL_3AXIS},
        {"cnc_router", MachineType::CNC_ROUTER},
        {"laser_diode", MachineType::LASER_DIODE},
        {"laser_co2", MachineType::LASER_CO2},
    };
    auto it = table.find(to_lower(str));
    return it != table.end() ? it->second : MachineType::UNKNOWN;
}

ConnectionProtocol protocol_from_string(const std::string& str) {
    static const std::unordered_map<std::string, ConnectionProtocol> table = {
        {"serial_gcode", ConnectionProtocol::SERIAL_GCODE},
        {"serial_grbl", ConnectionProtocol::SERIAL_GRBL},
        {"http_rest", ConnectionProtocol::HTTP_REST},
        {"octoprint", ConnectionProtocol::OCTOPRINT},
        {"moonraker", ConnectionProtocol::MOONRAKER},
        {"prusalink", ConnectionProtocol::PRUSALINK},
        {"duet_rrf", ConnectionProtocol::DUET_RRF},
    };
    auto it = table.find(to_lower(str));
    return it != table.end() ? it->second : ConnectionProtocol::UNKNOWN;
}

bool capability_from_string(const std::string& str, MachineCapability& out) {
    static const std::unordered_map<std::string, MachineCapability> table = {
        {"start", MachineCapability::START},
        {"pause", MachineCapability::PAUSE},
        {"resume", MachineCapability::RESUME},
        {"cancel", MachineCapability::CANCEL},
        {"temp_hotend", MachineCapability::TEMP_HOTEND},
        {"temp_bed", MachineCapability::TEMP_BED},
        {"temp_chamber", MachineCapability::TEMP_CHAMBER},
        {"home", MachineCapability::HOME},
        {"jog", MachineCapability::JOG},
        {"upload", MachineCapability::UPLOAD},
        {"delete", MachineCapability::DELETE_FILE},
        {"list_files", MachineCapability::LIST_FILES},
        {"progress", MachineCapability::PROGRESS},
        {"camera", MachineCapability::CAMERA},
        {"emergency_stop", MachineCapability::EMERGENCY_STOP},
    };
    auto it = table.find(to_lower(str));
    if (it == table.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool is_serial_protocol(ConnectionProtocol protocol) {
    return protocol == ConnectionProtocol::SERIAL_GCODE ||
           protocol == ConnectionProtocol::SERIAL_GRBL;
}

CapabilitySet default_capabilities(MachineType type) {
    CapabilitySet caps = kJobControl;

    switch (type) {
    case MachineType::PRINTER_3D_FDM:
    case MachineType::PRINTER_3D_DELTA:
        caps.insert({MachineCapability::TEMP_HOTEND, MachineCapability::TEMP_BED,
                     MachineCapability::HOME, MachineCapability::JOG, MachineCapability::UPLOAD,
                     MachineCapability::LIST_FILES, MachineCapability::DELETE_FILE,
                     MachineCapability::PROGRESS});
        break;
    case MachineType::PRINTER_3D_COREXY:
        caps.insert({MachineCapability::TEMP_HOTEND, MachineCapability::TEMP_BED,
                     MachineCapability::TEMP_CHAMBER, MachineCapability::HOME,
                     MachineCapability::JOG, MachineCapability::UPLOAD,
                     MachineCapability::LIST_FILES, MachineCapability::DELETE_FILE,
                     MachineCapability::PROGRESS, MachineCapability::CAMERA});
        break;
    case MachineType::PRINTER_3D_SLA:
        caps.insert({MachineCapability::UPLOAD, MachineCapability::LIST_FILES,
                     MachineCapability::DELETE_FILE, MachineCapability::PROGRESS});
        break;
    case MachineType::CNC_MILL_3AXIS:
    case MachineType::CNC_ROUTER:
    case MachineType::LASER_DIODE:
    case MachineType::LASER_CO2:
        caps.insert({MachineCapability::HOME, MachineCapability::JOG,
                     MachineCapability::LIST_FILES, MachineCapability::PROGRESS});
        break;
    case MachineType::UNKNOWN:
        break;
    }
    return caps;
}

PrinterState normalize_printer_state(const std::string& vendor_state, PrinterState fallback) {
    static const std::unordered_map<std::string, PrinterState> table = {
        // OctoPrint
        {"operational", PrinterState::IDLE},
        {"printing", PrinterState::PRINTING},
        {"printing from sd", PrinterState::PRINTING},
        {"paused", PrinterState::PAUSED},
        {"pausing", PrinterState::PAUSED},
        {"cancelling", PrinterState::CANCELLED},
        {"error", PrinterState::ERROR},
        {"offline", PrinterState::DISCONNECTED},
        {"closed", PrinterState::DISCONNECTED},
        // Klipper / Moonraker print_stats
        {"standby", PrinterState::IDLE},
        {"ready", PrinterState::IDLE},
        {"complete", PrinterState::IDLE},
        {"cancelled", PrinterState::CANCELLED},
        {"shutdown", PrinterState::ERROR},
        // Marlin host action
        {"sd_printing", PrinterState::PRINTING},
    };
    auto it = table.find(to_lower(vendor_state));
    return it != table.end() ? it->second : fallback;
}

} // namespace wit
