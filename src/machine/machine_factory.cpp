// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "machine_factory.h"

#include "gcode_machine.h"
#include "moonraker_machine.h"
#include "octoprint_machine.h"

#include <spdlog/spdlog.h>

namespace wit {

namespace {

std::string string_param(const json& params, const char* key) {
    if (params.is_object() && params.contains(key) && params[key].is_string()) {
        return params[key].get<std::string>();
    }
    return std::string();
}

MachineType effective_type(const DiscoveredMachine& record, MachineType fallback) {
    return record.machine_type == MachineType::UNKNOWN ? fallback : record.machine_type;
}

} // namespace

std::unique_ptr<Machine> create_machine(const std::string& id, const DiscoveredMachine& record,
                                        const MachineFactoryOptions& options) {
    const json& params = record.connection_params;

    switch (record.connection_protocol) {
    case ConnectionProtocol::SERIAL_GCODE:
    case ConnectionProtocol::SERIAL_GRBL: {
        std::string port = string_param(params, "port");
        if (port.empty()) {
            spdlog::warn("[MachineFactory] {}: serial record without a port", record.discovery_id);
            return nullptr;
        }

        SerialOptions serial;
        serial.baud_rate = options.default_baud_rate;
        if (params.contains("baud_rate") && params["baud_rate"].is_number_unsigned()) {
            serial.baud_rate = params["baud_rate"].get<uint32_t>();
        }
        const bool grbl = record.connection_protocol == ConnectionProtocol::SERIAL_GRBL;
        serial.dialect = grbl ? SerialDialect::GRBL : SerialDialect::GCODE;

        auto connection = std::make_unique<SerialConnection>(
            port, serial, options.serial_port_factory ? options.serial_port_factory() : nullptr);
        return std::make_unique<GcodeMachine>(
            id, std::move(connection),
            effective_type(record, grbl ? MachineType::CNC_MILL_3AXIS
                                        : MachineType::PRINTER_3D_FDM));
    }

    case ConnectionProtocol::OCTOPRINT:
    case ConnectionProtocol::PRUSALINK:
    case ConnectionProtocol::MOONRAKER: {
        std::string base_url = string_param(params, "base_url");
        if (base_url.empty()) {
            spdlog::warn("[MachineFactory] {}: network record without a base_url",
                         record.discovery_id);
            return nullptr;
        }

        HttpOptions http;
        http.base_url = base_url;
        http.api_key = string_param(params, "api_key");
        http.timeout = options.http_timeout;

        if (record.connection_protocol == ConnectionProtocol::MOONRAKER) {
            http.probe_path = "/server/info";
            auto connection = std::make_unique<HttpConnection>(http, options.http_transport);
            return std::make_unique<MoonrakerMachine>(
                id, std::move(connection),
                effective_type(record, MachineType::PRINTER_3D_COREXY));
        }

        auto connection = std::make_unique<OctoPrintConnection>(http, options.http_transport);
        return std::make_unique<OctoPrintMachine>(
            id, std::move(connection), effective_type(record, MachineType::PRINTER_3D_FDM),
            record.connection_protocol);
    }

    case ConnectionProtocol::HTTP_REST:
    case ConnectionProtocol::DUET_RRF:
    case ConnectionProtocol::UNKNOWN:
        break;
    }

    spdlog::warn("[MachineFactory] {}: no machine implementation for protocol '{}'",
                 record.discovery_id, to_string(record.connection_protocol));
    return nullptr;
}

} // namespace wit
