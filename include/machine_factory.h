// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "discovered_machine.h"
#include "http_transport.h"
#include "machine.h"
#include "serial_port.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace wit {

/**
 * @brief Injection points for create_machine()
 *
 * Defaults build real transports; tests pass a MockHttpTransport or a
 * factory returning MockSerialPort.
 */
struct MachineFactoryOptions {
    std::shared_ptr<HttpTransport> http_transport;                   ///< nullptr: libhv
    std::function<std::unique_ptr<SerialPort>()> serial_port_factory; ///< empty: PosixSerialPort
    std::chrono::seconds http_timeout{10};
    uint32_t default_baud_rate = 115200;
};

/**
 * @brief Build the Machine variant matching a discovery record
 *
 * serial_gcode/serial_grbl -> GcodeMachine, octoprint/prusalink ->
 * OctoPrintMachine, moonraker -> MoonrakerMachine.
 *
 * @return nullptr (with a logged warning) for protocols without a Machine
 *         variant or when connection_params lack the port / base_url
 */
std::unique_ptr<Machine> create_machine(const std::string& id, const DiscoveredMachine& record,
                                        const MachineFactoryOptions& options = {});

} // namespace wit
