// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file serial_discovery.cpp
 * @brief Serial port classification for machine discovery
 *
 * @pattern Table-driven: exact VID:PID first, then vendor, then keywords
 */

#include "serial_discovery.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace wit {

namespace {

// Boards commonly found on 3D printers and CNC controllers
const std::map<std::pair<uint16_t, uint16_t>, const char*> kKnownDevices = {
    {{0x1A86, 0x7523}, "CH340"},
    {{0x0403, 0x6001}, "FTDI"},
    {{0x2341, 0x0043}, "Arduino Mega 2560"},
    {{0x2341, 0x0042}, "Arduino Mega ADK"},
    {{0x2341, 0x0010}, "Arduino Mega"},
    {{0x2341, 0x003D}, "Arduino Due"},
    {{0x1A86, 0x5523}, "CH341"},
    {{0x0483, 0x3748}, "STM32"},
    {{0x27B1, 0x0001}, "Prusa"},
};

// Microcontroller and USB-UART vendors used by printer boards
const std::map<uint16_t, const char*> kKnownVendors = {
    {0x2341, "Arduino"},          {0x2A03, "Arduino"},  {0x2C99, "Prusa Research"},
    {0x27B1, "Prusa"},            {0x0483, "STMicroelectronics"},
    {0x1A86, "QinHeng"},          {0x0403, "FTDI"},     {0x10C4, "Silicon Labs"},
    {0x1D50, "OpenMoko"},
};

const char* const kKeywords[] = {"prusa", "arduino", "ch340", "ft232", "ch341",
                                 "cp210", "marlin", "grbl",  "3d printer"};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::optional<SerialClassification> classify_serial_port(const SerialPortInfo& port) {
    const std::string text =
        lower(port.description + " " + port.manufacturer + " " + port.product);

    std::optional<SerialClassification> result;

    if (port.vid && port.pid) {
        auto it = kKnownDevices.find({*port.vid, *port.pid});
        if (it != kKnownDevices.end()) {
            result = SerialClassification{it->second};
        }
    }

    if (!result && port.vid) {
        auto it = kKnownVendors.find(*port.vid);
        if (it != kKnownVendors.end()) {
            result = SerialClassification{it->second};
        }
    }

    if (!result) {
        for (const char* keyword : kKeywords) {
            if (text.find(keyword) != std::string::npos) {
                result = SerialClassification{
                    port.description.empty() ? std::string(keyword) : port.description};
                break;
            }
        }
    }

    if (result && text.find("grbl") != std::string::npos) {
        result->machine_type = MachineType::CNC_MILL_3AXIS;
        result->protocol = ConnectionProtocol::SERIAL_GRBL;
    }
    return result;
}

SerialDiscovery::SerialDiscovery(std::shared_ptr<SerialPortEnumerator> enumerator,
                                 SerialDiscoveryOptions options)
    : enumerator_(enumerator ? std::move(enumerator)
                             : std::shared_ptr<SerialPortEnumerator>(SerialPortEnumerator::create())),
      options_(options) {}

std::vector<DiscoveredMachine> SerialDiscovery::discover() {
    std::vector<DiscoveredMachine> found;

    for (const auto& port : enumerator_->list_ports()) {
        auto cls = classify_serial_port(port);
        if (!cls) {
            spdlog::trace("[SerialDiscovery] Skipping {} ({})", port.device, port.description);
            continue;
        }

        DiscoveredMachine m;
        m.discovery_id = "serial_" + port.device;
        m.name = cls->label + " on " + port.device;
        m.machine_type = cls->machine_type;
        m.connection_protocol = cls->protocol;
        m.connection_params = {{"port", port.device}, {"baud_rate", options_.baud_rate}};
        m.metadata = {{"vid", port.vid ? json(*port.vid) : json(nullptr)},
                      {"pid", port.pid ? json(*port.pid) : json(nullptr)},
                      {"hwid", port.hwid},
                      {"serial_number", port.serial_number},
                      {"manufacturer", port.manufacturer},
                      {"product", port.product},
                      {"description", port.description}};

        spdlog::debug("[SerialDiscovery] Candidate: {} ({})", m.name, port.hwid);
        found.push_back(std::move(m));
    }
    return found;
}

} // namespace wit
