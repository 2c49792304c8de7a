// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "serial_discovery.h"

#include "../mocks/mock_serial_port.h"

#include <catch2/catch_test_macros.hpp>

using namespace wit;

TEST_CASE("classify_serial_port: known VID:PID pairs", "[serial][discovery]") {
    auto ch340 = classify_serial_port(usb_port("/dev/ttyUSB0", 0x1A86, 0x7523));
    REQUIRE(ch340);
    REQUIRE(ch340->label == "CH340");
    REQUIRE(ch340->machine_type == MachineType::PRINTER_3D_FDM);
    REQUIRE(ch340->protocol == ConnectionProtocol::SERIAL_GCODE);

    auto mega = classify_serial_port(usb_port("/dev/ttyACM0", 0x2341, 0x0042));
    REQUIRE(mega);
    REQUIRE(mega->label == "Arduino Mega ADK");
}

TEST_CASE("classify_serial_port: vendor-only match", "[serial][discovery]") {
    auto prusa = classify_serial_port(usb_port("/dev/ttyACM0", 0x2C99, 0x0002));
    REQUIRE(prusa);
    REQUIRE(prusa->label == "Prusa Research");
}

TEST_CASE("classify_serial_port: description keywords", "[serial][discovery]") {
    SerialPortInfo port;
    port.device = "/dev/ttyS3";
    port.description = "Marlin USB Serial";
    auto cls = classify_serial_port(port);
    REQUIRE(cls);
    REQUIRE(cls->label == "Marlin USB Serial");

    SerialPortInfo bare;
    bare.device = "/dev/ttyS4";
    bare.manufacturer = "Generic 3D Printer Co";
    auto fallback = classify_serial_port(bare);
    REQUIRE(fallback);
    REQUIRE(fallback->label == "3d printer");
}

TEST_CASE("classify_serial_port: grbl hint selects CNC", "[serial][discovery]") {
    auto cls = classify_serial_port(usb_port("/dev/ttyUSB1", 0x1A86, 0x7523, "GRBL controller"));
    REQUIRE(cls);
    REQUIRE(cls->machine_type == MachineType::CNC_MILL_3AXIS);
    REQUIRE(cls->protocol == ConnectionProtocol::SERIAL_GRBL);
}

TEST_CASE("classify_serial_port: unrelated ports are skipped", "[serial][discovery]") {
    REQUIRE_FALSE(classify_serial_port(usb_port("/dev/ttyUSB2", 0x046D, 0xC52B, "USB Receiver",
                                                 "Logitech")));

    SerialPortInfo builtin;
    builtin.device = "/dev/ttyS0";
    REQUIRE_FALSE(classify_serial_port(builtin));
}

TEST_CASE("SerialDiscovery: produces records for candidate ports", "[serial][discovery]") {
    auto ports = std::make_shared<MockSerialPortEnumerator>(std::vector<SerialPortInfo>{
        usb_port("/dev/ttyACM0", 0x2341, 0x0043, "Arduino Mega 2560", "Arduino LLC"),
        usb_port("/dev/ttyUSB0", 0x046D, 0xC52B, "USB Receiver"),
        usb_port("/dev/ttyUSB1", 0x0403, 0x6001, "FT232R grbl"),
    });

    SerialDiscoveryOptions options;
    options.baud_rate = 250000;
    SerialDiscovery discovery(ports, options);

    REQUIRE(discovery.name() == "serial");
    auto found = discovery.discover();
    REQUIRE(ports->list_count_ == 1);
    REQUIRE(found.size() == 2);

    const auto& mega = found[0];
    REQUIRE(mega.discovery_id == "serial_/dev/ttyACM0");
    REQUIRE(mega.name == "Arduino Mega 2560 on /dev/ttyACM0");
    REQUIRE(mega.connection_params["port"] == "/dev/ttyACM0");
    REQUIRE(mega.connection_params["baud_rate"] == 250000);
    REQUIRE(mega.metadata["vid"] == 0x2341);
    REQUIRE(mega.metadata["manufacturer"] == "Arduino LLC");

    const auto& cnc = found[1];
    REQUIRE(cnc.discovery_id == "serial_/dev/ttyUSB1");
    REQUIRE(cnc.connection_protocol == ConnectionProtocol::SERIAL_GRBL);
}

TEST_CASE("SerialDiscovery: no ports, no records", "[serial][discovery]") {
    SerialDiscovery discovery(std::make_shared<MockSerialPortEnumerator>());
    REQUIRE(discovery.discover().empty());
}
