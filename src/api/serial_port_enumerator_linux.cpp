// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file serial_port_enumerator_linux.cpp
 * @brief Serial port listing from /sys/class/tty
 *
 * @pattern One small attribute file per property, read from the USB parent
 * @gotchas Legacy 8250 UARTs always show up as ttyS0..31 whether wired or not;
 *          entries whose device is a plain platform device are skipped
 */

#include "serial_port.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace wit {

namespace {

std::string read_attr(const fs::path& dir, const char* name) {
    std::ifstream in(dir / name);
    std::string value;
    if (in && std::getline(in, value)) {
        while (!value.empty() && (value.back() == '\n' || value.back() == '\r' ||
                                  value.back() == ' ')) {
            value.pop_back();
        }
    }
    return value;
}

std::optional<uint16_t> parse_hex16(const std::string& s) {
    if (s.empty()) {
        return std::nullopt;
    }
    try {
        unsigned long v = std::stoul(s, nullptr, 16);
        if (v > 0xFFFF) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// Walk up from the tty's device node until the USB device directory (has idVendor)
std::optional<fs::path> find_usb_device_dir(const fs::path& device_dir) {
    std::error_code ec;
    fs::path p = fs::canonical(device_dir, ec);
    if (ec) {
        return std::nullopt;
    }
    for (int depth = 0; depth < 4 && !p.empty() && p != p.root_path(); ++depth) {
        if (fs::exists(p / "idVendor", ec)) {
            return p;
        }
        p = p.parent_path();
    }
    return std::nullopt;
}

std::string subsystem_of(const fs::path& device_dir) {
    std::error_code ec;
    fs::path link = fs::read_symlink(device_dir / "subsystem", ec);
    return ec ? std::string() : link.filename().string();
}

} // namespace

std::string format_hwid(const SerialPortInfo& info) {
    if (!info.vid || !info.pid) {
        return "n/a";
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "USB VID:PID=%04X:%04X", *info.vid, *info.pid);
    std::string hwid = buf;
    if (!info.serial_number.empty()) {
        hwid += " SER=" + info.serial_number;
    }
    return hwid;
}

std::unique_ptr<SerialPortEnumerator> SerialPortEnumerator::create() {
    return std::make_unique<SysfsSerialPortEnumerator>();
}

SysfsSerialPortEnumerator::SysfsSerialPortEnumerator(std::string sysfs_root, std::string dev_root)
    : sysfs_root_(std::move(sysfs_root)), dev_root_(std::move(dev_root)) {}

std::vector<SerialPortInfo> SysfsSerialPortEnumerator::list_ports() {
    std::vector<SerialPortInfo> ports;
    std::error_code ec;

    fs::directory_iterator it(sysfs_root_, ec);
    if (ec) {
        spdlog::debug("[SerialEnumerator] Cannot read {}: {}", sysfs_root_, ec.message());
        return ports;
    }

    for (const auto& entry : it) {
        const fs::path tty_dir = entry.path();
        const fs::path device_dir = tty_dir / "device";
        if (!fs::exists(device_dir, ec)) {
            continue; // virtual terminal, pty, console
        }

        std::string subsystem = subsystem_of(device_dir);
        if (subsystem == "platform") {
            continue;
        }

        SerialPortInfo info;
        const std::string name = tty_dir.filename().string();
        info.device = dev_root_ + "/" + name;

        if (auto usb_dir = find_usb_device_dir(device_dir)) {
            info.vid = parse_hex16(read_attr(*usb_dir, "idVendor"));
            info.pid = parse_hex16(read_attr(*usb_dir, "idProduct"));
            info.serial_number = read_attr(*usb_dir, "serial");
            info.manufacturer = read_attr(*usb_dir, "manufacturer");
            info.product = read_attr(*usb_dir, "product");

            std::string interface = read_attr(fs::canonical(device_dir, ec), "interface");
            if (!info.product.empty()) {
                info.description = info.product;
            } else if (!interface.empty()) {
                info.description = interface;
            }
        }

        if (info.description.empty()) {
            info.description = name;
        }
        info.hwid = format_hwid(info);

        spdlog::trace("[SerialEnumerator] {} '{}' {}", info.device, info.description, info.hwid);
        ports.push_back(std::move(info));
    }

    std::sort(ports.begin(), ports.end(),
              [](const SerialPortInfo& a, const SerialPortInfo& b) { return a.device < b.device; });
    return ports;
}

} // namespace wit
