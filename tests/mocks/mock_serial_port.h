// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_SERIAL_PORT_H
#define MOCK_SERIAL_PORT_H

/**
 * @file mock_serial_port.h
 * @brief Scripted SerialPort and SerialPortEnumerator for tests
 *
 * Each written line is looked up in the reply script; the scripted lines are
 * queued for read_line(). An empty queue reads as a quiet line (timeout).
 *
 * @example
 * auto port = std::make_unique<MockSerialPort>();
 * MockSerialPort* mock = port.get();
 * mock->reply("M115", {"FIRMWARE_NAME:Marlin 2.1.2", "ok"});
 * SerialConnection conn("/dev/ttyACM0", fast_options(), std::move(port));
 */

#include "serial_port.h"

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace wit {

class MockSerialPort : public SerialPort {
  public:
    /// Marlin-style printer answering M115 and acknowledging everything else
    static std::unique_ptr<MockSerialPort> marlin() {
        auto port = std::make_unique<MockSerialPort>();
        port->reply("M115", {"FIRMWARE_NAME:Marlin 2.1.2 (Github) MACHINE_TYPE:Ender-3 EXTRUDER_COUNT:1",
                             "Cap:AUTOREPORT_TEMP:1", "ok"});
        port->set_default_reply({"ok"});
        return port;
    }

    /// GRBL controller answering $I
    static std::unique_ptr<MockSerialPort> grbl() {
        auto port = std::make_unique<MockSerialPort>();
        port->reply("$I", {"[VER:1.1h.20190825:]", "[OPT:V,15,128]", "ok"});
        port->set_default_reply({"ok"});
        return port;
    }

    void reply(const std::string& line, std::vector<std::string> lines) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_[line] = std::move(lines);
    }

    /// Reply for lines missing from the script; empty means silence
    void set_default_reply(std::vector<std::string> lines) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_reply_ = std::move(lines);
    }

    void fail_open(const std::string& error) {
        open_error_ = error;
    }

    /// Make every read after the next write report an I/O error
    void fail_reads(const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        read_error_ = error;
    }

    /// Queue lines as if the device sent them unprompted (late replies)
    void inject(std::vector<std::string> lines) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.insert(pending_.end(), lines.begin(), lines.end());
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    std::vector<std::string> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    int open_count() const {
        return open_count_;
    }

    bool open(const std::string& device, uint32_t baud_rate, std::chrono::milliseconds,
              std::string& error) override {
        ++open_count_;
        device_ = device;
        baud_rate_ = baud_rate;
        if (!open_error_.empty()) {
            error = open_error_;
            return false;
        }
        open_ = true;
        return true;
    }

    void close() override {
        open_ = false;
    }

    bool is_open() const override {
        return open_;
    }

    void flush_buffers() override {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.clear();
    }

    void discard_input() override {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.clear();
    }

    bool write_line(const std::string& line, std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            error = "Port closed";
            return false;
        }
        written_.push_back(line);
        auto it = script_.find(line);
        const auto& lines = it != script_.end() ? it->second : default_reply_;
        pending_.insert(pending_.end(), lines.begin(), lines.end());
        return true;
    }

    std::optional<std::string> read_line(std::string& error) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!read_error_.empty()) {
                error = read_error_;
                return std::nullopt;
            }
            if (!pending_.empty()) {
                std::string line = pending_.front();
                pending_.pop_front();
                return line;
            }
        }
        // Quiet line; keep timeout loops from spinning
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return std::nullopt;
    }

    std::string device_;
    uint32_t baud_rate_ = 0;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> script_;
    std::vector<std::string> default_reply_;
    std::deque<std::string> pending_;
    std::vector<std::string> written_;
    std::string open_error_;
    std::string read_error_;
    bool open_ = false;
    int open_count_ = 0;
};

class MockSerialPortEnumerator : public SerialPortEnumerator {
  public:
    explicit MockSerialPortEnumerator(std::vector<SerialPortInfo> ports = {})
        : ports_(std::move(ports)) {}

    std::vector<SerialPortInfo> list_ports() override {
        ++list_count_;
        return ports_;
    }

    std::vector<SerialPortInfo> ports_;
    int list_count_ = 0;
};

/// USB port description helper
inline SerialPortInfo usb_port(const std::string& device, uint16_t vid, uint16_t pid,
                               const std::string& description = "",
                               const std::string& manufacturer = "") {
    SerialPortInfo info;
    info.device = device;
    info.vid = vid;
    info.pid = pid;
    info.description = description;
    info.manufacturer = manufacturer;
    info.hwid = format_hwid(info);
    return info;
}

} // namespace wit

#endif // MOCK_SERIAL_PORT_H
