// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file serial_port.h
 * @brief Byte-stream device access and serial port enumeration
 *
 * Both concerns sit behind small abstract interfaces so SerialConnection and
 * SerialDiscovery can be tested with scripted fakes (see tests/mocks/).
 * Concrete implementations:
 * - PosixSerialPort: termios, raw 8N1, read timeout fixed at open time
 * - SysfsSerialPortEnumerator: Linux /sys/class/tty walk
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wit {

/**
 * @brief One serial device as reported by the enumerator
 */
struct SerialPortInfo {
    std::string device;        ///< Device path (e.g., "/dev/ttyACM0")
    std::string description;   ///< Human readable description (product or driver name)
    std::string hwid;          ///< "USB VID:PID=2341:0043 SER=..." or "n/a"
    std::optional<uint16_t> vid;
    std::optional<uint16_t> pid;
    std::string serial_number; ///< Empty when unknown
    std::string manufacturer;  ///< Empty when unknown
    std::string product;       ///< Empty when unknown
};

/// Build the pyserial-style hardware id string for a port
std::string format_hwid(const SerialPortInfo& info);

/**
 * @brief Line-oriented byte-stream device
 */
class SerialPort {
  public:
    virtual ~SerialPort() = default;

    /**
     * @brief Open the device
     *
     * @param device Device path
     * @param baud_rate Line speed
     * @param read_timeout Upper bound for every read_line() call
     * @param error Filled with a reason on failure
     */
    virtual bool open(const std::string& device, uint32_t baud_rate,
                      std::chrono::milliseconds read_timeout, std::string& error) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    /// Discard pending input and output
    virtual void flush_buffers() = 0;

    /// Discard received but unread input; queued output is kept
    virtual void discard_input() = 0;

    /// Write a full line; a newline is appended
    virtual bool write_line(const std::string& line, std::string& error) = 0;

    /**
     * @brief Read one line without its terminator
     *
     * @return Line text, or std::nullopt when the open-time read timeout expired
     *         or the device failed (in which case @p error is set)
     */
    virtual std::optional<std::string> read_line(std::string& error) = 0;
};

/**
 * @brief termios implementation of SerialPort
 */
class PosixSerialPort : public SerialPort {
  public:
    PosixSerialPort() = default;
    ~PosixSerialPort() override;

    PosixSerialPort(const PosixSerialPort&) = delete;
    PosixSerialPort& operator=(const PosixSerialPort&) = delete;

    bool open(const std::string& device, uint32_t baud_rate,
              std::chrono::milliseconds read_timeout, std::string& error) override;
    void close() override;
    bool is_open() const override;
    void flush_buffers() override;
    void discard_input() override;
    bool write_line(const std::string& line, std::string& error) override;
    std::optional<std::string> read_line(std::string& error) override;

  private:
    int fd_ = -1;
    std::chrono::milliseconds read_timeout_{2000};
    std::string pending_; ///< Bytes read past the last returned line
};

/**
 * @brief Lists the serial devices present on this host
 */
class SerialPortEnumerator {
  public:
    virtual ~SerialPortEnumerator() = default;

    /// Pure query; never opens a device
    virtual std::vector<SerialPortInfo> list_ports() = 0;

    /// Platform enumerator (sysfs on Linux)
    static std::unique_ptr<SerialPortEnumerator> create();
};

/**
 * @brief Enumerates /sys/class/tty entries that are backed by a real device
 *
 * USB-attached ports get vid/pid/serial/manufacturer/product from the parent
 * USB device's attribute files.
 */
class SysfsSerialPortEnumerator : public SerialPortEnumerator {
  public:
    explicit SysfsSerialPortEnumerator(std::string sysfs_root = "/sys/class/tty",
                                       std::string dev_root = "/dev");

    std::vector<SerialPortInfo> list_ports() override;

  private:
    std::string sysfs_root_;
    std::string dev_root_;
};

} // namespace wit
