// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file serial_port_posix.cpp
 * @brief termios-backed SerialPort
 *
 * @threading Not thread-safe; SerialConnection serializes access under its own mutex
 * @gotchas Opening most USB-CDC boards toggles DTR and reboots the firmware; the
 *          caller's handshake must tolerate boot banner lines before the reply
 */

#include "serial_port.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace wit {

namespace {

bool baud_to_speed(uint32_t baud, speed_t& out) {
    switch (baud) {
    case 9600:
        out = B9600;
        return true;
    case 19200:
        out = B19200;
        return true;
    case 38400:
        out = B38400;
        return true;
    case 57600:
        out = B57600;
        return true;
    case 115200:
        out = B115200;
        return true;
    case 230400:
        out = B230400;
        return true;
#ifdef B460800
    case 460800:
        out = B460800;
        return true;
#endif
#ifdef B921600
    case 921600:
        out = B921600;
        return true;
#endif
    default:
        return false;
    }
}

} // namespace

PosixSerialPort::~PosixSerialPort() {
    close();
}

bool PosixSerialPort::open(const std::string& device, uint32_t baud_rate,
                           std::chrono::milliseconds read_timeout, std::string& error) {
    close();

    speed_t speed;
    if (!baud_to_speed(baud_rate, speed)) {
        error = "Unsupported baud rate " + std::to_string(baud_rate);
        return false;
    }

    int fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        error = "open " + device + ": " + strerror(errno);
        return false;
    }

    struct termios tty;
    if (tcgetattr(fd, &tty) != 0) {
        error = "tcgetattr " + device + ": " + strerror(errno);
        ::close(fd);
        return false;
    }

    cfmakeraw(&tty);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    if (tcsetattr(fd, TCSANOW, &tty) != 0) {
        error = "tcsetattr " + device + ": " + strerror(errno);
        ::close(fd);
        return false;
    }

    fd_ = fd;
    read_timeout_ = read_timeout;
    pending_.clear();
    spdlog::debug("[PosixSerialPort] Opened {} at {} baud (read timeout {}ms)", device, baud_rate,
                  read_timeout.count());
    return true;
}

void PosixSerialPort::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        spdlog::debug("[PosixSerialPort] Closed");
    }
    pending_.clear();
}

bool PosixSerialPort::is_open() const {
    return fd_ >= 0;
}

void PosixSerialPort::flush_buffers() {
    if (fd_ >= 0) {
        tcflush(fd_, TCIOFLUSH);
    }
    pending_.clear();
}

void PosixSerialPort::discard_input() {
    if (fd_ >= 0) {
        tcflush(fd_, TCIFLUSH);
    }
    pending_.clear();
}

bool PosixSerialPort::write_line(const std::string& line, std::string& error) {
    if (fd_ < 0) {
        error = "Port not open";
        return false;
    }

    std::string out = line + "\n";
    size_t written = 0;
    auto deadline = std::chrono::steady_clock::now() + read_timeout_;

    while (written < out.size()) {
        ssize_t n = ::write(fd_, out.data() + written, out.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            error = std::string("write: ") + strerror(errno);
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            error = "write timeout";
            return false;
        }
        struct pollfd pfd = {fd_, POLLOUT, 0};
        poll(&pfd, 1, static_cast<int>(remaining.count()));
    }

    tcdrain(fd_);
    return true;
}

std::optional<std::string> PosixSerialPort::read_line(std::string& error) {
    if (fd_ < 0) {
        error = "Port not open";
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + read_timeout_;
    char buf[256];

    while (true) {
        auto nl = pending_.find('\n');
        if (nl != std::string::npos) {
            std::string line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt; // timeout, error left empty
        }

        struct pollfd pfd = {fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = std::string("poll: ") + strerror(errno);
            return std::nullopt;
        }
        if (ready == 0) {
            continue;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            error = "device disconnected";
            return std::nullopt;
        }

        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
            pending_.append(buf, static_cast<size_t>(n));
        } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            error = std::string("read: ") + strerror(errno);
            return std::nullopt;
        }
    }
}

} // namespace wit
