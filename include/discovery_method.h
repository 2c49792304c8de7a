// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "discovered_machine.h"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace wit {

/// Injectable steady-clock source; empty means std::chrono::steady_clock::now
using DiscoveryClock = std::function<std::chrono::steady_clock::time_point()>;

/**
 * @brief One pluggable probe run by DiscoveryService
 *
 * discover() returns whatever the probe finds in one pass and blocks for at
 * most its own probe duration. It must not mutate anything the service owns.
 * Failures inside a probe are logged and yield fewer (or no) records.
 */
class DiscoveryMethod {
  public:
    virtual ~DiscoveryMethod() = default;

    virtual std::vector<DiscoveredMachine> discover() = 0;

    /// Short name used in log lines (e.g., "serial", "mdns")
    virtual std::string name() const = 0;

    /// Release background resources (threads, sockets); safe to call repeatedly
    virtual void stop() {}

    /**
     * @brief Clear a previous stop() so later discover() calls do full work
     *
     * DiscoveryService calls this before it begins running the method, never
     * from inside a pass, so a stop() racing a pass start is not lost.
     */
    virtual void rearm() {}
};

} // namespace wit
