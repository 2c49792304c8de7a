// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file app_globals.cpp
 * @brief Process-wide accessors set by the composition root
 */

#include "app_globals.h"

#include <atomic>
#include <csignal>

namespace wit {

static std::atomic<DiscoveryService*> g_discovery_service{nullptr};

// Application quit flag
static volatile std::sig_atomic_t g_quit_requested = 0;

DiscoveryService* get_discovery_service() {
    return g_discovery_service.load();
}

void set_discovery_service(DiscoveryService* service) {
    g_discovery_service.store(service);
}

void app_request_quit() {
    g_quit_requested = 1;
}

bool app_quit_requested() {
    return g_quit_requested != 0;
}

} // namespace wit
