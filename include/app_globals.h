// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

namespace wit {

// Forward declarations
class DiscoveryService;

/**
 * @brief Get the process-wide DiscoveryService
 *
 * Set once by the composition root (the CLI). Library code receives the
 * service through constructors and never reads this.
 *
 * @return Pointer to the service (nullptr if not set)
 */
DiscoveryService* get_discovery_service();

/**
 * @brief Register the process-wide DiscoveryService (non-owning)
 * @param service Pointer that outlives every caller of get_discovery_service(), or nullptr
 */
void set_discovery_service(DiscoveryService* service);

/// Ask long-running loops to exit (async-signal-safe)
void app_request_quit();

bool app_quit_requested();

} // namespace wit
