// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config.h"
#include "discovery_service.h"
#include "http_transport.h"
#include "logging_init.h"
#include "machine_factory.h"
#include "mdns_discovery.h"
#include "network_scan_discovery.h"
#include "serial_discovery.h"

#include <chrono>
#include <memory>
#include <vector>

namespace wit {

/// Log settings from /log_level, /log_target and /log_file; CLI verbosity wins
logging::LogConfig log_config_from(Config& config, int verbosity);

SerialDiscoveryOptions serial_options_from(Config& config);
MdnsOptions mdns_options_from(Config& config);

/**
 * @brief Network scan settings from /discovery/network_scan
 *
 * Endpoint entries missing port or path are skipped with a warning; validation
 * of the result happens in the NetworkScanDiscovery constructor.
 */
NetworkScanOptions network_scan_options_from(Config& config);

DiscoveryOptions discovery_options_from(Config& config);
std::chrono::seconds discovery_interval_from(Config& config);
MachineFactoryOptions machine_factory_options_from(Config& config);

/**
 * @brief Instantiate every enabled discovery method, cheapest first
 *
 * A method whose settings are rejected is logged and left out.
 */
std::vector<std::shared_ptr<DiscoveryMethod>>
build_discovery_methods(Config& config, std::shared_ptr<HttpTransport> transport = nullptr);

} // namespace wit
