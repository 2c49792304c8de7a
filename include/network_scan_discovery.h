// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "discovery_method.h"
#include "http_transport.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wit {

/**
 * @brief One HTTP endpoint probed on every candidate host
 *
 * A host matches when GET http://<ip>:<port><path> answers 200 and the body
 * contains @p signature (case-insensitive; empty matches any body).
 */
struct ScanEndpoint {
    std::string identifier; ///< Short tag used in names and metadata (e.g., "moonraker")
    uint16_t port = 80;
    std::string path = "/";
    std::string signature;
    ConnectionProtocol protocol = ConnectionProtocol::HTTP_REST;
    MachineType machine_type = MachineType::PRINTER_3D_FDM;
};

/// PrusaLink, OctoPrint, Moonraker and Duet probes
std::vector<ScanEndpoint> default_scan_endpoints();

struct NetworkScanOptions {
    std::string cidr = "192.168.1.0/24";
    std::vector<ScanEndpoint> endpoints = default_scan_endpoints();
    size_t max_concurrency = 20;           ///< Simultaneous probes in flight
    std::chrono::seconds probe_timeout{2}; ///< Per-request timeout
};

/**
 * @brief Parse "a.b.c.d/n" into a host-order network address and prefix
 *
 * Host bits in the address are cleared. @return false on malformed input
 */
bool parse_cidr(const std::string& cidr, uint32_t& network, int& prefix);

/**
 * @brief Candidate host addresses of a CIDR block, ascending
 *
 * Network and broadcast addresses are excluded (a /24 yields 254 hosts);
 * /31 yields both addresses and /32 the single address.
 *
 * @return Empty vector for malformed input
 */
std::vector<std::string> enumerate_hosts(const std::string& cidr);

/**
 * @brief Speculative HTTP sweep of an address range
 *
 * The slowest discovery method: every host x endpoint pair is probed, at most
 * max_concurrency at a time. Run it least often.
 */
class NetworkScanDiscovery : public DiscoveryMethod {
  public:
    /**
     * @param options Range, endpoints and limits
     * @param transport Request executor; nullptr selects the libhv transport
     * @throws std::invalid_argument for a malformed CIDR, a prefix shorter than /16,
     *         an empty or malformed endpoint list, or zero concurrency
     */
    explicit NetworkScanDiscovery(NetworkScanOptions options,
                                  std::shared_ptr<HttpTransport> transport = nullptr);

    std::vector<DiscoveredMachine> discover() override;

    std::string name() const override {
        return "network_scan";
    }

    /// Make an in-flight scan skip its remaining probes; sticky until rearm()
    void stop() override;

    void rearm() override;

    const NetworkScanOptions& options() const {
        return options_;
    }

  private:
    NetworkScanOptions options_;
    std::shared_ptr<HttpTransport> transport_;
    std::atomic<bool> cancelled_{false};
};

} // namespace wit
