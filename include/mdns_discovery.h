// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "discovery_method.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wit {

/**
 * @brief Which TXT keys carry the declared device properties
 *
 * Print servers disagree on TXT vocabularies, so every key is configurable.
 * A key that is absent from a record falls back to MdnsOptions defaults.
 */
struct MdnsTxtSchema {
    std::string id_key = "id";                     ///< Stable device id
    std::string type_key = "type";                 ///< MachineType wire string
    std::string protocol_key = "protocol";         ///< ConnectionProtocol wire string
    std::string capabilities_key = "capabilities"; ///< Comma separated capability names
    std::string path_key = "path";                 ///< API root under the HTTP server
};

struct MdnsOptions {
    std::string service_type = "_octoprint._tcp.local."; ///< DNS-SD service to browse
    MachineType default_type = MachineType::PRINTER_3D_FDM;
    ConnectionProtocol default_protocol = ConnectionProtocol::OCTOPRINT;
    MdnsTxtSchema txt_schema;
    std::chrono::milliseconds query_interval{3000}; ///< Pause between PTR queries
    std::chrono::milliseconds receive_window{500};  ///< Listen time after each query
    /// Forget instances not re-announced for this long; 0 uses each record's own TTL
    std::chrono::seconds stale_after{0};
    bool auto_start = true; ///< discover() starts the browser thread unless stopped
    DiscoveryClock clock;   ///< Time source for expiry (steady_clock if empty)
};

/**
 * @brief One service instance assembled from PTR, SRV, A and TXT records
 */
struct MdnsServiceRecord {
    std::string instance_name; ///< e.g., "Workshop Prusa._octoprint._tcp.local."
    std::string hostname;      ///< SRV target (e.g., "octopi.local.")
    uint16_t port = 0;         ///< SRV port
    std::string ip_address;    ///< IPv4 address from the A record
    std::map<std::string, std::string> txt;
    uint32_t ttl = 120;        ///< Advertised TTL in seconds; 0 is a goodbye

    bool is_complete() const {
        return !hostname.empty() && port > 0 && !ip_address.empty();
    }
};

/**
 * @brief Decode a resolved service into a DiscoveredMachine
 *
 * discovery_id is "mdns_<declared id>" when the TXT record declares one,
 * otherwise "mdns_<ip>_<port>".
 *
 * @return std::nullopt for malformed records: incomplete address, or a
 *         declared type/protocol that names no known value. Unknown
 *         capability names are ignored.
 */
std::optional<DiscoveredMachine> build_discovered_machine(const MdnsServiceRecord& record,
                                                          const MdnsOptions& options);

/**
 * @brief DNS-SD browser for network-attached print servers
 *
 * Browsing is event-driven: a background thread re-queries the service type
 * every query_interval and feeds each resolved instance into a seen-set.
 * discover() only returns a snapshot of that set (starting the browser on
 * first use); it never performs a synchronous scan.
 *
 * An instance stays in the seen-set until its announcement goes stale
 * (record TTL, or stale_after when set) or it sends a goodbye (TTL 0).
 *
 * Threading model:
 * - mDNS socket I/O runs on the background thread
 * - the seen-set is guarded by one mutex shared with discover()
 * - stop() blocks until the background thread exits
 *
 * @code
 * MdnsDiscovery mdns;
 * mdns.start();
 * // ... a few seconds later
 * for (const auto& m : mdns.discover()) {
 *     spdlog::info("Found: {} at {}", m.name, m.connection_params["base_url"].get<std::string>());
 * }
 * @endcode
 */
class MdnsDiscovery : public DiscoveryMethod {
  public:
    /// @throws std::invalid_argument if the service type is not "_name._proto.local"
    explicit MdnsDiscovery(MdnsOptions options = {});
    ~MdnsDiscovery() override;

    // Non-copyable (owns background thread)
    MdnsDiscovery(const MdnsDiscovery&) = delete;
    MdnsDiscovery& operator=(const MdnsDiscovery&) = delete;

    std::vector<DiscoveredMachine> discover() override;

    std::string name() const override {
        return "mdns";
    }

    /// Start the browser thread; no-op if running
    void start();

    /// Stop the browser thread and wait for it; the seen-set is kept.
    /// discover() will not restart browsing until start() or rearm().
    void stop() override;

    void rearm() override;

    bool is_browsing() const;

    /**
     * @brief Add one resolved service to the seen-set
     *
     * Called from the browser thread; public so tests can inject records.
     * A record with ttl 0 removes the instance instead.
     * @return false if the record was malformed and dropped
     */
    bool on_service_resolved(const MdnsServiceRecord& record);

    const MdnsOptions& options() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace wit
