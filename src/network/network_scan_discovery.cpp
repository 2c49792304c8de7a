// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file network_scan_discovery.cpp
 * @brief Bounded-concurrency HTTP sweep of a CIDR block
 *
 * @threading discover() spawns up to max_concurrency workers that pull probe
 *            indices from a shared counter and joins them before returning
 */

#include "network_scan_discovery.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace wit {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string ipv4_to_string(uint32_t host_order) {
    struct in_addr addr;
    addr.s_addr = htonl(host_order);
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf))) {
        return std::string(buf);
    }
    return "";
}

} // namespace

std::vector<ScanEndpoint> default_scan_endpoints() {
    return {
        {"prusa", 80, "/api/version", "prusalink", ConnectionProtocol::PRUSALINK,
         MachineType::PRINTER_3D_FDM},
        {"octoprint", 80, "/api/version", "octoprint", ConnectionProtocol::OCTOPRINT,
         MachineType::PRINTER_3D_FDM},
        {"moonraker", 7125, "/server/info", "moonraker", ConnectionProtocol::MOONRAKER,
         MachineType::PRINTER_3D_COREXY},
        {"duet", 80, "/rr_status", "\"status\"", ConnectionProtocol::DUET_RRF,
         MachineType::PRINTER_3D_FDM},
    };
}

bool parse_cidr(const std::string& cidr, uint32_t& network, int& prefix) {
    auto slash = cidr.find('/');
    if (slash == std::string::npos || slash + 1 >= cidr.size()) {
        return false;
    }

    std::string addr_part = cidr.substr(0, slash);
    std::string prefix_part = cidr.substr(slash + 1);
    if (prefix_part.size() > 2 ||
        !std::all_of(prefix_part.begin(), prefix_part.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    int bits = std::stoi(prefix_part);
    if (bits < 0 || bits > 32) {
        return false;
    }

    struct in_addr addr;
    if (inet_pton(AF_INET, addr_part.c_str(), &addr) != 1) {
        return false;
    }

    uint32_t mask = bits == 0 ? 0 : (0xFFFFFFFFu << (32 - bits));
    network = ntohl(addr.s_addr) & mask;
    prefix = bits;
    return true;
}

std::vector<std::string> enumerate_hosts(const std::string& cidr) {
    uint32_t network = 0;
    int prefix = 0;
    if (!parse_cidr(cidr, network, prefix)) {
        return {};
    }

    std::vector<std::string> hosts;
    if (prefix == 32) {
        hosts.push_back(ipv4_to_string(network));
        return hosts;
    }

    uint64_t size = uint64_t(1) << (32 - prefix);
    uint64_t first = network;
    uint64_t last = network + size - 1;
    if (prefix < 31) {
        ++first; // network address
        --last;  // broadcast address
    }

    hosts.reserve(static_cast<size_t>(last - first + 1));
    for (uint64_t a = first; a <= last; ++a) {
        hosts.push_back(ipv4_to_string(static_cast<uint32_t>(a)));
    }
    return hosts;
}

NetworkScanDiscovery::NetworkScanDiscovery(NetworkScanOptions options,
                                           std::shared_ptr<HttpTransport> transport)
    : options_(std::move(options)),
      transport_(transport ? std::move(transport) : HttpTransport::create()) {
    uint32_t network = 0;
    int prefix = 0;
    if (!parse_cidr(options_.cidr, network, prefix)) {
        throw std::invalid_argument("Invalid CIDR '" + options_.cidr + "'");
    }
    if (prefix < 16) {
        throw std::invalid_argument("CIDR '" + options_.cidr +
                                    "' is wider than /16; refusing to scan");
    }
    if (options_.endpoints.empty()) {
        throw std::invalid_argument("Network scan needs at least one endpoint");
    }
    for (const auto& ep : options_.endpoints) {
        if (ep.port == 0 || ep.path.empty() || ep.path.front() != '/') {
            throw std::invalid_argument("Malformed scan endpoint '" + ep.identifier + "'");
        }
    }
    if (options_.max_concurrency == 0) {
        throw std::invalid_argument("Network scan concurrency must be at least 1");
    }
    if (options_.probe_timeout.count() <= 0) {
        throw std::invalid_argument("Network scan timeout must be positive");
    }
}

void NetworkScanDiscovery::stop() {
    cancelled_.store(true);
}

void NetworkScanDiscovery::rearm() {
    cancelled_.store(false);
}

std::vector<DiscoveredMachine> NetworkScanDiscovery::discover() {
    if (cancelled_.load()) {
        spdlog::debug("[NetworkScan] Stopped; skipping scan of {}", options_.cidr);
        return {};
    }

    const auto hosts = enumerate_hosts(options_.cidr);
    const auto& endpoints = options_.endpoints;
    const size_t total = hosts.size() * endpoints.size();

    spdlog::info("[NetworkScan] Probing {} hosts x {} endpoints in {}", hosts.size(),
                 endpoints.size(), options_.cidr);

    std::mutex results_mutex;
    std::map<std::string, DiscoveredMachine> results;
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (!cancelled_.load()) {
            size_t i = next.fetch_add(1);
            if (i >= total) {
                return;
            }
            const std::string& ip = hosts[i / endpoints.size()];
            const ScanEndpoint& ep = endpoints[i % endpoints.size()];
            const std::string id = "network_" + ip + "_" + std::to_string(ep.port);

            HttpCall call;
            call.method = "GET";
            call.url = "http://" + ip + ":" + std::to_string(ep.port) + ep.path;
            call.timeout = options_.probe_timeout;

            HttpReply reply = transport_->perform(call);
            if (!reply.transport_ok || reply.status != 200) {
                continue; // expected for most addresses
            }
            if (!ep.signature.empty() &&
                lower(reply.body).find(lower(ep.signature)) == std::string::npos) {
                spdlog::trace("[NetworkScan] {} answered without '{}' signature", call.url,
                              ep.signature);
                continue;
            }

            DiscoveredMachine m;
            m.discovery_id = id;
            m.name = ep.identifier + " at " + ip;
            m.machine_type = ep.machine_type;
            m.connection_protocol = ep.protocol;
            m.connection_params = {{"base_url", "http://" + ip + ":" + std::to_string(ep.port)},
                                   {"ip", ip},
                                   {"port", ep.port}};
            m.metadata = {{"endpoint", ep.path},
                          {"identifier", ep.identifier},
                          {"response_preview", reply.body.substr(0, 200)}};

            std::lock_guard<std::mutex> lock(results_mutex);
            // Earlier endpoints in the list win when two match the same ip:port
            auto it = results.find(id);
            if (it == results.end() || (i % endpoints.size()) <
                                           static_cast<size_t>(it->second.metadata["order"])) {
                m.metadata["order"] = i % endpoints.size();
                spdlog::info("[NetworkScan] Found {} ({})", m.name, to_string(m.connection_protocol));
                results[id] = std::move(m);
            }
        }
    };

    size_t worker_count = std::min(options_.max_concurrency, std::max<size_t>(total, 1));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t w = 0; w < worker_count; ++w) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (cancelled_.load()) {
        spdlog::info("[NetworkScan] Scan of {} stopped early", options_.cidr);
    }

    std::vector<DiscoveredMachine> found;
    found.reserve(results.size());
    for (auto& [id, machine] : results) {
        machine.metadata.erase("order");
        found.push_back(std::move(machine));
    }
    return found;
}

} // namespace wit
