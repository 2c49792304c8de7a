// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "discovery_config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace wit {

logging::LogConfig log_config_from(Config& config, int verbosity) {
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(verbosity, config.get<std::string>("/log_level", ""), false);
    log_config.target =
        logging::parse_log_target(config.get<std::string>("/log_target", "console"));
    log_config.file_path = config.get<std::string>("/log_file", "");
    return log_config;
}

SerialDiscoveryOptions serial_options_from(Config& config) {
    SerialDiscoveryOptions options;
    options.baud_rate = config.get<uint32_t>("/discovery/serial/baud_rate", options.baud_rate);
    return options;
}

MdnsOptions mdns_options_from(Config& config) {
    MdnsOptions options;
    options.service_type =
        config.get<std::string>("/discovery/mdns/service_type", options.service_type);
    int stale_after = config.get<int>("/discovery/mdns/stale_after_sec", 0);
    options.stale_after = std::chrono::seconds(std::max(stale_after, 0));

    auto& schema = options.txt_schema;
    schema.id_key = config.get<std::string>("/discovery/mdns/txt_schema/id", schema.id_key);
    schema.type_key = config.get<std::string>("/discovery/mdns/txt_schema/type", schema.type_key);
    schema.capabilities_key = config.get<std::string>("/discovery/mdns/txt_schema/capabilities",
                                                      schema.capabilities_key);
    schema.path_key = config.get<std::string>("/discovery/mdns/txt_schema/path", schema.path_key);
    return options;
}

NetworkScanOptions network_scan_options_from(Config& config) {
    NetworkScanOptions options;
    options.cidr = config.get<std::string>("/discovery/network_scan/cidr", options.cidr);
    options.max_concurrency =
        config.get<size_t>("/discovery/network_scan/max_concurrency", options.max_concurrency);
    options.probe_timeout = std::chrono::seconds(config.get<int>(
        "/discovery/network_scan/timeout_sec", static_cast<int>(options.probe_timeout.count())));

    json endpoints = config.get<json>("/discovery/network_scan/endpoints", json());
    if (endpoints.is_array()) {
        options.endpoints.clear();
        for (const auto& e : endpoints) {
            if (!e.is_object() || !e.contains("port") || !e.contains("path") ||
                !e["port"].is_number_unsigned() || e["port"].get<uint32_t>() > 65535 ||
                !e["path"].is_string()) {
                spdlog::warn("[Config] Skipping malformed scan endpoint: {}", e.dump());
                continue;
            }
            ScanEndpoint ep;
            ep.identifier = e.value("identifier", std::string("http"));
            ep.port = e["port"].get<uint16_t>();
            ep.path = e["path"].get<std::string>();
            ep.signature = e.value("signature", std::string());
            ep.protocol = protocol_from_string(e.value("protocol", std::string("http_rest")));
            ep.machine_type =
                machine_type_from_string(e.value("machine_type", std::string("3d_printer_fdm")));
            options.endpoints.push_back(std::move(ep));
        }
    }
    return options;
}

DiscoveryOptions discovery_options_from(Config& config) {
    DiscoveryOptions options;
    options.ttl = std::chrono::seconds(
        config.get<int>("/discovery/ttl_sec", static_cast<int>(options.ttl.count())));
    return options;
}

std::chrono::seconds discovery_interval_from(Config& config) {
    int sec = config.get<int>("/discovery/interval_sec", 30);
    return std::chrono::seconds(sec > 0 ? sec : 30);
}

MachineFactoryOptions machine_factory_options_from(Config& config) {
    MachineFactoryOptions options;
    int timeout = config.get<int>("/http/timeout_sec", 10);
    options.http_timeout = std::chrono::seconds(timeout > 0 ? timeout : 10);
    options.default_baud_rate =
        config.get<uint32_t>("/discovery/serial/baud_rate", options.default_baud_rate);
    return options;
}

std::vector<std::shared_ptr<DiscoveryMethod>>
build_discovery_methods(Config& config, std::shared_ptr<HttpTransport> transport) {
    std::vector<std::shared_ptr<DiscoveryMethod>> methods;

    if (config.get<bool>("/discovery/serial/enabled", true)) {
        methods.push_back(std::make_shared<SerialDiscovery>(nullptr, serial_options_from(config)));
    }

    if (config.get<bool>("/discovery/mdns/enabled", true)) {
        try {
            methods.push_back(std::make_shared<MdnsDiscovery>(mdns_options_from(config)));
        } catch (const std::invalid_argument& e) {
            spdlog::error("[Config] mDNS discovery disabled: {}", e.what());
        }
    }

    if (config.get<bool>("/discovery/network_scan/enabled", false)) {
        try {
            methods.push_back(
                std::make_shared<NetworkScanDiscovery>(network_scan_options_from(config), transport));
        } catch (const std::invalid_argument& e) {
            spdlog::error("[Config] Network scan disabled: {}", e.what());
        }
    }

    spdlog::debug("[Config] {} discovery methods enabled", methods.size());
    return methods;
}

} // namespace wit
