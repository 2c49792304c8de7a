// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file wit_discover.cpp
 * @brief Standalone diagnostic tool for machine discovery and control
 *
 * Usage: wit-discover [options]
 *   --ports              List serial ports and exit
 *   --once               Run one discovery pass and print the results (default)
 *   --watch <sec>        Run continuous discovery, printing changes until Ctrl-C
 *   --config <path>      Config file (default: ./wit.json)
 *   --probe <target>     Connect to a serial device or http(s) URL and dump its info
 *   --protocol <name>    Protocol for --probe (default: serial_gcode or octoprint)
 *   --api-key <key>      API key for --probe over HTTP
 *   -v, -vv, -vvv        Verbosity
 */

#include "app_globals.h"
#include "config.h"
#include "discovery_config.h"
#include "discovery_service.h"
#include "logging_init.h"
#include "machine.h"
#include "machine_factory.h"
#include "serial_connection.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>

using namespace wit;

namespace {

void print_header(const std::string& title) {
    std::cout << "\n== " << title << " ==\n";
}

void print_kv(const std::string& key, const std::string& value) {
    std::cout << "  " << std::left << std::setw(22) << key << ": " << value << "\n";
}

void print_machine(const DiscoveredMachine& m) {
    std::cout << "\n" << m.name << "\n";
    print_kv("id", m.discovery_id);
    print_kv("type", to_string(m.machine_type));
    print_kv("protocol", to_string(m.connection_protocol));
    print_kv("connection", m.connection_params.dump());
    if (!m.metadata.empty()) {
        print_kv("metadata", m.metadata.dump());
    }
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--ports | --once | --watch <sec> | --probe <target>]\n"
              << "Options:\n"
              << "  --ports              List serial ports and exit\n"
              << "  --once               One discovery pass (default)\n"
              << "  --watch <sec>        Continuous discovery at the given interval\n"
              << "  --config <path>      Config file (default: wit.json)\n"
              << "  --probe <target>     Serial device or http(s) URL to connect to\n"
              << "  --protocol <name>    Protocol for --probe\n"
              << "  --api-key <key>      API key for --probe over HTTP\n"
              << "  -v, -vv, -vvv        Increase verbosity\n";
}

int run_ports() {
    print_header("Serial Ports");
    auto ports = SerialConnection::list_ports();
    if (ports.empty()) {
        std::cout << "  (none)\n";
    }
    for (const auto& p : ports) {
        std::cout << "  " << p.device << "  " << p.description << "  " << p.hwid << "\n";
    }
    return 0;
}

int run_once(Config& config) {
    DiscoveryService service(build_discovery_methods(config), discovery_options_from(config));
    set_discovery_service(&service);

    print_header("Discovery");
    auto found = service.discover_once();
    if (found.empty()) {
        std::cout << "  No machines found\n";
    }
    for (const auto& m : found) {
        print_machine(m);
    }

    set_discovery_service(nullptr);
    return 0;
}

int run_watch(Config& config, int interval_sec) {
    DiscoveryService service(build_discovery_methods(config), discovery_options_from(config));
    set_discovery_service(&service);

    service.add_discovery_listener([](const DiscoveredMachine& m) { print_machine(m); });

    std::cout << "Watching every " << interval_sec << "s, Ctrl-C to stop\n";
    service.start_continuous_discovery(std::chrono::seconds(interval_sec));
    while (!app_quit_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    service.stop_continuous_discovery();
    service.wait_for_idle(std::chrono::seconds(2));

    print_header("Cached");
    for (const auto& m : service.get_discovered_machines()) {
        print_kv(m.discovery_id, m.name);
    }

    set_discovery_service(nullptr);
    return 0;
}

int run_probe(Config& config, const std::string& target, const std::string& protocol_name,
              const std::string& api_key) {
    DiscoveredMachine record;
    record.discovery_id = "probe";
    record.name = target;

    bool is_url = target.rfind("http://", 0) == 0 || target.rfind("https://", 0) == 0;
    std::string proto = protocol_name.empty() ? (is_url ? "octoprint" : "serial_gcode")
                                              : protocol_name;
    record.connection_protocol = protocol_from_string(proto);
    if (record.connection_protocol == ConnectionProtocol::UNKNOWN) {
        std::cerr << "Unknown protocol '" << proto << "'\n";
        return 1;
    }

    if (is_serial_protocol(record.connection_protocol)) {
        record.connection_params = {
            {"port", target},
            {"baud_rate", config.get<uint32_t>("/discovery/serial/baud_rate", 115200)}};
    } else {
        record.connection_params = {{"base_url", target}, {"api_key", api_key}};
    }

    auto machine = create_machine("probe", record, machine_factory_options_from(config));
    if (!machine) {
        std::cerr << "No machine implementation for protocol '" << proto << "'\n";
        return 1;
    }

    print_header("Connecting to " + target);
    if (!machine->connect()) {
        std::cerr << "Connection failed: " << machine->get_info()["connection"].dump() << "\n";
        return 2;
    }

    std::cout << machine->get_info().dump(2) << "\n";

    print_header("Status");
    auto temps = machine->get_temperatures();
    print_kv("temperatures", temps.ok() ? temps.data().dump() : temps.error_message());
    auto progress = machine->get_progress();
    print_kv("progress", progress.ok() ? progress.data().dump() : progress.error_message());
    auto job = machine->get_current_job();
    print_kv("job", job.ok() ? job.data().dump() : job.error_message());

    machine->disconnect();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    logging::init_early();

    std::string mode = "once";
    std::string config_path = "wit.json";
    std::string probe_target;
    std::string protocol_name;
    std::string api_key;
    int watch_sec = 0;
    int verbosity = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--ports") {
            mode = "ports";
        } else if (arg == "--once") {
            mode = "once";
        } else if (arg == "--watch") {
            std::string v;
            if (!next_value(v)) {
                return 1;
            }
            try {
                watch_sec = std::stoi(v);
            } catch (const std::exception&) {
                watch_sec = 0;
            }
            if (watch_sec <= 0) {
                std::cerr << "--watch needs a positive number of seconds\n";
                return 1;
            }
            mode = "watch";
        } else if (arg == "--config") {
            if (!next_value(config_path)) {
                return 1;
            }
        } else if (arg == "--probe") {
            if (!next_value(probe_target)) {
                return 1;
            }
            mode = "probe";
        } else if (arg == "--protocol") {
            if (!next_value(protocol_name)) {
                return 1;
            }
        } else if (arg == "--api-key") {
            if (!next_value(api_key)) {
                return 1;
            }
        } else if (arg == "-v" || arg == "-vv" || arg == "-vvv") {
            verbosity += static_cast<int>(arg.size()) - 1;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    Config* config = Config::get_instance();
    config->init(config_path);
    logging::init(log_config_from(*config, verbosity));

    std::signal(SIGINT, [](int) { app_request_quit(); });
    std::signal(SIGTERM, [](int) { app_request_quit(); });

    spdlog::info("[wit-discover] Mode: {}", mode);

    if (mode == "ports") {
        return run_ports();
    }
    if (mode == "watch") {
        return run_watch(*config, watch_sec);
    }
    if (mode == "probe") {
        return run_probe(*config, probe_target, protocol_name, api_key);
    }
    return run_once(*config);
}
