// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "discovery_config.h"

#include "../mocks/mock_http_transport.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace wit;
namespace fs = std::filesystem;

// Test fixture for Config class testing
class ConfigTestFixture {
  protected:
    Config config;

    ConfigTestFixture() {
        dir = fs::temp_directory_path() / "wit_config_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void set_data(const json& j) {
        config.data = j;
    }

    json& data() {
        return config.data;
    }

    std::string config_path() const {
        return (dir / "wit.json").string();
    }

    void write_file(const std::string& contents) {
        std::ofstream out(config_path());
        out << contents;
    }

    json read_file() {
        std::ifstream in(config_path());
        return json::parse(in);
    }

    fs::path dir;
};

// ============================================================================
// get() / set()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns nested values", "[config][get]") {
    set_data({{"discovery", {{"ttl_sec", 120}, {"mdns", {{"service_type", "_x._tcp.local"}}}}}});

    REQUIRE(config.get<int>("/discovery/ttl_sec") == 120);
    REQUIRE(config.get<std::string>("/discovery/mdns/service_type") == "_x._tcp.local");
    REQUIRE(config.get<json>("/discovery/mdns").is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() without default throws on missing key",
                 "[config][get]") {
    set_data({{"discovery", json::object()}});
    REQUIRE_THROWS_AS(config.get<std::string>("/discovery/missing"), nlohmann::detail::type_error);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default falls back", "[config][get]") {
    set_data({{"discovery", {{"ttl_sec", "soon"}}}});

    SECTION("missing key") {
        REQUIRE(config.get<int>("/discovery/interval_sec", 30) == 30);
        REQUIRE(config.get<std::string>("/nowhere/at/all", "dflt") == "dflt");
    }

    SECTION("wrong type") {
        REQUIRE(config.get<int>("/discovery/ttl_sec", 300) == 300);
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate objects", "[config][set]") {
    set_data(json::object());
    config.set<std::string>("/discovery/network_scan/cidr", "10.0.0.0/24");
    REQUIRE(config.get<std::string>("/discovery/network_scan/cidr") == "10.0.0.0/24");
    REQUIRE(config.get_json("/discovery/network_scan").is_object());
}

// ============================================================================
// File handling
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates a default file", "[config][file]") {
    config.init(config_path());

    REQUIRE(fs::exists(config_path()));
    REQUIRE(config.get_path() == config_path());
    REQUIRE(read_file() == Config::default_config());
    REQUIRE(config.get<int>("/discovery/ttl_sec") == 300);
    REQUIRE(config.get<bool>("/discovery/network_scan/enabled") == false);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() keeps user values and fills gaps",
                 "[config][file]") {
    write_file(R"({"log_level": "debug", "discovery": {"ttl_sec": 60}})");
    config.init(config_path());

    REQUIRE(config.get<std::string>("/log_level") == "debug");
    REQUIRE(config.get<int>("/discovery/ttl_sec") == 60);
    REQUIRE(config.get<int>("/discovery/interval_sec") == 30);
    REQUIRE(config.get<std::string>("/discovery/network_scan/cidr") == "192.168.1.0/24");

    // The merged result is written back
    REQUIRE(read_file()["discovery"]["serial"]["baud_rate"] == 115200);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: corrupt file is moved aside", "[config][file]") {
    write_file("{ not json");
    config.init(config_path());

    REQUIRE(fs::exists(config_path() + ".corrupt"));
    REQUIRE(config.get<int>("/discovery/ttl_sec") == 300);
    REQUIRE(read_file() == Config::default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: non-object file is treated as corrupt",
                 "[config][file]") {
    write_file("[1, 2, 3]");
    config.init(config_path());
    REQUIRE(fs::exists(config_path() + ".corrupt"));
    REQUIRE(data().is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() round trips through init()", "[config][file]") {
    config.init(config_path());
    config.set<int>("/discovery/interval_sec", 5);
    REQUIRE(config.save());
    REQUIRE_FALSE(fs::exists(config_path() + ".tmp"));

    Config reloaded;
    reloaded.init(config_path());
    REQUIRE(reloaded.get<int>("/discovery/interval_sec") == 5);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() before init() writes nothing",
                 "[config][file]") {
    REQUIRE_FALSE(config.save());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: reset_to_defaults()", "[config]") {
    set_data({{"log_level", "trace"}});
    config.reset_to_defaults();
    REQUIRE(config.get<std::string>("/log_level") == "warn");
}

// ============================================================================
// Settings builders
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: builders read defaults", "[config][discovery]") {
    set_data(Config::default_config());

    auto log = log_config_from(config, 0);
    REQUIRE(log.level == spdlog::level::warn);
    REQUIRE(log.target == logging::LogTarget::Console);

    REQUIRE(log_config_from(config, 2).level == spdlog::level::debug);

    REQUIRE(serial_options_from(config).baud_rate == 115200);
    REQUIRE(discovery_options_from(config).ttl == std::chrono::seconds(300));
    REQUIRE(discovery_interval_from(config) == std::chrono::seconds(30));

    auto mdns = mdns_options_from(config);
    REQUIRE(mdns.service_type == "_octoprint._tcp.local.");
    REQUIRE(mdns.txt_schema.capabilities_key == "capabilities");

    auto scan = network_scan_options_from(config);
    REQUIRE(scan.cidr == "192.168.1.0/24");
    REQUIRE(scan.max_concurrency == 20);
    REQUIRE(scan.probe_timeout == std::chrono::seconds(2));
    REQUIRE(scan.endpoints.size() == 4);
    REQUIRE(scan.endpoints[2].identifier == "moonraker");
    REQUIRE(scan.endpoints[2].port == 7125);
    REQUIRE(scan.endpoints[2].protocol == ConnectionProtocol::MOONRAKER);
    REQUIRE(scan.endpoints[2].machine_type == MachineType::PRINTER_3D_COREXY);

    auto factory = machine_factory_options_from(config);
    REQUIRE(factory.http_timeout == std::chrono::seconds(10));
    REQUIRE(factory.default_baud_rate == 115200);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: builders tolerate bad values", "[config][discovery]") {
    set_data(Config::default_config());
    config.set<int>("/discovery/interval_sec", 0);
    config.set<int>("/http/timeout_sec", -3);
    config.set<std::string>("/log_target", "pigeon");
    config.set<json>("/discovery/network_scan/endpoints",
                     json::array({{{"identifier", "ok"}, {"port", 8080}, {"path", "/status"}},
                                  {{"identifier", "no-port"}, {"path", "/x"}},
                                  {{"identifier", "big-port"}, {"port", 70000}, {"path", "/x"}},
                                  "not an object"}));

    REQUIRE(discovery_interval_from(config) == std::chrono::seconds(30));
    REQUIRE(machine_factory_options_from(config).http_timeout == std::chrono::seconds(10));
    REQUIRE(log_config_from(config, 0).target == logging::LogTarget::Auto);

    auto scan = network_scan_options_from(config);
    REQUIRE(scan.endpoints.size() == 1);
    REQUIRE(scan.endpoints[0].identifier == "ok");
    REQUIRE(scan.endpoints[0].protocol == ConnectionProtocol::HTTP_REST);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: build_discovery_methods honours enabled flags",
                 "[config][discovery]") {
    set_data(Config::default_config());
    auto http = std::make_shared<MockHttpTransport>();

    SECTION("defaults: serial and mdns") {
        auto methods = build_discovery_methods(config, http);
        REQUIRE(methods.size() == 2);
        REQUIRE(methods[0]->name() == "serial");
        REQUIRE(methods[1]->name() == "mdns");
    }

    SECTION("network scan enabled") {
        config.set<bool>("/discovery/network_scan/enabled", true);
        config.set<bool>("/discovery/serial/enabled", false);
        auto methods = build_discovery_methods(config, http);
        REQUIRE(methods.size() == 2);
        REQUIRE(methods[1]->name() == "network_scan");
    }

    SECTION("rejected settings leave the method out") {
        config.set<bool>("/discovery/network_scan/enabled", true);
        config.set<std::string>("/discovery/network_scan/cidr", "10.0.0.0/8");
        config.set<std::string>("/discovery/mdns/service_type", "not-a-service");
        auto methods = build_discovery_methods(config, http);
        REQUIRE(methods.size() == 1);
        REQUIRE(methods[0]->name() == "serial");
    }
}
