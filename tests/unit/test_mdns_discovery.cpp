// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mdns_discovery.h"

#include "../mocks/fake_discovery_method.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace wit;

namespace {

MdnsServiceRecord prusa_record() {
    MdnsServiceRecord r;
    r.instance_name = "Workshop Prusa._octoprint._tcp.local.";
    r.hostname = "octopi.local.";
    r.port = 80;
    r.ip_address = "192.168.1.50";
    return r;
}

MdnsOptions manual_options() {
    MdnsOptions options;
    options.auto_start = false;
    return options;
}

} // namespace

// ============================================================================
// Record decoding
// ============================================================================

TEST_CASE("build_discovered_machine: plain record uses defaults", "[mdns][discovery]") {
    auto m = build_discovered_machine(prusa_record(), MdnsOptions{});
    REQUIRE(m);
    REQUIRE(m->discovery_id == "mdns_192.168.1.50_80");
    REQUIRE(m->name == "Workshop Prusa");
    REQUIRE(m->machine_type == MachineType::PRINTER_3D_FDM);
    REQUIRE(m->connection_protocol == ConnectionProtocol::OCTOPRINT);
    REQUIRE(m->connection_params["base_url"] == "http://192.168.1.50:80");
    REQUIRE(m->connection_params["ip"] == "192.168.1.50");
    REQUIRE(m->connection_params["port"] == 80);
    REQUIRE(m->metadata["hostname"] == "octopi.local.");
    REQUIRE(m->metadata["capabilities"].empty());
}

TEST_CASE("build_discovered_machine: TXT fields declare the device", "[mdns][discovery]") {
    auto r = prusa_record();
    r.txt = {{"id", "mk4-0042"},
             {"type", "corexy"},
             {"protocol", "moonraker"},
             {"capabilities", "start, pause,teleport, camera"},
             {"path", "api/"}};

    auto m = build_discovered_machine(r, MdnsOptions{});
    REQUIRE(m);
    REQUIRE(m->discovery_id == "mdns_mk4-0042");
    REQUIRE(m->machine_type == MachineType::PRINTER_3D_COREXY);
    REQUIRE(m->connection_protocol == ConnectionProtocol::MOONRAKER);
    REQUIRE(m->connection_params["base_url"] == "http://192.168.1.50:80/api");
    REQUIRE(m->metadata["capabilities"] == json::array({"start", "pause", "camera"}));
    REQUIRE(m->metadata["txt"]["id"] == "mk4-0042");
}

TEST_CASE("build_discovered_machine: custom TXT schema", "[mdns][discovery]") {
    MdnsOptions options;
    options.txt_schema.id_key = "serial";
    options.txt_schema.type_key = "kind";

    auto r = prusa_record();
    r.txt = {{"serial", "SN123"}, {"kind", "sla"}, {"id", "ignored"}};

    auto m = build_discovered_machine(r, options);
    REQUIRE(m);
    REQUIRE(m->discovery_id == "mdns_SN123");
    REQUIRE(m->machine_type == MachineType::PRINTER_3D_SLA);
}

TEST_CASE("build_discovered_machine: malformed records are dropped", "[mdns][discovery]") {
    SECTION("no address") {
        auto r = prusa_record();
        r.ip_address.clear();
        REQUIRE_FALSE(build_discovered_machine(r, MdnsOptions{}));
    }

    SECTION("no port") {
        auto r = prusa_record();
        r.port = 0;
        REQUIRE_FALSE(build_discovered_machine(r, MdnsOptions{}));
    }

    SECTION("unknown declared type") {
        auto r = prusa_record();
        r.txt = {{"type", "toaster"}};
        REQUIRE_FALSE(build_discovered_machine(r, MdnsOptions{}));
    }

    SECTION("unknown declared protocol") {
        auto r = prusa_record();
        r.txt = {{"protocol", "carrier-pigeon"}};
        REQUIRE_FALSE(build_discovered_machine(r, MdnsOptions{}));
    }
}

// ============================================================================
// Browser seen-set
// ============================================================================

TEST_CASE("MdnsDiscovery: invalid service types are rejected", "[mdns][discovery]") {
    MdnsOptions options = manual_options();

    options.service_type = "octoprint";
    REQUIRE_THROWS_AS(MdnsDiscovery(options), std::invalid_argument);

    options.service_type = "_octoprint._tcp.example.com";
    REQUIRE_THROWS_AS(MdnsDiscovery(options), std::invalid_argument);

    options.service_type = "_moonraker._tcp.local";
    REQUIRE_NOTHROW(MdnsDiscovery(options));
}

TEST_CASE("MdnsDiscovery: resolved services feed discover()", "[mdns][discovery]") {
    MdnsDiscovery mdns(manual_options());
    REQUIRE(mdns.name() == "mdns");
    REQUIRE(mdns.discover().empty());
    REQUIRE_FALSE(mdns.is_browsing());

    REQUIRE(mdns.on_service_resolved(prusa_record()));

    auto bad = prusa_record();
    bad.port = 0;
    REQUIRE_FALSE(mdns.on_service_resolved(bad));

    auto found = mdns.discover();
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].name == "Workshop Prusa");
}

TEST_CASE("MdnsDiscovery: a re-announced service replaces the old record", "[mdns][discovery]") {
    MdnsDiscovery mdns(manual_options());

    auto r = prusa_record();
    r.txt = {{"id", "printer-1"}};
    REQUIRE(mdns.on_service_resolved(r));

    r.ip_address = "192.168.1.77";
    REQUIRE(mdns.on_service_resolved(r));

    auto found = mdns.discover();
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].connection_params["ip"] == "192.168.1.77");
}

TEST_CASE("MdnsDiscovery: stop keeps the seen-set", "[mdns][discovery]") {
    MdnsDiscovery mdns(manual_options());
    REQUIRE(mdns.on_service_resolved(prusa_record()));
    mdns.stop();
    REQUIRE(mdns.discover().size() == 1);
}

TEST_CASE("MdnsDiscovery: stopped browser is not restarted until rearmed", "[mdns][discovery]") {
    MdnsOptions options;
    options.query_interval = std::chrono::milliseconds(50);
    options.receive_window = std::chrono::milliseconds(10);
    MdnsDiscovery mdns(options);

    mdns.stop();
    mdns.discover();
    REQUIRE_FALSE(mdns.is_browsing());

    // Rearming only lifts the block; it does not browse by itself
    mdns.rearm();
    REQUIRE_FALSE(mdns.is_browsing());
}

class MdnsExpiryFixture {
  protected:
    MdnsOptions clocked_options(std::chrono::seconds stale_after = std::chrono::seconds(0)) {
        MdnsOptions options;
        options.auto_start = false;
        options.stale_after = stale_after;
        options.clock = [this]() { return clock.now(); };
        return options;
    }

    ManualClock clock;
};

TEST_CASE_METHOD(MdnsExpiryFixture, "MdnsDiscovery: silent instances drop out after their TTL",
                 "[mdns][discovery][expiry]") {
    MdnsDiscovery mdns(clocked_options());
    auto r = prusa_record();
    r.ttl = 120;
    REQUIRE(mdns.on_service_resolved(r));

    clock.advance(std::chrono::seconds(120));
    REQUIRE(mdns.discover().size() == 1);

    clock.advance(std::chrono::seconds(1));
    REQUIRE(mdns.discover().empty());
}

TEST_CASE_METHOD(MdnsExpiryFixture, "MdnsDiscovery: re-announcement extends the lifetime",
                 "[mdns][discovery][expiry]") {
    MdnsDiscovery mdns(clocked_options());
    auto r = prusa_record();
    r.ttl = 60;
    REQUIRE(mdns.on_service_resolved(r));

    clock.advance(std::chrono::seconds(50));
    REQUIRE(mdns.on_service_resolved(r));
    clock.advance(std::chrono::seconds(50));
    REQUIRE(mdns.discover().size() == 1);

    clock.advance(std::chrono::seconds(11));
    REQUIRE(mdns.discover().empty());
}

TEST_CASE_METHOD(MdnsExpiryFixture, "MdnsDiscovery: stale_after overrides the record TTL",
                 "[mdns][discovery][expiry]") {
    MdnsDiscovery mdns(clocked_options(std::chrono::seconds(10)));
    auto r = prusa_record();
    r.ttl = 4500;
    REQUIRE(mdns.on_service_resolved(r));

    clock.advance(std::chrono::seconds(11));
    REQUIRE(mdns.discover().empty());
}

TEST_CASE_METHOD(MdnsExpiryFixture, "MdnsDiscovery: goodbye removes the instance",
                 "[mdns][discovery][expiry]") {
    MdnsDiscovery mdns(clocked_options());
    REQUIRE(mdns.on_service_resolved(prusa_record()));

    MdnsServiceRecord goodbye;
    goodbye.instance_name = prusa_record().instance_name;
    goodbye.ttl = 0;
    REQUIRE(mdns.on_service_resolved(goodbye));
    REQUIRE(mdns.discover().empty());
}

TEST_CASE_METHOD(MdnsExpiryFixture, "MdnsDiscovery: moved instance keeps a single record",
                 "[mdns][discovery][expiry]") {
    MdnsDiscovery mdns(clocked_options());
    auto r = prusa_record();
    REQUIRE(mdns.on_service_resolved(r));

    r.ip_address = "192.168.1.51";
    REQUIRE(mdns.on_service_resolved(r));

    auto found = mdns.discover();
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].discovery_id == "mdns_192.168.1.51_80");
}
