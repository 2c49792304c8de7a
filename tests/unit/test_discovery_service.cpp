// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "discovery_service.h"

#include "../mocks/fake_discovery_method.h"

#include <catch2/catch_test_macros.hpp>

#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace wit;

namespace {

/// Collects listener deliveries across threads
class EventLog {
  public:
    DiscoveryListener listener() {
        return [this](const DiscoveredMachine& m) {
            std::lock_guard<std::mutex> lock(mutex_);
            ids_.push_back(m.discovery_id);
            names_.push_back(m.name);
        };
    }

    std::vector<std::string> ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ids_;
    }

    std::vector<std::string> names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return names_;
    }

  private:
    mutable std::mutex mutex_;
    std::vector<std::string> ids_;
    std::vector<std::string> names_;
};

} // namespace

class DiscoveryServiceFixture {
  protected:
    DiscoveryServiceFixture()
        : serial(std::make_shared<FakeDiscoveryMethod>("serial")),
          mdns(std::make_shared<FakeDiscoveryMethod>("mdns")) {}

    std::unique_ptr<DiscoveryService> make_service(DiscoveryOptions options = {}) {
        return std::make_unique<DiscoveryService>(
            std::vector<std::shared_ptr<DiscoveryMethod>>{serial, mdns}, options,
            [this]() { return clock.now(); });
    }

    std::shared_ptr<FakeDiscoveryMethod> serial;
    std::shared_ptr<FakeDiscoveryMethod> mdns;
    ManualClock clock;
};

// ============================================================================
// Single pass
// ============================================================================

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: merges methods in order",
                 "[discovery]") {
    serial->set_results({make_record("serial_/dev/ttyACM0", "Mega")});
    mdns->set_results({make_record("mdns_a", "A"), make_record("mdns_b", "B")});
    auto service = make_service();

    auto found = service->discover_once();
    REQUIRE(found.size() == 3);
    REQUIRE(found[0].discovery_id == "serial_/dev/ttyACM0");
    REQUIRE(found[1].discovery_id == "mdns_a");
    REQUIRE(found[2].discovery_id == "mdns_b");

    REQUIRE(service->get_discovered_machines().size() == 3);
    REQUIRE(service->get_machine("mdns_b")->name == "B");
    REQUIRE_FALSE(service->get_machine("nope"));
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: duplicate ids keep the last sighting",
                 "[discovery]") {
    serial->set_results({make_record("dup", "From serial"), make_record("other")});
    mdns->set_results({make_record("dup", "From mdns")});
    auto service = make_service();

    auto found = service->discover_once();
    REQUIRE(found.size() == 2);
    // First-seen position, last-written content
    REQUIRE(found[0].discovery_id == "dup");
    REQUIRE(found[0].name == "From mdns");
    REQUIRE(service->get_machine("dup")->name == "From mdns");
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: a failing method does not abort the pass",
                 "[discovery]") {
    serial->set_throws(true);
    mdns->set_results({make_record("mdns_a")});
    auto service = make_service();

    auto found = service->discover_once();
    REQUIRE(found.size() == 1);
    REQUIRE(serial->discover_count_ == 1);
    REQUIRE(mdns->discover_count_ == 1);
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: methods can be added later",
                 "[discovery]") {
    auto service = make_service();
    REQUIRE(service->discover_once().empty());

    auto extra = std::make_shared<FakeDiscoveryMethod>("extra");
    extra->set_results({make_record("late")});
    service->add_discovery_method(extra);
    service->add_discovery_method(nullptr);

    REQUIRE(service->discover_once().size() == 1);
}

// ============================================================================
// Cache expiry
// ============================================================================

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: records expire after the TTL",
                 "[discovery][ttl]") {
    DiscoveryOptions options;
    options.ttl = std::chrono::seconds(60);
    mdns->set_results({make_record("mdns_a")});
    auto service = make_service(options);

    service->discover_once();
    clock.advance(std::chrono::seconds(60));
    REQUIRE(service->get_machine("mdns_a"));

    clock.advance(std::chrono::seconds(1));
    REQUIRE_FALSE(service->get_machine("mdns_a"));
    REQUIRE(service->get_discovered_machines().empty());
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: sightings refresh last_seen",
                 "[discovery][ttl]") {
    DiscoveryOptions options;
    options.ttl = std::chrono::seconds(60);
    mdns->set_results({make_record("mdns_a")});
    auto service = make_service(options);

    service->discover_once();
    clock.advance(std::chrono::seconds(45));
    service->discover_once();
    clock.advance(std::chrono::seconds(45));
    REQUIRE(service->get_machine("mdns_a"));

    mdns->set_results({});
    service->discover_once();
    clock.advance(std::chrono::seconds(16));
    REQUIRE_FALSE(service->get_machine("mdns_a"));
}

// ============================================================================
// Listeners
// ============================================================================

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: listeners see new and changed records",
                 "[discovery][listener]") {
    auto service = make_service();
    EventLog log;
    service->add_discovery_listener(log.listener());

    mdns->set_results({make_record("mdns_a", "A")});
    service->discover_once();
    service->discover_once(); // unchanged: no event
    REQUIRE(service->wait_for_idle(std::chrono::seconds(2)));
    REQUIRE(log.ids() == std::vector<std::string>{"mdns_a"});

    mdns->set_results({make_record("mdns_a", "A renamed")});
    service->discover_once();
    REQUIRE(service->wait_for_idle(std::chrono::seconds(2)));
    REQUIRE(log.names() == std::vector<std::string>{"A", "A renamed"});
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: expired record is new again",
                 "[discovery][listener][ttl]") {
    DiscoveryOptions options;
    options.ttl = std::chrono::seconds(10);
    auto service = make_service(options);
    EventLog log;
    service->add_discovery_listener(log.listener());

    mdns->set_results({make_record("mdns_a")});
    service->discover_once();
    clock.advance(std::chrono::seconds(11));
    service->discover_once();

    REQUIRE(service->wait_for_idle(std::chrono::seconds(2)));
    REQUIRE(log.ids().size() == 2);
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: a throwing listener is isolated",
                 "[discovery][listener]") {
    auto service = make_service();
    EventLog log;
    service->add_discovery_listener(
        [](const DiscoveredMachine&) { throw std::runtime_error("listener bug"); });
    service->add_discovery_listener(log.listener());

    mdns->set_results({make_record("mdns_a"), make_record("mdns_b")});
    service->discover_once();

    REQUIRE(service->wait_for_idle(std::chrono::seconds(2)));
    REQUIRE(log.ids() == std::vector<std::string>{"mdns_a", "mdns_b"});
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: removed listeners stop receiving",
                 "[discovery][listener]") {
    auto service = make_service();
    EventLog log;
    ListenerId id = service->add_discovery_listener(log.listener());

    REQUIRE(service->remove_discovery_listener(id));
    REQUIRE_FALSE(service->remove_discovery_listener(id));

    mdns->set_results({make_record("mdns_a")});
    service->discover_once();
    REQUIRE(service->wait_for_idle(std::chrono::seconds(2)));
    REQUIRE(log.ids().empty());
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: full event queue drops the oldest",
                 "[discovery][listener]") {
    DiscoveryOptions options;
    options.event_queue_limit = 2;
    auto service = make_service(options);

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> first{true};
    EventLog log;
    auto record = log.listener();

    service->add_discovery_listener([&](const DiscoveredMachine& m) {
        if (first.exchange(false)) {
            entered.set_value();
            released.wait();
        }
        record(m);
    });

    // Park the dispatcher inside the first delivery
    mdns->set_results({make_record("blocker")});
    service->discover_once();
    entered.get_future().wait();

    mdns->set_results({make_record("blocker"), make_record("e1"), make_record("e2"),
                       make_record("e3"), make_record("e4")});
    service->discover_once();
    REQUIRE(service->dropped_events() == 2);

    release.set_value();
    REQUIRE(service->wait_for_idle(std::chrono::seconds(2)));
    REQUIRE(log.ids() == std::vector<std::string>{"blocker", "e3", "e4"});
}

// ============================================================================
// Continuous discovery
// ============================================================================

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: continuous passes until stopped",
                 "[discovery][continuous]") {
    mdns->set_results({make_record("mdns_a")});
    auto service = make_service();

    service->start_continuous_discovery(std::chrono::milliseconds(10));
    REQUIRE(service->is_running());
    service->start_continuous_discovery(std::chrono::milliseconds(10)); // no-op

    for (int i = 0; i < 200 && mdns->discover_count_ < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(mdns->discover_count_ >= 3);

    service->stop_continuous_discovery();
    REQUIRE_FALSE(service->is_running());
    REQUIRE(serial->stop_count_ >= 1);
    REQUIRE(mdns->stop_count_ >= 1);

    int passes = mdns->discover_count_;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(mdns->discover_count_ == passes);
    REQUIRE(service->get_machine("mdns_a"));
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: restart after stop",
                 "[discovery][continuous]") {
    auto service = make_service();

    service->stop_continuous_discovery(); // never started
    service->start_continuous_discovery(std::chrono::milliseconds(0));
    service->stop_continuous_discovery();

    int before = mdns->discover_count_;
    service->start_continuous_discovery(std::chrono::milliseconds(10));
    for (int i = 0; i < 200 && mdns->discover_count_ == before; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    service->stop_continuous_discovery();
    REQUIRE(mdns->discover_count_ > before);
}

TEST_CASE_METHOD(DiscoveryServiceFixture, "DiscoveryService: methods are rearmed only when a run starts",
                 "[discovery][continuous]") {
    auto service = make_service();

    service->discover_once();
    REQUIRE(mdns->rearm_count_ == 1);

    service->start_continuous_discovery(std::chrono::milliseconds(5));
    REQUIRE(mdns->rearm_count_ == 2);
    int before = mdns->discover_count_;
    for (int i = 0; i < 200 && mdns->discover_count_ < before + 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    // Passes inside the loop never clear a pending stop
    REQUIRE(mdns->rearm_count_ == 2);

    service->stop_continuous_discovery();
    REQUIRE(mdns->rearm_count_ == 2);
    REQUIRE(serial->rearm_count_ == 2);
}
