// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "discovery_method.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace wit {

using ListenerId = uint64_t;
using DiscoveryListener = std::function<void(const DiscoveredMachine&)>;

struct DiscoveryOptions {
    std::chrono::seconds ttl{300};  ///< Records unseen for longer are evicted on read
    size_t event_queue_limit = 256; ///< Pending listener events; oldest dropped on overflow
};

/**
 * @brief Runs discovery methods and keeps a deduplicated, expiring cache
 *
 * Records are keyed by discovery_id; a later sighting replaces an earlier one.
 * Listeners are told about new or materially changed records. Delivery runs on
 * a dedicated dispatcher thread so a slow listener never stalls a pass.
 *
 * Threading model:
 * - discover_once() may be called from any thread
 * - continuous discovery owns one worker thread
 * - listener callbacks run on the dispatcher thread, one event at a time
 * - the cache, the listener table and the event queue each have their own mutex
 */
class DiscoveryService {
  public:
    /**
     * @param methods Probes run in order on every pass
     * @param options TTL and queue bound
     * @param clock Time source for last_seen and eviction (steady_clock if empty)
     */
    explicit DiscoveryService(std::vector<std::shared_ptr<DiscoveryMethod>> methods,
                              DiscoveryOptions options = {}, DiscoveryClock clock = {});
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    /**
     * @brief Run every method once and merge the results
     * @return Records seen in this pass, one per discovery_id
     */
    std::vector<DiscoveredMachine> discover_once();

    /// Start the background pass loop; no-op if already running
    void start_continuous_discovery(std::chrono::milliseconds interval);

    /// Stop the loop and join it; an in-flight pass skips its remaining methods
    void stop_continuous_discovery();

    bool is_running() const {
        return running_.load();
    }

    /// Cached records still inside the TTL; expired ones are evicted here
    std::vector<DiscoveredMachine> get_discovered_machines();

    std::optional<DiscoveredMachine> get_machine(const std::string& discovery_id);

    ListenerId add_discovery_listener(DiscoveryListener listener);

    /// @return false if the id was not registered
    bool remove_discovery_listener(ListenerId id);

    void add_discovery_method(std::shared_ptr<DiscoveryMethod> method);

    /**
     * @brief Block until every queued event has been delivered
     * @return false on timeout
     */
    bool wait_for_idle(std::chrono::milliseconds timeout);

    /// Events discarded because the queue was full
    uint64_t dropped_events() const {
        return dropped_events_.load();
    }

    const DiscoveryOptions& options() const {
        return options_;
    }

  private:
    struct CacheEntry {
        DiscoveredMachine machine;
        std::chrono::steady_clock::time_point last_seen;
    };

    std::vector<DiscoveredMachine> run_pass(const std::atomic<bool>* keep_going);
    void rearm_methods();
    void evict_expired_locked(std::chrono::steady_clock::time_point now);
    void enqueue_event(const DiscoveredMachine& machine);
    void dispatch_loop();
    void continuous_loop(std::chrono::milliseconds interval);

    DiscoveryOptions options_;
    DiscoveryClock clock_;

    mutable std::mutex methods_mutex_;
    std::vector<std::shared_ptr<DiscoveryMethod>> methods_;

    std::mutex cache_mutex_;
    std::map<std::string, CacheEntry> cache_;

    std::mutex listeners_mutex_;
    std::map<ListenerId, DiscoveryListener> listeners_;
    ListenerId next_listener_id_ = 1;

    // Dispatcher
    std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::condition_variable idle_cv_;
    std::deque<DiscoveredMachine> events_;
    bool delivering_ = false;
    bool dispatcher_exit_ = false;
    std::atomic<uint64_t> dropped_events_{0};
    std::thread dispatcher_;

    // Continuous discovery
    std::mutex run_mutex_;
    std::condition_variable stop_cv_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

} // namespace wit
