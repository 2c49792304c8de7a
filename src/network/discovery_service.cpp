// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "discovery_service.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <unordered_map>

namespace wit {

DiscoveryService::DiscoveryService(std::vector<std::shared_ptr<DiscoveryMethod>> methods,
                                   DiscoveryOptions options, DiscoveryClock clock)
    : options_(options),
      clock_(clock ? std::move(clock) : DiscoveryClock([]() {
          return std::chrono::steady_clock::now();
      })) {
    for (auto& m : methods) {
        if (m) {
            methods_.push_back(std::move(m));
        }
    }
    if (options_.event_queue_limit == 0) {
        options_.event_queue_limit = 1;
    }
    dispatcher_ = std::thread([this]() { dispatch_loop(); });
    spdlog::debug("[DiscoveryService] Created with {} methods, ttl={}s", methods_.size(),
                  options_.ttl.count());
}

DiscoveryService::~DiscoveryService() {
    stop_continuous_discovery();

    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        dispatcher_exit_ = true;
    }
    events_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    std::lock_guard<std::mutex> lock(methods_mutex_);
    for (auto& m : methods_) {
        m->stop();
    }
}

std::vector<DiscoveredMachine> DiscoveryService::discover_once() {
    rearm_methods();
    return run_pass(nullptr);
}

void DiscoveryService::rearm_methods() {
    std::lock_guard<std::mutex> lock(methods_mutex_);
    for (auto& m : methods_) {
        m->rearm();
    }
}

std::vector<DiscoveredMachine> DiscoveryService::run_pass(const std::atomic<bool>* keep_going) {
    std::vector<std::shared_ptr<DiscoveryMethod>> methods;
    {
        std::lock_guard<std::mutex> lock(methods_mutex_);
        methods = methods_;
    }

    // Pass-local dedup: first-seen order, last write wins
    std::vector<DiscoveredMachine> seen;
    std::unordered_map<std::string, size_t> index;

    for (const auto& method : methods) {
        if (keep_going && !keep_going->load()) {
            spdlog::debug("[DiscoveryService] Pass interrupted before '{}'", method->name());
            break;
        }
        try {
            auto found = method->discover();
            spdlog::debug("[DiscoveryService] '{}' returned {} records", method->name(),
                          found.size());
            for (auto& m : found) {
                auto it = index.find(m.discovery_id);
                if (it == index.end()) {
                    index.emplace(m.discovery_id, seen.size());
                    seen.push_back(std::move(m));
                } else {
                    seen[it->second] = std::move(m);
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("[DiscoveryService] Method '{}' failed: {}", method->name(), e.what());
        }
    }

    const auto now = clock_();
    std::vector<DiscoveredMachine> changed;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        evict_expired_locked(now);
        for (const auto& m : seen) {
            auto it = cache_.find(m.discovery_id);
            if (it == cache_.end()) {
                spdlog::info("[DiscoveryService] New machine: {} ({})", m.name, m.discovery_id);
                changed.push_back(m);
                cache_.emplace(m.discovery_id, CacheEntry{m, now});
            } else {
                if (!it->second.machine.same_content(m)) {
                    spdlog::debug("[DiscoveryService] Updated machine: {}", m.discovery_id);
                    changed.push_back(m);
                    it->second.machine = m;
                }
                it->second.last_seen = now;
            }
        }
    }

    for (const auto& m : changed) {
        enqueue_event(m);
    }
    return seen;
}

void DiscoveryService::evict_expired_locked(std::chrono::steady_clock::time_point now) {
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (now - it->second.last_seen > options_.ttl) {
            spdlog::debug("[DiscoveryService] Expired: {}", it->first);
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<DiscoveredMachine> DiscoveryService::get_discovered_machines() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    evict_expired_locked(clock_());
    std::vector<DiscoveredMachine> out;
    out.reserve(cache_.size());
    for (const auto& [id, entry] : cache_) {
        out.push_back(entry.machine);
    }
    return out;
}

std::optional<DiscoveredMachine> DiscoveryService::get_machine(const std::string& discovery_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    evict_expired_locked(clock_());
    auto it = cache_.find(discovery_id);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second.machine;
}

ListenerId DiscoveryService::add_discovery_listener(DiscoveryListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool DiscoveryService::remove_discovery_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.erase(id) > 0;
}

void DiscoveryService::add_discovery_method(std::shared_ptr<DiscoveryMethod> method) {
    if (!method) {
        return;
    }
    std::lock_guard<std::mutex> lock(methods_mutex_);
    spdlog::debug("[DiscoveryService] Added method '{}'", method->name());
    methods_.push_back(std::move(method));
}

void DiscoveryService::enqueue_event(const DiscoveredMachine& machine) {
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        if (events_.size() >= options_.event_queue_limit) {
            events_.pop_front();
            uint64_t dropped = dropped_events_.fetch_add(1) + 1;
            spdlog::warn("[DiscoveryService] Event queue full, dropped oldest ({} total)",
                         dropped);
        }
        events_.push_back(machine);
    }
    events_cv_.notify_one();
}

void DiscoveryService::dispatch_loop() {
    std::unique_lock<std::mutex> lock(events_mutex_);
    while (true) {
        events_cv_.wait(lock, [this]() { return dispatcher_exit_ || !events_.empty(); });
        if (events_.empty() && dispatcher_exit_) {
            break;
        }

        DiscoveredMachine machine = std::move(events_.front());
        events_.pop_front();
        delivering_ = true;
        lock.unlock();

        std::vector<DiscoveryListener> listeners;
        {
            std::lock_guard<std::mutex> ll(listeners_mutex_);
            listeners.reserve(listeners_.size());
            for (const auto& [id, cb] : listeners_) {
                listeners.push_back(cb);
            }
        }
        for (const auto& cb : listeners) {
            try {
                cb(machine);
            } catch (const std::exception& e) {
                spdlog::error("[DiscoveryService] Listener threw for {}: {}",
                              machine.discovery_id, e.what());
            }
        }

        lock.lock();
        delivering_ = false;
        if (events_.empty()) {
            idle_cv_.notify_all();
        }
    }
    delivering_ = false;
    idle_cv_.notify_all();
}

bool DiscoveryService::wait_for_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(events_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return events_.empty() && !delivering_; });
}

void DiscoveryService::start_continuous_discovery(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_.load()) {
        spdlog::debug("[DiscoveryService] Continuous discovery already running");
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds(1000);
    }
    // Cleared here, before the worker exists, so only a later stop can cancel it
    rearm_methods();
    running_.store(true);
    worker_ = std::thread([this, interval]() { continuous_loop(interval); });
    spdlog::info("[DiscoveryService] Continuous discovery started (every {}ms)",
                 interval.count());
}

void DiscoveryService::stop_continuous_discovery() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        bool was_running = running_.exchange(false);
        if (!was_running && !worker_.joinable()) {
            return;
        }
        worker = std::move(worker_);
    }
    stop_cv_.notify_all();

    // Abort long probes in flight (network scan)
    {
        std::lock_guard<std::mutex> lock(methods_mutex_);
        for (auto& m : methods_) {
            m->stop();
        }
    }

    if (worker.joinable()) {
        worker.join();
    }
    spdlog::info("[DiscoveryService] Continuous discovery stopped");
}

void DiscoveryService::continuous_loop(std::chrono::milliseconds interval) {
    while (running_.load()) {
        auto found = run_pass(&running_);
        spdlog::trace("[DiscoveryService] Pass complete: {} records", found.size());

        std::unique_lock<std::mutex> lock(run_mutex_);
        stop_cv_.wait_for(lock, interval, [this]() { return !running_.load(); });
    }
}

} // namespace wit
