// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file mdns_discovery.cpp
 * @brief DNS-SD browsing for network print servers
 *
 * @pattern PIMPL with background thread for network I/O
 * @threading Browser runs on a background thread; the seen-set is mutex-guarded
 * @gotchas Socket may fail on systems without network; handle gracefully.
 *          Responses arrive split across packets, so PTR/SRV/A/TXT records are
 *          collected per instance and only complete ones are decoded
 */

#define MDNS_IMPLEMENTATION
#include "mdns_discovery.h"

#include "mdns/mdns.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace wit {

namespace {

// Buffer size for mDNS operations (must be 32-bit aligned)
constexpr size_t MDNS_BUFFER_SIZE = 2048;

// Timeout for socket receive operations (milliseconds)
constexpr int SOCKET_TIMEOUT_MS = 500;

constexpr size_t MAX_TXT_ENTRIES = 32;

std::string strip_trailing_dot(std::string s) {
    while (!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    return s;
}

/// "Workshop Prusa._octoprint._tcp.local." -> "Workshop Prusa"
std::string extract_display_name(const std::string& instance, const std::string& service) {
    std::string name = strip_trailing_dot(instance);
    std::string suffix = "." + strip_trailing_dot(service);
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return name.substr(0, name.size() - suffix.size());
    }
    return name;
}

std::string sockaddr_to_string(const struct sockaddr_in* addr) {
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf))) {
        return std::string(buf);
    }
    return "";
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

const std::string* txt_value(const MdnsServiceRecord& record, const std::string& key) {
    if (key.empty()) {
        return nullptr;
    }
    auto it = record.txt.find(key);
    if (it == record.txt.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

bool valid_service_type(const std::string& service) {
    std::string s = strip_trailing_dot(service);
    const std::string local = ".local";
    if (s.size() <= local.size() || s.compare(s.size() - local.size(), local.size(), local) != 0) {
        return false;
    }
    // "_name._tcp" or "_name._udp" before ".local"
    std::string head = s.substr(0, s.size() - local.size());
    auto dot = head.find('.');
    return head.size() > 1 && head[0] == '_' && dot != std::string::npos &&
           (head.substr(dot) == "._tcp" || head.substr(dot) == "._udp");
}

} // namespace

std::optional<DiscoveredMachine> build_discovered_machine(const MdnsServiceRecord& record,
                                                          const MdnsOptions& options) {
    if (!record.is_complete()) {
        return std::nullopt;
    }
    const MdnsTxtSchema& schema = options.txt_schema;

    MachineType type = options.default_type;
    if (const auto* declared = txt_value(record, schema.type_key)) {
        type = machine_type_from_string(*declared);
        if (type == MachineType::UNKNOWN) {
            spdlog::debug("[MdnsDiscovery] Dropping {}: unknown type '{}'", record.instance_name,
                          *declared);
            return std::nullopt;
        }
    }

    ConnectionProtocol protocol = options.default_protocol;
    if (const auto* declared = txt_value(record, schema.protocol_key)) {
        protocol = protocol_from_string(*declared);
        if (protocol == ConnectionProtocol::UNKNOWN) {
            spdlog::debug("[MdnsDiscovery] Dropping {}: unknown protocol '{}'",
                          record.instance_name, *declared);
            return std::nullopt;
        }
    }

    json capabilities = json::array();
    if (const auto* declared = txt_value(record, schema.capabilities_key)) {
        std::istringstream in(*declared);
        std::string token;
        while (std::getline(in, token, ',')) {
            token = trim(token);
            MachineCapability cap;
            if (capability_from_string(token, cap)) {
                capabilities.push_back(to_string(cap));
            } else if (!token.empty()) {
                spdlog::debug("[MdnsDiscovery] {}: ignoring capability '{}'",
                              record.instance_name, token);
            }
        }
    }

    std::string base_url = "http://" + record.ip_address + ":" + std::to_string(record.port);
    if (const auto* path = txt_value(record, schema.path_key)) {
        std::string p = *path;
        while (!p.empty() && p.back() == '/') {
            p.pop_back();
        }
        if (!p.empty() && p.front() != '/') {
            p.insert(p.begin(), '/');
        }
        base_url += p;
    }

    DiscoveredMachine m;
    if (const auto* id = txt_value(record, schema.id_key)) {
        m.discovery_id = "mdns_" + *id;
    } else {
        m.discovery_id = "mdns_" + record.ip_address + "_" + std::to_string(record.port);
    }
    m.name = extract_display_name(record.instance_name, options.service_type);
    if (m.name.empty()) {
        m.name = strip_trailing_dot(record.hostname);
    }
    m.machine_type = type;
    m.connection_protocol = protocol;
    m.connection_params = {{"base_url", base_url},
                           {"ip", record.ip_address},
                           {"port", record.port}};

    json txt = json::object();
    for (const auto& [k, v] : record.txt) {
        txt[k] = v;
    }
    m.metadata = {{"mdns_name", record.instance_name},
                  {"hostname", record.hostname},
                  {"service_type", options.service_type},
                  {"capabilities", capabilities},
                  {"txt", txt}};
    return m;
}

/**
 * @brief PIMPL implementation class
 */
class MdnsDiscovery::Impl {
  public:
    explicit Impl(MdnsOptions options)
        : options_(std::move(options)), query_name_(strip_trailing_dot(options_.service_type)),
          clock_(options_.clock ? options_.clock : DiscoveryClock([]() {
              return std::chrono::steady_clock::now();
          })) {}

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        stopped_.store(false);
        if (running_.load()) {
            return;
        }
        if (thread_.joinable()) {
            thread_.join(); // previous loop exited on its own (socket failure)
        }
        running_.store(true);
        thread_ = std::thread(&Impl::discovery_loop, this);
        spdlog::info("[MdnsDiscovery] Started browsing for {}", options_.service_type);
    }

    void stop() {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        stopped_.store(true);
        bool was_running = false;
        {
            // Flip under stop_mutex_ so the loop cannot miss the wakeup
            std::lock_guard<std::mutex> stop_lock(stop_mutex_);
            was_running = running_.exchange(false);
        }
        stop_cv_.notify_all();

        if (thread_.joinable()) {
            thread_.join();
        }
        if (was_running) {
            spdlog::info("[MdnsDiscovery] Stopped browsing");
        }
    }

    bool is_running() const {
        return running_.load();
    }

    void rearm() {
        stopped_.store(false);
    }

    bool should_auto_start() const {
        return options_.auto_start && !stopped_.load() && !running_.load();
    }

    bool add(const MdnsServiceRecord& record) {
        if (record.ttl == 0) {
            forget_instance(record.instance_name);
            return true;
        }

        auto machine = build_discovered_machine(record, options_);
        if (!machine) {
            return false;
        }

        auto lifetime = options_.stale_after.count() > 0
                            ? options_.stale_after
                            : std::chrono::seconds(record.ttl);

        std::lock_guard<std::mutex> lock(seen_mutex_);
        // An instance that moved to a new address must not linger under its old id
        for (auto it = seen_.begin(); it != seen_.end();) {
            if (it->second.instance_name == record.instance_name &&
                it->first != machine->discovery_id) {
                it = seen_.erase(it);
            } else {
                ++it;
            }
        }

        auto it = seen_.find(machine->discovery_id);
        if (it == seen_.end()) {
            spdlog::info("[MdnsDiscovery] Found {} at {}", machine->name,
                         machine->connection_params["base_url"].get<std::string>());
        }
        const std::string id = machine->discovery_id;
        seen_[id] = SeenEntry{std::move(*machine), record.instance_name, clock_() + lifetime};
        return true;
    }

    std::vector<DiscoveredMachine> snapshot() {
        std::lock_guard<std::mutex> lock(seen_mutex_);
        const auto now = clock_();
        std::vector<DiscoveredMachine> out;
        out.reserve(seen_.size());
        for (auto it = seen_.begin(); it != seen_.end();) {
            if (now > it->second.expires_at) {
                spdlog::info("[MdnsDiscovery] {} was not re-announced; forgetting it",
                             it->second.machine.name);
                it = seen_.erase(it);
                continue;
            }
            out.push_back(it->second.machine);
            ++it;
        }
        return out;
    }

    const MdnsOptions& options() const {
        return options_;
    }

  private:
    struct SeenEntry {
        DiscoveredMachine machine;
        std::string instance_name;
        std::chrono::steady_clock::time_point expires_at;
    };

    void forget_instance(const std::string& instance_name) {
        std::lock_guard<std::mutex> lock(seen_mutex_);
        for (auto it = seen_.begin(); it != seen_.end();) {
            if (it->second.instance_name == instance_name) {
                spdlog::info("[MdnsDiscovery] {} said goodbye", it->second.machine.name);
                it = seen_.erase(it);
            } else {
                ++it;
            }
        }
    }

    /**
     * @brief Main discovery loop running on background thread
     */
    void discovery_loop() {
        spdlog::debug("[MdnsDiscovery] Discovery thread started");

        int sock = mdns_socket_open_ipv4(nullptr);
        if (sock < 0) {
            spdlog::warn("[MdnsDiscovery] Failed to open mDNS socket - network may be unavailable");
            running_.store(false);
            return;
        }

        // Set socket timeout for non-blocking receives
        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = SOCKET_TIMEOUT_MS * 1000;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        // Aligned buffer for mDNS operations
        alignas(4) uint8_t buffer[MDNS_BUFFER_SIZE];

        while (running_.load()) {
            int query_id = mdns_query_send(sock, MDNS_RECORDTYPE_PTR, query_name_.c_str(),
                                           query_name_.size(), buffer, sizeof(buffer), 0);

            if (query_id < 0) {
                spdlog::debug("[MdnsDiscovery] Failed to send mDNS query");
            } else {
                spdlog::trace("[MdnsDiscovery] Sent PTR query for {}", query_name_);

                auto recv_deadline = std::chrono::steady_clock::now() + options_.receive_window;
                while (std::chrono::steady_clock::now() < recv_deadline && running_.load()) {
                    size_t records = mdns_query_recv(sock, buffer, sizeof(buffer),
                                                     record_callback, this, query_id);
                    if (records == 0) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    }
                }
            }

            process_pending_records();

            // Wait for next query interval (or until stop requested)
            std::unique_lock<std::mutex> lock(stop_mutex_);
            stop_cv_.wait_for(lock, options_.query_interval,
                              [this]() { return !running_.load(); });
        }

        mdns_socket_close(sock);
        spdlog::debug("[MdnsDiscovery] Discovery thread exiting");
    }

    /**
     * @brief Static callback for mDNS record parsing
     */
    static int record_callback(int sock, const struct sockaddr* from, size_t addrlen,
                               mdns_entry_type_t entry, uint16_t query_id, uint16_t rtype,
                               uint16_t rclass, uint32_t ttl, const void* data, size_t size,
                               size_t name_offset, size_t name_length, size_t record_offset,
                               size_t record_length, void* user_data) {
        (void)sock;
        (void)from;
        (void)addrlen;
        (void)entry;
        (void)query_id;
        (void)rclass;
        (void)name_length;

        auto* self = static_cast<Impl*>(user_data);
        if (!self || !self->running_.load()) {
            return 1; // Stop processing
        }

        char namebuf[256];
        char entrybuf[256];

        mdns_string_t name_str =
            mdns_string_extract(data, size, &name_offset, namebuf, sizeof(namebuf));
        std::string record_name(name_str.str, name_str.length);

        switch (rtype) {
        case MDNS_RECORDTYPE_PTR: {
            mdns_string_t ptr_str = mdns_record_parse_ptr(data, size, record_offset, record_length,
                                                          entrybuf, sizeof(entrybuf));
            if (ptr_str.length > 0) {
                std::string instance_name(ptr_str.str, ptr_str.length);
                spdlog::trace("[MdnsDiscovery] PTR: {} -> {}", record_name, instance_name);

                std::lock_guard<std::mutex> lock(self->records_mutex_);
                auto& record = self->pending_records_[instance_name];
                record.instance_name = instance_name;
                if (ttl == 0) {
                    record.ttl = 0; // goodbye
                }
            }
            break;
        }

        case MDNS_RECORDTYPE_SRV: {
            mdns_record_srv_t srv = mdns_record_parse_srv(data, size, record_offset, record_length,
                                                          entrybuf, sizeof(entrybuf));
            if (srv.name.length > 0 && srv.port > 0) {
                std::string hostname(srv.name.str, srv.name.length);
                spdlog::trace("[MdnsDiscovery] SRV: {} -> {}:{}", record_name, hostname, srv.port);

                std::lock_guard<std::mutex> lock(self->records_mutex_);
                auto& record = self->pending_records_[record_name];
                record.instance_name = record_name;
                record.hostname = hostname;
                record.port = srv.port;
                if (record.ttl != 0) {
                    record.ttl = ttl;
                }
            }
            break;
        }

        case MDNS_RECORDTYPE_A: {
            struct sockaddr_in addr;
            mdns_record_parse_a(data, size, record_offset, record_length, &addr);
            std::string ip = sockaddr_to_string(&addr);
            if (!ip.empty()) {
                spdlog::trace("[MdnsDiscovery] A: {} -> {}", record_name, ip);

                std::lock_guard<std::mutex> lock(self->records_mutex_);
                // A records are keyed by hostname, matched to SRV targets later
                self->address_cache_[record_name] = ip;
            }
            break;
        }

        case MDNS_RECORDTYPE_TXT: {
            mdns_record_txt_t txt[MAX_TXT_ENTRIES];
            size_t count = mdns_record_parse_txt(data, size, record_offset, record_length, txt,
                                                 MAX_TXT_ENTRIES);

            std::lock_guard<std::mutex> lock(self->records_mutex_);
            auto& record = self->pending_records_[record_name];
            record.instance_name = record_name;
            for (size_t i = 0; i < count; ++i) {
                std::string key(txt[i].key.str, txt[i].key.length);
                std::string value = txt[i].value.length > 0
                                        ? std::string(txt[i].value.str, txt[i].value.length)
                                        : std::string();
                record.txt[key] = value;
            }
            break;
        }

        case MDNS_RECORDTYPE_AAAA:
            // IPv6 - we prefer IPv4, so skip these
            break;

        default:
            break;
        }

        return 0; // Continue processing
    }

    /**
     * @brief Decode this cycle's records into the seen-set, then start over
     */
    void process_pending_records() {
        std::vector<MdnsServiceRecord> ready;
        {
            std::lock_guard<std::mutex> lock(records_mutex_);
            for (auto& [name, record] : pending_records_) {
                if (record.ip_address.empty() && !record.hostname.empty()) {
                    auto it = address_cache_.find(record.hostname);
                    if (it != address_cache_.end()) {
                        record.ip_address = it->second;
                    }
                }
                if (record.ttl == 0 || record.is_complete()) {
                    ready.push_back(record);
                }
            }
            pending_records_.clear();
            address_cache_.clear();
        }

        for (const auto& record : ready) {
            add(record);
        }
    }

    MdnsOptions options_;
    std::string query_name_; ///< Service type without the trailing dot
    DiscoveryClock clock_;

    // Thread management
    std::mutex thread_mutex_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false}; ///< Explicit stop(); blocks auto-start

    // Synchronization for stop
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    // Seen-set, shared with discover()
    mutable std::mutex seen_mutex_;
    std::map<std::string, SeenEntry> seen_;

    // Protected by records_mutex_ (browser thread only, plus stop)
    std::mutex records_mutex_;
    std::map<std::string, MdnsServiceRecord> pending_records_;
    std::map<std::string, std::string> address_cache_; // hostname -> IP
};

// ============================================================================
// MdnsDiscovery public interface
// ============================================================================

MdnsDiscovery::MdnsDiscovery(MdnsOptions options) {
    if (!valid_service_type(options.service_type)) {
        throw std::invalid_argument("Invalid DNS-SD service type '" + options.service_type + "'");
    }
    if (options.query_interval.count() <= 0) {
        throw std::invalid_argument("mDNS query interval must be positive");
    }
    impl_ = std::make_unique<Impl>(std::move(options));
}

MdnsDiscovery::~MdnsDiscovery() = default;

std::vector<DiscoveredMachine> MdnsDiscovery::discover() {
    if (impl_->should_auto_start()) {
        impl_->start();
    }
    return impl_->snapshot();
}

void MdnsDiscovery::start() {
    impl_->start();
}

void MdnsDiscovery::stop() {
    impl_->stop();
}

void MdnsDiscovery::rearm() {
    impl_->rearm();
}

bool MdnsDiscovery::is_browsing() const {
    return impl_->is_running();
}

bool MdnsDiscovery::on_service_resolved(const MdnsServiceRecord& record) {
    return impl_->add(record);
}

const MdnsOptions& MdnsDiscovery::options() const {
    return impl_->options();
}

} // namespace wit
