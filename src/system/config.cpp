// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace wit {

Config* Config::instance{nullptr};

namespace {

/// Add keys present in @p defaults but missing from @p target; existing values win
bool merge_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            modified |= merge_missing(target[it.key()], it.value());
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::default_config() {
    json endpoints = json::array({
        {{"identifier", "prusa"},
         {"port", 80},
         {"path", "/api/version"},
         {"signature", "prusalink"},
         {"protocol", "prusalink"},
         {"machine_type", "3d_printer_fdm"}},
        {{"identifier", "octoprint"},
         {"port", 80},
         {"path", "/api/version"},
         {"signature", "octoprint"},
         {"protocol", "octoprint"},
         {"machine_type", "3d_printer_fdm"}},
        {{"identifier", "moonraker"},
         {"port", 7125},
         {"path", "/server/info"},
         {"signature", "moonraker"},
         {"protocol", "moonraker"},
         {"machine_type", "3d_printer_corexy"}},
        {{"identifier", "duet"},
         {"port", 80},
         {"path", "/rr_status"},
         {"signature", "\"status\""},
         {"protocol", "duet_rrf"},
         {"machine_type", "3d_printer_fdm"}},
    });

    return {{"log_level", "warn"},
            {"log_target", "console"},
            {"log_file", ""},
            {"http", {{"timeout_sec", 10}}},
            {"discovery",
             {{"interval_sec", 30},
              {"ttl_sec", 300},
              {"serial", {{"enabled", true}, {"baud_rate", 115200}}},
              {"mdns",
               {{"enabled", true},
                {"service_type", "_octoprint._tcp.local."},
                {"stale_after_sec", 0},
                {"txt_schema",
                 {{"id", "id"}, {"type", "type"}, {"capabilities", "capabilities"},
                  {"path", "path"}}}}},
              {"network_scan",
               {{"enabled", false},
                {"cidr", "192.168.1.0/24"},
                {"max_concurrency", 20},
                {"timeout_sec", 2},
                {"endpoints", endpoints}}}}}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        bool parsed = false;
        try {
            data = json::parse(std::fstream(config_path));
            parsed = data.is_object();
            if (!parsed) {
                spdlog::error("[Config] {}: top level is not an object", config_path);
            }
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        }
        if (!parsed) {
            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            std::rename(config_path.c_str(), backup_path.c_str());
            spdlog::warn("[Config] Corrupt config backed up to {}, using defaults", backup_path);
            data = default_config();
            config_modified = true;
        }
        if (merge_missing(data, default_config())) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        std::error_code ec;
        fs::path dir = fs::path(config_path).parent_path();
        if (!dir.empty()) {
            fs::create_directories(dir, ec);
        }
        data = default_config();
        config_modified = true;
    }

    if (config_modified) {
        save();
    }

    spdlog::debug("[Config] Initialized: interval={}s ttl={}s",
                  get<int>("/discovery/interval_sec", 30), get<int>("/discovery/ttl_sec", 300));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    if (path.empty()) {
        spdlog::warn("[Config] save() called before init(); nothing written");
        return false;
    }
    spdlog::trace("[Config] Saving config to {}", path);

    const std::string tmp_path = path + ".tmp";
    try {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open {} for writing", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;
        o.close();
        if (!o) {
            spdlog::error("[Config] Error writing {}", tmp_path);
            std::remove(tmp_path.c_str());
            return false;
        }

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            spdlog::error("[Config] Could not replace {}", path);
            std::remove(tmp_path.c_str());
            return false;
        }

        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to defaults");
    data = default_config();
}

} // namespace wit
