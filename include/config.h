// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __WIT_CONFIG_H__
#define __WIT_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

namespace wit {

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages configuration from a JSON file. Uses JSON pointer syntax
 * (RFC 6901) for nested value access. Missing keys are filled from
 * default_config() on load, so older files pick up new settings.
 *
 * Thread safety: Not thread-safe. Initialize once at startup, read from the
 * thread that builds the discovery subsystem.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/wit.json");
 *
 * int ttl = cfg->get<int>("/discovery/ttl_sec", 300);
 * cfg->set<std::string>("/discovery/network_scan/cidr", "10.0.0.0/24");
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A corrupt file is
     * moved aside to "<path>.corrupt" and replaced with defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            try {
                return data[ptr].template get<T>();
            } catch (const json::exception& e) {
                spdlog::warn("[Config] {} has unexpected type: {}", json_ptr, e.what());
            }
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /// Mutable JSON sub-object at path
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written atomically (temp file + rename).
     * @return false if the file could not be written
     */
    bool save();

    std::string get_path();

    /// Replace all settings with default_config()
    void reset_to_defaults();

    /// Every known key with its default value
    static json default_config();

    static Config* get_instance();
};

} // namespace wit

#endif // __WIT_CONFIG_H__
