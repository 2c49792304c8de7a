// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "machine_types.h"

#include <functional>
#include <string>

#include "hv/json.hpp"

namespace wit {

using json = nlohmann::json;

/**
 * @brief A device found by one discovery pass
 *
 * Identity is discovery_id alone: two sightings of the same device compare
 * equal and hash alike even if their metadata differs. same_content() is the
 * full comparison used to decide whether a re-sighting is a material change.
 *
 * connection_params by protocol:
 * - serial_gcode / serial_grbl: {"port": "/dev/ttyACM0", "baud_rate": 115200}
 * - octoprint / prusalink / moonraker / http_rest: {"base_url": "...", "api_key": "..."}
 */
struct DiscoveredMachine {
    std::string discovery_id;                 ///< Stable identity key (e.g., "serial_/dev/ttyACM0")
    std::string name;                         ///< Human readable name
    MachineType machine_type = MachineType::UNKNOWN;
    ConnectionProtocol connection_protocol = ConnectionProtocol::UNKNOWN;
    nlohmann::json connection_params = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object(); ///< vid/pid, serial numbers, TXT fields

    bool operator==(const DiscoveredMachine& other) const {
        return discovery_id == other.discovery_id;
    }
    bool operator!=(const DiscoveredMachine& other) const {
        return !(*this == other);
    }

    /// Field-by-field comparison
    bool same_content(const DiscoveredMachine& other) const {
        return discovery_id == other.discovery_id && name == other.name &&
               machine_type == other.machine_type &&
               connection_protocol == other.connection_protocol &&
               connection_params == other.connection_params && metadata == other.metadata;
    }

    nlohmann::json to_json() const {
        return {{"discovery_id", discovery_id},
                {"name", name},
                {"machine_type", to_string(machine_type)},
                {"connection_protocol", to_string(connection_protocol)},
                {"connection_params", connection_params},
                {"metadata", metadata}};
    }
};

} // namespace wit

namespace std {
template <> struct hash<wit::DiscoveredMachine> {
    size_t operator()(const wit::DiscoveredMachine& m) const noexcept {
        return hash<string>()(m.discovery_id);
    }
};
} // namespace std
