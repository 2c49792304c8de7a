// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "discovery_method.h"
#include "serial_port.h"

#include <memory>
#include <optional>
#include <string>

namespace wit {

/**
 * @brief Why a serial port looks like a machine
 */
struct SerialClassification {
    std::string label; ///< e.g., "Arduino Mega 2560", or the matched description
    MachineType machine_type = MachineType::PRINTER_3D_FDM;
    ConnectionProtocol protocol = ConnectionProtocol::SERIAL_GCODE;
};

/**
 * @brief Heuristic: is this port likely a printer or CNC controller?
 *
 * Matches, in order:
 * 1. Known USB VID:PID pairs (CH340, FTDI, Arduino Mega/Due, CH341, STM32 VCP, Prusa)
 * 2. Known vendor IDs alone (Arduino, Prusa Research, STMicro, QinHeng, FTDI, Silicon Labs)
 * 3. Substrings of description/manufacturer/product: prusa, arduino, ch340,
 *    ft232, ch341, cp210, marlin, grbl, 3d printer
 *
 * A "grbl" hint anywhere selects CNC / serial_grbl. False positives are
 * acceptable: the connect() handshake rejects non-machines.
 *
 * @return std::nullopt for ports that match nothing
 */
std::optional<SerialClassification> classify_serial_port(const SerialPortInfo& port);

struct SerialDiscoveryOptions {
    uint32_t baud_rate = 115200; ///< Written into connection_params
};

/**
 * @brief Finds likely machines among the host's serial ports
 *
 * discovery_id is "serial_<device>", so a board re-enumerated on another
 * device node is a new record.
 */
class SerialDiscovery : public DiscoveryMethod {
  public:
    /// @param enumerator Port source; nullptr selects the platform enumerator
    explicit SerialDiscovery(std::shared_ptr<SerialPortEnumerator> enumerator = nullptr,
                             SerialDiscoveryOptions options = {});

    std::vector<DiscoveredMachine> discover() override;

    std::string name() const override {
        return "serial";
    }

  private:
    std::shared_ptr<SerialPortEnumerator> enumerator_;
    SerialDiscoveryOptions options_;
};

} // namespace wit
