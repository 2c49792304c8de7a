// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "machine.h"
#include "serial_connection.h"

#include <memory>

namespace wit {

/**
 * @brief Machine driven directly over a serial line
 *
 * G-code dialect (Marlin/RepRap): jobs run from the controller's SD card
 * (M23/M24 start, M25 pause, M24 resume, M25+M524 cancel), M112 emergency stop,
 * M105/M27 status queries, M20/M30 file management. Uploads are not supported.
 *
 * GRBL dialect: motion only ($H homing, $J= jogging, '!' feed hold as stop);
 * there is no job storage or heater on a GRBL controller.
 */
class GcodeMachine : public Machine {
  public:
    GcodeMachine(std::string id, std::unique_ptr<SerialConnection> connection,
                 MachineType type = MachineType::PRINTER_3D_FDM);

    ConnectionProtocol protocol() const override;

    CommandResult get_temperatures() override;
    CommandResult get_progress() override;
    CommandResult get_time_remaining() override;
    CommandResult get_current_job() override;

    CommandResult upload_file(const std::string& path, const std::string& content) override;
    CommandResult list_files(const std::string& path = "") override;
    CommandResult delete_file(const std::string& path) override;

    /// Firmware fields reported by the connect handshake
    const std::map<std::string, std::string>& firmware_info() const {
        return serial_->firmware_info();
    }

  protected:
    CommandResult do_start(const std::string& file) override;
    CommandResult do_pause() override;
    CommandResult do_resume() override;
    CommandResult do_cancel() override;
    CommandResult do_emergency_stop() override;
    CommandResult do_home(const std::vector<std::string>& axes) override;
    CommandResult do_jog(const std::string& axis, double distance,
                         std::optional<double> speed) override;
    CommandResult do_set_temperature(const std::string& zone, double target) override;

  private:
    GcodeMachine(std::string id, MachineType type, SerialConnection* connection);

    static CapabilitySet transport_capabilities(const SerialConnection* connection);

    bool is_grbl() const {
        return serial_->options().dialect == SerialDialect::GRBL;
    }

    /// Reply lines of a successful serial exchange
    static std::vector<std::string> response_lines(const CommandResult& result);

    SerialConnection* serial_; ///< Non-owning view of the owned connection
};

} // namespace wit
