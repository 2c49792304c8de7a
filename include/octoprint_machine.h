// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "machine.h"
#include "octoprint_connection.h"

#include <memory>

namespace wit {

/**
 * @brief Machine behind an OctoPrint (or OctoPrint-compatible PrusaLink) server
 *
 * Job verbs go through OctoPrintConnection; motion and heaters use the
 * /api/printer/{printhead,tool,bed,chamber} endpoints. OctoPrint has no
 * emergency-stop endpoint, so emergency_stop() sends M112 through
 * /api/printer/command.
 */
class OctoPrintMachine : public Machine {
  public:
    OctoPrintMachine(std::string id, std::unique_ptr<OctoPrintConnection> connection,
                     MachineType type = MachineType::PRINTER_3D_FDM,
                     ConnectionProtocol protocol = ConnectionProtocol::OCTOPRINT);

    ConnectionProtocol protocol() const override {
        return protocol_;
    }

    CommandResult get_temperatures() override;
    CommandResult get_progress() override;
    CommandResult get_time_remaining() override;
    CommandResult get_current_job() override;

    CommandResult upload_file(const std::string& path, const std::string& content) override;
    CommandResult list_files(const std::string& path = "") override;
    CommandResult delete_file(const std::string& path) override;

    /// Server-reported state text mapped to PrinterState; does not change the local state
    CommandResult get_reported_state();

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
    OctoPrintMachine(std::string id, MachineType type, ConnectionProtocol protocol,
                     OctoPrintConnection* connection);

    OctoPrintConnection* octo_; ///< Non-owning view of the owned connection
    ConnectionProtocol protocol_;
};

} // namespace wit
