// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "http_connection.h"
#include "machine.h"

#include <memory>

namespace wit {

/**
 * @brief Machine behind a Klipper/Moonraker server
 *
 * Uses Moonraker's HTTP API over a generic HttpConnection (probe path
 * /server/info). Motion and heaters are sent as G-code scripts through
 * /printer/gcode/script; status comes from /printer/objects/query.
 */
class MoonrakerMachine : public Machine {
  public:
    /// @param connection Must probe /server/info (see moonraker_http_options())
    MoonrakerMachine(std::string id, std::unique_ptr<HttpConnection> connection,
                     MachineType type = MachineType::PRINTER_3D_COREXY);

    ConnectionProtocol protocol() const override {
        return ConnectionProtocol::MOONRAKER;
    }

    CommandResult get_temperatures() override;
    CommandResult get_progress() override;
    CommandResult get_time_remaining() override;
    CommandResult get_current_job() override;

    CommandResult upload_file(const std::string& path, const std::string& content) override;
    CommandResult list_files(const std::string& path = "") override;
    CommandResult delete_file(const std::string& path) override;

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
    MoonrakerMachine(std::string id, MachineType type, HttpConnection* connection);

    CommandResult run_gcode(const std::string& script);

    /// GET /printer/objects/query and return result.status, or the failure
    CommandResult query_objects(const json& objects);

    HttpConnection* http_; ///< Non-owning view of the owned connection
};

/// HttpOptions with the Moonraker probe path
HttpOptions moonraker_http_options(std::string base_url, std::string api_key = "");

} // namespace wit
