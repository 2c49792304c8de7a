// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file machine.h
 * @brief Protocol-agnostic command and state facade over one Connection
 *
 * Machine owns the job state machine and its guard rules; the concrete
 * variants (GcodeMachine, OctoPrintMachine, MoonrakerMachine) only translate
 * each accepted command into transport calls.
 *
 * State machine:
 * @code
 *   Disconnected --connect()--> Idle --start()--> Printing <--resume()-- Paused
 *                                                  |  pause() ---------->  |
 *                                                  +--cancel()--> Cancelled <--+
 *   any --emergency_stop()--> Error
 * @endcode
 * Error and Cancelled are terminal for the Machine object. A guard violation
 * returns error_code::INVALID_STATE, performs no I/O and leaves the state alone.
 * A transport failure on an accepted command also leaves the state alone.
 *
 * Machine does not serialize concurrent callers; the guards only make
 * out-of-order calls fail safely.
 */

#include "command_result.h"
#include "connection.h"
#include "machine_types.h"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wit {

class Machine {
  public:
    virtual ~Machine() = default;

    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    const std::string& id() const {
        return id_;
    }
    MachineType machine_type() const {
        return machine_type_;
    }
    virtual ConnectionProtocol protocol() const = 0;

    /// Capabilities of the machine type narrowed to what the transport supports
    const CapabilitySet& capabilities() const {
        return capabilities_;
    }
    bool has_capability(MachineCapability capability) const {
        return capabilities_.count(capability) > 0;
    }

    const Connection& connection() const {
        return *connection_;
    }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /// Connect the transport; Disconnected becomes Idle on success
    bool connect();

    /// Disconnect the transport; Idle becomes Disconnected, job states are kept
    bool disconnect();

    // ========================================================================
    // Job control (guarded)
    // ========================================================================

    /// Start a job; only from Idle. @p file may be empty to start the selected file
    CommandResult start(const std::string& file = "");
    CommandResult pause();
    CommandResult resume();
    CommandResult cancel();

    /**
     * @brief Halt the machine immediately
     *
     * Always accepted, always forces Error, never returns a failure. The data
     * reports whether the transport acknowledged: {"transport_acknowledged",
     * "transport_error"}.
     */
    CommandResult emergency_stop();

    // ========================================================================
    // Motion and temperature (validated)
    // ========================================================================

    /// Home the given axes (subset of x/y/z); empty means all
    CommandResult home(const std::vector<std::string>& axes = {});

    /// Relative move of one axis (x/y/z/e) by a signed distance, speed in mm/min
    CommandResult jog(const std::string& axis, double distance,
                      std::optional<double> speed = std::nullopt);

    /// Set a heater target in degrees C; zone is hotend, bed or chamber, target 0..500
    CommandResult set_temperature(const std::string& zone, double target);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Local job state; no I/O
    PrinterState get_current_state() const {
        return state_.load();
    }

    /// {"hotend": [current, target], "bed": [...], "chamber": [...]}
    virtual CommandResult get_temperatures() = 0;

    /// {"progress": percent or null}
    virtual CommandResult get_progress() = 0;

    /// {"time_remaining": seconds or null}
    virtual CommandResult get_time_remaining() = 0;

    /// {"job": {...}} while Printing or Paused, {"job": null} otherwise
    virtual CommandResult get_current_job() = 0;

    // ========================================================================
    // Files
    // ========================================================================

    virtual CommandResult upload_file(const std::string& path, const std::string& content) = 0;

    /// {"files": [{"name", "size", ...}]}
    virtual CommandResult list_files(const std::string& path = "") = 0;

    virtual CommandResult delete_file(const std::string& path) = 0;

    /// Identity, state, capabilities and connection health for the web layer
    json get_info() const;

  protected:
    Machine(std::string id, MachineType type, std::unique_ptr<Connection> connection,
            const CapabilitySet& transport_capabilities);

    Connection& mutable_connection() {
        return *connection_;
    }

    /// File named by the last accepted start(); empty when none
    const std::string& current_file() const {
        return current_file_;
    }

    // Transport translation, called only after the guards accepted the command.
    // Axis and zone names arrive lower-cased and validated.
    virtual CommandResult do_start(const std::string& file) = 0;
    virtual CommandResult do_pause() = 0;
    virtual CommandResult do_resume() = 0;
    virtual CommandResult do_cancel() = 0;
    virtual CommandResult do_emergency_stop() = 0;
    virtual CommandResult do_home(const std::vector<std::string>& axes) = 0;
    virtual CommandResult do_jog(const std::string& axis, double distance,
                                 std::optional<double> speed) = 0;
    virtual CommandResult do_set_temperature(const std::string& zone, double target) = 0;

    /// Hook run after a successful connect()
    virtual void on_connected() {}

  private:
    CommandResult require_capability(MachineCapability capability, const char* what) const;
    void transition(PrinterState from, PrinterState to);

    std::string id_;
    MachineType machine_type_;
    std::unique_ptr<Connection> connection_;
    CapabilitySet capabilities_;
    std::atomic<PrinterState> state_{PrinterState::DISCONNECTED};
    std::string current_file_;
};

/// Maximum heater target accepted by set_temperature()
constexpr double kMaxTemperatureTarget = 500.0;

} // namespace wit
