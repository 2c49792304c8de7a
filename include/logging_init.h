// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace wit {
namespace logging {

/// Where log lines go besides the console
enum class LogTarget {
    Auto,    ///< Syslog on Linux, console elsewhere
    Journal, ///< systemd journal (falls back to syslog without systemd support)
    Syslog,
    File,    ///< Rotating file, 5 MB x 3
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Console;
    std::string file_path; ///< Empty selects the default location
    bool enable_console = true;
};

/// Console-only logger so log calls made before init() are safe
void init_early();

/// Replace the default logger with the configured sinks and sync libhv's level
void init(const LogConfig& config);

/// "trace".."off" (plus "warning"), case sensitive; @p fallback otherwise
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum fallback = spdlog::level::warn);

/// -v = info, -vv = debug, -vvv and beyond = trace, none = warn
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// CLI verbosity beats the config string, which beats the default
spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level,
                                            bool debug_default);

/// libhv LOG_LEVEL_* value for an spdlog level (libhv has no trace)
int to_hv_level(spdlog::level::level_enum level);

LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace wit
