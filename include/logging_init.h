// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace printerpal {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< syslog on Linux, console elsewhere
    Console, ///< Console only
    Syslog,  ///< syslog(3)
    File,    ///< Rotating file (5 MB x 3)
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Only for LogTarget::File; empty = auto-resolve
};

/**
 * @brief Build the default multi-sink logger
 *
 * Safe to call again (e.g. after the config file supplies logging settings);
 * the previous default logger is replaced.
 */
void init(const LogConfig& config);

/// "auto" | "console" | "syslog" | "file"; unrecognized strings map to Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Map config/CLI level names to spdlog levels
 *
 * Accepts "trace", "debug", "info", "warn", "error"; anything else is info.
 */
spdlog::level::level_enum parse_log_level(const std::string& str);

/// -v count to level: 0 = warn, 1 = info, 2 = debug, 3+ = trace
spdlog::level::level_enum level_from_verbosity(int verbosity);

} // namespace logging
} // namespace printerpal
