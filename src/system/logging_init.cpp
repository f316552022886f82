// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace printerpal {
namespace logging {

namespace {

/// Check if a path is writable (for file logging location selection)
bool is_path_writable(const std::string& path) {
    std::filesystem::path p(path);
    std::filesystem::path dir = p.parent_path();

    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return false;
    }

    auto perms = std::filesystem::status(dir, ec).permissions();
    if (ec) {
        return false;
    }

    // Owner write bit only; good enough for picking a default location
    return (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
}

/// Get XDG_STATE_HOME or default ~/.local/state
std::string get_xdg_state_home() {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/state";
    }

    return "/tmp";
}

/// Resolve log file path with fallback logic
std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    // Service installs can write /var/log
    const std::string var_log = "/var/log/printerpal.log";
    if (is_path_writable(var_log)) {
        return var_log;
    }

    std::string user_dir = get_xdg_state_home() + "/printerpal";
    std::error_code ec;
    std::filesystem::create_directories(user_dir, ec);

    return user_dir + "/printerpal.log";
}

LogTarget detect_best_target() {
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Syslog:
        sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>("printerpal", LOG_PID,
                                                                        LOG_USER, false));
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        // 5MB max size, 3 rotated files
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        break;
    }
    default:
        break;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    try {
        add_system_sink(sinks, effective_target, config.file_path);
    } catch (const spdlog::spdlog_ex& e) {
        // Unwritable log file: keep going with the console
        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        auto fallback = std::make_shared<spdlog::logger>("printerpal", sinks.begin(), sinks.end());
        fallback->warn("[Logging] {} sink unavailable: {}", log_target_name(effective_target),
                       e.what());
    }

    auto logger = std::make_shared<spdlog::logger>("printerpal", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Console:
        return "console";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    }
    return "unknown";
}

spdlog::level::level_enum parse_log_level(const std::string& str) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "warn")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    return spdlog::level::info;
}

spdlog::level::level_enum level_from_verbosity(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}

} // namespace logging
} // namespace printerpal
