// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for printerpal-server
 */

#include <string>

namespace printerpal {

/**
 * @brief Parsed command-line arguments
 *
 * Empty strings and zero ports mean "not given on the command line".
 */
struct CliArgs {
    std::string host;        ///< --host: bind address override
    int port = 0;            ///< --port: listen port override
    std::string config_path; ///< --config: config file location
    std::string upload_dir;  ///< --upload-dir
    std::string cache_dir;   ///< --cache-dir
    int threads = 4;         ///< --threads: HTTP worker threads

    bool test_mode = false; ///< --test: mock CUPS backend

    // Logging
    int verbosity = 0;    ///< -v count, 0 = use logging.level from config
    std::string log_dest; ///< --log-dest: auto, console, syslog, file
    std::string log_file; ///< --log-file

    bool show_help = false;
    bool show_version = false;
};

/// Outcome of parse_cli_args()
enum class CliParseResult {
    RUN,   ///< Arguments accepted, start the server
    EXIT,  ///< --help or --version handled, exit 0
    ERROR, ///< Bad arguments, message already printed, exit 2
};

/**
 * @brief Parse command-line arguments
 *
 * Prints help, version and error messages to stdout itself.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 */
CliParseResult parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Copy CLI overrides into the global RuntimeConfig
 *
 * Call after RuntimeConfig::apply_environment() so flags win over the
 * environment.
 */
void apply_cli_overrides(const CliArgs& args);

/**
 * @brief Print test mode banner
 */
void print_test_mode_banner();

} // namespace printerpal
