// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "runtime_config.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifndef PRINTERPAL_VERSION
#define PRINTERPAL_VERSION "0.0.0"
#endif

namespace printerpal {

void print_test_mode_banner() {
    const RuntimeConfig& config = get_runtime_config();

    printf("╔════════════════════════════════════════╗\n");
    printf("║           TEST MODE ENABLED            ║\n");
    printf("╚════════════════════════════════════════╝\n");
    printf("  Using MOCK CUPS backend (no jobs reach a printer)\n");
    printf("  Config:  %s\n", config.config_path.c_str());
    printf("  Uploads: %s\n", config.upload_dir.c_str());
    printf("\n");
}

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

/// Accepts "--name value" and "--name=value"; advances @p i past a separate value
static bool option_value(int argc, char** argv, int& i, const char* name, const char*& value) {
    size_t len = strlen(name);
    if (strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    if (i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    printf("Error: %s requires an argument\n", name);
    return false;
}

static bool matches(const char* arg, const char* name) {
    size_t len = strlen(name);
    return strncmp(arg, name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -H, --host <addr>     Bind address (overrides app.host)\n");
    printf("  -p, --port <n>        Listen port 1-65535 (overrides app.port)\n");
    printf("  -c, --config <path>   Config file (default: %s)\n",
           RuntimeConfig().config_path.c_str());
    printf("  --upload-dir <path>   Upload directory\n");
    printf("  --cache-dir <path>    Scratch directory for previews and print jobs\n");
    printf("  --threads <n>         HTTP worker threads 1-64 (default: 4)\n");
    printf("  -v, --verbose         Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>     Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>     Log file path (when --log-dest=file)\n");
    printf("  --test                Use a simulated CUPS backend\n");
    printf("  -h, --help            Show this help message\n");
    printf("  -V, --version         Show version information\n");
    printf("\nEnvironment:\n");
    printf("  PRINTERPAL_CONFIG, PRINTERPAL_UPLOAD_DIR, PRINTERPAL_CACHE_DIR,\n");
    printf("  PRINTERPAL_ROOT_HELPER, PRINTERPAL_HOST, PRINTERPAL_PORT\n");
    printf("  Command-line flags take precedence over the environment.\n");
}

CliParseResult parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* value = nullptr;

        if (strcmp(argv[i], "-H") == 0 || matches(argv[i], "--host")) {
            if (!option_value(argc, argv, i, "--host", value))
                return CliParseResult::ERROR;
            args.host = value;
        } else if (strcmp(argv[i], "-p") == 0 || matches(argv[i], "--port")) {
            if (!option_value(argc, argv, i, "--port", value) ||
                !parse_int(value, 1, 65535, args.port, "port"))
                return CliParseResult::ERROR;
        } else if (strcmp(argv[i], "-c") == 0 || matches(argv[i], "--config")) {
            if (!option_value(argc, argv, i, "--config", value))
                return CliParseResult::ERROR;
            args.config_path = value;
        } else if (matches(argv[i], "--upload-dir")) {
            if (!option_value(argc, argv, i, "--upload-dir", value))
                return CliParseResult::ERROR;
            args.upload_dir = value;
        } else if (matches(argv[i], "--cache-dir")) {
            if (!option_value(argc, argv, i, "--cache-dir", value))
                return CliParseResult::ERROR;
            args.cache_dir = value;
        } else if (matches(argv[i], "--threads")) {
            if (!option_value(argc, argv, i, "--threads", value) ||
                !parse_int(value, 1, 64, args.threads, "thread count"))
                return CliParseResult::ERROR;
        } else if (strcmp(argv[i], "--test") == 0) {
            args.test_mode = true;
        }
        // Verbosity: -v, -vv, -vvv
        else if (argv[i][0] == '-' && argv[i][1] == 'v' && argv[i][2] != '-') {
            const char* p = argv[i] + 1;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
            if (*p != '\0') {
                printf("Unknown argument: %s\n", argv[i]);
                return CliParseResult::ERROR;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches(argv[i], "--log-dest")) {
            if (!option_value(argc, argv, i, "--log-dest", value))
                return CliParseResult::ERROR;
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, syslog, file, console\n");
                return CliParseResult::ERROR;
            }
        } else if (matches(argv[i], "--log-file")) {
            if (!option_value(argc, argv, i, "--log-file", value))
                return CliParseResult::ERROR;
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.show_help = true;
            print_help(argv[0]);
            return CliParseResult::EXIT;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            args.show_version = true;
            printf("printerpal-server %s\n", PRINTERPAL_VERSION);
            return CliParseResult::EXIT;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return CliParseResult::ERROR;
        }
    }

    if (!args.log_file.empty() && !args.log_dest.empty() && args.log_dest != "file") {
        printf("Error: --log-file requires --log-dest=file\n");
        return CliParseResult::ERROR;
    }

    return CliParseResult::RUN;
}

void apply_cli_overrides(const CliArgs& args) {
    RuntimeConfig* config = get_mutable_runtime_config();

    if (args.test_mode)
        config->test_mode = true;
    if (!args.config_path.empty())
        config->config_path = args.config_path;
    if (!args.upload_dir.empty())
        config->upload_dir = args.upload_dir;
    if (!args.cache_dir.empty())
        config->cache_dir = args.cache_dir;
    if (!args.host.empty())
        config->host_override = args.host;
    if (args.port > 0)
        config->port_override = args.port;
}

} // namespace printerpal
