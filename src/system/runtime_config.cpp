// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "runtime_config.h"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace printerpal {

// Global runtime configuration instance
static RuntimeConfig g_runtime_config;

const RuntimeConfig& get_runtime_config() {
    return g_runtime_config;
}

RuntimeConfig* get_mutable_runtime_config() {
    return &g_runtime_config;
}

namespace {

void env_string(const char* name, std::string& target) {
    const char* v = std::getenv(name);
    if (v != nullptr && *v != '\0') {
        target = v;
        spdlog::debug("[RuntimeConfig] {}={}", name, target);
    }
}

} // namespace

void RuntimeConfig::apply_environment() {
    env_string("PRINTERPAL_CONFIG", config_path);
    env_string("PRINTERPAL_UPLOAD_DIR", upload_dir);
    env_string("PRINTERPAL_CACHE_DIR", cache_dir);
    env_string("PRINTERPAL_ROOT_HELPER", root_helper);
    env_string("PRINTERPAL_HOST", host_override);

    const char* port = std::getenv("PRINTERPAL_PORT");
    if (port != nullptr && *port != '\0') {
        char* end = nullptr;
        long v = std::strtol(port, &end, 10);
        if (*end == '\0' && v > 0 && v <= 65535) {
            port_override = static_cast<int>(v);
        } else {
            spdlog::warn("[RuntimeConfig] Ignoring invalid PRINTERPAL_PORT '{}'", port);
        }
    }
}

} // namespace printerpal
