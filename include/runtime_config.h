// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace printerpal {

/**
 * @brief Process-level settings that never live in the config file
 *
 * Filesystem locations and the test-mode switch. Defaults match a packaged
 * install; PRINTERPAL_* environment variables override them and CLI flags
 * override those.
 */
struct RuntimeConfig {
    bool test_mode = false; ///< Use the mock print backend (--test)

    std::string config_path = "/etc/printerpal/config.json"; ///< PRINTERPAL_CONFIG
    std::string upload_dir = "/var/lib/printerpal/uploads";  ///< PRINTERPAL_UPLOAD_DIR
    std::string cache_dir = "/var/lib/printerpal/cache";     ///< PRINTERPAL_CACHE_DIR
    std::string root_helper = "/usr/local/sbin/printerpal-root"; ///< PRINTERPAL_ROOT_HELPER

    /// Searched in order; the first file yielding any Info lines wins
    std::vector<std::string> printers_conf_paths = {"/etc/cups/printers.conf",
                                                    "/etc/cups/printers.conf.O"};

    std::string host_override; ///< PRINTERPAL_HOST, empty = use app.host
    int port_override = 0;     ///< PRINTERPAL_PORT, 0 = use app.port

    /**
     * @brief Check if the CUPS backend should be replaced by the mock
     */
    bool should_mock_cups() const {
        return test_mode;
    }

    /**
     * @brief Apply PRINTERPAL_* environment variables
     */
    void apply_environment();
};

/**
 * @brief Get global runtime configuration
 */
const RuntimeConfig& get_runtime_config();

/**
 * @brief Get mutable runtime configuration (for initialization only)
 */
RuntimeConfig* get_mutable_runtime_config();

} // namespace printerpal
