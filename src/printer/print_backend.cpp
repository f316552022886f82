// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "print_backend.h"

#include "print_backend_cups.h"
#include "print_backend_mock.h"
#include "runtime_config.h"

#include <spdlog/spdlog.h>

namespace printerpal {

std::unique_ptr<PrintBackend>
PrintBackend::create(std::shared_ptr<CommandRunner> runner,
                     const std::vector<std::string>& printers_conf_paths) {
    if (get_runtime_config().should_mock_cups()) {
        spdlog::debug("[PrintBackend] Test mode: using mock backend");
        return std::make_unique<PrintBackendMock>();
    }

    if (!runner) {
        runner = std::make_shared<CommandRunner>();
    }
    if (!runner->which("lpstat")) {
        // Not fatal: the status snapshot reports CUPS as unavailable until it is installed
        spdlog::warn("[PrintBackend] lpstat not found on PATH, CUPS will report unavailable");
    }
    spdlog::debug("[PrintBackend] Using CUPS command-line backend");
    return std::make_unique<PrintBackendCups>(std::move(runner), printers_conf_paths);
}

} // namespace printerpal
