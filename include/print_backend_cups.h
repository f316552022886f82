// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_runner.h"
#include "print_backend.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace printerpal {

/**
 * @brief CUPS backend using the lp/lpstat/cancel command-line tools
 *
 * Every query spawns a fresh lpstat; nothing is cached. lpstat exit codes are
 * not checked (lpstat exits non-zero for "no entries"), but a missing lpstat
 * binary or a hung scheduler propagate as exceptions.
 */
class PrintBackendCups : public PrintBackend {
  public:
    /// lp gets longer than lpstat: large PDFs are spooled synchronously
    static constexpr std::chrono::milliseconds SUBMIT_TIMEOUT{60000};

    PrintBackendCups(std::shared_ptr<CommandRunner> runner,
                     std::vector<std::string> printers_conf_paths);
    ~PrintBackendCups() override = default;

    bool is_available() override;
    SchedulerStatus scheduler_status() override;
    std::string default_printer() override;
    std::string display_name(const std::string& printer_name) override;
    std::vector<PrinterInfo> list_printers() override;
    std::vector<QueueJob> queue_jobs() override;
    JobStats job_stats() override;
    json printer_detail(const std::string& printer_name) override;
    std::string submit(const std::string& file_path, const PrintJobOptions& options) override;
    void cancel_job(const std::string& queue_id) override;

    std::string get_backend_name() const override {
        return "cups";
    }

    /**
     * @brief Build the lp argv for a submission (exposed for tests)
     */
    static std::vector<std::string> build_lp_argv(const std::string& file_path,
                                                  const PrintJobOptions& options);

  private:
    std::string lpstat(const std::vector<std::string>& args);

    std::shared_ptr<CommandRunner> runner_;
    std::vector<std::string> printers_conf_paths_;
};

} // namespace printerpal
