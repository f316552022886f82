// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "print_backend.h"

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace printerpal {

/**
 * @brief In-memory print backend for --test and unit tests
 *
 * Starts with two idle printers. Submitted jobs stay in the queue for
 * job_duration() and then move to the completed list. set_available(false)
 * makes every query throw UNAVAILABLE, mimicking a stopped scheduler.
 */
class PrintBackendMock : public PrintBackend {
  public:
    PrintBackendMock();
    ~PrintBackendMock() override = default;

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
        return "mock";
    }

    // Test controls
    void set_available(bool available);
    void set_printers(std::vector<PrinterInfo> printers, const std::string& default_printer);
    void set_job_duration(std::chrono::milliseconds duration);
    std::vector<PrintJobOptions> submissions() const;

  private:
    struct MockJob {
        QueueJob job;
        std::chrono::steady_clock::time_point submitted;
    };

    void require_available() const;
    void advance_locked();

    mutable std::mutex mutex_;
    bool available_ = true;
    std::vector<PrinterInfo> printers_;
    std::string default_printer_;
    std::deque<MockJob> active_;
    std::vector<std::string> completed_;
    std::vector<PrintJobOptions> submissions_;
    int next_job_id_ = 1;
    std::chrono::milliseconds job_duration_{6000};
};

} // namespace printerpal
