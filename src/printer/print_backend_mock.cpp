// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "print_backend_mock.h"

#include "lpstat_parser.h"
#include "printerpal_error.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace printerpal {

PrintBackendMock::PrintBackendMock() {
    PrinterInfo office;
    office.name = "Office_Laser";
    office.state = "idle";
    office.is_default = true;
    office.accepting = true;
    office.display_name = "Office Laser (Mock)";

    PrinterInfo label;
    label.name = "Label_Printer";
    label.state = "idle";
    label.accepting = true;

    printers_ = {office, label};
    default_printer_ = office.name;
    spdlog::debug("[PrintBackendMock] Created with {} mock printers", printers_.size());
}

void PrintBackendMock::require_available() const {
    if (!available_) {
        throw PrinterPalException(PrinterPalError::unavailable("Mock scheduler is stopped"));
    }
}

void PrintBackendMock::advance_locked() {
    auto now = std::chrono::steady_clock::now();
    while (!active_.empty() && now - active_.front().submitted >= job_duration_) {
        completed_.push_back(active_.front().job.raw);
        active_.pop_front();
    }
}

bool PrintBackendMock::is_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

SchedulerStatus PrintBackendMock::scheduler_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    SchedulerStatus s;
    s.running = available_;
    s.raw = available_ ? "scheduler is running" : "scheduler is not running";
    return s;
}

std::string PrintBackendMock::default_printer() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_available();
    return default_printer_;
}

std::string PrintBackendMock::display_name(const std::string& printer_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : printers_) {
        if (p.name == printer_name && p.display_name) {
            return *p.display_name;
        }
    }
    return printer_name;
}

std::vector<PrinterInfo> PrintBackendMock::list_printers() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_available();
    advance_locked();

    auto printers = printers_;
    for (auto& p : printers) {
        bool printing = std::any_of(active_.begin(), active_.end(), [&](const MockJob& j) {
            return j.job.queue_id.rfind(p.name + "-", 0) == 0;
        });
        if (printing && p.state == "idle") {
            p.state = "busy";
        }
    }
    return printers;
}

std::vector<QueueJob> PrintBackendMock::queue_jobs() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_available();
    advance_locked();

    std::vector<QueueJob> jobs;
    for (const auto& j : active_) {
        jobs.push_back(j.job);
    }
    return jobs;
}

JobStats PrintBackendMock::job_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_available();
    advance_locked();

    JobStats stats;
    stats.active_jobs = static_cast<int>(active_.size());
    stats.completed_jobs = static_cast<int>(completed_.size());
    stats.last_completed_raw = completed_.empty() ? "" : completed_.back();
    return stats;
}

json PrintBackendMock::printer_detail(const std::string& printer_name) {
    if (printer_name.empty()) {
        return json::object();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    require_available();
    for (const auto& p : printers_) {
        if (p.name == printer_name) {
            return {{"name", printer_name},
                    {"detail", "printer " + p.name + " is " + p.state +
                                   ".\n\tDescription: " + p.display_name.value_or(p.name)}};
        }
    }
    return {{"name", printer_name},
            {"detail", "lpstat: Invalid destination name in list \"" + printer_name + "\"."}};
}

std::string PrintBackendMock::submit(const std::string& file_path,
                                     const PrintJobOptions& options) {
    if (options.copies < 1 || options.copies > 99) {
        throw PrinterPalException(
            PrinterPalError::validation("copies must be between 1 and 99"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    require_available();

    std::string dest = options.printer.empty() ? default_printer_ : options.printer;
    auto it = std::find_if(printers_.begin(), printers_.end(),
                           [&](const PrinterInfo& p) { return p.name == dest; });
    if (it == printers_.end()) {
        throw PrinterPalException(PrinterPalError::command_failed(
            "Printing failed: lp: The printer or class does not exist.", 1,
            "lp: The printer or class does not exist."));
    }

    MockJob mj;
    mj.job.job_id = next_job_id_++;
    mj.job.queue_id = dest + "-" + std::to_string(mj.job.job_id);
    mj.job.user = "printerpal";
    mj.job.size = "1024";
    mj.job.raw = mj.job.queue_id + "  printerpal  1024  " + options.title;
    mj.submitted = std::chrono::steady_clock::now();

    submissions_.push_back(options);
    active_.push_back(mj);

    spdlog::info("[PrintBackendMock] Queued {} ({}) from {}", mj.job.queue_id, options.title,
                 file_path);
    return "request id is " + mj.job.queue_id + " (1 file(s))";
}

void PrintBackendMock::cancel_job(const std::string& queue_id) {
    if (!lpstat::is_valid_job_id(queue_id)) {
        throw PrinterPalException(PrinterPalError::validation("Invalid job id"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    require_available();
    auto it = std::find_if(active_.begin(), active_.end(),
                           [&](const MockJob& j) { return j.job.queue_id == queue_id; });
    if (it == active_.end()) {
        throw PrinterPalException(PrinterPalError::command_failed(
            "cancel: Job #" + queue_id + " does not exist.", 1, ""));
    }
    active_.erase(it);
    spdlog::info("[PrintBackendMock] Cancelled {}", queue_id);
}

void PrintBackendMock::set_available(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

void PrintBackendMock::set_printers(std::vector<PrinterInfo> printers,
                                    const std::string& default_printer) {
    std::lock_guard<std::mutex> lock(mutex_);
    printers_ = std::move(printers);
    default_printer_ = default_printer;
    for (auto& p : printers_) {
        p.is_default = (p.name == default_printer_);
    }
}

void PrintBackendMock::set_job_duration(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    job_duration_ = duration;
}

std::vector<PrintJobOptions> PrintBackendMock::submissions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submissions_;
}

} // namespace printerpal
