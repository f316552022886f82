// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "status_aggregator.h"

#include "airprint_helper.h"
#include "print_backend.h"

#include <spdlog/spdlog.h>

namespace printerpal {

StatusAggregator::StatusAggregator(std::shared_ptr<PrintBackend> backend,
                                   std::shared_ptr<AirPrintHelper> airprint,
                                   AirPrintPolicy airprint_enabled)
    : backend_(std::move(backend)), airprint_(std::move(airprint)),
      airprint_enabled_(std::move(airprint_enabled)) {}

JobStats StatusAggregator::last_known_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_stats_;
}

bool StatusAggregator::cups_available() {
    return backend_->scheduler_status().running;
}

StatusSnapshot StatusAggregator::unavailable_snapshot(const SchedulerStatus& scheduler,
                                                      bool airprint_enabled) {
    StatusSnapshot s;
    s.cups_available = false;
    s.scheduler = scheduler;
    s.airprint_enabled = airprint_enabled;
    s.stats = last_known_stats();
    return s;
}

StatusSnapshot StatusAggregator::snapshot() {
    bool airprint_enabled = airprint_enabled_ ? airprint_enabled_() : false;
    SchedulerStatus scheduler = backend_->scheduler_status();

    if (!scheduler.running) {
        spdlog::trace("[StatusAggregator] Scheduler not running: {}",
                      scheduler.error.empty() ? scheduler.raw : scheduler.error);
        return unavailable_snapshot(scheduler, airprint_enabled);
    }

    StatusSnapshot s;
    s.cups_available = true;
    s.scheduler = scheduler;
    s.airprint_enabled = airprint_enabled;

    try {
        s.default_printer = backend_->default_printer();
        s.printers = backend_->list_printers();
        s.jobs = backend_->queue_jobs();
        s.stats = backend_->job_stats();
        if (!s.default_printer.empty()) {
            s.default_printer_display = backend_->display_name(s.default_printer);
            s.default_printer_label = s.default_printer_display + " (default)";
        }
    } catch (const std::exception& e) {
        spdlog::warn("[StatusAggregator] CUPS query failed, reporting unavailable: {}", e.what());
        scheduler.error = e.what();
        return unavailable_snapshot(scheduler, airprint_enabled);
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        last_stats_ = s.stats;
    }

    if (airprint_enabled && airprint_) {
        try {
            airprint_->maybe_auto_ensure(s.printers);
        } catch (const std::exception& e) {
            spdlog::warn("[StatusAggregator] AirPrint auto-ensure not started: {}", e.what());
        }
    }

    return s;
}

} // namespace printerpal
