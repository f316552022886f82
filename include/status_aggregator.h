// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printerpal_types.h"

#include <functional>
#include <memory>
#include <mutex>

namespace printerpal {

class AirPrintHelper;
class PrintBackend;

/**
 * @brief Builds coherent StatusSnapshots from the print backend
 *
 * Used for both GET /api/status and every broadcaster tick. Never throws:
 * any backend failure downgrades the snapshot to "CUPS unavailable" while the
 * job counters keep their last-known values.
 *
 * When AirPrint auto-enable is on and CUPS is up, each snapshot also gives the
 * AirPrint helper a chance to refresh advertising (rate-limited there).
 *
 * @threading snapshot() may be called concurrently from HTTP workers and the
 *            broadcaster thread.
 */
class StatusAggregator {
  public:
    /// Reads airprint.auto_enable at snapshot time
    using AirPrintPolicy = std::function<bool()>;

    StatusAggregator(std::shared_ptr<PrintBackend> backend,
                     std::shared_ptr<AirPrintHelper> airprint = nullptr,
                     AirPrintPolicy airprint_enabled = nullptr);

    StatusSnapshot snapshot();

    /// Counters from the last successful query (zero before the first)
    JobStats last_known_stats() const;

    /// Scheduler liveness only (GET /healthz)
    bool cups_available();

  private:
    StatusSnapshot unavailable_snapshot(const SchedulerStatus& scheduler, bool airprint_enabled);

    std::shared_ptr<PrintBackend> backend_;
    std::shared_ptr<AirPrintHelper> airprint_;
    AirPrintPolicy airprint_enabled_;

    mutable std::mutex stats_mutex_;
    JobStats last_stats_;
};

} // namespace printerpal
