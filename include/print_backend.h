// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printerpal_types.h"

#include <memory>
#include <string>
#include <vector>

namespace printerpal {

class CommandRunner;

/**
 * @brief Options for a single print submission
 */
struct PrintJobOptions {
    std::string printer; ///< Empty = CUPS default destination
    int copies = 1;      ///< 1..99
    std::string title;   ///< Job title shown in the queue
    std::vector<std::string> options; ///< Extra "-o" values, each passed as its own argv entry
};

/**
 * @brief Abstract printer/queue gateway
 *
 * Platform-agnostic interface to the print subsystem. Implementations:
 * - PrintBackendCups: CUPS command-line tools (lp, lpstat, cancel)
 * - PrintBackendMock: in-memory printers and queue for --test
 *
 * Query methods throw PrinterPalException when the subsystem cannot be
 * reached at all (COMMAND_NOT_FOUND, TIMEOUT). A reachable subsystem that
 * reports nothing yields empty results, not errors. All methods are safe to
 * call from multiple request threads.
 */
class PrintBackend {
  public:
    virtual ~PrintBackend() = default;

    /**
     * @brief True if the scheduler answers and reports itself running
     */
    virtual bool is_available() = 0;

    /**
     * @brief Scheduler state for the status snapshot; never throws
     */
    virtual SchedulerStatus scheduler_status() = 0;

    /// System default destination, "" if none
    virtual std::string default_printer() = 0;

    /// printers.conf Info label for @p printer_name, falling back to the name
    virtual std::string display_name(const std::string& printer_name) = 0;

    virtual std::vector<PrinterInfo> list_printers() = 0;

    /// Active jobs, in queue order
    virtual std::vector<QueueJob> queue_jobs() = 0;

    virtual JobStats job_stats() = 0;

    /**
     * @brief Long-form printer description (`lpstat -l -p NAME`)
     *
     * @return {name, detail}; empty object for an empty name
     */
    virtual json printer_detail(const std::string& printer_name) = 0;

    /**
     * @brief Submit a file for printing
     *
     * @param file_path Print-ready file (must exist)
     * @param options Destination, copies, title
     * @return Scheduler's confirmation text, e.g. "request id is HP-12 (1 file(s))"
     * @throws PrinterPalException NOT_FOUND, VALIDATION_ERROR (copies), COMMAND_FAILED
     */
    virtual std::string submit(const std::string& file_path, const PrintJobOptions& options) = 0;

    /**
     * @brief Cancel a queued job by its full queue id
     *
     * @throws PrinterPalException VALIDATION_ERROR for malformed ids, COMMAND_FAILED
     */
    virtual void cancel_job(const std::string& queue_id) = 0;

    virtual std::string get_backend_name() const = 0;

    /**
     * @brief Create the backend for this run
     *
     * Test mode yields the mock; otherwise the CUPS backend driving
     * @p runner. printers.conf is searched along @p printers_conf_paths.
     */
    static std::unique_ptr<PrintBackend> create(std::shared_ptr<CommandRunner> runner,
                                                const std::vector<std::string>& printers_conf_paths);
};

} // namespace printerpal
