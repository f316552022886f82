// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file printerpal_types.h
 * @brief Wire-level data model shared by the server and the session controller
 *
 * Field names match the HTTP/SSE JSON contract exactly (case-sensitive).
 * Everything here is a plain value: snapshots are replaced wholesale, never
 * patched in place.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace printerpal {

using json = nlohmann::json;

// ============================================================================
// Uploads
// ============================================================================

/**
 * @brief A document stored in the upload directory
 *
 * Identity is `name`. Immutable once listed.
 */
struct UploadedFile {
    std::string name;
    uint64_t size = 0;
    std::string size_h; ///< Human-readable size, e.g. "1.5 MB"
    int64_t mtime = 0;  ///< Unix timestamp (seconds)

    [[nodiscard]] json to_json() const;
    static UploadedFile from_json(const json& j);
};

// ============================================================================
// Printers and queue
// ============================================================================

/**
 * @brief One CUPS destination as reported by lpstat
 */
struct PrinterInfo {
    std::string name;
    std::string state; ///< "idle", "busy" or "disabled"
    bool is_default = false;
    std::optional<bool> accepting;           ///< Unknown until `lpstat -a` answers
    std::optional<std::string> display_name; ///< "Info" line from printers.conf

    [[nodiscard]] json to_json() const;
    static PrinterInfo from_json(const json& j);
};

/**
 * @brief Display-ready queue entry, in `lpstat -o` order
 */
struct QueueJob {
    int job_id = 0;       ///< Numeric CUPS job id (suffix of queue_id)
    std::string queue_id; ///< Full CUPS id, e.g. "HP_LaserJet-12"
    std::string user;
    std::string size;
    std::string raw; ///< Untouched lpstat line

    [[nodiscard]] json to_json() const;
    static QueueJob from_json(const json& j);
};

struct JobStats {
    int active_jobs = 0;
    int completed_jobs = 0;
    std::string last_completed_raw;

    [[nodiscard]] json to_json() const;
    static JobStats from_json(const json& j);
};

struct SchedulerStatus {
    bool running = false;
    std::string raw;
    std::string error;

    [[nodiscard]] json to_json() const;
};

/**
 * @brief Complete, self-consistent description of printer/queue/job state
 *
 * When CUPS is unavailable, printers/jobs are empty, default_printer is ""
 * and stats carry the last-known counters.
 */
struct StatusSnapshot {
    bool cups_available = false;
    std::string default_printer;
    std::string default_printer_display;
    std::string default_printer_label;
    std::vector<PrinterInfo> printers;
    std::vector<QueueJob> jobs;
    JobStats stats;
    SchedulerStatus scheduler;
    bool airprint_enabled = false;

    [[nodiscard]] json to_json() const;
    static StatusSnapshot from_json(const json& j);

    /// Name lookup used by print validation
    [[nodiscard]] bool has_printer(const std::string& printer_name) const;
};

// ============================================================================
// Print requests
// ============================================================================

/// Transformation modes accepted by preview and print
inline const std::vector<std::string>& print_modes() {
    static const std::vector<std::string> modes = {"raw", "grayscale", "bw", "dither", "outline"};
    return modes;
}

bool is_valid_print_mode(const std::string& mode);

/**
 * @brief Body of POST /api/print (page is client-side only)
 */
struct PrintRequest {
    std::string filename;
    std::string mode;
    std::string printer; ///< Empty means "system default"
    int copies = 1;
    int page = 1;

    [[nodiscard]] json to_json() const;
};

/// Combined SSE payload: {ts, files, status}
json make_status_event(int64_t ts, const std::vector<UploadedFile>& files,
                       const StatusSnapshot& status);

} // namespace printerpal
