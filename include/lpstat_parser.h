// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file lpstat_parser.h
 * @brief Parsers for CUPS command-line output and printers.conf
 *
 * Pure functions: no process spawning, no filesystem access (except
 * load_printer_info_map). The CUPS backend feeds them raw stdout.
 */

#include "printerpal_types.h"

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace printerpal::lpstat {

/// `lpstat -r`: "scheduler is running" / "scheduler is not running"
bool parse_scheduler_running(const std::string& out);

/// `lpstat -d`: "system default destination: HP_LaserJet" -> "HP_LaserJet"; "" if none
std::string parse_default_destination(const std::string& out);

/**
 * @brief Parse `lpstat -p` into printers (name, state)
 *
 * Accepts both "printer X is idle.  enabled since ..." and the terse
 * "printer X idle ..." form. "now printing" maps to "busy". Continuation
 * lines (indented detail) are skipped. is_default is set against
 * @p default_printer; display names come from @p info_map.
 */
std::vector<PrinterInfo> parse_printers(const std::string& out, const std::string& default_printer,
                                        const std::map<std::string, std::string>& info_map);

/**
 * @brief Fill PrinterInfo::accepting from `lpstat -a`
 *
 * "X accepting requests since ..." -> true, "X not accepting requests ..." -> false.
 * Printers not mentioned keep accepting = nullopt.
 */
void apply_accepting(const std::string& out, std::vector<PrinterInfo>& printers);

/**
 * @brief Parse `lpstat -o` lines into queue jobs, preserving order
 *
 * Lines with fewer than three whitespace-separated fields are skipped.
 */
std::vector<QueueJob> parse_queue(const std::string& out);

/// Numeric suffix of a CUPS job id ("HP_LaserJet-12" -> 12); 0 if none
int numeric_job_id(const std::string& queue_id);

/// Non-blank lines of @p out, trimmed
std::vector<std::string> non_empty_lines(const std::string& out);

/**
 * @brief Extract `<Printer NAME>` ... `Info TEXT` pairs from printers.conf
 *
 * Handles `<DefaultPrinter NAME>` blocks too. Quotes around TEXT are stripped;
 * empty Info values are ignored.
 */
std::map<std::string, std::string> parse_printers_conf(std::istream& in);

/// Try each path in order; return the first non-empty map (unreadable files skipped)
std::map<std::string, std::string> load_printer_info_map(const std::vector<std::string>& paths);

/// Job ids passed to `cancel` must match [A-Za-z0-9_.-]+
bool is_valid_job_id(const std::string& job_id);

} // namespace printerpal::lpstat
