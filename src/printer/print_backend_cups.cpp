// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "print_backend_cups.h"

#include "lpstat_parser.h"
#include "printerpal_error.h"

#include <spdlog/spdlog.h>

#include <sys/stat.h>

namespace printerpal {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

PrintBackendCups::PrintBackendCups(std::shared_ptr<CommandRunner> runner,
                                   std::vector<std::string> printers_conf_paths)
    : runner_(std::move(runner)), printers_conf_paths_(std::move(printers_conf_paths)) {}

std::string PrintBackendCups::lpstat(const std::vector<std::string>& args) {
    std::vector<std::string> argv{"lpstat"};
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_->run(argv, DEFAULT_COMMAND_TIMEOUT, false).out;
}

bool PrintBackendCups::is_available() {
    try {
        return lpstat::parse_scheduler_running(lpstat({"-r"}));
    } catch (const PrinterPalException& e) {
        spdlog::debug("[PrintBackendCups] Scheduler probe failed: {}", e.what());
        return false;
    }
}

SchedulerStatus PrintBackendCups::scheduler_status() {
    SchedulerStatus status;
    try {
        std::string out = lpstat({"-r"});
        status.running = lpstat::parse_scheduler_running(out);
        status.raw = trim(out);
    } catch (const PrinterPalException& e) {
        status.running = false;
        status.error = e.what();
    }
    return status;
}

std::string PrintBackendCups::default_printer() {
    return lpstat::parse_default_destination(lpstat({"-d"}));
}

std::string PrintBackendCups::display_name(const std::string& printer_name) {
    if (printer_name.empty()) {
        return "";
    }
    auto info_map = lpstat::load_printer_info_map(printers_conf_paths_);
    auto it = info_map.find(printer_name);
    return it != info_map.end() ? it->second : printer_name;
}

std::vector<PrinterInfo> PrintBackendCups::list_printers() {
    std::string default_name = default_printer();
    auto info_map = lpstat::load_printer_info_map(printers_conf_paths_);

    auto printers = lpstat::parse_printers(lpstat({"-p"}), default_name, info_map);
    lpstat::apply_accepting(lpstat({"-a"}), printers);

    spdlog::trace("[PrintBackendCups] {} printer(s), default '{}'", printers.size(), default_name);
    return printers;
}

std::vector<QueueJob> PrintBackendCups::queue_jobs() {
    return lpstat::parse_queue(lpstat({"-o"}));
}

JobStats PrintBackendCups::job_stats() {
    auto completed = lpstat::non_empty_lines(lpstat({"-W", "completed", "-o"}));

    JobStats stats;
    stats.completed_jobs = static_cast<int>(completed.size());
    stats.last_completed_raw = completed.empty() ? "" : completed.back();
    stats.active_jobs = static_cast<int>(queue_jobs().size());
    return stats;
}

json PrintBackendCups::printer_detail(const std::string& printer_name) {
    if (printer_name.empty()) {
        return json::object();
    }
    return {{"name", printer_name}, {"detail", trim(lpstat({"-l", "-p", printer_name}))}};
}

std::vector<std::string> PrintBackendCups::build_lp_argv(const std::string& file_path,
                                                         const PrintJobOptions& options) {
    std::vector<std::string> argv{"lp", "-n", std::to_string(options.copies), "-t", options.title};
    if (!options.printer.empty()) {
        argv.push_back("-d");
        argv.push_back(options.printer);
    }

    // Monochrome hint; drivers without colour controls ignore it
    argv.insert(argv.end(), {"-o", "print-color-mode=monochrome", "-o", "ColorModel=Gray"});

    for (const auto& opt : options.options) {
        if (opt.empty()) {
            continue;
        }
        argv.push_back("-o");
        argv.push_back(opt);
    }

    argv.push_back(file_path);
    return argv;
}

std::string PrintBackendCups::submit(const std::string& file_path,
                                     const PrintJobOptions& options) {
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0) {
        throw PrinterPalException(PrinterPalError::not_found("File does not exist: " + file_path));
    }
    if (options.copies < 1 || options.copies > 99) {
        throw PrinterPalException(
            PrinterPalError::validation("copies must be between 1 and 99"));
    }

    auto argv = build_lp_argv(file_path, options);
    spdlog::info("[PrintBackendCups] Submitting '{}' to {} ({} copies)", options.title,
                 options.printer.empty() ? "default printer" : options.printer, options.copies);

    try {
        auto result = runner_->run(argv, SUBMIT_TIMEOUT, true);
        std::string out = trim(result.out);
        spdlog::info("[PrintBackendCups] lp: {}", out);
        return out;
    } catch (const PrinterPalException& e) {
        if (e.error().type != PrinterPalErrorType::COMMAND_FAILED) {
            throw;
        }
        std::string reason = trim(e.error().details);
        if (reason.empty()) {
            reason = "unknown error";
        }
        spdlog::error("[PrintBackendCups] lp failed ({}): {}", e.error().code, reason);
        throw PrinterPalException(PrinterPalError::command_failed(
            "Printing failed: " + reason, e.error().code, e.error().details));
    }
}

void PrintBackendCups::cancel_job(const std::string& queue_id) {
    if (!lpstat::is_valid_job_id(queue_id)) {
        throw PrinterPalException(PrinterPalError::validation("Invalid job id"));
    }
    spdlog::info("[PrintBackendCups] Cancelling job {}", queue_id);
    runner_->run({"cancel", queue_id}, DEFAULT_COMMAND_TIMEOUT, true);
}

} // namespace printerpal
