// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "airprint_helper.h"

#include "command_runner.h"
#include "printerpal_error.h"

#include <spdlog/spdlog.h>

#include <algorithm>
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

AirPrintHelper::AirPrintHelper(std::shared_ptr<CommandRunner> runner, std::string helper_path)
    : runner_(std::move(runner)), helper_path_(std::move(helper_path)) {}

AirPrintHelper::~AirPrintHelper() {
    wait_idle();
}

void AirPrintHelper::wait_idle() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        finished = std::move(worker_);
    }
    if (finished.joinable()) {
        finished.join();
    }
}

HelperResult AirPrintHelper::ensure_airprint(std::chrono::milliseconds timeout) {
    struct stat st;
    if (stat(helper_path_.c_str(), &st) != 0) {
        throw PrinterPalException(
            PrinterPalError::not_found("Root helper not found at " + helper_path_));
    }

    spdlog::info("[AirPrint] Ensuring AirPrint advertising via {}", helper_path_);
    auto result = runner_->run({"sudo", "-n", helper_path_, "ensure-airprint"}, timeout, true);

    HelperResult r;
    r.ok = true;
    r.output = trim(result.out);
    spdlog::debug("[AirPrint] ensure-airprint: {}", r.output);
    return r;
}

HelperResult AirPrintHelper::restart_host() {
    spdlog::warn("[AirPrint] Host restart requested");
    auto result = runner_->run({"sudo", "-n", helper_path_, "restart-host"}, RESTART_TIMEOUT, true);

    HelperResult r;
    r.ok = true;
    r.output = trim(result.out);
    return r;
}

std::string AirPrintHelper::printer_signature(const std::vector<PrinterInfo>& printers) {
    std::vector<std::string> names;
    for (const auto& p : printers) {
        if (!p.name.empty()) {
            names.push_back(p.name);
        }
    }
    std::sort(names.begin(), names.end());

    std::string sig;
    for (const auto& n : names) {
        if (!sig.empty()) {
            sig.push_back(',');
        }
        sig += n;
    }
    return sig;
}

bool AirPrintHelper::maybe_auto_ensure(const std::vector<PrinterInfo>& printers) {
    std::string sig = printer_signature(printers);
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(state_mutex_);
    bool due = !attempted_ || sig != last_signature_ || now - last_ensure_ > AUTO_ENSURE_INTERVAL;
    if (!due) {
        return false;
    }

    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        spdlog::trace("[AirPrint] Auto-ensure already in flight");
        return false;
    }

    // in_flight_ was false, so any previous worker has finished
    if (worker_.joinable()) {
        worker_.join();
    }

    spdlog::debug("[AirPrint] Auto-ensure triggered (signature '{}')", sig);
    worker_ = std::thread([this, sig, now]() {
        try {
            ensure_airprint(ENSURE_TIMEOUT);
        } catch (const std::exception& e) {
            spdlog::warn("[AirPrint] Auto-ensure failed: {}", e.what());
        }
        {
            // Failures are also rate-limited: retried on change or after the interval
            std::lock_guard<std::mutex> state_lock(state_mutex_);
            last_signature_ = sig;
            last_ensure_ = now;
            attempted_ = true;
        }
        in_flight_.store(false);
    });
    return true;
}

} // namespace printerpal
