// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printerpal_types.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace printerpal {

class CommandRunner;

/**
 * @brief Outcome of a privileged helper invocation ({ok, output} on the wire)
 */
struct HelperResult {
    bool ok = false;
    std::string output;

    [[nodiscard]] json to_json() const {
        return {{"ok", ok}, {"output", output}};
    }
};

/**
 * @brief Invokes the root helper through `sudo -n`
 *
 * The helper script itself (Avahi service files, reboot) is installed
 * separately; this class only knows its command-line contract:
 *   sudo -n <helper> ensure-airprint
 *   sudo -n <helper> restart-host
 *
 * Also owns the automatic AirPrint refresh: re-run when the set of printer
 * names changes or every AUTO_ENSURE_INTERVAL, on a background thread, never
 * more than one at a time.
 */
class AirPrintHelper {
  public:
    static constexpr std::chrono::milliseconds ENSURE_TIMEOUT{45000};
    static constexpr std::chrono::milliseconds RESTART_TIMEOUT{5000};
    static constexpr std::chrono::seconds AUTO_ENSURE_INTERVAL{600};

    AirPrintHelper(std::shared_ptr<CommandRunner> runner, std::string helper_path);
    virtual ~AirPrintHelper();

    AirPrintHelper(const AirPrintHelper&) = delete;
    AirPrintHelper& operator=(const AirPrintHelper&) = delete;

    /**
     * @brief Advertise CUPS printers over AirPrint (blocking)
     *
     * @throws PrinterPalException NOT_FOUND if the helper is not installed,
     *         or the command runner's error
     */
    virtual HelperResult ensure_airprint(std::chrono::milliseconds timeout = ENSURE_TIMEOUT);

    /**
     * @brief Ask the helper to reboot the host (blocking)
     */
    virtual HelperResult restart_host();

    /**
     * @brief Rate-limited, non-blocking ensure
     *
     * Starts a background ensure when the signature of @p printers differs
     * from the last successful run or the interval has elapsed. Returns
     * immediately; returns false when nothing was started (up to date, or a
     * run is already in flight). Failures are logged only.
     */
    bool maybe_auto_ensure(const std::vector<PrinterInfo>& printers);

    /// True while a background ensure is running
    bool auto_ensure_in_flight() const {
        return in_flight_.load();
    }

    /// Wait for a background ensure to finish (shutdown, tests)
    void wait_idle();

    /// Sorted, comma-joined printer names
    static std::string printer_signature(const std::vector<PrinterInfo>& printers);

    const std::string& helper_path() const {
        return helper_path_;
    }

  protected:
    std::shared_ptr<CommandRunner> runner_;

  private:
    std::string helper_path_;

    std::atomic<bool> in_flight_{false};
    std::mutex state_mutex_;
    std::string last_signature_;
    std::chrono::steady_clock::time_point last_ensure_{};
    bool attempted_ = false;
    std::thread worker_;
};

} // namespace printerpal
