// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "scheduler.h"

#include <chrono>
#include <functional>

namespace printerpal {

/**
 * @brief Trailing-edge debounce on a Scheduler
 *
 * Each trigger() restarts the delay; only the last action runs, once the
 * triggers have been quiet for the full delay. Loop thread only.
 */
class Debouncer {
  public:
    static constexpr std::chrono::milliseconds DEFAULT_DELAY{120};

    explicit Debouncer(Scheduler& scheduler, std::chrono::milliseconds delay = DEFAULT_DELAY);
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    void trigger(std::function<void()> action);

    /// Drop the pending action, if any
    void cancel();

    bool pending() const {
        return pending_;
    }

  private:
    Scheduler& scheduler_;
    std::chrono::milliseconds delay_;
    Scheduler::TimerId timer_ = 0;
    bool pending_ = false;
};

} // namespace printerpal
