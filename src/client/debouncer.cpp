// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "debouncer.h"

namespace printerpal {

Debouncer::Debouncer(Scheduler& scheduler, std::chrono::milliseconds delay)
    : scheduler_(scheduler), delay_(delay) {}

Debouncer::~Debouncer() {
    cancel();
}

void Debouncer::trigger(std::function<void()> action) {
    cancel();
    pending_ = true;
    timer_ = scheduler_.schedule(delay_, [this, action = std::move(action)]() {
        pending_ = false;
        timer_ = 0;
        action();
    });
}

void Debouncer::cancel() {
    if (pending_) {
        scheduler_.cancel(timer_);
        pending_ = false;
        timer_ = 0;
    }
}

} // namespace printerpal
