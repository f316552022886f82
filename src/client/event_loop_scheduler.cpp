// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scheduler.h"

#include "hv/EventLoop.h"

namespace printerpal {

EventLoopScheduler::EventLoopScheduler(std::shared_ptr<hv::EventLoop> loop)
    : loop_(std::move(loop)) {}

void EventLoopScheduler::post(Task task) {
    loop_->runInLoop(std::move(task));
}

Scheduler::TimerId EventLoopScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    return loop_->setTimeout(static_cast<int>(delay.count()),
                             [task = std::move(task)](hv::TimerID) { task(); });
}

void EventLoopScheduler::cancel(TimerId id) {
    loop_->killTimer(id);
}

} // namespace printerpal
