// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file manual_scheduler.h
 * @brief Scheduler driven by the test instead of an event loop
 *
 * post() queues tasks until run_posted(); timers fire only from advance().
 * Single-threaded: the test thread plays the role of the loop thread.
 */

#include "scheduler.h"

#include <algorithm>
#include <deque>
#include <map>

class ManualScheduler : public printerpal::Scheduler {
  public:
    void post(Task task) override {
        posted_.push_back(std::move(task));
    }

    TimerId schedule(std::chrono::milliseconds delay, Task task) override {
        TimerId id = ++next_id_;
        timers_[id] = Timer{now_ + delay, std::move(task)};
        return id;
    }

    void cancel(TimerId id) override {
        timers_.erase(id);
    }

    /// Run queued posts (including ones queued while running)
    size_t run_posted() {
        size_t count = 0;
        while (!posted_.empty()) {
            Task task = std::move(posted_.front());
            posted_.pop_front();
            task();
            ++count;
        }
        return count;
    }

    /// Move the clock forward, firing due timers in deadline order
    size_t advance(std::chrono::milliseconds delta) {
        auto target = now_ + delta;
        size_t fired = 0;
        while (true) {
            auto next = std::min_element(timers_.begin(), timers_.end(),
                                         [](const auto& a, const auto& b) {
                                             return a.second.due < b.second.due;
                                         });
            if (next == timers_.end() || next->second.due > target) {
                break;
            }
            now_ = next->second.due;
            Task task = std::move(next->second.task);
            timers_.erase(next);
            task();
            ++fired;
        }
        now_ = target;
        return fired;
    }

    size_t pending_timers() const {
        return timers_.size();
    }

  private:
    struct Timer {
        std::chrono::milliseconds due;
        Task task;
    };

    std::chrono::milliseconds now_{0};
    TimerId next_id_ = 0;
    std::map<TimerId, Timer> timers_;
    std::deque<Task> posted_;
};
