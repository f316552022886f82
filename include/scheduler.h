// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file scheduler.h
 * @brief The session controller's event loop, as seen by client code
 *
 * Network completions arrive on worker threads; everything that touches
 * session state is posted here first so the controller stays single-threaded.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace hv {
class EventLoop;
}

namespace printerpal {

class Scheduler {
  public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    virtual ~Scheduler() = default;

    /// Run @p task on the loop thread (thread-safe)
    virtual void post(Task task) = 0;

    /// Run @p task once after @p delay; returns an id for cancel()
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;

    /// Cancel a pending timer; unknown or fired ids are ignored
    virtual void cancel(TimerId id) = 0;
};

/**
 * @brief Scheduler backed by a libhv EventLoop
 *
 * post() uses runInLoop(), timers use setTimeout()/killTimer(). Timer
 * operations must be issued from the loop thread.
 */
class EventLoopScheduler : public Scheduler {
  public:
    explicit EventLoopScheduler(std::shared_ptr<hv::EventLoop> loop);

    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;

  private:
    std::shared_ptr<hv::EventLoop> loop_;
};

} // namespace printerpal
