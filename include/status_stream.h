// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file status_stream.h
 * @brief Live `status` push channel (GET /events)
 *
 * @pattern subscribe() returns a cancellable subscription
 * @threading Handlers run on the subscriber's Scheduler
 */

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "hv/json.hpp"

namespace printerpal {

using json = nlohmann::json;

class Scheduler;

struct StatusStreamHandlers {
    std::function<void()> on_open;                   ///< (Re)connected
    std::function<void(const json&)> on_status;      ///< `status` event payload {ts, files, status}
    std::function<void(const std::string&)> on_error; ///< Dropped or failed; a retry follows
};

/**
 * @brief Handle for an active subscription
 *
 * Destroying the handle cancels the subscription. No handler runs after
 * cancel() returns.
 */
class StatusSubscription {
  public:
    virtual ~StatusSubscription() = default;
    virtual void cancel() = 0;
};

class StatusStream {
  public:
    virtual ~StatusStream() = default;

    /**
     * @brief Start receiving pushes
     *
     * @return Subscription handle, or nullptr if a live channel cannot be
     *         opened at all (reported as "No live updates")
     */
    virtual std::unique_ptr<StatusSubscription> subscribe(StatusStreamHandlers handlers) = 0;
};

/**
 * @brief Server-Sent Events client over libhv
 *
 * One worker thread per subscription holds the stream open and reconnects
 * with exponential backoff (200 ms doubling to 2 s) until cancelled.
 */
class SseStatusStream : public StatusStream {
  public:
    static constexpr std::chrono::milliseconds MIN_BACKOFF{200};
    static constexpr std::chrono::milliseconds MAX_BACKOFF{2000};

    /// @param url Full events URL, e.g. "http://printerpal.local/events"
    SseStatusStream(std::string url, Scheduler& scheduler);

    std::unique_ptr<StatusSubscription> subscribe(StatusStreamHandlers handlers) override;

    /// Next reconnect delay after @p current
    static std::chrono::milliseconds next_backoff(std::chrono::milliseconds current);

  private:
    std::string url_;
    Scheduler& scheduler_;
};

} // namespace printerpal
