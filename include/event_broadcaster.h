// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file event_broadcaster.h
 * @brief Periodic push of {ts, files, status} to every connected SSE client
 *
 * @pattern Heartbeat timer on a dedicated hv::EventLoopThread
 * @threading add_channel() is called from HTTP worker threads; tick() runs on
 *            the broadcaster's loop thread. The channel set is mutex-guarded
 *            and never held while building the payload or writing.
 */

#include "hv/json.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hv {
class EventLoopThread;
}

namespace printerpal {

using json = nlohmann::json;

/**
 * @brief One live SSE connection
 *
 * Implementations must not block: a slow peer buffers or fails, it never
 * stalls the tick for other channels.
 */
class EventChannel {
  public:
    virtual ~EventChannel() = default;

    virtual bool is_open() const = 0;

    /**
     * @brief Write one named event
     *
     * @param event SSE event name ("status", "error")
     * @param data Serialized JSON payload (single line)
     * @return false if the write failed; the channel is then dropped
     */
    virtual bool send(const std::string& event, const std::string& data) = 0;
};

class EventBroadcaster {
  public:
    /// Builds the status payload {ts, files, status}; may throw
    using PayloadBuilder = std::function<json()>;

    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{2000};

    explicit EventBroadcaster(PayloadBuilder builder,
                              std::chrono::milliseconds interval = DEFAULT_INTERVAL);
    ~EventBroadcaster();

    EventBroadcaster(const EventBroadcaster&) = delete;
    EventBroadcaster& operator=(const EventBroadcaster&) = delete;

    /**
     * @brief Start the heartbeat thread
     */
    void start();

    /**
     * @brief Stop the heartbeat and wait for the loop thread to exit
     */
    void stop();

    /**
     * @brief Register a new channel and send it the current payload at once
     */
    void add_channel(std::shared_ptr<EventChannel> channel);

    /**
     * @brief Build the payload once and deliver it to every open channel
     *
     * Closed or failing channels are pruned. If the builder throws, an
     * "error" event {ts, error} is delivered instead.
     *
     * @return Number of channels that received the event
     */
    size_t tick();

    size_t channel_count() const;

    std::chrono::milliseconds interval() const {
        return interval_;
    }

  private:
    /// Returns (event name, serialized data)
    std::pair<std::string, std::string> build_event();

    PayloadBuilder builder_;
    std::chrono::milliseconds interval_;

    mutable std::mutex channels_mutex_;
    std::vector<std::shared_ptr<EventChannel>> channels_;

    std::unique_ptr<hv::EventLoopThread> loop_thread_;
};

/// Seconds since epoch, the `ts` field of every pushed event
int64_t unix_now();

} // namespace printerpal
