// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "event_broadcaster.h"

#include <spdlog/spdlog.h>

#include "hv/EventLoopThread.h"

#include <algorithm>
#include <ctime>

namespace printerpal {

int64_t unix_now() {
    return static_cast<int64_t>(std::time(nullptr));
}

EventBroadcaster::EventBroadcaster(PayloadBuilder builder, std::chrono::milliseconds interval)
    : builder_(std::move(builder)), interval_(interval) {}

EventBroadcaster::~EventBroadcaster() {
    stop();
}

void EventBroadcaster::start() {
    if (loop_thread_) {
        return;
    }
    loop_thread_ = std::make_unique<hv::EventLoopThread>();
    loop_thread_->start();
    loop_thread_->loop()->setInterval(static_cast<int>(interval_.count()),
                                      [this](hv::TimerID) { tick(); });
    spdlog::info("[EventBroadcaster] Started ({}ms interval)", interval_.count());
}

void EventBroadcaster::stop() {
    if (!loop_thread_) {
        return;
    }
    // Stop the loop first so no tick fires on a half-destroyed broadcaster
    loop_thread_->stop();
    loop_thread_->join();
    loop_thread_.reset();

    std::lock_guard<std::mutex> lock(channels_mutex_);
    channels_.clear();
    spdlog::debug("[EventBroadcaster] Stopped");
}

std::pair<std::string, std::string> EventBroadcaster::build_event() {
    try {
        json payload = builder_();
        return {"status", payload.dump()};
    } catch (const std::exception& e) {
        spdlog::warn("[EventBroadcaster] Payload build failed: {}", e.what());
        json err = {{"ts", unix_now()}, {"error", e.what()}};
        return {"error", err.dump()};
    }
}

void EventBroadcaster::add_channel(std::shared_ptr<EventChannel> channel) {
    if (!channel) {
        return;
    }

    auto event = build_event();
    bool delivered = false;
    try {
        delivered = channel->is_open() && channel->send(event.first, event.second);
    } catch (const std::exception& e) {
        spdlog::debug("[EventBroadcaster] Initial send failed: {}", e.what());
    }
    if (!delivered) {
        spdlog::debug("[EventBroadcaster] Channel closed before first event, not registered");
        return;
    }

    std::lock_guard<std::mutex> lock(channels_mutex_);
    channels_.push_back(std::move(channel));
    spdlog::debug("[EventBroadcaster] Channel added ({} connected)", channels_.size());
}

size_t EventBroadcaster::tick() {
    std::vector<std::shared_ptr<EventChannel>> targets;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        targets = channels_;
    }
    if (targets.empty()) {
        return 0;
    }

    auto event = build_event();

    size_t delivered = 0;
    std::vector<std::shared_ptr<EventChannel>> dead;
    for (const auto& ch : targets) {
        bool ok = false;
        try {
            ok = ch->is_open() && ch->send(event.first, event.second);
        } catch (const std::exception& e) {
            spdlog::debug("[EventBroadcaster] Send failed: {}", e.what());
        }
        if (ok) {
            ++delivered;
        } else {
            dead.push_back(ch);
        }
    }

    if (!dead.empty()) {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
                                       [&](const std::shared_ptr<EventChannel>& ch) {
                                           return std::find(dead.begin(), dead.end(), ch) !=
                                                  dead.end();
                                       }),
                        channels_.end());
        spdlog::debug("[EventBroadcaster] Pruned {} channel(s), {} remaining", dead.size(),
                      channels_.size());
    }

    spdlog::trace("[EventBroadcaster] '{}' event delivered to {} channel(s)", event.first,
                  delivered);
    return delivered;
}

size_t EventBroadcaster::channel_count() const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    return channels_.size();
}

} // namespace printerpal
