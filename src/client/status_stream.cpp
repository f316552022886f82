// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "status_stream.h"

#include "scheduler.h"
#include "sse_parser.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

#include "hv/requests.h"

namespace printerpal {

namespace {

struct StreamState {
    std::atomic<bool> cancelled{false};
    std::mutex request_mutex;
    HttpRequestPtr request; ///< In-flight request, for Cancel()
};

class SseSubscription : public StatusSubscription {
  public:
    SseSubscription(std::string url, Scheduler& scheduler, StatusStreamHandlers handlers)
        : state_(std::make_shared<StreamState>()), url_(std::move(url)), scheduler_(scheduler),
          handlers_(std::move(handlers)) {
        worker_ = std::thread([this]() { run(); });
    }

    ~SseSubscription() override {
        cancel();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void cancel() override {
        if (state_->cancelled.exchange(true)) {
            return;
        }
        std::lock_guard<std::mutex> lock(state_->request_mutex);
        if (state_->request) {
            state_->request->Cancel();
        }
        spdlog::debug("[SseStatusStream] Subscription to {} cancelled", url_);
    }

  private:
    void post(std::function<void()> fn) {
        auto state = state_;
        scheduler_.post([state, fn = std::move(fn)]() {
            if (!state->cancelled.load()) {
                fn();
            }
        });
    }

    void run() {
        auto backoff = SseStatusStream::MIN_BACKOFF;

        while (!state_->cancelled.load()) {
            bool opened = false;
            SseParser parser([this](const std::string& event, const std::string& data) {
                if (event != "status") {
                    spdlog::debug("[SseStatusStream] '{}' event: {}", event, data);
                    return;
                }
                try {
                    json payload = json::parse(data);
                    auto on_status = handlers_.on_status;
                    if (on_status) {
                        post([on_status, payload]() { on_status(payload); });
                    }
                } catch (const json::parse_error& e) {
                    spdlog::warn("[SseStatusStream] Malformed status event: {}", e.what());
                }
            });

            auto req = std::make_shared<HttpRequest>();
            req->method = HTTP_GET;
            req->url = url_;
            req->headers["Accept"] = "text/event-stream";
            req->timeout = 0; // the stream stays open indefinitely
            req->http_cb = [this, &opened, &parser, &backoff](HttpMessage* msg,
                                                              http_parser_state state,
                                                              const char* data, size_t size) {
                if (state_->cancelled.load()) {
                    return;
                }
                if (state == HP_HEADERS_COMPLETE) {
                    auto* resp = static_cast<HttpResponse*>(msg);
                    if (resp->status_code == HTTP_STATUS_OK) {
                        opened = true;
                        backoff = SseStatusStream::MIN_BACKOFF;
                        spdlog::info("[SseStatusStream] Connected to {}", url_);
                        auto on_open = handlers_.on_open;
                        if (on_open) {
                            post(on_open);
                        }
                    }
                } else if (state == HP_BODY && opened && data != nullptr && size > 0) {
                    parser.feed(data, size);
                }
            };

            {
                std::lock_guard<std::mutex> lock(state_->request_mutex);
                if (state_->cancelled.load()) {
                    break;
                }
                state_->request = req;
            }

            auto resp = requests::request(req);

            {
                std::lock_guard<std::mutex> lock(state_->request_mutex);
                state_->request.reset();
            }
            if (state_->cancelled.load()) {
                break;
            }

            std::string reason;
            if (!resp) {
                reason = "connection failed";
            } else if (!opened) {
                reason = "HTTP " + std::to_string(static_cast<int>(resp->status_code));
            } else {
                reason = "stream closed";
            }
            spdlog::warn("[SseStatusStream] {} ({}), retrying in {}ms", url_, reason,
                         backoff.count());
            auto on_error = handlers_.on_error;
            if (on_error) {
                post([on_error, reason]() { on_error(reason); });
            }

            // Sleep in slices so cancel() is honoured promptly
            auto wake = std::chrono::steady_clock::now() + backoff;
            while (!state_->cancelled.load() && std::chrono::steady_clock::now() < wake) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            backoff = SseStatusStream::next_backoff(backoff);
        }
    }

    std::shared_ptr<StreamState> state_;
    std::string url_;
    Scheduler& scheduler_;
    StatusStreamHandlers handlers_;
    std::thread worker_;
};

} // namespace

SseStatusStream::SseStatusStream(std::string url, Scheduler& scheduler)
    : url_(std::move(url)), scheduler_(scheduler) {}

std::unique_ptr<StatusSubscription> SseStatusStream::subscribe(StatusStreamHandlers handlers) {
    if (url_.rfind("http://", 0) != 0 && url_.rfind("https://", 0) != 0) {
        spdlog::error("[SseStatusStream] Cannot open live channel, bad URL '{}'", url_);
        return nullptr;
    }
    return std::make_unique<SseSubscription>(url_, scheduler_, std::move(handlers));
}

std::chrono::milliseconds SseStatusStream::next_backoff(std::chrono::milliseconds current) {
    return std::min(current * 2, MAX_BACKOFF);
}

} // namespace printerpal
