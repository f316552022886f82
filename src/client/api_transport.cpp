// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "api_transport.h"

#include "json_utils.h"
#include "scheduler.h"

#include <spdlog/spdlog.h>

#include "hv/requests.h"

namespace printerpal {

RestResponse make_rest_response(int status_code, const std::string& body) {
    RestResponse result;
    result.status_code = status_code;
    result.body = body;
    result.success = status_code >= 200 && status_code < 300;

    if (!body.empty()) {
        try {
            result.data = json::parse(body);
        } catch (const json::parse_error& e) {
            spdlog::trace("[HttpApiTransport] Response is not JSON: {}", e.what());
        }
    }

    if (!result.success) {
        result.error = json_util::error_text(result.data, body);
        if (result.error.empty()) {
            result.error = "HTTP " + std::to_string(status_code);
        }
    }
    return result;
}

HttpApiTransport::HttpApiTransport(std::string base_url, Scheduler& scheduler, std::string token)
    : base_url_(std::move(base_url)), scheduler_(scheduler), token_(std::move(token)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpApiTransport::~HttpApiTransport() {
    shutting_down_ = true;
    std::list<HttpThread> threads;
    {
        std::lock_guard<std::mutex> lock(http_threads_mutex_);
        threads.swap(http_threads_);
    }
    for (auto& t : threads) {
        if (t.thread.joinable()) {
            t.thread.join();
        }
    }
}

std::string HttpApiTransport::url_for(const std::string& endpoint) const {
    if (!endpoint.empty() && endpoint[0] != '/') {
        return base_url_ + "/" + endpoint;
    }
    return base_url_ + endpoint;
}

void HttpApiTransport::launch_http_thread(std::function<void()> func) {
    if (shutting_down_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(http_threads_mutex_);
    reap_finished_threads();

    auto done = std::make_shared<std::atomic<bool>>(false);
    HttpThread entry;
    entry.done = done;
    entry.thread = std::thread([func = std::move(func), done]() {
        func();
        done->store(true);
    });
    http_threads_.push_back(std::move(entry));
}

void HttpApiTransport::reap_finished_threads() {
    for (auto it = http_threads_.begin(); it != http_threads_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = http_threads_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t HttpApiTransport::active_requests() {
    std::lock_guard<std::mutex> lock(http_threads_mutex_);
    reap_finished_threads();
    return http_threads_.size();
}

void HttpApiTransport::deliver(RestCallback on_complete, RestResponse response) {
    if (!on_complete || shutting_down_.load()) {
        return;
    }
    scheduler_.post([on_complete = std::move(on_complete), response = std::move(response)]() {
        on_complete(response);
    });
}

void HttpApiTransport::get(const std::string& endpoint, RestCallback on_complete) {
    std::string url = url_for(endpoint);
    spdlog::debug("[HttpApiTransport] GET {}", url);

    launch_http_thread([this, url, on_complete]() {
        auto req = std::make_shared<HttpRequest>();
        req->method = HTTP_GET;
        req->url = url;
        req->timeout = REQUEST_TIMEOUT_SEC;
        if (!token_.empty()) {
            req->headers["X-PrinterPal-Token"] = token_;
        }

        auto resp = requests::request(req);
        if (!resp) {
            spdlog::warn("[HttpApiTransport] GET {} failed (no response)", url);
            RestResponse result;
            result.error = "Request failed: no response from server";
            deliver(on_complete, std::move(result));
            return;
        }
        deliver(on_complete, make_rest_response(static_cast<int>(resp->status_code), resp->body));
    });
}

void HttpApiTransport::post(const std::string& endpoint, const json& body,
                            RestCallback on_complete) {
    std::string url = url_for(endpoint);
    std::string payload = body.dump();
    spdlog::debug("[HttpApiTransport] POST {}", url);

    launch_http_thread([this, url, payload, on_complete]() {
        auto req = std::make_shared<HttpRequest>();
        req->method = HTTP_POST;
        req->url = url;
        req->timeout = REQUEST_TIMEOUT_SEC;
        req->headers["Content-Type"] = "application/json";
        if (!token_.empty()) {
            req->headers["X-PrinterPal-Token"] = token_;
        }
        req->body = payload;

        auto resp = requests::request(req);
        if (!resp) {
            spdlog::warn("[HttpApiTransport] POST {} failed (no response)", url);
            RestResponse result;
            result.error = "Request failed: no response from server";
            deliver(on_complete, std::move(result));
            return;
        }

        RestResponse result = make_rest_response(static_cast<int>(resp->status_code), resp->body);
        if (!result.success) {
            spdlog::warn("[HttpApiTransport] POST {} failed: {}", url, result.error);
        }
        deliver(on_complete, std::move(result));
    });
}

} // namespace printerpal
