// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file api_transport.h
 * @brief REST calls from the session controller to printerpal-server
 *
 * @threading Callbacks are delivered on the controller's Scheduler, never on
 *            the HTTP worker thread.
 */

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "hv/json.hpp"

namespace printerpal {

using json = nlohmann::json;

class Scheduler;

/**
 * @brief Outcome of one REST call
 *
 * Transport failures have status_code 0. For HTTP errors, error holds the
 * server's `error` (or `message`) field, else the raw body.
 */
struct RestResponse {
    bool success = false; ///< true if HTTP 2xx response
    int status_code = 0;  ///< HTTP status code, 0 = no response
    json data;            ///< Parsed JSON body (null if not JSON)
    std::string body;     ///< Raw response body
    std::string error;    ///< Error message (empty on success)
};

using RestCallback = std::function<void(const RestResponse&)>;

class ApiTransport {
  public:
    virtual ~ApiTransport() = default;

    virtual void get(const std::string& endpoint, RestCallback on_complete) = 0;
    virtual void post(const std::string& endpoint, const json& body, RestCallback on_complete) = 0;

    /// Absolute URL for an endpoint (preview images are fetched by the view)
    virtual std::string url_for(const std::string& endpoint) const = 0;
};

/**
 * @brief Build a RestResponse from a raw HTTP status and body
 *
 * Shared by the HTTP transport and tests so error-text extraction is
 * identical everywhere.
 */
RestResponse make_rest_response(int status_code, const std::string& body);

/**
 * @brief ApiTransport over libhv's synchronous requests API
 *
 * Each call runs on its own tracked thread; the result is posted back to the
 * Scheduler. Finished threads are joined on the next launch, the destructor
 * joins the rest.
 */
class HttpApiTransport : public ApiTransport {
  public:
    static constexpr int REQUEST_TIMEOUT_SEC = 30;

    /**
     * @param base_url e.g. "http://printerpal.local"
     * @param token Sent as X-PrinterPal-Token when non-empty
     */
    HttpApiTransport(std::string base_url, Scheduler& scheduler, std::string token = "");
    ~HttpApiTransport() override;

    HttpApiTransport(const HttpApiTransport&) = delete;
    HttpApiTransport& operator=(const HttpApiTransport&) = delete;

    void get(const std::string& endpoint, RestCallback on_complete) override;
    void post(const std::string& endpoint, const json& body, RestCallback on_complete) override;
    std::string url_for(const std::string& endpoint) const override;

    /// Joins finished request threads and returns how many are still running
    size_t active_requests();

  private:
    struct HttpThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void launch_http_thread(std::function<void()> func);
    /// Caller holds http_threads_mutex_
    void reap_finished_threads();
    void deliver(RestCallback on_complete, RestResponse response);

    std::string base_url_;
    Scheduler& scheduler_;
    std::string token_;

    std::atomic<bool> shutting_down_{false};
    std::mutex http_threads_mutex_;
    std::list<HttpThread> http_threads_;
};

} // namespace printerpal
