// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "event_broadcaster.h"

#include <memory>
#include <string>

#include "hv/HttpServer.h"

namespace printerpal {

class PrinterPalApi;
struct ApiResult;

/**
 * @brief SSE channel backed by a libhv response writer
 */
class HvSseChannel : public EventChannel {
  public:
    explicit HvSseChannel(hv::HttpResponseWriterPtr writer);

    bool is_open() const override;
    bool send(const std::string& event, const std::string& data) override;

  private:
    hv::HttpResponseWriterPtr writer_;
};

/**
 * @brief libhv HTTP server exposing PrinterPalApi and the /events stream
 *
 * Routes:
 *   GET  /                         bootstrap info
 *   GET  /healthz                  {ok, cups}
 *   GET  /api/files                {files}
 *   GET  /api/status               StatusSnapshot
 *   GET  /api/config               {config}
 *   POST /api/config               {ok, config}            (token)
 *   GET  /api/printer/{name}       {name, detail}
 *   GET  /api/preview/{filename}   image/png
 *   POST /api/print                {ok, lp_stdout}         (token)
 *   POST /api/jobs/{job_id}/cancel {ok}                    (token)
 *   POST /api/restart-host         {ok, output}            (token)
 *   POST /api/airprint/ensure      {ok, output}            (token)
 *   POST /upload                   multipart "file", 302 / (token)
 *   GET  /uploads/{filename}       attachment
 *   GET  /events                   SSE `status` events
 */
class PrinterPalServer {
  public:
    PrinterPalServer(std::shared_ptr<PrinterPalApi> api,
                     std::shared_ptr<EventBroadcaster> broadcaster);
    ~PrinterPalServer();

    PrinterPalServer(const PrinterPalServer&) = delete;
    PrinterPalServer& operator=(const PrinterPalServer&) = delete;

    /**
     * @brief Start listening (non-blocking)
     *
     * @return 0 on success, libhv error code otherwise
     */
    int start(const std::string& host, int port, int worker_threads = 4);

    void stop();

  private:
    void register_routes();

    std::shared_ptr<PrinterPalApi> api_;
    std::shared_ptr<EventBroadcaster> broadcaster_;
    hv::HttpService router_;
    std::unique_ptr<hv::HttpServer> server_;
};

/**
 * @brief Copy an ApiResult into a libhv response
 *
 * @return HTTP status code (libhv handler return convention)
 */
int write_api_result(HttpResponse* resp, const ApiResult& result);

} // namespace printerpal
