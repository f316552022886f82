// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file printerpal_api.h
 * @brief Route logic of the REST surface, independent of the HTTP library
 *
 * Every handler returns an ApiResult (status + JSON body, or raw bytes for
 * previews and plain-text errors). The libhv binding in printerpal_server
 * only moves bytes between HttpRequest/HttpResponse and these methods.
 *
 * Error convention: non-2xx JSON bodies carry {ok:false, error}.
 */

#include "printerpal_types.h"

#include <memory>
#include <optional>
#include <string>

namespace printerpal {

class AirPrintHelper;
class Config;
class DocumentProcessor;
class PrintBackend;
class StatusAggregator;
class UploadStore;

struct ApiResult {
    int status = 200;
    json body;                ///< Used when content_type is empty
    std::string content_type; ///< Set for non-JSON payloads
    std::string raw;          ///< Non-JSON payload (PNG, text/plain)
    std::string location;     ///< Redirect target

    bool is_json() const {
        return content_type.empty();
    }

    static ApiResult ok(json body) {
        ApiResult r;
        r.body = std::move(body);
        return r;
    }

    static ApiResult error(int status, const std::string& message) {
        ApiResult r;
        r.status = status;
        r.body = {{"ok", false}, {"error", message}};
        return r;
    }

    static ApiResult text(int status, const std::string& message) {
        ApiResult r;
        r.status = status;
        r.content_type = "text/plain";
        r.raw = message;
        return r;
    }
};

/**
 * @brief Query parameters of GET /api/preview/{filename}, as received
 */
struct PreviewQuery {
    std::string mode;  ///< Empty = printing.default_mode
    std::string page;  ///< Empty = 1
    std::string width; ///< Empty = 720
};

class PrinterPalApi {
  public:
    PrinterPalApi(Config& config, std::shared_ptr<PrintBackend> backend,
                  std::shared_ptr<StatusAggregator> aggregator,
                  std::shared_ptr<UploadStore> uploads,
                  std::shared_ptr<DocumentProcessor> documents,
                  std::shared_ptr<AirPrintHelper> airprint);

    // ---- Read-only ----

    ApiResult index();
    ApiResult healthz();
    ApiResult files();
    ApiResult status();
    ApiResult get_config();
    ApiResult printer_detail(const std::string& name);
    ApiResult preview(const std::string& filename, const PreviewQuery& query);

    /// Absolute path for GET /uploads/{filename}, nullopt if unknown
    std::optional<std::string> download_path(const std::string& filename);

    // ---- Mutating (token-guarded) ----

    ApiResult set_config(const json& body);
    ApiResult print(const json& body);
    ApiResult upload(const std::string& client_filename, const std::string& content);
    ApiResult restart_host();
    ApiResult ensure_airprint();
    ApiResult cancel_job(const std::string& job_id);

    /**
     * @brief Token guard for mutating endpoints
     *
     * @param header_token X-PrinterPal-Token header value ("" if absent)
     * @param query_token `token` query parameter ("" if absent)
     * @return nullopt if the request may proceed, else the 401/503 response
     */
    std::optional<ApiResult> check_token(const std::string& header_token,
                                         const std::string& query_token);

    /// {ts, files (25 newest), status}, the SSE `status` event payload
    json event_payload();

    /// Upload limit in bytes from app.max_upload_mb
    uint64_t max_upload_bytes() const;

  private:
    Config& config_;
    std::shared_ptr<PrintBackend> backend_;
    std::shared_ptr<StatusAggregator> aggregator_;
    std::shared_ptr<UploadStore> uploads_;
    std::shared_ptr<DocumentProcessor> documents_;
    std::shared_ptr<AirPrintHelper> airprint_;
};

} // namespace printerpal
