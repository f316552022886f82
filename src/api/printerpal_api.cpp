// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printerpal_api.h"

#include "airprint_helper.h"
#include "config.h"
#include "document_processor.h"
#include "event_broadcaster.h"
#include "json_utils.h"
#include "print_backend.h"
#include "printerpal_error.h"
#include "status_aggregator.h"
#include "upload_store.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdlib>

#ifndef PRINTERPAL_VERSION
#define PRINTERPAL_VERSION "0.0.0"
#endif

namespace printerpal {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Strict decimal parse for query parameters
bool parse_query_int(const std::string& s, int& out) {
    if (s.empty()) {
        return false;
    }
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (*end != '\0' || v < INT_MIN || v > INT_MAX) {
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

/// JSON "falsy" values fall back to the default, as a missing key does
bool is_unset(const json& body, const char* key) {
    if (!body.contains(key)) {
        return true;
    }
    const auto& v = body[key];
    return v.is_null() || (v.is_string() && v.get<std::string>().empty()) ||
           (v.is_number() && v.get<double>() == 0.0) || (v.is_boolean() && !v.get<bool>());
}

} // namespace

PrinterPalApi::PrinterPalApi(Config& config, std::shared_ptr<PrintBackend> backend,
                             std::shared_ptr<StatusAggregator> aggregator,
                             std::shared_ptr<UploadStore> uploads,
                             std::shared_ptr<DocumentProcessor> documents,
                             std::shared_ptr<AirPrintHelper> airprint)
    : config_(config), backend_(std::move(backend)), aggregator_(std::move(aggregator)),
      uploads_(std::move(uploads)), documents_(std::move(documents)),
      airprint_(std::move(airprint)) {}

uint64_t PrinterPalApi::max_upload_bytes() const {
    return static_cast<uint64_t>(config_.get<int>("/app/max_upload_mb", 25)) * 1024 * 1024;
}

// ============================================================================
// Read-only endpoints
// ============================================================================

ApiResult PrinterPalApi::index() {
    json cfg = config_.snapshot();
    return ApiResult::ok({{"name", "PrinterPal"},
                          {"version", PRINTERPAL_VERSION},
                          {"ui_defaults", cfg.value("ui", json::object())},
                          {"default_mode", json_util::safe_string(cfg["printing"], "default_mode",
                                                                  "grayscale")}});
}

ApiResult PrinterPalApi::healthz() {
    return ApiResult::ok({{"ok", true}, {"cups", aggregator_->cups_available()}});
}

ApiResult PrinterPalApi::files() {
    json list = json::array();
    for (const auto& f : uploads_->list(UploadStore::LIST_LIMIT)) {
        list.push_back(f.to_json());
    }
    return ApiResult::ok({{"files", list}});
}

ApiResult PrinterPalApi::status() {
    return ApiResult::ok(aggregator_->snapshot().to_json());
}

ApiResult PrinterPalApi::get_config() {
    return ApiResult::ok({{"config", config_.snapshot()}});
}

ApiResult PrinterPalApi::printer_detail(const std::string& name) {
    try {
        return ApiResult::ok(backend_->printer_detail(name));
    } catch (const PrinterPalException& e) {
        spdlog::warn("[PrinterPalApi] printer detail for '{}' failed: {}", name, e.what());
        return ApiResult::error(e.error().http_status(), e.what());
    }
}

std::optional<std::string> PrinterPalApi::download_path(const std::string& filename) {
    return uploads_->resolve(filename);
}

ApiResult PrinterPalApi::preview(const std::string& filename, const PreviewQuery& query) {
    json cfg = config_.snapshot();

    PreviewOptions opts;
    opts.mode = query.mode.empty() ? cfg["printing"].value("default_mode", "grayscale")
                                   : to_lower(query.mode);
    opts.preview_dpi = cfg["printing"].value("preview_dpi", 150);
    opts.threshold = cfg["printing"].value("bw_threshold", 180);
    if (!query.page.empty() && !parse_query_int(query.page, opts.page)) {
        return ApiResult::text(400, "page must be an integer");
    }
    if (!query.width.empty() && !parse_query_int(query.width, opts.width)) {
        return ApiResult::text(400, "w must be an integer");
    }

    auto path = uploads_->resolve(filename);
    if (!path) {
        return ApiResult::text(404, "File not found");
    }

    try {
        ApiResult r;
        r.content_type = "image/png";
        r.raw = documents_->render_preview_png(*path, opts);
        return r;
    } catch (const PrinterPalException& e) {
        spdlog::debug("[PrinterPalApi] Preview of {} failed: {}", filename, e.what());
        return ApiResult::text(400, e.what());
    }
}

// ============================================================================
// Mutating endpoints
// ============================================================================

std::optional<ApiResult> PrinterPalApi::check_token(const std::string& header_token,
                                                    const std::string& query_token) {
    if (!config_.get<bool>("/security/require_token", false)) {
        return std::nullopt;
    }
    std::string expected = trim(config_.get<std::string>("/security/token", ""));
    if (expected.empty()) {
        return ApiResult::error(503, "Auth token required but not configured");
    }
    const std::string& provided = header_token.empty() ? query_token : header_token;
    if (provided != expected) {
        spdlog::info("[PrinterPalApi] Rejected request with missing or wrong token");
        return ApiResult::error(401, "Unauthorized");
    }
    return std::nullopt;
}

ApiResult PrinterPalApi::set_config(const json& body) {
    if (!body.is_object() || !body.contains("config")) {
        return ApiResult::error(400, "Expected JSON body: {config: {...}}");
    }
    if (!body["config"].is_object()) {
        return ApiResult::error(400, "config must be an object");
    }

    json saved;
    try {
        saved = config_.replace(body["config"]);
    } catch (const PrinterPalException& e) {
        spdlog::info("[PrinterPalApi] Config rejected: {}", e.what());
        return ApiResult::error(e.error().http_status(), e.what());
    }

    if (saved["airprint"].value("auto_enable", false) && airprint_) {
        try {
            airprint_->ensure_airprint();
        } catch (const PrinterPalException& e) {
            spdlog::warn("[PrinterPalApi] Config saved but AirPrint ensure failed: {}", e.what());
            ApiResult r = ApiResult::error(500, e.what());
            r.body["config"] = saved;
            return r;
        }
    }

    return ApiResult::ok({{"ok", true}, {"config", saved}});
}

ApiResult PrinterPalApi::print(const json& body) {
    if (!body.is_object()) {
        return ApiResult::error(400, "Invalid JSON");
    }
    json cfg = config_.snapshot();
    const json& printing = cfg["printing"];

    std::string filename;
    if (body.contains("filename") && body["filename"].is_string()) {
        filename = trim(body["filename"].get<std::string>());
    }
    if (filename.empty()) {
        return ApiResult::error(400, "filename required");
    }

    std::string mode = printing.value("default_mode", "grayscale");
    if (!is_unset(body, "mode")) {
        if (!body["mode"].is_string()) {
            return ApiResult::error(400, "mode must be a string");
        }
        mode = to_lower(trim(body["mode"].get<std::string>()));
    }
    if (!is_valid_print_mode(mode)) {
        return ApiResult::error(400, "mode must be one of raw|grayscale|bw|dither|outline");
    }

    std::string printer;
    if (body.contains("printer") && body["printer"].is_string()) {
        printer = trim(body["printer"].get<std::string>());
    }

    int copies = printing.value("default_copies", 1);
    if (!is_unset(body, "copies")) {
        const auto& c = body["copies"];
        if (c.is_boolean() || !c.is_number() || c.get<double>() != std::floor(c.get<double>())) {
            return ApiResult::error(400, "copies must be an integer");
        }
        double v = c.get<double>();
        if (v < 1 || v > 99) {
            return ApiResult::error(400, "copies must be between 1 and 99");
        }
        copies = static_cast<int>(v);
    }

    auto path = uploads_->resolve(filename);
    if (!path) {
        return ApiResult::error(404, "File not found");
    }

    try {
        PrintPrepOptions prep;
        prep.mode = mode;
        prep.print_dpi = printing.value("print_dpi", 200);
        prep.max_pdf_pages = printing.value("max_pdf_pages_process", 30);
        prep.threshold = printing.value("bw_threshold", 180);
        PreparedDocument doc = documents_->prepare_for_print(*path, prep);

        PrintJobOptions job;
        job.printer = printer;
        job.copies = copies;
        job.title = "PrinterPal: " + filename;
        std::string out = backend_->submit(doc.path(), job);
        return ApiResult::ok({{"ok", true}, {"lp_stdout", out}});
    } catch (const PrinterPalException& e) {
        spdlog::error("[PrinterPalApi] Print of {} failed: {}", filename, e.what());
        return ApiResult::error(500, e.what());
    }
}

ApiResult PrinterPalApi::upload(const std::string& client_filename, const std::string& content) {
    if (content.size() > max_upload_bytes()) {
        return ApiResult::text(413, "File exceeds upload limit of " +
                                        std::to_string(max_upload_bytes() / (1024 * 1024)) + " MB");
    }
    try {
        std::string stored = uploads_->store(client_filename, content, max_upload_bytes());
        ApiResult r;
        r.status = 302;
        r.location = "/";
        r.body = {{"ok", true}, {"name", stored}};
        return r;
    } catch (const PrinterPalException& e) {
        spdlog::info("[PrinterPalApi] Upload of '{}' rejected: {}", client_filename, e.what());
        return ApiResult::text(e.error().http_status(), e.what());
    }
}

ApiResult PrinterPalApi::restart_host() {
    try {
        return ApiResult::ok(airprint_->restart_host().to_json());
    } catch (const PrinterPalException& e) {
        spdlog::error("[PrinterPalApi] Host restart failed: {}", e.what());
        return ApiResult::error(500, e.what());
    }
}

ApiResult PrinterPalApi::ensure_airprint() {
    try {
        return ApiResult::ok(airprint_->ensure_airprint().to_json());
    } catch (const PrinterPalException& e) {
        spdlog::error("[PrinterPalApi] AirPrint ensure failed: {}", e.what());
        return ApiResult::error(500, e.what());
    }
}

ApiResult PrinterPalApi::cancel_job(const std::string& job_id) {
    try {
        backend_->cancel_job(job_id);
        return ApiResult::ok({{"ok", true}});
    } catch (const PrinterPalException& e) {
        int code = e.error().type == PrinterPalErrorType::VALIDATION_ERROR ? 400 : 500;
        return ApiResult::error(code, e.what());
    }
}

json PrinterPalApi::event_payload() {
    return make_status_event(unix_now(), uploads_->list(UploadStore::PUSH_LIMIT),
                             aggregator_->snapshot());
}

} // namespace printerpal
