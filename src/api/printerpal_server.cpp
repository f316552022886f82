// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printerpal_server.h"

#include "printerpal_api.h"

#include <spdlog/spdlog.h>

#include "hv/hurl.h"

namespace printerpal {

namespace {

json parse_body(const HttpRequest* req) {
    json body = json::parse(req->body, nullptr, false);
    if (body.is_discarded()) {
        return json();
    }
    return body;
}

std::string path_param(HttpRequest* req, const char* key) {
    return HUrl::unescape(req->GetParam(key));
}

} // namespace

int write_api_result(HttpResponse* resp, const ApiResult& result) {
    resp->status_code = static_cast<http_status>(result.status);
    if (!result.location.empty()) {
        resp->SetHeader("Location", result.location);
    }
    if (result.is_json()) {
        resp->content_type = APPLICATION_JSON;
        resp->body = result.body.dump();
    } else {
        resp->SetHeader("Content-Type", result.content_type);
        resp->body = result.raw;
    }
    return result.status;
}

// ============================================================================
// HvSseChannel
// ============================================================================

HvSseChannel::HvSseChannel(hv::HttpResponseWriterPtr writer) : writer_(std::move(writer)) {}

bool HvSseChannel::is_open() const {
    return writer_ && writer_->isConnected();
}

bool HvSseChannel::send(const std::string& event, const std::string& data) {
    return writer_->SSEvent(data, event.c_str()) >= 0;
}

// ============================================================================
// PrinterPalServer
// ============================================================================

PrinterPalServer::PrinterPalServer(std::shared_ptr<PrinterPalApi> api,
                                   std::shared_ptr<EventBroadcaster> broadcaster)
    : api_(std::move(api)), broadcaster_(std::move(broadcaster)) {
    register_routes();
}

PrinterPalServer::~PrinterPalServer() {
    stop();
}

void PrinterPalServer::register_routes() {
    auto api = api_;

    // Wraps a mutating handler with the token guard
    auto guarded = [api](std::function<int(HttpRequest*, HttpResponse*)> fn) {
        return [api, fn](HttpRequest* req, HttpResponse* resp) -> int {
            auto denied = api->check_token(req->GetHeader("X-PrinterPal-Token"),
                                           req->GetParam("token"));
            if (denied) {
                return write_api_result(resp, *denied);
            }
            return fn(req, resp);
        };
    };

    router_.GET("/", [api](HttpRequest*, HttpResponse* resp) {
        return write_api_result(resp, api->index());
    });

    router_.GET("/healthz", [api](HttpRequest*, HttpResponse* resp) {
        return write_api_result(resp, api->healthz());
    });

    router_.GET("/api/files", [api](HttpRequest*, HttpResponse* resp) {
        return write_api_result(resp, api->files());
    });

    router_.GET("/api/status", [api](HttpRequest*, HttpResponse* resp) {
        return write_api_result(resp, api->status());
    });

    router_.GET("/api/config", [api](HttpRequest*, HttpResponse* resp) {
        return write_api_result(resp, api->get_config());
    });

    router_.POST("/api/config", guarded([api](HttpRequest* req, HttpResponse* resp) {
                     return write_api_result(resp, api->set_config(parse_body(req)));
                 }));

    router_.GET("/api/printer/{name}", [api](HttpRequest* req, HttpResponse* resp) {
        return write_api_result(resp, api->printer_detail(path_param(req, "name")));
    });

    router_.GET("/api/preview/{filename}", [api](HttpRequest* req, HttpResponse* resp) {
        PreviewQuery q;
        q.mode = req->GetParam("mode");
        q.page = req->GetParam("page");
        q.width = req->GetParam("w");
        ApiResult r = api->preview(path_param(req, "filename"), q);
        if (r.status == 200) {
            resp->SetHeader("Cache-Control", "no-store");
        }
        return write_api_result(resp, r);
    });

    router_.POST("/api/print", guarded([api](HttpRequest* req, HttpResponse* resp) {
                     return write_api_result(resp, api->print(parse_body(req)));
                 }));

    router_.POST("/api/jobs/{job_id}/cancel", guarded([api](HttpRequest* req, HttpResponse* resp) {
                     return write_api_result(resp, api->cancel_job(path_param(req, "job_id")));
                 }));

    router_.POST("/api/restart-host", guarded([api](HttpRequest*, HttpResponse* resp) {
                     return write_api_result(resp, api->restart_host());
                 }));

    router_.POST("/api/airprint/ensure", guarded([api](HttpRequest*, HttpResponse* resp) {
                     return write_api_result(resp, api->ensure_airprint());
                 }));

    router_.POST("/upload", guarded([api](HttpRequest* req, HttpResponse* resp) {
                     req->ParseBody();
                     auto it = req->form.find("file");
                     if (it == req->form.end()) {
                         return write_api_result(resp, ApiResult::text(400, "No file part"));
                     }
                     return write_api_result(
                         resp, api->upload(it->second.filename, it->second.content));
                 }));

    router_.GET("/uploads/{filename}", [api](HttpRequest* req, HttpResponse* resp) {
        std::string name = path_param(req, "filename");
        auto path = api->download_path(name);
        if (!path) {
            return write_api_result(resp, ApiResult::error(404, "File not found"));
        }
        int status = resp->File(path->c_str());
        resp->SetHeader("Content-Disposition", "attachment; filename=\"" + name + "\"");
        return status;
    });

    auto broadcaster = broadcaster_;
    router_.GET("/events",
                [broadcaster](const HttpRequestPtr& req, const HttpResponseWriterPtr& writer) {
                    writer->WriteHeader("Cache-Control", "no-cache");
                    writer->WriteHeader("X-Accel-Buffering", "no");
                    writer->EndHeaders("Content-Type", "text/event-stream");
                    spdlog::debug("[PrinterPalServer] SSE client connected from {}",
                                  req->client_addr.ip);
                    broadcaster->add_channel(std::make_shared<HvSseChannel>(writer));
                });
}

int PrinterPalServer::start(const std::string& host, int port, int worker_threads) {
    server_ = std::make_unique<hv::HttpServer>(&router_);
    server_->setHost(host.c_str());
    server_->setPort(port);
    server_->setThreadNum(worker_threads);

    int rc = server_->start();
    if (rc != 0) {
        spdlog::error("[PrinterPalServer] Failed to listen on {}:{} (error {})", host, port, rc);
        server_.reset();
        return rc;
    }
    spdlog::info("[PrinterPalServer] Listening on http://{}:{}", host, port);
    return 0;
}

void PrinterPalServer::stop() {
    if (!server_) {
        return;
    }
    server_->stop();
    server_.reset();
    spdlog::info("[PrinterPalServer] Stopped");
}

} // namespace printerpal
