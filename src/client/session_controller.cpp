// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_controller.h"

#include "api_transport.h"
#include "json_utils.h"
#include "preference_store.h"
#include "scheduler.h"
#include "status_stream.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace printerpal {

namespace {

struct CommandName {
    SessionCommand command;
    const char* name;
};

const CommandName COMMAND_NAMES[] = {
    {SessionCommand::SELECT_FILE, "select-file"},
    {SessionCommand::PRINT, "print"},
    {SessionCommand::REFRESH, "refresh"},
    {SessionCommand::REFRESH_STATUS, "refresh-status"},
    {SessionCommand::SAVE_CONFIG, "save-config"},
    {SessionCommand::RESTART_HOST, "restart-host"},
    {SessionCommand::ENSURE_AIRPRINT, "ensure-airprint"},
    {SessionCommand::SET_MODE, "set-mode"},
    {SessionCommand::SET_PAGE, "set-page"},
    {SessionCommand::RESIZE, "resize"},
    {SessionCommand::TOGGLE_DARK, "toggle-dark"},
    {SessionCommand::TOGGLE_EINK, "toggle-eink"},
};

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return "";
    }
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

/// Integer form field; unparseable text becomes null so the server rejects it by name
json form_int(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) {
        return nullptr;
    }
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(t.c_str(), &end, 10);
    if (end == t.c_str() || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
        return nullptr;
    }
    return static_cast<int>(v);
}

std::vector<UploadedFile> files_from(const json& list) {
    std::vector<UploadedFile> files;
    if (!list.is_array()) {
        return files;
    }
    for (const auto& f : list) {
        UploadedFile file = UploadedFile::from_json(f);
        if (!file.name.empty()) {
            files.push_back(std::move(file));
        }
    }
    return files;
}

} // namespace

// ============================================================================
// Free helpers
// ============================================================================

const char* session_command_name(SessionCommand command) {
    for (const auto& entry : COMMAND_NAMES) {
        if (entry.command == command) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<SessionCommand> parse_session_command(const std::string& name) {
    for (const auto& entry : COMMAND_NAMES) {
        if (name == entry.name) {
            return entry.command;
        }
    }
    return std::nullopt;
}

std::string describe_failure(const RestResponse& response) {
    if (response.status_code == 0) {
        return response.error.empty() ? "Request failed" : response.error;
    }
    return "HTTP " + std::to_string(response.status_code) + ": " + response.error;
}

std::optional<int> parse_positive_int(const std::string& text) {
    std::string t = trim(text);
    if (t.empty() || t.find_first_not_of("0123456789") != std::string::npos || t.size() > 9) {
        return std::nullopt;
    }
    int v = std::atoi(t.c_str());
    if (v < 1) {
        return std::nullopt;
    }
    return v;
}

SettingsForm SettingsForm::from_config(const json& config) {
    SettingsForm form;
    json printing = config.is_object() && config.contains("printing") ? config["printing"] : json();
    json airprint = config.is_object() && config.contains("airprint") ? config["airprint"] : json();

    auto number_text = [&printing](const char* key) {
        return printing.is_object() && printing.contains(key) && printing[key].is_number()
                   ? std::to_string(printing[key].get<int>())
                   : std::string();
    };

    form.default_printer = json_util::safe_string(printing, "default_printer");
    form.preview_dpi = number_text("preview_dpi");
    form.print_dpi = number_text("print_dpi");
    form.bw_threshold = number_text("bw_threshold");
    form.max_pdf_pages = number_text("max_pdf_pages_process");
    form.airprint_auto_enable = json_util::safe_bool(airprint, "auto_enable");
    return form;
}

// ============================================================================
// Lifecycle
// ============================================================================

SessionController::SessionController(ApiTransport& transport, StatusStream& stream,
                                     Scheduler& scheduler, PreferenceStore& preferences,
                                     SessionView& view)
    : transport_(transport), stream_(stream), scheduler_(scheduler), preferences_(preferences),
      view_(view), resize_debounce_(scheduler), alive_(std::make_shared<bool>(true)) {}

SessionController::~SessionController() {
    *alive_ = false;
    if (subscription_) {
        subscription_->cancel();
    }
}

template <typename Fn> auto SessionController::guarded(Fn fn) {
    std::weak_ptr<bool> alive = alive_;
    return [alive, fn = std::move(fn)](const auto&... args) {
        auto token = alive.lock();
        if (token && *token) {
            fn(args...);
        }
    };
}

void SessionController::start() {
    load_preferences();
    view_.set_print_enabled(false);
    view_.hide_preview();

    struct InitialPull {
        int remaining = 3;
        RestResponse files;
        RestResponse status;
        RestResponse config;
    };
    auto pull = std::make_shared<InitialPull>();

    auto complete = [this, pull]() {
        if (--pull->remaining == 0) {
            finish_initial_pull(pull->files, pull->status, pull->config);
        }
    };

    spdlog::debug("[SessionController] Initial pull");
    transport_.get("/api/files", guarded([pull, complete](const RestResponse& r) {
                       pull->files = r;
                       complete();
                   }));
    transport_.get("/api/status", guarded([pull, complete](const RestResponse& r) {
                       pull->status = r;
                       complete();
                   }));
    transport_.get("/api/config", guarded([pull, complete](const RestResponse& r) {
                       pull->config = r;
                       complete();
                   }));
}

void SessionController::finish_initial_pull(const RestResponse& files, const RestResponse& status,
                                            const RestResponse& config) {
    for (const RestResponse* r : {&files, &status, &config}) {
        if (!r->success) {
            spdlog::error("[SessionController] Initial pull failed: {}", describe_failure(*r));
            state_.live_status = LIVE_STATUS_DISCONNECTED;
            view_.set_live_status(state_.live_status);
            view_.show_message(MessagePanel::ACTION, "Startup failed: " + describe_failure(*r),
                               true);
            return;
        }
    }

    apply_files(files_from(files.data.is_object() ? files.data.value("files", json::array())
                                                  : json::array()));
    apply_config(config.data.is_object() && config.data.contains("config") ? config.data["config"]
                                                                           : json());
    apply_status(StatusSnapshot::from_json(status.data));

    state_.initial_pull_done = true;
    state_.live_status = LIVE_STATUS_LIVE;
    view_.set_live_status(state_.live_status);

    open_live_channel();
}

void SessionController::open_live_channel() {
    StatusStreamHandlers handlers;
    handlers.on_open = guarded([]() { spdlog::debug("[SessionController] Live channel open"); });
    handlers.on_status = guarded([this](const json& payload) { on_status_event(payload); });
    handlers.on_error = guarded([this](const std::string& reason) {
        spdlog::debug("[SessionController] Live channel interrupted: {}", reason);
        state_.live_status = LIVE_STATUS_RECONNECTING;
        view_.set_live_status(state_.live_status);
    });

    subscription_ = stream_.subscribe(std::move(handlers));
    if (!subscription_) {
        state_.live_status = LIVE_STATUS_UNAVAILABLE;
        view_.set_live_status(state_.live_status);
    }
}

// ============================================================================
// Reconciliation
// ============================================================================

void SessionController::on_status_event(const json& payload) {
    if (!payload.is_object()) {
        spdlog::warn("[SessionController] Ignoring non-object status event");
        return;
    }

    state_.live_status = LIVE_STATUS_LIVE;
    view_.set_live_status(state_.live_status);

    if (payload.contains("files") && payload["files"].is_array()) {
        apply_files(files_from(payload["files"]));
    }
    if (payload.contains("status") && payload["status"].is_object()) {
        apply_status(StatusSnapshot::from_json(payload["status"]));
    }
    reconcile_settings();
}

void SessionController::apply_files(const std::vector<UploadedFile>& files) {
    state_.files = files;

    if (state_.selected_file) {
        bool still_there =
            std::any_of(files.begin(), files.end(), [this](const UploadedFile& f) {
                return f.name == *state_.selected_file;
            });
        if (!still_there) {
            spdlog::info("[SessionController] {} disappeared, clearing selection",
                         *state_.selected_file);
            state_.selected_file.reset();
            state_.preview_key.reset();
            state_.preview_url.clear();
            state_.preview_visible = false;
            resize_debounce_.cancel();
            view_.hide_preview();
        }
    }

    view_.render_files(state_.files, state_.selected_file.value_or(""));
    update_print_enabled();
}

void SessionController::apply_status(const StatusSnapshot& status) {
    state_.status = status;
    view_.render_status(status, preferred_printer());
}

void SessionController::apply_config(const json& config) {
    if (!config.is_object()) {
        return;
    }
    state_.config = config;
    state_.settings_stale = false;
    view_.render_settings(SettingsForm::from_config(config));

    std::string mode = json_util::safe_string(config.value("printing", json::object()),
                                              "default_mode");
    if (is_valid_print_mode(mode)) {
        state_.mode = mode;
        view_.render_mode(mode);
    }

    load_preferences();
}

void SessionController::reconcile_settings() {
    if (state_.settings_stale && state_.config.is_object()) {
        state_.settings_stale = false;
        view_.render_settings(SettingsForm::from_config(state_.config));
    }
}

void SessionController::update_print_enabled() {
    view_.set_print_enabled(state_.print_enabled());
}

void SessionController::update_preview() {
    state_.preview_visible = false;
    if (!state_.selected_file) {
        view_.hide_preview();
        return;
    }

    PreviewKey key;
    key.filename = *state_.selected_file;
    key.mode = state_.mode;
    key.page = parse_positive_int(state_.page_text).value_or(1);
    key.width = preview_width_for_container(state_.container_width);

    state_.preview_key = key;
    state_.preview_url = transport_.url_for(preview_url(key, preview_tokens_.next()));
    spdlog::debug("[SessionController] Preview {}", state_.preview_url);
    view_.show_preview(state_.preview_url);
}

void SessionController::preview_loaded(const std::string& url) {
    if (url != state_.preview_url) {
        spdlog::trace("[SessionController] Ignoring superseded preview {}", url);
        return;
    }
    state_.preview_visible = true;
}

void SessionController::preview_failed(const std::string& url) {
    if (url != state_.preview_url) {
        return;
    }
    state_.preview_visible = false;
    view_.hide_preview();
    view_.show_message(MessagePanel::ACTION, "Preview failed. (Is the file type supported?)",
                       true);
}

std::string SessionController::preferred_printer() const {
    if (!state_.config.is_object() || !state_.config.contains("printing")) {
        return "";
    }
    return json_util::safe_string(state_.config["printing"], "default_printer");
}

int SessionController::default_copies() const {
    if (!state_.config.is_object() || !state_.config.contains("printing")) {
        return 1;
    }
    return json_util::safe_int(state_.config["printing"], "default_copies", 1);
}

// ============================================================================
// Commands
// ============================================================================

void SessionController::dispatch(const SessionAction& action) {
    spdlog::debug("[SessionController] Command {}", session_command_name(action.command));

    switch (action.command) {
    case SessionCommand::SELECT_FILE:
        select_file(action.value);
        break;
    case SessionCommand::PRINT:
        print(action);
        break;
    case SessionCommand::REFRESH:
        refresh_files();
        break;
    case SessionCommand::REFRESH_STATUS:
        refresh_status(true);
        break;
    case SessionCommand::SAVE_CONFIG:
        save_config(action.settings);
        break;
    case SessionCommand::RESTART_HOST:
        restart_host();
        break;
    case SessionCommand::ENSURE_AIRPRINT:
        ensure_airprint();
        break;
    case SessionCommand::SET_MODE:
        set_mode(action.value);
        break;
    case SessionCommand::SET_PAGE:
        set_page(action.value);
        break;
    case SessionCommand::RESIZE:
        resize(action.value);
        break;
    case SessionCommand::TOGGLE_DARK:
        toggle_dark();
        break;
    case SessionCommand::TOGGLE_EINK:
        toggle_eink();
        break;
    }
}

void SessionController::select_file(const std::string& name) {
    bool known = std::any_of(state_.files.begin(), state_.files.end(),
                             [&name](const UploadedFile& f) { return f.name == name; });
    if (!known) {
        view_.show_message(MessagePanel::ACTION, "File not found: " + name, true);
        return;
    }

    state_.selected_file = name;
    view_.render_files(state_.files, name);
    update_print_enabled();
    view_.show_message(MessagePanel::ACTION, "", false);
    update_preview();
}

void SessionController::print(const SessionAction& action) {
    if (!state_.selected_file || state_.print_in_flight) {
        return;
    }

    std::optional<int> page = trim(state_.page_text).empty()
                                  ? std::optional<int>(1)
                                  : parse_positive_int(state_.page_text);
    if (!page) {
        view_.show_message(MessagePanel::ACTION, "Invalid page number.", true);
        return;
    }

    std::optional<int> copies = trim(action.copies).empty()
                                    ? std::optional<int>(default_copies())
                                    : parse_positive_int(action.copies);
    if (!copies || *copies > 99) {
        view_.show_message(MessagePanel::ACTION, "Copies must be 1–99.", true);
        return;
    }

    if (!action.printer.empty() &&
        (!state_.status || !state_.status->has_printer(action.printer))) {
        view_.show_message(MessagePanel::ACTION, "Unknown printer: " + action.printer, true);
        return;
    }

    PrintRequest request;
    request.filename = *state_.selected_file;
    request.mode = state_.mode;
    request.printer = action.printer;
    request.copies = *copies;
    request.page = *page;

    state_.print_in_flight = true;
    update_print_enabled();
    view_.show_message(MessagePanel::ACTION, "Sending job to CUPS…", false);
    spdlog::info("[SessionController] Printing {} ({}, {} copies)", request.filename,
                 request.mode, request.copies);

    transport_.post("/api/print", request.to_json(), guarded([this](const RestResponse& r) {
                        state_.print_in_flight = false;
                        if (r.success) {
                            std::string out = json_util::safe_string(r.data, "lp_stdout");
                            view_.show_message(MessagePanel::ACTION,
                                               out.empty() ? "Queued." : "Queued: " + out, false);
                        } else {
                            view_.show_message(MessagePanel::ACTION,
                                               "Print failed: " + describe_failure(r), true);
                        }
                        update_print_enabled();
                        refresh_status(false);
                    }));
}

void SessionController::refresh_files() {
    transport_.get("/api/files", guarded([this](const RestResponse& r) {
                       if (!r.success) {
                           view_.show_message(MessagePanel::ACTION,
                                              "Refresh failed: " + describe_failure(r), true);
                           return;
                       }
                       apply_files(files_from(r.data.is_object()
                                                  ? r.data.value("files", json::array())
                                                  : json::array()));
                       reconcile_settings();
                       view_.show_message(MessagePanel::ACTION, "Files refreshed.", false);
                   }));
}

void SessionController::refresh_status(bool report_errors) {
    transport_.get("/api/status", guarded([this, report_errors](const RestResponse& r) {
                       if (!r.success) {
                           spdlog::warn("[SessionController] Status refresh failed: {}",
                                        describe_failure(r));
                           if (report_errors) {
                               view_.show_message(MessagePanel::ACTION,
                                                  "Status refresh failed: " + describe_failure(r),
                                                  true);
                           }
                           return;
                       }
                       apply_status(StatusSnapshot::from_json(r.data));
                       reconcile_settings();
                   }));
}

void SessionController::save_config(const SettingsForm& form) {
    if (!state_.config.is_object()) {
        view_.show_message(MessagePanel::SETTINGS, "Config not loaded.", true);
        return;
    }

    json cfg = state_.config;
    if (!cfg.contains("printing") || !cfg["printing"].is_object()) {
        cfg["printing"] = json::object();
    }
    if (!cfg.contains("airprint") || !cfg["airprint"].is_object()) {
        cfg["airprint"] = json::object();
    }
    cfg["printing"]["default_printer"] = trim(form.default_printer);
    cfg["printing"]["preview_dpi"] = form_int(form.preview_dpi);
    cfg["printing"]["print_dpi"] = form_int(form.print_dpi);
    cfg["printing"]["bw_threshold"] = form_int(form.bw_threshold);
    cfg["printing"]["max_pdf_pages_process"] = form_int(form.max_pdf_pages);
    cfg["airprint"]["auto_enable"] = form.airprint_auto_enable;

    view_.show_message(MessagePanel::SETTINGS, "Saving…", false);

    transport_.post(
        "/api/config", json{{"config", cfg}}, guarded([this](const RestResponse& r) {
            json returned = r.data.is_object() && r.data.contains("config") ? r.data["config"]
                                                                             : json();
            if (r.success && returned.is_object()) {
                apply_config(returned);
                view_.show_message(MessagePanel::SETTINGS, "Saved.", false);
                refresh_status(false);
                return;
            }

            if (returned.is_object()) {
                // Persisted, but the follow-up AirPrint refresh failed
                apply_config(returned);
                view_.show_message(MessagePanel::SETTINGS,
                                   "Saved, but AirPrint refresh failed: " + describe_failure(r),
                                   true);
                refresh_status(false);
                return;
            }

            state_.settings_stale = true;
            view_.show_message(MessagePanel::SETTINGS, "Save failed: " + describe_failure(r),
                               true);
        }));
}

void SessionController::restart_host() {
    if (!view_.confirm("Restart the host now? This will interrupt prints.")) {
        return;
    }
    view_.show_message(MessagePanel::ACTION, "Restart requested…", false);
    transport_.post("/api/restart-host", json::object(), guarded([this](const RestResponse& r) {
                        if (r.success) {
                            std::string out = json_util::safe_string(r.data, "output");
                            view_.show_message(MessagePanel::ACTION,
                                               out.empty() ? "Host restart command sent." : out,
                                               false);
                        } else {
                            view_.show_message(MessagePanel::ACTION,
                                               "Restart failed: " + describe_failure(r), true);
                        }
                    }));
}

void SessionController::ensure_airprint() {
    view_.show_message(MessagePanel::ACTION, "Refreshing AirPrint advertising…", false);
    transport_.post("/api/airprint/ensure", json::object(), guarded([this](const RestResponse& r) {
                        if (r.success) {
                            std::string out = json_util::safe_string(r.data, "output");
                            view_.show_message(MessagePanel::ACTION,
                                               out.empty() ? "AirPrint refresh completed." : out,
                                               false);
                        } else {
                            view_.show_message(MessagePanel::ACTION,
                                               "AirPrint refresh failed: " + describe_failure(r),
                                               true);
                        }
                    }));
}

void SessionController::set_mode(const std::string& mode) {
    if (!is_valid_print_mode(mode)) {
        view_.show_message(MessagePanel::ACTION, "Unknown mode: " + mode, true);
        return;
    }
    state_.mode = mode;
    view_.render_mode(mode);
    update_preview();
}

void SessionController::set_page(const std::string& page_text) {
    state_.page_text = page_text;
    update_preview();
}

void SessionController::resize(const std::string& width_text) {
    std::optional<int> width = parse_positive_int(width_text);
    if (!width) {
        spdlog::debug("[SessionController] Ignoring resize to '{}'", width_text);
        return;
    }
    state_.container_width = *width;
    resize_debounce_.trigger(guarded([this]() { update_preview(); }));
}

// ============================================================================
// Preferences
// ============================================================================

void SessionController::load_preferences() {
    json ui = state_.config.is_object() ? state_.config.value("ui", json::object())
                                        : json::object();
    auto dark = preferences_.get(PREF_DARK_MODE);
    auto eink = preferences_.get(PREF_EINK_MODE);

    state_.dark = dark ? *dark == "1" : json_util::safe_bool(ui, "default_dark_mode");
    state_.eink = eink ? *eink == "1" : json_util::safe_bool(ui, "default_eink_mode");
    if (state_.dark && state_.eink) {
        state_.dark = false;
    }
    view_.apply_theme(state_.dark, state_.eink);
}

void SessionController::save_preferences() {
    preferences_.set(PREF_DARK_MODE, state_.dark ? "1" : "0");
    preferences_.set(PREF_EINK_MODE, state_.eink ? "1" : "0");
    view_.apply_theme(state_.dark, state_.eink);
}

void SessionController::toggle_dark() {
    state_.dark = !state_.dark;
    if (state_.dark) {
        state_.eink = false;
    }
    save_preferences();
}

void SessionController::toggle_eink() {
    state_.eink = !state_.eink;
    if (state_.eink) {
        state_.dark = false;
    }
    save_preferences();
}

} // namespace printerpal
