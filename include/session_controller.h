// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file session_controller.h
 * @brief Client-side session state and command dispatch
 *
 * Pulls the full snapshot once (files, status, config), then follows the live
 * `status` push channel. Every received list or status replaces the previous
 * one wholesale. User actions go through dispatch().
 *
 * @threading Single-threaded: construct, dispatch and receive callbacks on
 *            the Scheduler's loop thread
 */

#include "debouncer.h"
#include "preview_request.h"
#include "printerpal_types.h"
#include "session_view.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace printerpal {

class ApiTransport;
class PreferenceStore;
class Scheduler;
class StatusStream;
class StatusSubscription;
struct RestResponse;

// Footer indicator texts
constexpr const char* LIVE_STATUS_LIVE = "Live";
constexpr const char* LIVE_STATUS_RECONNECTING = "Reconnecting…";
constexpr const char* LIVE_STATUS_DISCONNECTED = "Disconnected";
constexpr const char* LIVE_STATUS_UNAVAILABLE = "No live updates";

enum class SessionCommand {
    SELECT_FILE,
    PRINT,
    REFRESH,
    REFRESH_STATUS,
    SAVE_CONFIG,
    RESTART_HOST,
    ENSURE_AIRPRINT,
    SET_MODE,
    SET_PAGE,
    RESIZE,
    TOGGLE_DARK,
    TOGGLE_EINK,
};

/// "select-file", "print", ... as typed in the console
const char* session_command_name(SessionCommand command);
std::optional<SessionCommand> parse_session_command(const std::string& name);

/**
 * @brief One user action
 *
 * `value` carries the single argument of select-file (name), set-mode (mode),
 * set-page (page text) and resize (container width). print reads `printer`
 * and `copies`; save-config reads `settings`.
 */
struct SessionAction {
    SessionCommand command = SessionCommand::REFRESH;
    std::string value;
    std::string printer; ///< print: "" = system default
    std::string copies;  ///< print: "" = printing.default_copies
    SettingsForm settings;
};

enum class SelectionState { NO_FILE_SELECTED, FILE_SELECTED };

/**
 * @brief Everything the controller knows, owned by the controller
 */
struct SessionState {
    std::vector<UploadedFile> files;
    std::optional<std::string> selected_file;
    std::optional<StatusSnapshot> status;
    json config; ///< Last good config, null until loaded

    std::string mode = "grayscale";
    std::string page_text = "1";
    int container_width = 744;

    bool initial_pull_done = false;
    bool print_in_flight = false;
    bool settings_stale = false; ///< Form differs from config after a failed save
    std::string live_status;

    std::optional<PreviewKey> preview_key;
    std::string preview_url; ///< Last requested preview ("" = none)
    bool preview_visible = false;

    bool dark = false;
    bool eink = false;

    SelectionState selection() const {
        return selected_file ? SelectionState::FILE_SELECTED : SelectionState::NO_FILE_SELECTED;
    }

    bool print_enabled() const {
        return selected_file.has_value() && !print_in_flight;
    }
};

class SessionController {
  public:
    SessionController(ApiTransport& transport, StatusStream& stream, Scheduler& scheduler,
                      PreferenceStore& preferences, SessionView& view);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /// Initial pull, then open the live channel
    void start();

    void dispatch(const SessionAction& action);

    /// Convenience for argument-less commands
    void dispatch(SessionCommand command) {
        SessionAction action;
        action.command = command;
        dispatch(action);
    }

    // View callbacks for show_preview()
    void preview_loaded(const std::string& url);
    void preview_failed(const std::string& url);

    const SessionState& state() const {
        return state_;
    }

  private:
    // Commands
    void select_file(const std::string& name);
    void print(const SessionAction& action);
    void refresh_files();
    void refresh_status(bool report_errors);
    void save_config(const SettingsForm& form);
    void restart_host();
    void ensure_airprint();
    void set_mode(const std::string& mode);
    void set_page(const std::string& page_text);
    void resize(const std::string& width_text);
    void toggle_dark();
    void toggle_eink();

    // Reconciliation
    void finish_initial_pull(const RestResponse& files, const RestResponse& status,
                             const RestResponse& config);
    void open_live_channel();
    void on_status_event(const json& payload);
    void apply_files(const std::vector<UploadedFile>& files);
    void apply_status(const StatusSnapshot& status);
    void apply_config(const json& config);
    void reconcile_settings();
    void update_print_enabled();
    void update_preview();

    void load_preferences();
    void save_preferences();

    std::string preferred_printer() const;
    int default_copies() const;

    /// Runs @p fn only while this controller is alive
    template <typename Fn> auto guarded(Fn fn);

    ApiTransport& transport_;
    StatusStream& stream_;
    Scheduler& scheduler_;
    PreferenceStore& preferences_;
    SessionView& view_;

    SessionState state_;
    Debouncer resize_debounce_;
    PreviewTokenSource preview_tokens_;
    std::unique_ptr<StatusSubscription> subscription_;
    std::shared_ptr<bool> alive_;
};

/// "HTTP 400: <server error>" or the transport's own message
std::string describe_failure(const RestResponse& response);

/// Strict positive integer parse ("1" ok; "", "0", "1.5", "abc" rejected)
std::optional<int> parse_positive_int(const std::string& text);

} // namespace printerpal
