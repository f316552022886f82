// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_session_controller.cpp
 * @brief Client session: initial pull, live updates, print flow, preview, settings
 *
 * The controller runs against in-memory transport/stream/scheduler doubles,
 * so every server reply and push event is delivered explicitly by the test.
 */

#include "config.h"
#include "session_controller.h"

#include "../mocks/manual_scheduler.h"
#include "../mocks/mock_api_transport.h"
#include "../mocks/mock_preference_store.h"
#include "../mocks/mock_session_view.h"
#include "../mocks/mock_status_stream.h"

#include <memory>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace printerpal;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

/// Everything before the cache-busting token
std::string without_token(const std::string& url) {
    return url.substr(0, url.find("&_="));
}

json file_entry(const std::string& name, int64_t mtime) {
    return {{"name", name}, {"size", 2048}, {"size_h", "2.0 KB"}, {"mtime", mtime}};
}

json sample_files() {
    return json::array({file_entry("report.pdf", 1700000200), file_entry("photo.png", 1700000100)});
}

json sample_status() {
    StatusSnapshot s;
    s.cups_available = true;
    s.scheduler.running = true;
    s.scheduler.raw = "scheduler is running";
    s.default_printer = "Office_Laser";
    s.default_printer_display = "Office Laser";
    s.default_printer_label = "Office Laser (default)";

    PrinterInfo office;
    office.name = "Office_Laser";
    office.state = "idle";
    office.is_default = true;
    office.accepting = true;
    PrinterInfo label;
    label.name = "Label_Printer";
    label.state = "idle";
    label.accepting = true;
    s.printers = {office, label};
    return s.to_json();
}

json push_event(const json& files) {
    return {{"ts", 1700000300}, {"files", files}, {"status", sample_status()}};
}

} // namespace

// ============================================================================
// Fixture
// ============================================================================

class SessionTestFixture {
  public:
    SessionTestFixture() {
        controller = std::make_unique<SessionController>(transport, stream, scheduler, prefs, view);
    }

    /// start() and answer the initial pull successfully
    void start_session(const json& config = default_config()) {
        controller->start();
        transport.respond("/api/files", 200, {{"files", sample_files()}});
        transport.respond("/api/status", 200, sample_status());
        transport.respond("/api/config", 200, {{"config", config}});
    }

    void select(const std::string& name) {
        SessionAction action;
        action.command = SessionCommand::SELECT_FILE;
        action.value = name;
        controller->dispatch(action);
    }

    void print(const std::string& copies = "", const std::string& printer = "") {
        SessionAction action;
        action.command = SessionCommand::PRINT;
        action.copies = copies;
        action.printer = printer;
        controller->dispatch(action);
    }

    void command(SessionCommand cmd, const std::string& value) {
        SessionAction action;
        action.command = cmd;
        action.value = value;
        controller->dispatch(action);
    }

    const SessionState& state() const {
        return controller->state();
    }

    MockApiTransport transport;
    MockStatusStream stream;
    ManualScheduler scheduler;
    MockPreferenceStore prefs;
    MockSessionView view;
    std::unique_ptr<SessionController> controller;
};

// ============================================================================
// Initial pull
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "SessionController: initial pull populates every panel",
                 "[session][startup]") {
    controller->start();

    REQUIRE(transport.count("/api/files") == 1);
    REQUIRE(transport.count("/api/status") == 1);
    REQUIRE(transport.count("/api/config") == 1);
    CHECK_FALSE(view.print_enabled_);
    CHECK(view.file_renders == 0);

    SECTION("nothing renders until all three replies arrive") {
        transport.respond("/api/files", 200, {{"files", sample_files()}});
        transport.respond("/api/status", 200, sample_status());
        CHECK(view.file_renders == 0);
        CHECK(stream.subscribe_count() == 0);

        transport.respond("/api/config", 200, {{"config", default_config()}});
        CHECK(view.files_.size() == 2);
        CHECK(view.status_.has_printer("Office_Laser"));
        CHECK(view.settings_.preview_dpi == "150");
        CHECK(view.settings_.max_pdf_pages == "30");
        CHECK(view.settings_.airprint_auto_enable);
        CHECK(view.mode_ == "grayscale");
        CHECK(view.live_status() == LIVE_STATUS_LIVE);
        CHECK(stream.subscribe_count() == 1);
        CHECK(state().initial_pull_done);
        CHECK(state().selection() == SelectionState::NO_FILE_SELECTED);
    }

    SECTION("replies may arrive in any order") {
        transport.respond("/api/config", 200, {{"config", default_config()}});
        transport.respond("/api/status", 200, sample_status());
        transport.respond("/api/files", 200, {{"files", sample_files()}});
        CHECK(state().initial_pull_done);
        CHECK(view.files_.size() == 2);
    }
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: failed initial pull reports startup error",
                 "[session][startup]") {
    controller->start();
    transport.respond("/api/files", 200, {{"files", sample_files()}});
    transport.respond("/api/status", 500, {{"ok", false}, {"error", "boom"}});
    transport.respond("/api/config", 200, {{"config", default_config()}});

    CHECK_FALSE(state().initial_pull_done);
    CHECK(view.live_status() == LIVE_STATUS_DISCONNECTED);
    CHECK(view.last_message(MessagePanel::ACTION) == "Startup failed: HTTP 500: boom");
    CHECK(view.last_message_is_error(MessagePanel::ACTION));
    CHECK(stream.subscribe_count() == 0);
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: transport failure names the reason",
                 "[session][startup]") {
    controller->start();
    transport.fail("/api/files", "Request failed: no response from server");
    transport.respond("/api/status", 200, sample_status());
    transport.respond("/api/config", 200, {{"config", default_config()}});

    CHECK(view.last_message(MessagePanel::ACTION) ==
          "Startup failed: Request failed: no response from server");
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: no live channel is reported, not fatal",
                 "[session][startup]") {
    stream.set_available(false);
    start_session();

    CHECK(state().initial_pull_done);
    CHECK(view.live_status() == LIVE_STATUS_UNAVAILABLE);
    CHECK(view.files_.size() == 2);
}

// ============================================================================
// Selection and live updates
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "SessionController: selecting a file enables print and preview",
                 "[session][selection]") {
    start_session();
    select("report.pdf");

    CHECK(state().selection() == SelectionState::FILE_SELECTED);
    CHECK(view.selected_ == "report.pdf");
    CHECK(view.print_enabled_);
    REQUIRE(view.preview_urls.size() == 1);
    CHECK(contains(view.preview_urls.back(), std::string(MockApiTransport::BASE_URL) +
                                                 "/api/preview/report.pdf?mode=grayscale&page=1&w=720&_="));
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: selecting an unknown file is refused",
                 "[session][selection]") {
    start_session();
    select("missing.pdf");

    CHECK(state().selection() == SelectionState::NO_FILE_SELECTED);
    CHECK(view.last_message(MessagePanel::ACTION) == "File not found: missing.pdf");
    CHECK(view.preview_urls.empty());
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: vanished selection is cleared exactly once",
                 "[session][selection][live]") {
    start_session();
    select("report.pdf");
    int hides_before = view.preview_hides;

    json remaining = json::array({file_entry("photo.png", 1700000100)});
    stream.push(push_event(remaining));

    CHECK(state().selection() == SelectionState::NO_FILE_SELECTED);
    CHECK(view.selected_.empty());
    CHECK_FALSE(view.print_enabled_);
    CHECK_FALSE(view.preview_shown_);
    CHECK(state().preview_url.empty());
    CHECK(view.preview_hides == hides_before + 1);

    // Same event again: nothing left to deselect
    stream.push(push_event(remaining));
    CHECK(state().selection() == SelectionState::NO_FILE_SELECTED);
    CHECK(view.preview_hides == hides_before + 1);
    CHECK(view.files_.size() == 1);
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: push events replace lists wholesale",
                 "[session][live]") {
    start_session();

    stream.push(push_event(sample_files()));
    stream.push(push_event(sample_files()));
    CHECK(view.files_.size() == 2);
    CHECK(state().files.size() == 2);
    CHECK(state().status->printers.size() == 2);
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: CUPS outage renders without losing state",
                 "[session][live]") {
    start_session();
    select("report.pdf");
    REQUIRE(view.print_enabled_);

    StatusSnapshot down;
    down.cups_available = false;
    down.scheduler.error = "Command not found: lpstat";
    down.stats.active_jobs = 2;
    down.stats.completed_jobs = 17;
    int renders = view.status_renders;

    SECTION("pushed") {
        stream.push({{"ts", 1700000400}, {"files", sample_files()}, {"status", down.to_json()}});
    }
    SECTION("pulled") {
        controller->dispatch(SessionCommand::REFRESH_STATUS);
        transport.respond("/api/status", 200, down.to_json());
    }

    CHECK(view.status_renders == renders + 1);
    CHECK_FALSE(view.status_.cups_available);
    CHECK(view.status_.printers.empty());
    CHECK(view.status_.jobs.empty());
    CHECK(view.status_.default_printer.empty());
    CHECK(view.status_.stats.active_jobs == 2);
    CHECK(view.status_.stats.completed_jobs == 17);

    CHECK(state().selection() == SelectionState::FILE_SELECTED);
    CHECK(view.print_enabled_);

    print("1", "Office_Laser");
    CHECK(view.last_message(MessagePanel::ACTION) == "Unknown printer: Office_Laser");
    CHECK(transport.count("/api/print") == 0);

    print("1", "");
    CHECK(transport.count("/api/print") == 1);
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: reconnect cycle updates the indicator",
                 "[session][live]") {
    start_session();
    REQUIRE(view.live_status() == LIVE_STATUS_LIVE);

    stream.drop("connection reset");
    CHECK(view.live_status() == LIVE_STATUS_RECONNECTING);

    stream.open();
    stream.push(push_event(sample_files()));
    CHECK(view.live_status() == LIVE_STATUS_LIVE);
    CHECK(view.files_.size() == 2);

    std::vector<std::string> expected{LIVE_STATUS_LIVE, LIVE_STATUS_RECONNECTING, LIVE_STATUS_LIVE};
    CHECK(view.live_statuses == expected);
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: destruction cancels the live channel",
                 "[session][live]") {
    start_session();
    REQUIRE(stream.active());

    controller->dispatch(SessionCommand::REFRESH);
    size_t messages = view.messages.size();
    controller.reset();

    CHECK_FALSE(stream.active());
    // A reply landing after destruction is delivered to nobody
    REQUIRE(transport.respond("/api/files", 200, {{"files", sample_files()}}));
    CHECK(view.messages.size() == messages);
}

// ============================================================================
// Print flow
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "SessionController: invalid print input never reaches the server",
                 "[session][print]") {
    start_session();
    select("report.pdf");

    SECTION("page 0") {
        command(SessionCommand::SET_PAGE, "0");
        print();
        CHECK(view.last_message(MessagePanel::ACTION) == "Invalid page number.");
    }

    SECTION("page is not a number") {
        command(SessionCommand::SET_PAGE, "two");
        print();
        CHECK(view.last_message(MessagePanel::ACTION) == "Invalid page number.");
    }

    SECTION("copies 100") {
        print("100");
        CHECK(view.last_message(MessagePanel::ACTION) == "Copies must be 1–99.");
    }

    SECTION("copies 0") {
        print("0");
        CHECK(view.last_message(MessagePanel::ACTION) == "Copies must be 1–99.");
    }

    SECTION("unknown printer") {
        print("1", "Basement_Inkjet");
        CHECK(view.last_message(MessagePanel::ACTION) == "Unknown printer: Basement_Inkjet");
    }

    CHECK(view.last_message_is_error(MessagePanel::ACTION));
    CHECK(transport.count("/api/print") == 0);
    CHECK_FALSE(state().print_in_flight);
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: valid print sends exactly one request",
                 "[session][print]") {
    start_session();
    select("report.pdf");
    print("1", "");

    REQUIRE(transport.count("/api/print") == 1);
    const json& body = transport.last("/api/print").body;
    CHECK(body["filename"] == "report.pdf");
    CHECK(body["mode"] == "grayscale");
    CHECK(body["page"] == 1);
    CHECK(body["copies"] == 1);
    CHECK(body["printer"] == "");

    CHECK(state().print_in_flight);
    CHECK_FALSE(view.print_enabled_);
    CHECK(view.last_message(MessagePanel::ACTION) == "Sending job to CUPS…");

    SECTION("a second print while in flight is ignored") {
        print("1", "");
        CHECK(transport.count("/api/print") == 1);
    }

    SECTION("success shows lp output and refreshes status") {
        size_t status_calls = transport.count("/api/status");
        transport.respond("/api/print", 200,
                          {{"ok", true}, {"lp_stdout", "request id is Office_Laser-7 (1 file(s))"}});
        CHECK(view.last_message(MessagePanel::ACTION) ==
              "Queued: request id is Office_Laser-7 (1 file(s))");
        CHECK_FALSE(view.last_message_is_error(MessagePanel::ACTION));
        CHECK(view.print_enabled_);
        CHECK(transport.count("/api/status") == status_calls + 1);
    }

    SECTION("server error re-enables print with the reason") {
        transport.respond("/api/print", 500,
                          {{"ok", false}, {"error", "Printing failed: lp: not accepting jobs"}});
        CHECK(view.last_message(MessagePanel::ACTION) ==
              "Print failed: HTTP 500: Printing failed: lp: not accepting jobs");
        CHECK(view.print_enabled_);
        CHECK_FALSE(state().print_in_flight);
    }
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: empty copies use the configured default",
                 "[session][print]") {
    json config = default_config();
    config["printing"]["default_copies"] = 3;
    start_session(config);
    select("photo.png");
    print("", "Label_Printer");

    REQUIRE(transport.count("/api/print") == 1);
    CHECK(transport.last("/api/print").body["copies"] == 3);
    CHECK(transport.last("/api/print").body["printer"] == "Label_Printer");
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: blank page field prints page 1",
                 "[session][print]") {
    start_session();
    select("report.pdf");

    SECTION("empty") {
        command(SessionCommand::SET_PAGE, "");
    }
    SECTION("whitespace") {
        command(SessionCommand::SET_PAGE, "  ");
    }

    CHECK(contains(view.preview_urls.back(), "page=1&"));
    print("1", "");

    REQUIRE(transport.count("/api/print") == 1);
    CHECK(transport.last("/api/print").body["page"] == 1);
    CHECK(state().print_in_flight);
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: push during a print keeps print disabled",
                 "[session][print][live]") {
    start_session();
    select("report.pdf");
    print();
    REQUIRE(state().print_in_flight);

    stream.push(push_event(sample_files()));
    CHECK_FALSE(view.print_enabled_);
    CHECK(state().selection() == SelectionState::FILE_SELECTED);

    transport.respond("/api/print", 200, {{"ok", true}, {"lp_stdout", ""}});
    CHECK(view.last_message(MessagePanel::ACTION) == "Queued.");
    CHECK(view.print_enabled_);
}

// ============================================================================
// Preview
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "SessionController: every preview request carries a fresh token",
                 "[session][preview]") {
    start_session();
    select("report.pdf");
    command(SessionCommand::SET_MODE, "grayscale");

    REQUIRE(view.preview_urls.size() == 2);
    CHECK(view.preview_urls[0] != view.preview_urls[1]);
    CHECK(without_token(view.preview_urls[0]) == without_token(view.preview_urls[1]));
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: mode and page changes re-derive the preview",
                 "[session][preview]") {
    start_session();
    select("report.pdf");

    command(SessionCommand::SET_MODE, "bw");
    CHECK(contains(view.preview_urls.back(), "mode=bw&page=1&w=720"));
    CHECK(view.mode_ == "bw");

    command(SessionCommand::SET_PAGE, "3");
    CHECK(contains(view.preview_urls.back(), "mode=bw&page=3&w=720"));

    command(SessionCommand::SET_MODE, "sepia");
    CHECK(view.last_message(MessagePanel::ACTION) == "Unknown mode: sepia");
    CHECK(state().mode == "bw");
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: resize bursts coalesce into one fetch",
                 "[session][preview][debounce]") {
    start_session();
    select("report.pdf");
    size_t before = view.preview_urls.size();

    for (int w = 500; w < 1500; w += 100) {
        command(SessionCommand::RESIZE, std::to_string(w));
        scheduler.advance(std::chrono::milliseconds(50));
    }
    CHECK(view.preview_urls.size() == before);

    scheduler.advance(std::chrono::milliseconds(120));
    REQUIRE(view.preview_urls.size() == before + 1);
    // Last width 1400, minus padding
    CHECK(contains(view.preview_urls.back(), "&w=1376&"));
    CHECK(scheduler.pending_timers() == 0);
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: preview failure keeps the selection",
                 "[session][preview]") {
    start_session();
    select("report.pdf");
    std::string first = view.preview_urls.back();
    command(SessionCommand::SET_PAGE, "2");
    std::string current = view.preview_urls.back();

    SECTION("stale failures are ignored") {
        size_t messages = view.messages.size();
        controller->preview_failed(first);
        CHECK(view.messages.size() == messages);
        CHECK(view.preview_shown_);
    }

    SECTION("current failure shows the placeholder") {
        controller->preview_failed(current);
        CHECK_FALSE(view.preview_shown_);
        CHECK(view.last_message(MessagePanel::ACTION) ==
              "Preview failed. (Is the file type supported?)");
        CHECK(state().selection() == SelectionState::FILE_SELECTED);
        CHECK(view.print_enabled_);
    }

    SECTION("load marks the preview visible") {
        controller->preview_loaded(first);
        CHECK_FALSE(state().preview_visible);
        controller->preview_loaded(current);
        CHECK(state().preview_visible);
    }
}

// ============================================================================
// Settings
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "SessionController: saving settings round-trips the config",
                 "[session][settings]") {
    start_session();

    SettingsForm form = view.settings_;
    form.preview_dpi = "300";
    form.airprint_auto_enable = false;
    SessionAction action;
    action.command = SessionCommand::SAVE_CONFIG;
    action.settings = form;
    controller->dispatch(action);

    REQUIRE(transport.count("/api/config") == 2);
    json sent = transport.last("/api/config").body["config"];
    CHECK(sent["printing"]["preview_dpi"] == 300);
    CHECK(sent["airprint"]["auto_enable"] == false);
    CHECK(sent["app"]["port"] == 80);
    CHECK(view.last_message(MessagePanel::SETTINGS) == "Saving…");

    SECTION("accepted save repopulates from the server copy") {
        json saved = validate_config(sent);
        transport.respond("/api/config", 200, {{"ok", true}, {"config", saved}});
        CHECK(view.settings_.preview_dpi == "300");
        CHECK_FALSE(view.settings_.airprint_auto_enable);
        CHECK(view.last_message(MessagePanel::SETTINGS) == "Saved.");
        CHECK(state().config["printing"]["preview_dpi"] == 300);
    }

    SECTION("rejected save is discarded at the next reconciliation") {
        transport.respond("/api/config", 400,
                          {{"ok", false}, {"error", "printing.preview_dpi must be between 72 and 600"}});
        CHECK(view.last_message(MessagePanel::SETTINGS) ==
              "Save failed: HTTP 400: printing.preview_dpi must be between 72 and 600");
        CHECK(state().settings_stale);
        CHECK(state().config["printing"]["preview_dpi"] == 150);

        int renders = view.settings_renders;
        stream.push(push_event(sample_files()));
        CHECK(view.settings_renders == renders + 1);
        CHECK(view.settings_.preview_dpi == "150");
        CHECK_FALSE(state().settings_stale);
    }

    SECTION("save persisted but AirPrint failed") {
        json saved = validate_config(sent);
        transport.respond("/api/config", 500,
                          {{"ok", false}, {"error", "Root helper not found"}, {"config", saved}});
        CHECK(view.last_message(MessagePanel::SETTINGS) ==
              "Saved, but AirPrint refresh failed: HTTP 500: Root helper not found");
        CHECK(state().config["printing"]["preview_dpi"] == 300);
        CHECK_FALSE(state().settings_stale);
    }
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: unparseable numbers are sent as null",
                 "[session][settings]") {
    start_session();

    SessionAction action;
    action.command = SessionCommand::SAVE_CONFIG;
    action.settings = view.settings_;
    action.settings.print_dpi = "lots";
    controller->dispatch(action);

    CHECK(transport.last("/api/config").body["config"]["printing"]["print_dpi"].is_null());
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: save before config load is refused",
                 "[session][settings]") {
    SessionAction action;
    action.command = SessionCommand::SAVE_CONFIG;
    controller->dispatch(action);

    CHECK(view.last_message(MessagePanel::SETTINGS) == "Config not loaded.");
    CHECK(transport.count("/api/config") == 0);
}

// ============================================================================
// Host actions
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "SessionController: host restart needs confirmation",
                 "[session][actions]") {
    start_session();

    SECTION("declined") {
        view.confirm_answer = false;
        controller->dispatch(SessionCommand::RESTART_HOST);
        CHECK(view.questions.size() == 1);
        CHECK(transport.count("/api/restart-host") == 0);
    }

    SECTION("confirmed") {
        controller->dispatch(SessionCommand::RESTART_HOST);
        REQUIRE(transport.count("/api/restart-host") == 1);
        CHECK(view.last_message(MessagePanel::ACTION) == "Restart requested…");
        transport.respond("/api/restart-host", 200, {{"ok", true}, {"output", ""}});
        CHECK(view.last_message(MessagePanel::ACTION) == "Host restart command sent.");
    }
}

TEST_CASE_METHOD(SessionTestFixture, "SessionController: AirPrint refresh reports the outcome",
                 "[session][actions]") {
    start_session();
    controller->dispatch(SessionCommand::ENSURE_AIRPRINT);
    REQUIRE(transport.count("/api/airprint/ensure") == 1);

    SECTION("helper output is shown") {
        transport.respond("/api/airprint/ensure", 200,
                          {{"ok", true}, {"output", "avahi service file updated"}});
        CHECK(view.last_message(MessagePanel::ACTION) == "avahi service file updated");
    }

    SECTION("failure") {
        transport.respond("/api/airprint/ensure", 500,
                          {{"ok", false}, {"error", "Root helper not found at /x"}});
        CHECK(view.last_message(MessagePanel::ACTION) ==
              "AirPrint refresh failed: HTTP 500: Root helper not found at /x");
    }
}

// ============================================================================
// Preferences
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "SessionController: theme preferences", "[session][prefs]") {
    SECTION("config defaults apply when nothing is stored") {
        json config = default_config();
        config["ui"]["default_dark_mode"] = true;
        start_session(config);
        CHECK(view.dark_);
        CHECK_FALSE(view.eink_);
    }

    SECTION("stored choice wins over config defaults") {
        prefs.set(PREF_DARK_MODE, "0");
        prefs.set(PREF_EINK_MODE, "1");
        json config = default_config();
        config["ui"]["default_dark_mode"] = true;
        start_session(config);
        CHECK_FALSE(view.dark_);
        CHECK(view.eink_);
    }

    SECTION("dark and e-ink are mutually exclusive") {
        start_session();
        controller->dispatch(SessionCommand::TOGGLE_DARK);
        CHECK(view.dark_);
        controller->dispatch(SessionCommand::TOGGLE_EINK);
        CHECK(view.eink_);
        CHECK_FALSE(view.dark_);
        CHECK(prefs.get(PREF_DARK_MODE) == std::optional<std::string>("0"));
        CHECK(prefs.get(PREF_EINK_MODE) == std::optional<std::string>("1"));
    }
}

// ============================================================================
// Free helpers
// ============================================================================

TEST_CASE("parse_positive_int: digits only, at least one", "[session][helpers]") {
    CHECK(parse_positive_int("1") == std::optional<int>(1));
    CHECK(parse_positive_int(" 42 ") == std::optional<int>(42));
    CHECK_FALSE(parse_positive_int("0").has_value());
    CHECK_FALSE(parse_positive_int("-3").has_value());
    CHECK_FALSE(parse_positive_int("2.5").has_value());
    CHECK_FALSE(parse_positive_int("").has_value());
    CHECK_FALSE(parse_positive_int("9999999999").has_value());
}

TEST_CASE("describe_failure: HTTP status versus transport error", "[session][helpers]") {
    RestResponse http = make_rest_response(404, R"({"ok":false,"error":"File not found"})");
    CHECK(describe_failure(http) == "HTTP 404: File not found");

    RestResponse plain = make_rest_response(502, "Bad Gateway");
    CHECK(describe_failure(plain) == "HTTP 502: Bad Gateway");

    RestResponse transport;
    transport.error = "Connection refused";
    CHECK(describe_failure(transport) == "Connection refused");
}

TEST_CASE("session commands: names round-trip", "[session][helpers]") {
    for (auto cmd : {SessionCommand::SELECT_FILE, SessionCommand::PRINT, SessionCommand::REFRESH,
                     SessionCommand::REFRESH_STATUS, SessionCommand::SAVE_CONFIG,
                     SessionCommand::RESTART_HOST, SessionCommand::ENSURE_AIRPRINT,
                     SessionCommand::SET_MODE, SessionCommand::SET_PAGE, SessionCommand::RESIZE,
                     SessionCommand::TOGGLE_DARK, SessionCommand::TOGGLE_EINK}) {
        auto parsed = parse_session_command(session_command_name(cmd));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == cmd);
    }
    CHECK_FALSE(parse_session_command("reboot").has_value());
}
