// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file printerpal_console.cpp
 * @brief Terminal client for printerpal-server
 *
 * Usage: printerpal-console [options] [base_url]
 * Example: printerpal-console http://printerpal.local
 *
 * Runs a SessionController against a live server: pulls files, status and
 * config, follows the /events push channel and accepts the session commands
 * (select-file, print, save-config, ...) as typed lines.
 */

#include "api_transport.h"
#include "format_utils.h"
#include "logging_init.h"
#include "preference_store.h"
#include "scheduler.h"
#include "session_controller.h"
#include "status_stream.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdio>
#include <cstring>
#include <future>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "hv/EventLoopThread.h"
#include "hv/requests.h"

using namespace printerpal;

// Global flag for color support (disabled via --no-color)
static bool use_colors = true;

namespace {

const char* color(const char* code) {
    return use_colors ? code : "";
}

constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* RED = "\033[31m";
constexpr const char* GREEN = "\033[32m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* CYAN = "\033[36m";

/**
 * @brief SessionView that prints to the terminal
 *
 * Output from the loop thread and the prompt share stdout, so every render
 * takes the same mutex.
 */
class ConsoleView : public SessionView {
  public:
    using PreviewFetcher = std::function<void(const std::string&)>;

    void set_preview_fetcher(PreviewFetcher fetcher) {
        fetcher_ = std::move(fetcher);
    }

    SettingsForm last_settings() const {
        std::lock_guard<std::mutex> lock(out_mutex_);
        return settings_;
    }

    void render_files(const std::vector<UploadedFile>& files,
                      const std::string& selected) override {
        std::lock_guard<std::mutex> lock(out_mutex_);
        printf("\n%sFiles%s\n", color(BOLD), color(RESET));
        if (files.empty()) {
            printf("  %sNo uploads yet.%s\n", color(DIM), color(RESET));
            return;
        }
        for (const auto& f : files) {
            bool is_sel = f.name == selected;
            printf("  %s%s %-40s%s %10s  %s\n", is_sel ? color(CYAN) : "", is_sel ? ">" : " ",
                   f.name.c_str(), color(RESET), f.size_h.c_str(),
                   format::format_timestamp(f.mtime).c_str());
        }
    }

    void render_status(const StatusSnapshot& status,
                       const std::string& preferred_printer) override {
        std::lock_guard<std::mutex> lock(out_mutex_);
        // Counters mean nothing until CUPS has answered once
        stats_known_ = stats_known_ || status.cups_available;
        printf("\n%sCUPS%s %s%s%s  default: %s  active: %s  completed: %s\n", color(BOLD),
               color(RESET), status.cups_available ? color(GREEN) : color(RED),
               status.cups_available ? "Available" : "Not available", color(RESET),
               status.default_printer.empty() ? format::UNAVAILABLE
                                              : status.default_printer.c_str(),
               format::format_count_or_unavailable(status.stats.active_jobs, stats_known_)
                   .c_str(),
               format::format_count_or_unavailable(status.stats.completed_jobs, stats_known_)
                   .c_str());

        for (const auto& p : status.printers) {
            printf("  %s%s • %s%s%s\n", p.name == preferred_printer ? "* " : "  ", p.name.c_str(),
                   p.state.c_str(), p.accepting && !*p.accepting ? " • not accepting" : "",
                   p.is_default ? " (default)" : "");
        }
        if (status.jobs.empty()) {
            printf("  %sQueue is empty.%s\n", color(DIM), color(RESET));
        }
        for (const auto& j : status.jobs) {
            printf("  %s\n", j.raw.empty() ? std::to_string(j.job_id).c_str() : j.raw.c_str());
        }
    }

    void render_settings(const SettingsForm& form) override {
        std::lock_guard<std::mutex> lock(out_mutex_);
        settings_ = form;
        printf("\n%sSettings%s default_printer=%s preview_dpi=%s print_dpi=%s "
               "bw_threshold=%s max_pages=%s airprint=%s\n",
               color(BOLD), color(RESET),
               form.default_printer.empty() ? "(system)" : form.default_printer.c_str(),
               form.preview_dpi.c_str(), form.print_dpi.c_str(), form.bw_threshold.c_str(),
               form.max_pdf_pages.c_str(), form.airprint_auto_enable ? "on" : "off");
    }

    void render_mode(const std::string& mode) override {
        std::lock_guard<std::mutex> lock(out_mutex_);
        printf("Mode: %s\n", mode.c_str());
    }

    void set_print_enabled(bool enabled) override {
        print_enabled_ = enabled;
    }

    void show_preview(const std::string& url) override {
        {
            std::lock_guard<std::mutex> lock(out_mutex_);
            printf("%sPreview%s %s\n", color(DIM), color(RESET), url.c_str());
        }
        if (fetcher_) {
            fetcher_(url);
        }
    }

    void hide_preview() override {}

    void show_message(MessagePanel panel, const std::string& text, bool is_error) override {
        if (text.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(out_mutex_);
        printf("%s[%s]%s %s%s%s\n", color(DIM),
               panel == MessagePanel::SETTINGS ? "settings" : "action", color(RESET),
               is_error ? color(RED) : color(GREEN), text.c_str(), color(RESET));
    }

    void set_live_status(const std::string& text) override {
        std::lock_guard<std::mutex> lock(out_mutex_);
        printf("%s── %s ──%s\n", color(YELLOW), text.c_str(), color(RESET));
    }

    void apply_theme(bool dark, bool eink) override {
        spdlog::debug("[Console] theme dark={} eink={}", dark, eink);
    }

    bool confirm(const std::string& question) override {
        {
            std::lock_guard<std::mutex> lock(out_mutex_);
            printf("%s [y/N] ", question.c_str());
            fflush(stdout);
        }
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return false;
        }
        return answer == "y" || answer == "Y" || answer == "yes";
    }

    bool print_enabled() const {
        return print_enabled_;
    }

  private:
    mutable std::mutex out_mutex_;
    SettingsForm settings_;
    bool stats_known_ = false;
    PreviewFetcher fetcher_;
    std::atomic<bool> print_enabled_{false};
};

void print_usage(const char* program_name) {
    printf("Usage: %s [options] [base_url]\n", program_name);
    printf("Options:\n");
    printf("  --token <token>   Send X-PrinterPal-Token with every request\n");
    printf("  --no-color        Disable ANSI colors\n");
    printf("  -v, --verbose     Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  -h, --help        Show this help message\n");
    printf("\nDefault base_url: http://127.0.0.1\n");
}

void print_commands() {
    printf("Commands:\n");
    printf("  select-file <name>        Select an upload\n");
    printf("  print [copies] [printer]  Print the selected file\n");
    printf("  set-mode <mode>           raw, grayscale, bw, dither, outline\n");
    printf("  set-page <n>              Preview/print page\n");
    printf("  resize <width>            Preview container width in pixels\n");
    printf("  refresh | refresh-status  Re-pull files or status\n");
    printf("  save-config key=value...  default_printer, preview_dpi, print_dpi,\n");
    printf("                            bw_threshold, max_pages, airprint=on|off\n");
    printf("  ensure-airprint | restart-host\n");
    printf("  toggle-dark | toggle-eink\n");
    printf("  help | quit\n");
}

/// Parse one console line into an action; false (with message) if malformed
bool parse_line(const std::string& line, const ConsoleView& view, SessionAction& action) {
    std::istringstream in(line);
    std::string word;
    in >> word;

    auto command = parse_session_command(word);
    if (!command) {
        printf("Unknown command: %s (try 'help')\n", word.c_str());
        return false;
    }
    action.command = *command;

    std::vector<std::string> rest;
    std::string token;
    while (in >> token) {
        rest.push_back(token);
    }

    switch (*command) {
    case SessionCommand::SELECT_FILE:
    case SessionCommand::SET_MODE:
    case SessionCommand::SET_PAGE:
    case SessionCommand::RESIZE: {
        if (rest.empty()) {
            printf("%s requires an argument\n", word.c_str());
            return false;
        }
        // File names may contain spaces
        std::string value = line.substr(line.find(rest.front()));
        while (!value.empty() && (value.back() == ' ' || value.back() == '\r')) {
            value.pop_back();
        }
        action.value = value;
        break;
    }
    case SessionCommand::PRINT:
        if (!rest.empty()) {
            action.copies = rest[0];
        }
        if (rest.size() > 1) {
            action.printer = rest[1];
        }
        break;
    case SessionCommand::SAVE_CONFIG:
        action.settings = view.last_settings();
        for (const auto& kv : rest) {
            size_t eq = kv.find('=');
            if (eq == std::string::npos) {
                printf("Expected key=value, got: %s\n", kv.c_str());
                return false;
            }
            std::string key = kv.substr(0, eq);
            std::string value = kv.substr(eq + 1);
            if (key == "default_printer") {
                action.settings.default_printer = value;
            } else if (key == "preview_dpi") {
                action.settings.preview_dpi = value;
            } else if (key == "print_dpi") {
                action.settings.print_dpi = value;
            } else if (key == "bw_threshold") {
                action.settings.bw_threshold = value;
            } else if (key == "max_pages") {
                action.settings.max_pdf_pages = value;
            } else if (key == "airprint") {
                action.settings.airprint_auto_enable = value == "on" || value == "1" ||
                                                       value == "true";
            } else {
                printf("Unknown setting: %s\n", key.c_str());
                return false;
            }
        }
        break;
    default:
        break;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string base_url = "http://127.0.0.1";
    std::string auth_token;
    int verbosity = 0;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--token") == 0 && i + 1 < argc) {
            auth_token = argv[++i];
        } else if (strcmp(argv[i], "--no-color") == 0) {
            use_colors = false;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbosity++;
        } else if (strcmp(argv[i], "-vv") == 0) {
            verbosity += 2;
        } else if (strcmp(argv[i], "-vvv") == 0) {
            verbosity += 3;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            base_url = argv[i];
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            print_usage(argv[0]);
            return 2;
        }
    }

    logging::LogConfig log_config;
    log_config.level = logging::level_from_verbosity(verbosity);
    log_config.target = logging::LogTarget::Console;
    logging::init(log_config);

    hv::EventLoopThread loop_thread;
    loop_thread.start();

    EventLoopScheduler scheduler(loop_thread.loop());
    HttpApiTransport transport(base_url, scheduler, auth_token);
    SseStatusStream stream(transport.url_for("/events"), scheduler);
    JsonFilePreferenceStore preferences(JsonFilePreferenceStore::default_path());
    ConsoleView view;

    SessionController controller(transport, stream, scheduler, preferences, view);

    view.set_preview_fetcher([&scheduler, &controller](const std::string& url) {
        auto req = std::make_shared<HttpRequest>();
        req->method = HTTP_GET;
        req->url = url;
        req->timeout = 60;
        requests::async(req, [&scheduler, &controller, url](const HttpResponsePtr& resp) {
            bool ok = resp && resp->status_code == HTTP_STATUS_OK &&
                      resp->GetHeader("Content-Type").find("image/png") != std::string::npos;
            scheduler.post([&controller, url, ok]() {
                if (ok) {
                    controller.preview_loaded(url);
                } else {
                    controller.preview_failed(url);
                }
            });
        });
    });

    // Everything that touches the controller runs on the loop thread
    auto run_on_loop = [&scheduler](std::function<void()> fn) {
        auto done = std::make_shared<std::promise<void>>();
        std::future<void> finished = done->get_future();
        scheduler.post([fn = std::move(fn), done]() {
            fn();
            done->set_value();
        });
        finished.wait();
    };

    printf("%sPrinterPal console%s → %s\n", color(BOLD), color(RESET), base_url.c_str());
    print_commands();
    run_on_loop([&controller]() { controller.start(); });

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        if (line == "quit" || line == "exit") {
            break;
        }
        if (line == "help") {
            print_commands();
            continue;
        }

        SessionAction action;
        if (!parse_line(line, view, action)) {
            continue;
        }
        if (action.command == SessionCommand::PRINT && !view.print_enabled()) {
            printf("Select a file first (or wait for the current job to be sent).\n");
            continue;
        }
        run_on_loop([&controller, action]() { controller.dispatch(action); });
    }

    // Controller teardown must not race a pending loop callback
    run_on_loop([]() {});
    loop_thread.stop();
    loop_thread.join();
    spdlog::shutdown();
    return 0;
}
