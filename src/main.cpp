// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "airprint_helper.h"
#include "cli_args.h"
#include "command_runner.h"
#include "config.h"
#include "document_processor.h"
#include "event_broadcaster.h"
#include "logging_init.h"
#include "print_backend.h"
#include "printerpal_api.h"
#include "printerpal_error.h"
#include "printerpal_server.h"
#include "runtime_config.h"
#include "status_aggregator.h"
#include "upload_store.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

#ifndef PRINTERPAL_VERSION
#define PRINTERPAL_VERSION "0.0.0"
#endif

using namespace printerpal;

namespace {

std::atomic<bool> g_quit{false};

void on_signal(int) {
    g_quit = true;
}

logging::LogConfig build_log_config(const Config& config, const CliArgs& args) {
    logging::LogConfig log_config;
    log_config.level = args.verbosity > 0
                           ? logging::level_from_verbosity(args.verbosity)
                           : logging::parse_log_level(
                                 config.get<std::string>("/logging/level", "info"));
    log_config.target = logging::parse_log_target(
        args.log_dest.empty() ? config.get<std::string>("/logging/target", "auto")
                              : args.log_dest);
    log_config.file_path =
        args.log_file.empty() ? config.get<std::string>("/logging/file", "") : args.log_file;
    return log_config;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    switch (parse_cli_args(argc, argv, args)) {
    case CliParseResult::EXIT:
        return 0;
    case CliParseResult::ERROR:
        return 2;
    case CliParseResult::RUN:
        break;
    }

    // Console logging until the config file has had its say
    logging::LogConfig early;
    early.level = args.verbosity > 0 ? logging::level_from_verbosity(args.verbosity)
                                     : spdlog::level::info;
    early.target = logging::LogTarget::Console;
    logging::init(early);

    get_mutable_runtime_config()->apply_environment();
    apply_cli_overrides(args);
    const RuntimeConfig& runtime = get_runtime_config();

    if (runtime.test_mode) {
        print_test_mode_banner();
    }

    Config* config = Config::get_instance();
    try {
        config->init(runtime.config_path);
    } catch (const PrinterPalException& e) {
        spdlog::critical("[Main] Invalid configuration {}: {}", runtime.config_path, e.what());
        return 1;
    }

    logging::init(build_log_config(*config, args));
    spdlog::info("[Main] PrinterPal {} starting", PRINTERPAL_VERSION);

    auto runner = std::make_shared<CommandRunner>();
    std::shared_ptr<PrintBackend> backend =
        PrintBackend::create(runner, runtime.printers_conf_paths);
    auto airprint = std::make_shared<AirPrintHelper>(runner, runtime.root_helper);
    auto aggregator = std::make_shared<StatusAggregator>(
        backend, airprint, [config]() { return config->get<bool>("/airprint/auto_enable", true); });

    auto uploads = std::make_shared<UploadStore>(runtime.upload_dir);
    try {
        uploads->ensure_directory();
    } catch (const PrinterPalException& e) {
        spdlog::critical("[Main] {}", e.what());
        return 1;
    }
    auto documents = std::make_shared<DocumentProcessor>(runner, runtime.cache_dir);

    auto api = std::make_shared<PrinterPalApi>(*config, backend, aggregator, uploads, documents,
                                               airprint);
    auto broadcaster = std::make_shared<EventBroadcaster>([api]() { return api->event_payload(); });

    // Best effort: make printers discoverable before the first client shows up
    if (config->get<bool>("/airprint/auto_enable", true)) {
        try {
            HelperResult result = airprint->ensure_airprint();
            if (!result.ok) {
                spdlog::warn("[Main] Startup AirPrint ensure failed: {}", result.output);
            }
        } catch (const PrinterPalException& e) {
            spdlog::warn("[Main] Startup AirPrint ensure skipped: {}", e.what());
        }
    }

    std::string host = runtime.host_override.empty()
                           ? config->get<std::string>("/app/host", "0.0.0.0")
                           : runtime.host_override;
    int port =
        runtime.port_override > 0 ? runtime.port_override : config->get<int>("/app/port", 80);

    PrinterPalServer server(api, broadcaster);
    broadcaster->start();
    if (server.start(host, port, args.threads) != 0) {
        spdlog::critical("[Main] Could not listen on {}:{}", host, port);
        broadcaster->stop();
        return 1;
    }
    spdlog::info("[Main] Print backend: {}", backend->get_backend_name());

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_quit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("[Main] Shutting down");
    server.stop();
    broadcaster->stop();
    airprint->wait_idle();
    spdlog::shutdown();
    return 0;
}
