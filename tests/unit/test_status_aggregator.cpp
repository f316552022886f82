// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "airprint_helper.h"
#include "print_backend_cups.h"
#include "print_backend_mock.h"
#include "printerpal_error.h"
#include "status_aggregator.h"

#include "../test_fixtures.h"

#include <atomic>

#include <catch2/catch_test_macros.hpp>

using namespace printerpal;

namespace {

/// Counts ensure runs instead of invoking sudo
class CountingAirPrint : public AirPrintHelper {
  public:
    explicit CountingAirPrint(std::shared_ptr<CommandRunner> runner)
        : AirPrintHelper(std::move(runner), "/nonexistent/printerpal-root-helper") {}

    ~CountingAirPrint() override {
        wait_idle();
    }

    HelperResult ensure_airprint(std::chrono::milliseconds /*timeout*/) override {
        ensures++;
        HelperResult r;
        r.ok = true;
        return r;
    }

    std::atomic<int> ensures{0};
};

} // namespace

// ============================================================================
// Healthy scheduler
// ============================================================================

TEST_CASE("StatusAggregator: snapshot of a running scheduler", "[status]") {
    auto backend = std::make_shared<PrintBackendMock>();
    StatusAggregator aggregator(backend);

    PrintJobOptions opts;
    opts.title = "PrinterPal: a.pdf";
    backend->submit("/tmp/a.pdf", opts);

    StatusSnapshot s = aggregator.snapshot();
    CHECK(s.cups_available);
    CHECK(s.scheduler.running);
    CHECK(s.default_printer == "Office_Laser");
    CHECK(s.default_printer_display == "Office Laser (Mock)");
    CHECK(s.default_printer_label == "Office Laser (Mock) (default)");
    CHECK(s.printers.size() == 2);
    CHECK(s.jobs.size() == 1);
    CHECK(s.stats.active_jobs == 1);
    CHECK_FALSE(s.airprint_enabled);

    CHECK(aggregator.last_known_stats().active_jobs == 1);
    CHECK(aggregator.cups_available());
}

TEST_CASE("StatusAggregator: no default printer leaves the labels empty", "[status]") {
    auto backend = std::make_shared<PrintBackendMock>();
    PrinterInfo p;
    p.name = "Solo";
    p.state = "idle";
    backend->set_printers({p}, "");

    StatusSnapshot s = StatusAggregator(backend).snapshot();
    CHECK(s.cups_available);
    CHECK(s.default_printer.empty());
    CHECK(s.default_printer_label.empty());
}

// ============================================================================
// Degraded scheduler
// ============================================================================

TEST_CASE("StatusAggregator: stopped scheduler keeps last known stats", "[status]") {
    auto backend = std::make_shared<PrintBackendMock>();
    StatusAggregator aggregator(backend);

    PrintJobOptions opts;
    opts.title = "PrinterPal: a.pdf";
    backend->submit("/tmp/a.pdf", opts);
    backend->submit("/tmp/a.pdf", opts);
    REQUIRE(aggregator.snapshot().stats.active_jobs == 2);

    backend->set_available(false);
    StatusSnapshot s = aggregator.snapshot();
    CHECK_FALSE(s.cups_available);
    CHECK_FALSE(s.scheduler.running);
    CHECK(s.printers.empty());
    CHECK(s.jobs.empty());
    CHECK(s.default_printer.empty());
    CHECK(s.stats.active_jobs == 2);
    CHECK_FALSE(aggregator.cups_available());
}

TEST_CASE("StatusAggregator: query failure after a healthy probe is reported unavailable",
          "[status]") {
    auto runner = std::make_shared<ScriptedCommandRunner>();
    runner->script("lpstat", [](const std::vector<std::string>& argv) {
        if (argv.at(1) == "-r") {
            return ScriptedCommandRunner::ok("scheduler is running\n");
        }
        if (argv.at(1) == "-d") {
            return ScriptedCommandRunner::ok("system default destination: Office\n");
        }
        throw PrinterPalException(
            PrinterPalError::timeout("Command timed out after 6.0s: lpstat " + argv.at(1)));
    });
    auto backend = std::make_shared<PrintBackendCups>(runner, std::vector<std::string>{});
    StatusAggregator aggregator(backend);

    StatusSnapshot s = aggregator.snapshot();
    CHECK_FALSE(s.cups_available);
    CHECK(s.scheduler.error == "Command timed out after 6.0s: lpstat -p");
    CHECK(s.printers.empty());
    CHECK(s.stats.active_jobs == 0);
}

// ============================================================================
// AirPrint
// ============================================================================

TEST_CASE("StatusAggregator: AirPrint auto-ensure follows the policy", "[status][airprint]") {
    auto backend = std::make_shared<PrintBackendMock>();
    auto airprint = std::make_shared<CountingAirPrint>(std::make_shared<ScriptedCommandRunner>());
    bool enabled = true;
    StatusAggregator aggregator(backend, airprint, [&enabled]() { return enabled; });

    SECTION("enabled: one run per printer set") {
        CHECK(aggregator.snapshot().airprint_enabled);
        airprint->wait_idle();
        CHECK(airprint->ensures.load() == 1);

        aggregator.snapshot();
        airprint->wait_idle();
        CHECK(airprint->ensures.load() == 1);

        PrinterInfo extra;
        extra.name = "Garage";
        extra.state = "idle";
        backend->set_printers({extra}, "Garage");
        aggregator.snapshot();
        airprint->wait_idle();
        CHECK(airprint->ensures.load() == 2);
    }

    SECTION("disabled: never runs") {
        enabled = false;
        CHECK_FALSE(aggregator.snapshot().airprint_enabled);
        airprint->wait_idle();
        CHECK(airprint->ensures.load() == 0);
    }

    SECTION("unavailable scheduler: never runs") {
        backend->set_available(false);
        StatusSnapshot s = aggregator.snapshot();
        CHECK(s.airprint_enabled);
        airprint->wait_idle();
        CHECK(airprint->ensures.load() == 0);
    }
}
