// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printerpal_types.h"

#include <catch2/catch_test_macros.hpp>

using namespace printerpal;

TEST_CASE("PrinterInfo: unknown fields serialize as null", "[types]") {
    PrinterInfo p;
    p.name = "Office";
    p.state = "idle";

    json j = p.to_json();
    CHECK(j["accepting"].is_null());
    CHECK(j["display_name"].is_null());

    p.accepting = false;
    p.display_name = "Front Office";
    j = p.to_json();
    CHECK(j["accepting"] == false);
    CHECK(j["display_name"] == "Front Office");
}

TEST_CASE("StatusSnapshot: wire layout", "[types]") {
    StatusSnapshot s;
    s.cups_available = true;
    s.scheduler.running = true;
    s.scheduler.raw = "scheduler is running";
    s.default_printer = "Office";
    s.airprint_enabled = true;
    s.stats.active_jobs = 2;

    json j = s.to_json();
    CHECK(j["scheduler"]["cups_scheduler_running"] == true);
    CHECK_FALSE(j["scheduler"].contains("error"));
    CHECK(j["airprint"]["enabled"] == true);
    CHECK(j["stats"]["active_jobs"] == 2);
    CHECK(j["printers"].is_array());
    CHECK(j["jobs"].is_array());
}

TEST_CASE("StatusSnapshot: from_json tolerates partial and mistyped input", "[types]") {
    json j = {{"cups_available", "yes"},
              {"default_printer", nullptr},
              {"printers", {{{"name", "A"}, {"state", "busy"}, {"accepting", true}}}},
              {"jobs", "none"},
              {"scheduler", {{"cups_scheduler_running", true}, {"error", "slow"}}}};

    StatusSnapshot s = StatusSnapshot::from_json(j);
    CHECK_FALSE(s.cups_available);
    CHECK(s.default_printer.empty());
    REQUIRE(s.printers.size() == 1);
    CHECK(s.printers[0].accepting == std::optional<bool>(true));
    CHECK_FALSE(s.printers[0].display_name.has_value());
    CHECK(s.jobs.empty());
    CHECK(s.scheduler.running);
    CHECK(s.scheduler.error == "slow");

    CHECK(s.has_printer("A"));
    CHECK_FALSE(s.has_printer("B"));
}

TEST_CASE("Print modes", "[types]") {
    for (const auto& m : print_modes()) {
        CHECK(is_valid_print_mode(m));
    }
    CHECK_FALSE(is_valid_print_mode("Grayscale"));
    CHECK_FALSE(is_valid_print_mode(""));
}

TEST_CASE("PrintRequest: all fields are sent", "[types]") {
    PrintRequest req;
    req.filename = "report.pdf";
    req.mode = "grayscale";

    CHECK(req.to_json() == json{{"filename", "report.pdf"},
                                {"mode", "grayscale"},
                                {"printer", ""},
                                {"copies", 1},
                                {"page", 1}});
}

TEST_CASE("make_status_event: combined payload", "[types]") {
    UploadedFile f;
    f.name = "a.pdf";
    f.size = 1536;
    f.size_h = "1.5 KB";
    f.mtime = 1700000000;

    json ev = make_status_event(1700000100, {f}, StatusSnapshot{});
    CHECK(ev["ts"] == 1700000100);
    REQUIRE(ev["files"].size() == 1);
    CHECK(ev["files"][0] == json{{"name", "a.pdf"}, {"size", 1536}, {"size_h", "1.5 KB"},
                                 {"mtime", 1700000000}});
    CHECK(ev["status"]["cups_available"] == false);
}
