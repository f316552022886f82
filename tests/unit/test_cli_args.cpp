// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for printerpal-server command-line parsing
 */

#include "cli_args.h"
#include "runtime_config.h"

#include <cstdlib>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace printerpal;

namespace {

CliParseResult parse(std::vector<std::string> args, CliArgs& out) {
    args.insert(args.begin(), "printerpal-server");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    return parse_cli_args(static_cast<int>(args.size()), argv.data(), out);
}

} // namespace

// ============================================================================
// parse_cli_args() tests
// ============================================================================

TEST_CASE("parse_cli_args: no arguments runs with defaults", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({}, args) == CliParseResult::RUN);
    CHECK(args.host.empty());
    CHECK(args.port == 0);
    CHECK(args.threads == 4);
    CHECK(args.verbosity == 0);
    CHECK_FALSE(args.test_mode);
}

TEST_CASE("parse_cli_args: server options", "[cli_args]") {
    SECTION("separate values") {
        CliArgs args;
        REQUIRE(parse({"-H", "127.0.0.1", "-p", "8080", "-c", "/tmp/pp.json", "--upload-dir",
                       "/tmp/up", "--cache-dir", "/tmp/cache", "--threads", "8", "--test"},
                      args) == CliParseResult::RUN);
        CHECK(args.host == "127.0.0.1");
        CHECK(args.port == 8080);
        CHECK(args.config_path == "/tmp/pp.json");
        CHECK(args.upload_dir == "/tmp/up");
        CHECK(args.cache_dir == "/tmp/cache");
        CHECK(args.threads == 8);
        CHECK(args.test_mode);
    }

    SECTION("--name=value form") {
        CliArgs args;
        REQUIRE(parse({"--port=9000", "--host=::1", "--config=/etc/pp.json"}, args) ==
                CliParseResult::RUN);
        CHECK(args.port == 9000);
        CHECK(args.host == "::1");
        CHECK(args.config_path == "/etc/pp.json");
    }
}

TEST_CASE("parse_cli_args: numeric validation", "[cli_args]") {
    CliArgs args;
    CHECK(parse({"--port", "0"}, args) == CliParseResult::ERROR);
    CHECK(parse({"--port", "65536"}, args) == CliParseResult::ERROR);
    CHECK(parse({"--port", "80x"}, args) == CliParseResult::ERROR);
    CHECK(parse({"--threads", "0"}, args) == CliParseResult::ERROR);
    CHECK(parse({"--threads", "65"}, args) == CliParseResult::ERROR);
    CHECK(parse({"--port"}, args) == CliParseResult::ERROR);
}

TEST_CASE("parse_cli_args: verbosity", "[cli_args][logging]") {
    SECTION("-v") {
        CliArgs args;
        REQUIRE(parse({"-v"}, args) == CliParseResult::RUN);
        CHECK(args.verbosity == 1);
    }

    SECTION("-vvv") {
        CliArgs args;
        REQUIRE(parse({"-vvv"}, args) == CliParseResult::RUN);
        CHECK(args.verbosity == 3);
    }

    SECTION("repeated flags accumulate") {
        CliArgs args;
        REQUIRE(parse({"-v", "--verbose", "-vv"}, args) == CliParseResult::RUN);
        CHECK(args.verbosity == 4);
    }

    SECTION("-vx is rejected") {
        CliArgs args;
        CHECK(parse({"-vx"}, args) == CliParseResult::ERROR);
    }
}

TEST_CASE("parse_cli_args: log destination", "[cli_args][logging]") {
    SECTION("valid destinations") {
        for (const char* dest : {"auto", "console", "syslog", "file"}) {
            CliArgs args;
            CHECK(parse({"--log-dest", dest}, args) == CliParseResult::RUN);
            CHECK(args.log_dest == dest);
        }
    }

    SECTION("invalid destination") {
        CliArgs args;
        CHECK(parse({"--log-dest", "journal"}, args) == CliParseResult::ERROR);
    }

    SECTION("--log-file with file destination") {
        CliArgs args;
        REQUIRE(parse({"--log-dest=file", "--log-file", "/tmp/pp.log"}, args) ==
                CliParseResult::RUN);
        CHECK(args.log_file == "/tmp/pp.log");
    }

    SECTION("--log-file with another destination") {
        CliArgs args;
        CHECK(parse({"--log-dest", "syslog", "--log-file", "/tmp/pp.log"}, args) ==
              CliParseResult::ERROR);
    }
}

TEST_CASE("parse_cli_args: help, version and unknown flags", "[cli_args]") {
    SECTION("--help") {
        CliArgs args;
        CHECK(parse({"--help"}, args) == CliParseResult::EXIT);
        CHECK(args.show_help);
    }

    SECTION("-V") {
        CliArgs args;
        CHECK(parse({"-V"}, args) == CliParseResult::EXIT);
        CHECK(args.show_version);
    }

    SECTION("unknown") {
        CliArgs args;
        CHECK(parse({"--frobnicate"}, args) == CliParseResult::ERROR);
    }
}

// ============================================================================
// RuntimeConfig overrides
// ============================================================================

TEST_CASE("apply_cli_overrides: flags land in the runtime config", "[cli_args][runtime_config]") {
    RuntimeConfig saved = get_runtime_config();

    CliArgs args;
    args.test_mode = true;
    args.config_path = "/tmp/pp.json";
    args.upload_dir = "/tmp/up";
    args.port = 8631;
    apply_cli_overrides(args);

    const RuntimeConfig& rc = get_runtime_config();
    CHECK(rc.should_mock_cups());
    CHECK(rc.config_path == "/tmp/pp.json");
    CHECK(rc.upload_dir == "/tmp/up");
    CHECK(rc.cache_dir == saved.cache_dir);
    CHECK(rc.host_override == saved.host_override);
    CHECK(rc.port_override == 8631);

    *get_mutable_runtime_config() = saved;
}

TEST_CASE("RuntimeConfig: environment overrides", "[runtime_config]") {
    setenv("PRINTERPAL_UPLOAD_DIR", "/srv/uploads", 1);
    setenv("PRINTERPAL_ROOT_HELPER", "/opt/pp/root-helper", 1);
    setenv("PRINTERPAL_PORT", "8632", 1);

    RuntimeConfig rc;
    rc.apply_environment();
    CHECK(rc.upload_dir == "/srv/uploads");
    CHECK(rc.root_helper == "/opt/pp/root-helper");
    CHECK(rc.port_override == 8632);
    CHECK(rc.config_path == "/etc/printerpal/config.json");

    SECTION("invalid port is ignored") {
        setenv("PRINTERPAL_PORT", "http", 1);
        RuntimeConfig other;
        other.apply_environment();
        CHECK(other.port_override == 0);
    }

    unsetenv("PRINTERPAL_UPLOAD_DIR");
    unsetenv("PRINTERPAL_ROOT_HELPER");
    unsetenv("PRINTERPAL_PORT");
}
