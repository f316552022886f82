// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "event_broadcaster.h"

#include "../test_fixtures.h"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

using namespace printerpal;

namespace {

class FakeChannel : public EventChannel {
  public:
    bool is_open() const override {
        return open;
    }

    bool send(const std::string& event, const std::string& data) override {
        if (throw_on_send) {
            throw std::runtime_error("socket reset");
        }
        events.emplace_back(event, data);
        return accept;
    }

    bool open = true;
    bool accept = true;
    bool throw_on_send = false;
    std::vector<std::pair<std::string, std::string>> events;
};

} // namespace

TEST_CASE("EventBroadcaster: new channel gets an immediate event", "[events]") {
    int builds = 0;
    EventBroadcaster broadcaster([&builds]() {
        ++builds;
        return json{{"ts", 1}, {"n", builds}};
    });

    auto ch = std::make_shared<FakeChannel>();
    broadcaster.add_channel(ch);

    REQUIRE(ch->events.size() == 1);
    CHECK(ch->events[0].first == "status");
    CHECK(json::parse(ch->events[0].second)["n"] == 1);
    CHECK(broadcaster.channel_count() == 1);
}

TEST_CASE("EventBroadcaster: channels that miss the first event are not registered", "[events]") {
    EventBroadcaster broadcaster([]() { return json{{"ts", 1}}; });

    auto closed = std::make_shared<FakeChannel>();
    closed->open = false;
    broadcaster.add_channel(closed);
    CHECK(closed->events.empty());

    auto refusing = std::make_shared<FakeChannel>();
    refusing->accept = false;
    broadcaster.add_channel(refusing);

    auto throwing = std::make_shared<FakeChannel>();
    throwing->throw_on_send = true;
    broadcaster.add_channel(throwing);

    broadcaster.add_channel(nullptr);
    CHECK(broadcaster.channel_count() == 0);
}

TEST_CASE("EventBroadcaster: tick fans out and prunes dead channels", "[events]") {
    EventBroadcaster broadcaster([]() { return json{{"ts", 2}}; });

    auto a = std::make_shared<FakeChannel>();
    auto b = std::make_shared<FakeChannel>();
    auto c = std::make_shared<FakeChannel>();
    broadcaster.add_channel(a);
    broadcaster.add_channel(b);
    broadcaster.add_channel(c);
    REQUIRE(broadcaster.channel_count() == 3);

    CHECK(broadcaster.tick() == 3);
    CHECK(a->events.size() == 2);

    b->open = false;
    c->throw_on_send = true;
    CHECK(broadcaster.tick() == 1);
    CHECK(broadcaster.channel_count() == 1);
    CHECK(a->events.size() == 3);
    CHECK(b->events.size() == 2);

    CHECK(broadcaster.tick() == 1);
}

TEST_CASE("EventBroadcaster: idle tick builds nothing", "[events]") {
    int builds = 0;
    EventBroadcaster broadcaster([&builds]() {
        ++builds;
        return json::object();
    });

    CHECK(broadcaster.tick() == 0);
    CHECK(builds == 0);
}

TEST_CASE("EventBroadcaster: builder failure becomes an error event", "[events]") {
    bool fail = false;
    EventBroadcaster broadcaster([&fail]() -> json {
        if (fail) {
            throw std::runtime_error("lpstat exploded");
        }
        return json{{"ts", 3}};
    });

    auto ch = std::make_shared<FakeChannel>();
    broadcaster.add_channel(ch);

    fail = true;
    CHECK(broadcaster.tick() == 1);
    REQUIRE(ch->events.size() == 2);
    CHECK(ch->events[1].first == "error");
    json err = json::parse(ch->events[1].second);
    CHECK(err["error"] == "lpstat exploded");
    CHECK(err["ts"].is_number_integer());
    CHECK(broadcaster.channel_count() == 1);
}

TEST_CASE_METHOD(ServerTestFixture, "EventBroadcaster: server payload carries files and status",
                 "[events][api]") {
    write_upload("report.pdf", "%PDF-1.4");
    EventBroadcaster broadcaster([this]() { return api().event_payload(); });

    auto ch = std::make_shared<FakeChannel>();
    broadcaster.add_channel(ch);
    REQUIRE(ch->events.size() == 1);

    json payload = json::parse(ch->events[0].second);
    CHECK(payload["ts"].is_number_integer());
    REQUIRE(payload["files"].size() == 1);
    CHECK(payload["files"][0]["name"] == "report.pdf");
    CHECK(payload["status"]["cups_available"] == true);
    CHECK(payload["status"]["default_printer"] == "Office_Laser");
}
