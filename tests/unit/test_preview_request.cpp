// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "preview_request.h"

#include <set>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace printerpal;

TEST_CASE("preview_width_for_container: padding and clamping", "[preview]") {
    CHECK(preview_width_for_container(744) == 720);
    CHECK(preview_width_for_container(100) == PREVIEW_MIN_WIDTH);
    CHECK(preview_width_for_container(344) == 320);
    CHECK(preview_width_for_container(1424) == 1400);
    CHECK(preview_width_for_container(3000) == PREVIEW_MAX_WIDTH);
}

TEST_CASE("preview_url: query layout", "[preview]") {
    PreviewKey key;
    key.filename = "report.pdf";
    key.mode = "dither";
    key.page = 4;
    key.width = 640;

    CHECK(preview_url(key, "17-3") == "/api/preview/report.pdf?mode=dither&page=4&w=640&_=17-3");
}

TEST_CASE("preview_url: filenames are percent-encoded", "[preview]") {
    PreviewKey key;
    key.filename = "q3 report#2.pdf";
    key.mode = "raw";

    std::string url = preview_url(key, "t");
    CHECK(url.find("/api/preview/q3%20report%232.pdf?") == 0);
}

TEST_CASE("PreviewKey: equality covers every field", "[preview]") {
    PreviewKey a{"a.pdf", "bw", 1, 720};
    PreviewKey b = a;
    CHECK(a == b);

    b.width = 721;
    CHECK(a != b);
    b = a;
    b.page = 2;
    CHECK(a != b);
    b = a;
    b.mode = "raw";
    CHECK(a != b);
}

TEST_CASE("PreviewTokenSource: tokens never repeat", "[preview]") {
    PreviewTokenSource source;
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        CHECK(seen.insert(source.next()).second);
    }
}
