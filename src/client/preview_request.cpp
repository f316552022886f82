// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "preview_request.h"

#include <algorithm>
#include <chrono>

#include "hv/hurl.h"

namespace printerpal {

int preview_width_for_container(int container_width) {
    return std::clamp(container_width - PREVIEW_CONTAINER_PADDING, PREVIEW_MIN_WIDTH,
                      PREVIEW_MAX_WIDTH);
}

std::string preview_url(const PreviewKey& key, const std::string& token) {
    std::string url = "/api/preview/" + HUrl::escape(key.filename);
    url += "?mode=" + HUrl::escape(key.mode);
    url += "&page=" + std::to_string(key.page);
    url += "&w=" + std::to_string(key.width);
    url += "&_=" + HUrl::escape(token);
    return url;
}

std::string PreviewTokenSource::next() {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    return std::to_string(now_ms) + "-" + std::to_string(++sequence_);
}

} // namespace printerpal
