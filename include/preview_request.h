// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace printerpal {

/// Preview width limits in CSS pixels
constexpr int PREVIEW_MIN_WIDTH = 320;
constexpr int PREVIEW_MAX_WIDTH = 1400;
/// Horizontal padding of the preview container
constexpr int PREVIEW_CONTAINER_PADDING = 24;

/**
 * @brief What a preview shows; two requests with equal keys differ only in
 *        their cache-busting token
 */
struct PreviewKey {
    std::string filename;
    std::string mode;
    int page = 1;
    int width = 720;

    bool operator==(const PreviewKey& other) const {
        return filename == other.filename && mode == other.mode && page == other.page &&
               width == other.width;
    }
    bool operator!=(const PreviewKey& other) const {
        return !(*this == other);
    }
};

/// clamp(container - 24, 320, 1400)
int preview_width_for_container(int container_width);

/**
 * @brief Relative URL: /api/preview/{filename}?mode=&page=&w=&_=
 *
 * The filename is percent-encoded.
 */
std::string preview_url(const PreviewKey& key, const std::string& token);

/**
 * @brief Source of cache-busting tokens
 *
 * Tokens are unique per instance: wall-clock milliseconds plus a sequence
 * number, so two requests in the same millisecond still differ.
 */
class PreviewTokenSource {
  public:
    std::string next();

  private:
    uint64_t sequence_ = 0;
};

} // namespace printerpal
