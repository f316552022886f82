// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "format_utils.h"

#include <cstdio>
#include <ctime>

namespace printerpal::format {

// =============================================================================
// Sizes and times
// =============================================================================

std::string format_file_size(int64_t bytes) {
    if (bytes < 0) {
        return "0 B";
    }

    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr int unit_count = 5;

    char buf[32];
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < unit_count - 1) {
        value /= 1024.0;
        ++unit;
    }

    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%lld B", static_cast<long long>(bytes));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    }
    return std::string(buf);
}

std::string format_timestamp(int64_t ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm_info{};
    if (localtime_r(&t, &tm_info) == nullptr) {
        return UNAVAILABLE;
    }

    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_info) == 0) {
        return UNAVAILABLE;
    }
    return std::string(buf);
}

// =============================================================================
// Counters
// =============================================================================

std::string format_count_or_unavailable(int value, bool available) {
    if (!available) {
        return UNAVAILABLE;
    }
    return std::to_string(value);
}

} // namespace printerpal::format
