// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace printerpal::format {

// =============================================================================
// Constants
// =============================================================================

/**
 * @brief Unavailable/unknown value placeholder (em dash)
 *
 * Use this constant for consistent display of missing data, e.g. no default
 * printer or job counters not yet received.
 */
inline constexpr const char* UNAVAILABLE = "—";

// =============================================================================
// Sizes and times
// =============================================================================

/**
 * @brief Format a byte count for display
 *
 * Bytes are shown as an integer ("512 B"), larger units with one decimal
 * ("1.5 KB", "12.0 MB"). Units stop at TB. Negative input yields "0 B".
 *
 * @param bytes Size in bytes
 * @return Formatted string
 */
std::string format_file_size(int64_t bytes);

/**
 * @brief Format a unix timestamp in local time ("2026-01-05 14:03:22")
 *
 * @param ts Seconds since epoch
 * @return Formatted string, or UNAVAILABLE if the conversion fails
 */
std::string format_timestamp(int64_t ts);

// =============================================================================
// Counters
// =============================================================================

/**
 * @brief Format an optional counter, UNAVAILABLE when not present
 */
std::string format_count_or_unavailable(int value, bool available);

} // namespace printerpal::format
