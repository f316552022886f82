// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

#include "hv/json.hpp"

namespace printerpal::json_util {

/// Safely extract a string from a JSON field that may be missing, null or another type.
/// nlohmann .value("key", "") throws type_error.302 when the field is JSON null.
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return def;
}

/// Safely extract an int from a JSON field that may be number, numeric string, or null.
inline int safe_int(const nlohmann::json& j, const char* key, int def = 0) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<int>();
    }
    if (v.is_string()) {
        try {
            return std::stoi(v.get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

/// 64-bit variant for byte sizes and unix timestamps.
inline int64_t safe_int64(const nlohmann::json& j, const char* key, int64_t def = 0) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<int64_t>();
    }
    return def;
}

/// Booleans only; "true"/1 are not coerced.
inline bool safe_bool(const nlohmann::json& j, const char* key, bool def = false) {
    if (!j.is_object() || !j.contains(key)) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    return def;
}

/// Extract the human-readable error from a failed API response body.
/// Prefers "error", then "message"; returns def if neither is a string.
inline std::string error_text(const nlohmann::json& body, const std::string& def = "") {
    std::string err = safe_string(body, "error");
    if (!err.empty()) {
        return err;
    }
    std::string msg = safe_string(body, "message");
    if (!msg.empty()) {
        return msg;
    }
    return def;
}

} // namespace printerpal::json_util
