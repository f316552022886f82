// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "preference_store.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>

#include "hv/json.hpp"

namespace printerpal {

using json = nlohmann::json;

JsonFilePreferenceStore::JsonFilePreferenceStore(std::string path) : path_(std::move(path)) {
    load();
}

std::string JsonFilePreferenceStore::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/printerpal/console.json";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/printerpal/console.json";
    }
    return "printerpal-console.json";
}

void JsonFilePreferenceStore::load() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        spdlog::debug("[Preferences] No preferences at {}", path_);
        return;
    }
    try {
        json doc = json::parse(in);
        if (!doc.is_object()) {
            spdlog::warn("[Preferences] {} is not a JSON object, ignoring", path_);
            return;
        }
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (it.value().is_string()) {
                values_[it.key()] = it.value().get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        spdlog::warn("[Preferences] Could not parse {}: {}", path_, e.what());
    }
}

bool JsonFilePreferenceStore::save() const {
    std::error_code ec;
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::warn("[Preferences] Cannot write {}", tmp);
            return false;
        }
        out << std::setw(2) << json(values_) << std::endl;
        if (!out.good()) {
            spdlog::warn("[Preferences] Error writing {}", tmp);
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::remove(tmp.c_str());
        spdlog::warn("[Preferences] Cannot replace {}", path_);
        return false;
    }
    return true;
}

std::optional<std::string> JsonFilePreferenceStore::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonFilePreferenceStore::set(const std::string& key, const std::string& value) {
    values_[key] = value;
    if (!save()) {
        spdlog::debug("[Preferences] {} kept in memory only", key);
    }
}

} // namespace printerpal
