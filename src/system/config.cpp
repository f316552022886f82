// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "printerpal_error.h"
#include "printerpal_types.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace printerpal {

Config* Config::instance{nullptr};

namespace {

/// Integer field check: numbers only (booleans rejected), truncated, range-checked
int require_int(const json& section, const char* section_name, const char* key, int min_v,
                int max_v) {
    std::string name = std::string(section_name) + "." + key;
    if (!section.contains(key)) {
        throw PrinterPalException(PrinterPalError::validation(name + " must be a number"));
    }
    const auto& v = section[key];
    if (v.is_boolean() || !v.is_number()) {
        throw PrinterPalException(PrinterPalError::validation(name + " must be a number"));
    }
    double d = std::trunc(v.get<double>());
    if (d < min_v || d > max_v) {
        throw PrinterPalException(PrinterPalError::validation(
            name + " must be between " + std::to_string(min_v) + " and " + std::to_string(max_v)));
    }
    return static_cast<int>(d);
}

void require_bool(const json& section, const char* section_name, const char* key) {
    if (!section.contains(key) || !section[key].is_boolean()) {
        throw PrinterPalException(PrinterPalError::validation(std::string(section_name) + "." +
                                                              key + " must be boolean"));
    }
}

void require_string(const json& section, const char* section_name, const char* key) {
    if (!section.contains(key) || !section[key].is_string()) {
        throw PrinterPalException(PrinterPalError::validation(std::string(section_name) + "." +
                                                              key + " must be string"));
    }
}

void require_one_of(const json& section, const char* section_name, const char* key,
                    const std::vector<std::string>& allowed) {
    std::string joined;
    for (const auto& a : allowed) {
        joined += joined.empty() ? a : "|" + a;
    }
    const auto& v = section.contains(key) ? section[key] : json();
    if (!v.is_string() ||
        std::find(allowed.begin(), allowed.end(), v.get<std::string>()) == allowed.end()) {
        throw PrinterPalException(PrinterPalError::validation(
            std::string(section_name) + "." + key + " must be one of " + joined));
    }
}

json& require_section(json& doc, const char* name) {
    if (!doc.contains(name) || !doc[name].is_object()) {
        throw PrinterPalException(
            PrinterPalError::validation(std::string(name) + " must be an object"));
    }
    return doc[name];
}

} // namespace

json default_config() {
    return {{"app", {{"host", "0.0.0.0"}, {"port", 80}, {"max_upload_mb", 25}}},
            {"printing",
             {{"default_printer", ""},
              {"preview_dpi", 150},
              {"print_dpi", 200},
              {"max_pdf_pages_process", 30},
              {"default_copies", 1},
              {"default_mode", "grayscale"},
              {"bw_threshold", 180}}},
            {"airprint", {{"auto_enable", true}}},
            {"ui", {{"default_dark_mode", false}, {"default_eink_mode", false}}},
            {"security", {{"require_token", false}, {"token", ""}}},
            {"logging", {{"level", "info"}, {"target", "auto"}, {"file", ""}}}};
}

json merge_config(const json& base, const json& overlay) {
    json merged = base;
    if (!overlay.is_object()) {
        return merged;
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (merged.contains(it.key()) && merged[it.key()].is_object() && it.value().is_object()) {
            merged[it.key()] = merge_config(merged[it.key()], it.value());
        } else {
            merged[it.key()] = it.value();
        }
    }
    return merged;
}

json validate_config(const json& cfg) {
    if (!cfg.is_object()) {
        throw PrinterPalException(PrinterPalError::validation("config must be an object"));
    }

    json merged = merge_config(default_config(), cfg);

    // app
    json& app = require_section(merged, "app");
    require_string(app, "app", "host");
    app["port"] = require_int(app, "app", "port", 1, 65535);
    app["max_upload_mb"] = require_int(app, "app", "max_upload_mb", 1, 500);

    // printing
    json& printing = require_section(merged, "printing");
    require_string(printing, "printing", "default_printer");
    printing["preview_dpi"] = require_int(printing, "printing", "preview_dpi", 72, 600);
    printing["print_dpi"] = require_int(printing, "printing", "print_dpi", 72, 1200);
    printing["max_pdf_pages_process"] =
        require_int(printing, "printing", "max_pdf_pages_process", 1, 500);
    printing["default_copies"] = require_int(printing, "printing", "default_copies", 1, 99);
    printing["bw_threshold"] = require_int(printing, "printing", "bw_threshold", 1, 254);
    require_one_of(printing, "printing", "default_mode", print_modes());

    // ui
    json& ui = require_section(merged, "ui");
    require_bool(ui, "ui", "default_dark_mode");
    require_bool(ui, "ui", "default_eink_mode");

    // airprint
    json& airprint = require_section(merged, "airprint");
    require_bool(airprint, "airprint", "auto_enable");

    // security
    json& security = require_section(merged, "security");
    require_bool(security, "security", "require_token");
    require_string(security, "security", "token");

    // logging
    json& logging = require_section(merged, "logging");
    require_one_of(logging, "logging", "level", {"trace", "debug", "info", "warn", "error"});
    require_one_of(logging, "logging", "target", {"auto", "console", "syslog", "file"});
    require_string(logging, "logging", "file");

    return merged;
}

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    path = config_path;

    struct stat buffer;
    bool config_modified = false;
    json loaded;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            std::ifstream in(config_path);
            loaded = json::parse(in);
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            loaded = json::object();
            config_modified = true;
        }

        if (!loaded.is_object()) {
            throw PrinterPalException(
                PrinterPalError::validation("Config file must be a JSON object"));
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        loaded = json::object();
        config_modified = true;
    }

    json normalized = validate_config(loaded);
    if (normalized != loaded) {
        config_modified = true;
    }
    data = normalized;

    if (config_modified) {
        try {
            write_atomic(data);
            spdlog::debug("[Config] Saved updated config to {}", config_path);
        } catch (const PrinterPalException& e) {
            // Read-only /etc is tolerated; the in-memory document is still valid
            spdlog::warn("[Config] Could not write {}: {}", config_path, e.what());
        }
    }

    spdlog::debug("[Config] initialized: port={} default_mode={} auto_airprint={}",
                  data["/app/port"_json_pointer].get<int>(),
                  data["/printing/default_mode"_json_pointer].get<std::string>(),
                  data["/airprint/auto_enable"_json_pointer].get<bool>());
}

std::string Config::get_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return path;
}

json Config::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data;
}

json Config::replace(const json& new_config) {
    json normalized = validate_config(new_config);

    std::lock_guard<std::mutex> lock(mutex_);
    write_atomic(normalized);
    data = normalized;
    spdlog::info("[Config] Configuration updated ({})", path);
    return data;
}

bool Config::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::trace("[Config] Saving config to {}", path);
    try {
        write_atomic(data);
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;
    } catch (const PrinterPalException& e) {
        spdlog::error("[Config] Failed to save config to {}: {}", path, e.what());
        return false;
    }
}

void Config::write_atomic(const json& doc) {
    if (path.empty()) {
        throw PrinterPalException(PrinterPalError::unknown("Config path not set"));
    }

    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw PrinterPalException(PrinterPalError::unknown(
                "Could not create " + target.parent_path().string() + ": " + ec.message()));
        }
    }

    std::string tmp_path = path + ".tmp." + std::to_string(getpid());
    {
        std::ofstream o(tmp_path, std::ios::trunc);
        if (!o.is_open()) {
            throw PrinterPalException(
                PrinterPalError::unknown("Failed to open config file for writing: " + tmp_path));
        }
        o << std::setw(2) << doc << std::endl;
        if (!o.good()) {
            o.close();
            std::remove(tmp_path.c_str());
            throw PrinterPalException(
                PrinterPalError::unknown("Error writing config file: " + tmp_path));
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        std::remove(tmp_path.c_str());
        throw PrinterPalException(PrinterPalError::unknown("Failed to replace " + path));
    }
}

} // namespace printerpal
