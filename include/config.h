// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <mutex>
#include <string>

#include "hv/json.hpp"

namespace printerpal {

using json = nlohmann::json;

/// Default config location; PRINTERPAL_CONFIG or --config overrides it.
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/printerpal/config.json";

/**
 * @brief Factory-default configuration document
 *
 * Sections: printing, airprint, app, ui, security, logging.
 */
json default_config();

/**
 * @brief Deep-merge @p overlay onto @p base
 *
 * Objects merge recursively; any other value in @p overlay replaces the one in
 * @p base. Keys only present in @p base are kept.
 */
json merge_config(const json& base, const json& overlay);

/**
 * @brief Validate and normalize a configuration document
 *
 * Fills missing keys from default_config(), then checks types and ranges.
 * Numbers with a fractional part are truncated, booleans are never accepted
 * where a number is expected.
 *
 * @param cfg Candidate document (must be a JSON object)
 * @return Normalized document
 * @throws PrinterPalException with VALIDATION_ERROR naming the offending key
 */
json validate_config(const json& cfg);

/**
 * @brief Application configuration store (singleton)
 *
 * Holds the validated configuration document and persists it as JSON.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: all accessors lock an internal mutex. replace() performs the
 * whole validate + write + swap sequence under that lock, so concurrent saves
 * are serialized and readers never observe a half-applied document.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/etc/printerpal/config.json");
 *
 * int dpi = cfg->get<int>("/printing/preview_dpi", 150);
 * json saved = cfg->replace(new_doc); // validates, writes atomically
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    mutable std::mutex mutex_;
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

    /// Write @p doc to path via temp file + rename. Caller holds mutex_.
    void write_atomic(const json& doc);

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Load configuration from file
     *
     * A missing file is created with defaults. A file that is not valid JSON
     * is moved aside to `<path>.corrupt` and replaced with defaults. A file
     * that parses but fails validation is an error: the store is left unchanged.
     *
     * @param config_path Path to the JSON configuration file
     * @throws PrinterPalException (VALIDATION_ERROR) for invalid contents
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value with default fallback
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/printing/preview_dpi")
     * @param default_value Fallback value if path not found or of another type
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception&) {
            return default_value;
        }
    }

    /**
     * @brief Set configuration value at JSON pointer path (in memory only)
     *
     * Used for environment/CLI overrides that must not be persisted. Call
     * save() to write.
     */
    template <typename T> void set(const std::string& json_ptr, T v) {
        std::lock_guard<std::mutex> lock(mutex_);
        data[json::json_pointer(json_ptr)] = v;
    }

    /**
     * @brief Copy of the whole document
     */
    json snapshot() const;

    /**
     * @brief Validate, persist and adopt a new document
     *
     * Read-modify-write entry point for POST /api/config. On any failure the
     * stored document is unchanged.
     *
     * @param new_config Full or partial document; missing keys take defaults
     * @return The normalized document now in effect
     * @throws PrinterPalException VALIDATION_ERROR, or UNKNOWN if the write fails
     */
    json replace(const json& new_config);

    /**
     * @brief Save current configuration to file
     *
     * @return true on success
     */
    bool save();

    std::string get_path() const;

    static Config* get_instance();
};

} // namespace printerpal
