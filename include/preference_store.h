// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <map>
#include <optional>
#include <string>

namespace printerpal {

/// Display preference keys ("1" / "0")
constexpr const char* PREF_DARK_MODE = "printerpal_ui_dark";
constexpr const char* PREF_EINK_MODE = "printerpal_ui_eink";

/**
 * @brief Per-client key/value preferences
 */
class PreferenceStore {
  public:
    virtual ~PreferenceStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
};

/**
 * @brief Preferences in a flat JSON object on disk
 *
 * Loaded once at construction (missing or unreadable file = empty), written
 * through on every set(). Write failures are logged, the in-memory value is
 * kept.
 */
class JsonFilePreferenceStore : public PreferenceStore {
  public:
    explicit JsonFilePreferenceStore(std::string path);

    std::optional<std::string> get(const std::string& key) const override;
    void set(const std::string& key, const std::string& value) override;

    /// ~/.config/printerpal/console.json, or XDG_CONFIG_HOME equivalent
    static std::string default_path();

  private:
    void load();
    bool save() const;

    std::string path_;
    std::map<std::string, std::string> values_;
};

} // namespace printerpal
