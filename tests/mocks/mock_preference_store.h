// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "preference_store.h"

#include <map>

/// In-memory PreferenceStore
class MockPreferenceStore : public printerpal::PreferenceStore {
  public:
    std::optional<std::string> get(const std::string& key) const override {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& key, const std::string& value) override {
        values_[key] = value;
    }

  private:
    std::map<std::string, std::string> values_;
};
