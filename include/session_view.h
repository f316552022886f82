// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file session_view.h
 * @brief Rendering surface driven by SessionController
 *
 * Implementations only draw; all decisions (validation, enablement,
 * selection) are made by the controller. Every call happens on the
 * controller's loop thread.
 */

#include "printerpal_types.h"

#include <string>
#include <vector>

namespace printerpal {

/// Inline message areas
enum class MessagePanel {
    ACTION,   ///< Print/preview/file actions
    SETTINGS, ///< Settings panel
};

/**
 * @brief Settings form contents as text, the way a user edits them
 */
struct SettingsForm {
    std::string default_printer;
    std::string preview_dpi;
    std::string print_dpi;
    std::string bw_threshold;
    std::string max_pdf_pages;
    bool airprint_auto_enable = false;

    /// Form populated from a config document
    static SettingsForm from_config(const json& config);
};

class SessionView {
  public:
    virtual ~SessionView() = default;

    /// Full list replacement; @p selected is "" when nothing is selected
    virtual void render_files(const std::vector<UploadedFile>& files,
                              const std::string& selected) = 0;

    /**
     * @brief Full status replacement (availability, counters, printers, queue)
     *
     * @param preferred_printer printing.default_printer, preselected in the
     *        printer choice when non-empty
     */
    virtual void render_status(const StatusSnapshot& status,
                               const std::string& preferred_printer) = 0;

    virtual void render_settings(const SettingsForm& form) = 0;

    /// Current transformation mode (set on load and after settings save)
    virtual void render_mode(const std::string& mode) = 0;

    virtual void set_print_enabled(bool enabled) = 0;

    /**
     * @brief Load a preview image
     *
     * The view reports the outcome through SessionController::preview_loaded()
     * or preview_failed() with the same @p url.
     */
    virtual void show_preview(const std::string& url) = 0;

    /// Show the placeholder instead of an image
    virtual void hide_preview() = 0;

    virtual void show_message(MessagePanel panel, const std::string& text, bool is_error) = 0;

    /// Footer live-channel indicator
    virtual void set_live_status(const std::string& text) = 0;

    virtual void apply_theme(bool dark, bool eink) = 0;

    /// Blocking yes/no question for destructive actions
    virtual bool confirm(const std::string& question) = 0;
};

} // namespace printerpal
