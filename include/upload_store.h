// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printerpal_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace printerpal {

/// Uploads, previews and prints accept these (lowercase) extensions
const std::vector<std::string>& allowed_upload_extensions();

/**
 * @brief The upload directory: listing, storing and resolving documents
 *
 * Only flat names are served; anything with a path separator or ".." never
 * resolves. Listing is newest first (mtime descending).
 */
class UploadStore {
  public:
    /// Pull endpoint limit
    static constexpr int LIST_LIMIT = 50;
    /// SSE push limit
    static constexpr int PUSH_LIMIT = 25;

    explicit UploadStore(std::string upload_dir);

    /**
     * @brief Create the upload directory if needed
     *
     * @throws PrinterPalException (UNKNOWN) if it cannot be created
     */
    void ensure_directory() const;

    /**
     * @brief List regular files, newest first
     *
     * @param limit Clamped to 1..200. A missing directory lists as empty.
     */
    std::vector<UploadedFile> list(int limit) const;

    /**
     * @brief Absolute path of an existing upload, or nullopt
     */
    std::optional<std::string> resolve(const std::string& name) const;

    /**
     * @brief Store an uploaded document
     *
     * The client name is sanitized; a clash with an existing file appends
     * "_<unix time>" before the extension.
     *
     * @param client_filename Name as sent by the browser
     * @param content File bytes
     * @return Name under which the file was stored
     * @throws PrinterPalException VALIDATION_ERROR (empty/invalid name, too large),
     *         UNSUPPORTED_TYPE (extension), UNKNOWN (write failure)
     */
    std::string store(const std::string& client_filename, const std::string& content,
                      uint64_t max_bytes) const;

    const std::string& directory() const {
        return dir_;
    }

    /**
     * @brief Reduce a client-supplied name to [A-Za-z0-9_.-]
     *
     * Path components become separators, whitespace runs become "_",
     * leading/trailing dots and underscores are stripped. May return "".
     */
    static std::string secure_filename(const std::string& name);

    /// Extension check against allowed_upload_extensions(), case-insensitive
    static bool is_allowed(const std::string& filename);

    /// Lowercased extension including the dot, "" if none
    static std::string extension_of(const std::string& filename);

  private:
    std::string dir_;
};

} // namespace printerpal
