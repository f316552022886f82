// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file document_processor.h
 * @brief Preview rendering and print preparation via external tools
 *
 * Rasterization is delegated: pdfinfo/pdftoppm (poppler-utils) for PDFs and
 * ImageMagick `convert` for the mode transforms, resizing and PDF assembly.
 * Intermediate files live in a private directory under the cache dir and are
 * removed when the operation (or the PreparedDocument) ends.
 */

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace printerpal {

class CommandRunner;

struct PreviewOptions {
    std::string mode = "grayscale";
    int page = 1;
    int width = 720;
    int preview_dpi = 150;
    int threshold = 180;
};

struct PrintPrepOptions {
    std::string mode = "grayscale";
    int print_dpi = 200;
    int max_pdf_pages = 30;
    int threshold = 180;
};

/**
 * @brief A print-ready file, deleted with this object when it was generated
 */
class PreparedDocument {
  public:
    PreparedDocument() = default;
    PreparedDocument(std::string path, std::string owned_dir, int pages);
    ~PreparedDocument();

    PreparedDocument(PreparedDocument&& other) noexcept;
    PreparedDocument& operator=(PreparedDocument&& other) noexcept;
    PreparedDocument(const PreparedDocument&) = delete;
    PreparedDocument& operator=(const PreparedDocument&) = delete;

    const std::string& path() const {
        return path_;
    }

    /// False when the original upload is printed untouched (raw mode)
    bool prepared() const {
        return !owned_dir_.empty();
    }

    /// PDF page count, 0 for images and raw mode
    int pages() const {
        return pages_;
    }

  private:
    void release();

    std::string path_;
    std::string owned_dir_;
    int pages_ = 0;
};

class DocumentProcessor {
  public:
    static constexpr int MIN_PREVIEW_WIDTH = 64;
    static constexpr int MAX_PREVIEW_WIDTH = 2000;

    DocumentProcessor(std::shared_ptr<CommandRunner> runner, std::string cache_dir);
    virtual ~DocumentProcessor() = default;

    /**
     * @brief Render one page of a document as PNG
     *
     * The image is transformed per mode, then shrunk (never enlarged) to
     * options.width keeping the aspect ratio.
     *
     * @return PNG bytes
     * @throws PrinterPalException VALIDATION_ERROR (width, page, mode),
     *         UNSUPPORTED_TYPE, or the tool's error
     */
    virtual std::string render_preview_png(const std::string& path, const PreviewOptions& options);

    /**
     * @brief Produce the file to hand to lp
     *
     * Raw mode returns the source itself. Otherwise PDFs are rasterized at
     * print_dpi (refused above max_pdf_pages) and images converted, both
     * reassembled into a PDF with the mode applied.
     */
    virtual PreparedDocument prepare_for_print(const std::string& path,
                                               const PrintPrepOptions& options);

    /**
     * @brief Page count via pdfinfo
     */
    int pdf_page_count(const std::string& path);

    /**
     * @brief ImageMagick operators implementing a print mode
     *
     * @throws PrinterPalException VALIDATION_ERROR for unknown modes
     */
    static std::vector<std::string> mode_arguments(const std::string& mode, int threshold);

    /// Parse the "Pages:" line of pdfinfo output; -1 if absent
    static int parse_pdfinfo_pages(const std::string& out);

  private:
    std::string make_work_dir(const char* prefix) const;

    std::shared_ptr<CommandRunner> runner_;
    std::string cache_dir_;
};

} // namespace printerpal
