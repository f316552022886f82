// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "document_processor.h"

#include "command_runner.h"
#include "printerpal_error.h"
#include "printerpal_types.h"
#include "upload_store.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace printerpal {

namespace {

constexpr std::chrono::milliseconds PDFINFO_TIMEOUT{8000};
constexpr std::chrono::milliseconds PDFTOPPM_PAGE_TIMEOUT{25000};
constexpr std::chrono::milliseconds CONVERT_TIMEOUT{60000};

/// Removes a work directory on scope exit
class ScopedDir {
  public:
    explicit ScopedDir(std::string dir) : dir_(std::move(dir)) {}
    ~ScopedDir() {
        if (!dir_.empty()) {
            std::error_code ec;
            fs::remove_all(dir_, ec);
            if (ec) {
                spdlog::warn("[DocumentProcessor] Could not remove {}: {}", dir_, ec.message());
            }
        }
    }
    ScopedDir(const ScopedDir&) = delete;
    ScopedDir& operator=(const ScopedDir&) = delete;

    const std::string& path() const {
        return dir_;
    }

    /// Hand ownership to the caller
    std::string release() {
        std::string d = std::move(dir_);
        dir_.clear();
        return d;
    }

  private:
    std::string dir_;
};

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw PrinterPalException(PrinterPalError::unknown("Cannot read " + path));
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

std::string threshold_percent(int threshold) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.1f%%", threshold * 100.0 / 255.0);
    return buf;
}

} // namespace

// ============================================================================
// PreparedDocument
// ============================================================================

PreparedDocument::PreparedDocument(std::string path, std::string owned_dir, int pages)
    : path_(std::move(path)), owned_dir_(std::move(owned_dir)), pages_(pages) {}

PreparedDocument::~PreparedDocument() {
    release();
}

PreparedDocument::PreparedDocument(PreparedDocument&& other) noexcept
    : path_(std::move(other.path_)), owned_dir_(std::move(other.owned_dir_)),
      pages_(other.pages_) {
    other.owned_dir_.clear();
}

PreparedDocument& PreparedDocument::operator=(PreparedDocument&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        owned_dir_ = std::move(other.owned_dir_);
        pages_ = other.pages_;
        other.owned_dir_.clear();
    }
    return *this;
}

void PreparedDocument::release() {
    if (owned_dir_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(owned_dir_, ec);
    if (ec) {
        spdlog::warn("[DocumentProcessor] Could not remove {}: {}", owned_dir_, ec.message());
    }
    owned_dir_.clear();
}

// ============================================================================
// DocumentProcessor
// ============================================================================

DocumentProcessor::DocumentProcessor(std::shared_ptr<CommandRunner> runner, std::string cache_dir)
    : runner_(std::move(runner)), cache_dir_(std::move(cache_dir)) {}

std::string DocumentProcessor::make_work_dir(const char* prefix) const {
    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec) {
        throw PrinterPalException(PrinterPalError::unknown("Cannot create cache directory " +
                                                           cache_dir_ + ": " + ec.message()));
    }

    std::string tmpl = cache_dir_ + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw PrinterPalException(
            PrinterPalError::unknown("Cannot create work directory in " + cache_dir_));
    }
    return std::string(buf.data());
}

std::vector<std::string> DocumentProcessor::mode_arguments(const std::string& mode,
                                                           int threshold) {
    std::string m = mode;
    std::transform(m.begin(), m.end(), m.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (m == "raw") {
        return {};
    }
    if (m == "grayscale") {
        return {"-colorspace", "Gray"};
    }
    if (m == "bw") {
        return {"-colorspace", "Gray", "-threshold", threshold_percent(threshold)};
    }
    if (m == "dither") {
        return {"-colorspace", "Gray", "-dither", "FloydSteinberg", "-monochrome"};
    }
    if (m == "outline") {
        return {"-colorspace", "Gray", "-edge",      "1",
                "-normalize",  "-negate", "-threshold", threshold_percent(threshold)};
    }
    throw PrinterPalException(PrinterPalError::validation("Unsupported mode"));
}

int DocumentProcessor::parse_pdfinfo_pages(const std::string& out) {
    std::istringstream iss(out);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.size() < 6) {
            continue;
        }
        std::string key = line.substr(0, 6);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (key != "pages:") {
            continue;
        }
        try {
            return std::stoi(line.substr(6));
        } catch (const std::exception&) {
            return -1;
        }
    }
    return -1;
}

int DocumentProcessor::pdf_page_count(const std::string& path) {
    if (!file_exists(path)) {
        throw PrinterPalException(PrinterPalError::not_found("PDF not found"));
    }
    auto result = runner_->run({"pdfinfo", path}, PDFINFO_TIMEOUT, true);
    int pages = parse_pdfinfo_pages(result.out);
    if (pages < 0) {
        throw PrinterPalException(PrinterPalError::unknown(
            "Unable to determine PDF page count (pdfinfo output unexpected)"));
    }
    return pages;
}

std::string DocumentProcessor::render_preview_png(const std::string& path,
                                                  const PreviewOptions& options) {
    if (options.width < MIN_PREVIEW_WIDTH || options.width > MAX_PREVIEW_WIDTH) {
        throw PrinterPalException(PrinterPalError::validation(
            "width must be between " + std::to_string(MIN_PREVIEW_WIDTH) + " and " +
            std::to_string(MAX_PREVIEW_WIDTH)));
    }
    auto mode_args = mode_arguments(options.mode, options.threshold);

    std::string ext = UploadStore::extension_of(path);
    ScopedDir work(make_work_dir("printerpal_preview_"));
    std::string input;

    if (ext == ".pdf") {
        if (options.page < 1) {
            throw PrinterPalException(PrinterPalError::validation("page must be >= 1"));
        }
        std::string prefix = work.path() + "/page";
        std::string page = std::to_string(options.page);
        runner_->run({"pdftoppm", "-png", "-f", page, "-l", page, "-r",
                      std::to_string(options.preview_dpi), "-singlefile", path, prefix},
                     PDFTOPPM_PAGE_TIMEOUT, true);
        input = prefix + ".png";
        if (!file_exists(input)) {
            throw PrinterPalException(
                PrinterPalError::unknown("pdftoppm did not produce expected PNG output"));
        }
    } else if (UploadStore::is_allowed(path)) {
        // First frame only for multi-page TIFFs
        input = path + "[0]";
    } else {
        throw PrinterPalException(
            PrinterPalError::unsupported("Preview supports PDF and common image formats"));
    }

    std::string output = work.path() + "/preview.png";
    std::vector<std::string> argv{"convert", input, "-background", "white", "-alpha", "remove"};
    argv.insert(argv.end(), mode_args.begin(), mode_args.end());
    argv.insert(argv.end(), {"-resize", std::to_string(options.width) + "x>", "png:" + output});
    runner_->run(argv, CONVERT_TIMEOUT, true);

    spdlog::debug("[DocumentProcessor] Preview {} mode={} page={} w={}", path, options.mode,
                  options.page, options.width);
    return read_file(output);
}

PreparedDocument DocumentProcessor::prepare_for_print(const std::string& path,
                                                      const PrintPrepOptions& options) {
    if (!file_exists(path)) {
        throw PrinterPalException(PrinterPalError::not_found("Source file not found"));
    }

    if (options.mode == "raw") {
        return PreparedDocument(path, "", 0);
    }
    auto mode_args = mode_arguments(options.mode, options.threshold);

    std::string ext = UploadStore::extension_of(path);
    std::vector<std::string> inputs;
    int pages = 0;
    ScopedDir work(make_work_dir("printerpal_print_"));

    if (ext == ".pdf") {
        pages = pdf_page_count(path);
        if (pages > options.max_pdf_pages) {
            throw PrinterPalException(PrinterPalError::validation(
                "PDF has " + std::to_string(pages) + " pages, which exceeds processing limit (" +
                std::to_string(options.max_pdf_pages) +
                "). Either increase printing.max_pdf_pages_process or use 'Raw' mode."));
        }

        std::string prefix = work.path() + "/page";
        runner_->run({"pdftoppm", "-png", "-r", std::to_string(options.print_dpi), path, prefix},
                     PDFTOPPM_PAGE_TIMEOUT * std::max(1, pages), true);

        // pdftoppm zero-pads page numbers to a common width, so name order is page order
        for (const auto& entry : fs::directory_iterator(work.path())) {
            if (entry.path().extension() == ".png") {
                inputs.push_back(entry.path().string());
            }
        }
        std::sort(inputs.begin(), inputs.end());
        if (inputs.empty()) {
            throw PrinterPalException(
                PrinterPalError::unknown("pdftoppm did not produce expected PNG output"));
        }
    } else if (UploadStore::is_allowed(path)) {
        inputs.push_back(path + "[0]");
    } else {
        throw PrinterPalException(
            PrinterPalError::unsupported("Unsupported file type for printing"));
    }

    std::string output = work.path() + "/print.pdf";
    std::vector<std::string> argv{"convert"};
    argv.insert(argv.end(), inputs.begin(), inputs.end());
    argv.insert(argv.end(), {"-background", "white", "-alpha", "remove"});
    argv.insert(argv.end(), mode_args.begin(), mode_args.end());
    argv.insert(argv.end(), {"-units", "PixelsPerInch", "-density",
                             std::to_string(options.print_dpi), "pdf:" + output});
    runner_->run(argv, CONVERT_TIMEOUT, true);

    spdlog::info("[DocumentProcessor] Prepared {} for printing (mode={}, pages={})", path,
                 options.mode, pages);
    return PreparedDocument(output, work.release(), pages);
}

} // namespace printerpal
