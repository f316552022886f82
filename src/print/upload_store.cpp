// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "upload_store.h"

#include "format_utils.h"
#include "printerpal_error.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <dirent.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace printerpal {

const std::vector<std::string>& allowed_upload_extensions() {
    static const std::vector<std::string> exts = {".pdf", ".png", ".jpg",  ".jpeg",
                                                  ".bmp", ".tif", ".tiff"};
    return exts;
}

UploadStore::UploadStore(std::string upload_dir) : dir_(std::move(upload_dir)) {}

void UploadStore::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw PrinterPalException(
            PrinterPalError::unknown("Cannot create upload directory " + dir_ + ": " + ec.message()));
    }
}

std::vector<UploadedFile> UploadStore::list(int limit) const {
    limit = std::max(1, std::min(limit, 200));
    std::vector<UploadedFile> files;

    DIR* dir = opendir(dir_.c_str());
    if (!dir) {
        spdlog::trace("[UploadStore] Cannot open {}", dir_);
        return files;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        std::string full = dir_ + "/" + name;
        struct stat st;
        if (stat(full.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            continue;
        }

        UploadedFile f;
        f.name = name;
        f.size = static_cast<uint64_t>(st.st_size);
        f.size_h = format::format_file_size(static_cast<int64_t>(st.st_size));
        f.mtime = static_cast<int64_t>(st.st_mtime);
        files.push_back(std::move(f));
    }
    closedir(dir);

    std::stable_sort(files.begin(), files.end(), [](const UploadedFile& a, const UploadedFile& b) {
        if (a.mtime != b.mtime) {
            return a.mtime > b.mtime;
        }
        return a.name < b.name;
    });
    if (files.size() > static_cast<size_t>(limit)) {
        files.resize(static_cast<size_t>(limit));
    }
    return files;
}

std::optional<std::string> UploadStore::resolve(const std::string& name) const {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos || name.find('\0') != std::string::npos) {
        return std::nullopt;
    }
    std::string full = dir_ + "/" + name;
    struct stat st;
    if (stat(full.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return std::nullopt;
    }
    return full;
}

std::string UploadStore::secure_filename(const std::string& name) {
    std::string spaced;
    spaced.reserve(name.size());
    for (char c : name) {
        spaced.push_back((c == '/' || c == '\\') ? ' ' : c);
    }

    // Whitespace runs collapse to a single underscore
    std::istringstream iss(spaced);
    std::string word;
    std::string joined;
    while (iss >> word) {
        if (!joined.empty()) {
            joined.push_back('_');
        }
        joined += word;
    }

    std::string safe;
    for (unsigned char c : joined) {
        if (std::isalnum(c) || c == '_' || c == '.' || c == '-') {
            safe.push_back(static_cast<char>(c));
        }
    }

    size_t start = safe.find_first_not_of("._");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = safe.find_last_not_of("._");
    return safe.substr(start, end - start + 1);
}

std::string UploadStore::extension_of(const std::string& filename) {
    size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    std::string ext = filename.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool UploadStore::is_allowed(const std::string& filename) {
    const auto& exts = allowed_upload_extensions();
    return std::find(exts.begin(), exts.end(), extension_of(filename)) != exts.end();
}

std::string UploadStore::store(const std::string& client_filename, const std::string& content,
                               uint64_t max_bytes) const {
    if (client_filename.empty()) {
        throw PrinterPalException(PrinterPalError::validation("No file provided"));
    }
    std::string filename = secure_filename(client_filename);
    if (filename.empty()) {
        throw PrinterPalException(PrinterPalError::validation("Invalid filename"));
    }
    if (!is_allowed(filename)) {
        throw PrinterPalException(PrinterPalError::unsupported(
            "Unsupported file type. Use PDF or common image formats."));
    }
    if (content.size() > max_bytes) {
        throw PrinterPalException(PrinterPalError::validation("File exceeds upload size limit"));
    }

    ensure_directory();

    std::string outname = filename;
    struct stat st;
    if (stat((dir_ + "/" + outname).c_str(), &st) == 0) {
        size_t dot = filename.rfind('.');
        std::string base = filename.substr(0, dot);
        std::string ext = filename.substr(dot);
        std::string stamp = std::to_string(static_cast<long long>(std::time(nullptr)));
        outname = base + "_" + stamp + ext;
        // Two uploads of the same name within one second
        for (int n = 2; stat((dir_ + "/" + outname).c_str(), &st) == 0; ++n) {
            outname = base + "_" + stamp + "-" + std::to_string(n) + ext;
        }
    }

    std::string outpath = dir_ + "/" + outname;
    std::ofstream out(outpath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw PrinterPalException(PrinterPalError::unknown("Cannot write " + outpath));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        std::remove(outpath.c_str());
        throw PrinterPalException(PrinterPalError::unknown("Error writing " + outpath));
    }

    spdlog::info("[UploadStore] Stored {} ({})", outname,
                 format::format_file_size(static_cast<int64_t>(content.size())));
    return outname;
}

} // namespace printerpal
