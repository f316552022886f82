// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace printerpal {

/**
 * @brief Error categories for PrinterPal operations
 */
enum class PrinterPalErrorType {
    NONE,              // No error
    VALIDATION_ERROR,  // Bad input (config values, print parameters, filenames)
    NOT_FOUND,         // Requested file or printer doesn't exist
    UNSUPPORTED_TYPE,  // File type not accepted for upload/preview/print
    COMMAND_NOT_FOUND, // External program missing from PATH
    COMMAND_FAILED,    // External program exited non-zero
    TIMEOUT,           // External program exceeded its time budget
    PERMISSION_DENIED, // Missing or wrong API token
    UNAVAILABLE,       // Subsystem not reachable (CUPS down, token not configured)
    UNKNOWN            // Unknown error
};

/**
 * @brief Error information carried through backends and HTTP handlers
 *
 * Synchronous code paths throw it wrapped in PrinterPalException; handlers
 * catch at the route boundary and translate with http_status().
 */
struct PrinterPalError {
    PrinterPalErrorType type = PrinterPalErrorType::NONE;
    int code = 0;        // Process exit code when the error came from a command
    std::string message; // Human-readable message, shown verbatim to clients
    std::string details; // Captured stderr or other diagnostic text

    bool has_error() const {
        return type != PrinterPalErrorType::NONE;
    }

    std::string get_type_string() const {
        switch (type) {
        case PrinterPalErrorType::NONE:
            return "NONE";
        case PrinterPalErrorType::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case PrinterPalErrorType::NOT_FOUND:
            return "NOT_FOUND";
        case PrinterPalErrorType::UNSUPPORTED_TYPE:
            return "UNSUPPORTED_TYPE";
        case PrinterPalErrorType::COMMAND_NOT_FOUND:
            return "COMMAND_NOT_FOUND";
        case PrinterPalErrorType::COMMAND_FAILED:
            return "COMMAND_FAILED";
        case PrinterPalErrorType::TIMEOUT:
            return "TIMEOUT";
        case PrinterPalErrorType::PERMISSION_DENIED:
            return "PERMISSION_DENIED";
        case PrinterPalErrorType::UNAVAILABLE:
            return "UNAVAILABLE";
        case PrinterPalErrorType::UNKNOWN:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    /**
     * @brief HTTP status code used when this error ends a request
     */
    int http_status() const {
        switch (type) {
        case PrinterPalErrorType::VALIDATION_ERROR:
            return 400;
        case PrinterPalErrorType::PERMISSION_DENIED:
            return 401;
        case PrinterPalErrorType::NOT_FOUND:
            return 404;
        case PrinterPalErrorType::UNSUPPORTED_TYPE:
            return 415;
        case PrinterPalErrorType::UNAVAILABLE:
            return 503;
        default:
            return 500;
        }
    }

    static PrinterPalError validation(const std::string& msg) {
        return PrinterPalError{PrinterPalErrorType::VALIDATION_ERROR, 0, msg, ""};
    }

    static PrinterPalError not_found(const std::string& msg) {
        return PrinterPalError{PrinterPalErrorType::NOT_FOUND, 0, msg, ""};
    }

    static PrinterPalError unsupported(const std::string& msg) {
        return PrinterPalError{PrinterPalErrorType::UNSUPPORTED_TYPE, 0, msg, ""};
    }

    static PrinterPalError command_not_found(const std::string& program) {
        return PrinterPalError{PrinterPalErrorType::COMMAND_NOT_FOUND, 127,
                               "Command not found: " + program, ""};
    }

    static PrinterPalError command_failed(const std::string& msg, int exit_code,
                                          const std::string& stderr_text) {
        return PrinterPalError{PrinterPalErrorType::COMMAND_FAILED, exit_code, msg, stderr_text};
    }

    static PrinterPalError timeout(const std::string& msg) {
        return PrinterPalError{PrinterPalErrorType::TIMEOUT, 0, msg, ""};
    }

    static PrinterPalError permission_denied(const std::string& msg) {
        return PrinterPalError{PrinterPalErrorType::PERMISSION_DENIED, 0, msg, ""};
    }

    static PrinterPalError unavailable(const std::string& msg) {
        return PrinterPalError{PrinterPalErrorType::UNAVAILABLE, 0, msg, ""};
    }

    static PrinterPalError unknown(const std::string& msg) {
        return PrinterPalError{PrinterPalErrorType::UNKNOWN, 0, msg, ""};
    }
};

/**
 * @brief Exception wrapper for PrinterPalError
 */
class PrinterPalException : public std::runtime_error {
  public:
    explicit PrinterPalException(PrinterPalError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const PrinterPalError& error() const noexcept {
        return error_;
    }

  private:
    PrinterPalError error_;
};

} // namespace printerpal
