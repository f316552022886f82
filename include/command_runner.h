// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file command_runner.h
 * @brief Runs external programs (lp, lpstat, pdftoppm, the root helper)
 *
 * @pattern fork/execvp with pipes, no shell
 * @threading Blocking; call from request worker threads only
 */

#include <chrono>
#include <string>
#include <vector>

namespace printerpal {

/// CUPS can be sluggish on a Pi; lpstat queries get this budget.
constexpr std::chrono::milliseconds DEFAULT_COMMAND_TIMEOUT{6000};

struct CommandResult {
    std::vector<std::string> argv;
    int exit_code = -1;
    std::string out;
    std::string err;
    double duration_s = 0.0;

    bool ok() const {
        return exit_code == 0;
    }

    /// argv joined with spaces, for log and error messages
    std::string command_line() const;
};

/**
 * @brief Executes commands and captures their output
 *
 * Arguments are passed to execvp() individually, so user-influenced values
 * (filenames, printer names) cannot inject shell syntax.
 *
 * Errors are thrown as PrinterPalException:
 *   - COMMAND_NOT_FOUND if the program is not on PATH
 *   - TIMEOUT if the child outlives @p timeout (it is killed)
 *   - COMMAND_FAILED if @p check is set and the exit code is non-zero
 *   - VALIDATION_ERROR for an empty argv
 *
 * run() is virtual so tests can script command output without spawning
 * processes.
 */
class CommandRunner {
  public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout = DEFAULT_COMMAND_TIMEOUT,
                              bool check = true);

    /**
     * @brief Check whether a program is on PATH
     */
    virtual bool which(const std::string& program) const;
};

} // namespace printerpal
