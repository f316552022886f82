// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file mock_command_runner.h
 * @brief CommandRunner that never forks
 *
 * Every invocation is recorded. Responses are looked up by program name
 * (argv[0]); programs without a script succeed with empty output. A script
 * may also have side effects, e.g. create the file `convert` would write.
 *
 * @example
 * auto runner = std::make_shared<ScriptedCommandRunner>();
 * runner->script("lpstat", [](const auto& argv) {
 *     return ScriptedCommandRunner::ok("scheduler is running\n");
 * });
 */

#include "command_runner.h"
#include "printerpal_error.h"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

class ScriptedCommandRunner : public printerpal::CommandRunner {
  public:
    using Script = std::function<printerpal::CommandResult(const std::vector<std::string>&)>;

    static printerpal::CommandResult ok(const std::string& out = "") {
        printerpal::CommandResult r;
        r.exit_code = 0;
        r.out = out;
        return r;
    }

    static printerpal::CommandResult fail(int exit_code, const std::string& err) {
        printerpal::CommandResult r;
        r.exit_code = exit_code;
        r.err = err;
        return r;
    }

    void script(const std::string& program, Script fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[program] = std::move(fn);
    }

    /// Behave as if @p program were not installed
    void remove_program(const std::string& program) {
        std::lock_guard<std::mutex> lock(mutex_);
        missing_.insert(program);
    }

    printerpal::CommandResult run(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds /*timeout*/ = printerpal::DEFAULT_COMMAND_TIMEOUT,
                                  bool check = true) override {
        Script fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(argv);
            if (missing_.count(argv.at(0))) {
                throw printerpal::PrinterPalException(
                    printerpal::PrinterPalError::command_not_found(argv[0]));
            }
            auto it = scripts_.find(argv.at(0));
            if (it != scripts_.end()) {
                fn = it->second;
            }
        }

        printerpal::CommandResult result = fn ? fn(argv) : ok();
        result.argv = argv;
        if (check && result.exit_code != 0) {
            throw printerpal::PrinterPalException(printerpal::PrinterPalError::command_failed(
                "Command failed (" + std::to_string(result.exit_code) +
                    "): " + result.command_line(),
                result.exit_code, result.err));
        }
        return result;
    }

    bool which(const std::string& program) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return missing_.count(program) == 0;
    }

    std::vector<std::vector<std::string>> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    /// Calls whose argv[0] is @p program
    std::vector<std::vector<std::string>> calls_to(const std::string& program) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::vector<std::string>> out;
        for (const auto& c : calls_) {
            if (!c.empty() && c[0] == program) {
                out.push_back(c);
            }
        }
        return out;
    }

  private:
    mutable std::mutex mutex_;
    std::map<std::string, Script> scripts_;
    std::set<std::string> missing_;
    std::vector<std::vector<std::string>> calls_;
};
