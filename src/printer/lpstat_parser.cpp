// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lpstat_parser.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>

namespace printerpal::lpstat {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) {
        parts.push_back(tok);
    }
    return parts;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool parse_scheduler_running(const std::string& out) {
    std::string lower = to_lower(out);
    if (lower.find("not running") != std::string::npos) {
        return false;
    }
    return lower.find("running") != std::string::npos;
}

std::string parse_default_destination(const std::string& out) {
    static const std::regex re(R"(destination:\s*(\S+))");
    std::smatch m;
    if (std::regex_search(out, m, re)) {
        return m[1].str();
    }
    return "";
}

std::vector<PrinterInfo> parse_printers(const std::string& out, const std::string& default_printer,
                                        const std::map<std::string, std::string>& info_map) {
    static const std::regex re(R"(^printer\s+(\S+)\s+(?:is\s+)?(idle|disabled|busy|now printing)\b.*)",
                               std::regex::icase);

    std::vector<PrinterInfo> printers;
    std::istringstream iss(out);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        std::smatch m;
        if (!std::regex_match(line, m, re)) {
            continue;
        }

        PrinterInfo p;
        p.name = m[1].str();
        std::string state = to_lower(m[2].str());
        p.state = (state == "now printing") ? "busy" : state;
        p.is_default = !default_printer.empty() && p.name == default_printer;
        auto it = info_map.find(p.name);
        if (it != info_map.end()) {
            p.display_name = it->second;
        }
        printers.push_back(std::move(p));
    }
    return printers;
}

void apply_accepting(const std::string& out, std::vector<PrinterInfo>& printers) {
    std::istringstream iss(out);
    std::string line;
    while (std::getline(iss, line)) {
        auto parts = split_ws(line);
        if (parts.empty()) {
            continue;
        }
        bool has_not = std::find(parts.begin(), parts.end(), "not") != parts.end();
        bool has_accepting = std::find(parts.begin(), parts.end(), "accepting") != parts.end();
        bool accepting = !(has_not && has_accepting);

        for (auto& p : printers) {
            if (p.name == parts[0]) {
                p.accepting = accepting;
                break;
            }
        }
    }
}

int numeric_job_id(const std::string& queue_id) {
    size_t dash = queue_id.rfind('-');
    std::string digits = (dash == std::string::npos) ? queue_id : queue_id.substr(dash + 1);
    if (digits.empty() || digits.size() > 9 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return 0;
    }
    return std::stoi(digits);
}

std::vector<QueueJob> parse_queue(const std::string& out) {
    std::vector<QueueJob> jobs;
    std::istringstream iss(out);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        auto parts = split_ws(line);
        if (parts.size() < 3) {
            continue;
        }
        QueueJob job;
        job.queue_id = parts[0];
        job.job_id = numeric_job_id(parts[0]);
        job.user = parts[1];
        job.size = parts[2];
        job.raw = line;
        jobs.push_back(std::move(job));
    }
    return jobs;
}

std::vector<std::string> non_empty_lines(const std::string& out) {
    std::vector<std::string> lines;
    std::istringstream iss(out);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::map<std::string, std::string> parse_printers_conf(std::istream& in) {
    static const std::regex start_re(R"(^<(?:Default)?Printer\s+([^>]+)>)");
    static const std::regex info_re(R"(^Info\s+(.+)$)");

    std::map<std::string, std::string> info_map;
    std::string current;
    std::string raw_line;
    while (std::getline(in, raw_line)) {
        std::string line = trim(raw_line);
        if (line.empty()) {
            continue;
        }

        std::smatch m;
        if (std::regex_search(line, m, start_re)) {
            current = trim(m[1].str());
            continue;
        }
        if (line.rfind("</Printer>", 0) == 0 || line.rfind("</DefaultPrinter>", 0) == 0) {
            current.clear();
            continue;
        }
        if (current.empty()) {
            continue;
        }
        if (std::regex_match(line, m, info_re)) {
            std::string label = trim(m[1].str());
            if (label.size() >= 2 && label.front() == '"' && label.back() == '"') {
                label = label.substr(1, label.size() - 2);
            }
            if (!label.empty()) {
                info_map[current] = label;
            }
        }
    }
    return info_map;
}

std::map<std::string, std::string> load_printer_info_map(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        std::ifstream in(path);
        if (!in.is_open()) {
            spdlog::trace("[Lpstat] Cannot read {}", path);
            continue;
        }
        auto info_map = parse_printers_conf(in);
        if (!info_map.empty()) {
            return info_map;
        }
    }
    return {};
}

bool is_valid_job_id(const std::string& job_id) {
    static const std::regex re(R"(^[A-Za-z0-9_.-]+$)");
    return !job_id.empty() && std::regex_match(job_id, re);
}

} // namespace printerpal::lpstat
