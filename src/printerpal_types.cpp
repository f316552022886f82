// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printerpal_types.h"

#include "json_utils.h"

#include <algorithm>

namespace printerpal {

using json_util::safe_bool;
using json_util::safe_int;
using json_util::safe_string;

json UploadedFile::to_json() const {
    return {{"name", name}, {"size", size}, {"size_h", size_h}, {"mtime", mtime}};
}

UploadedFile UploadedFile::from_json(const json& j) {
    UploadedFile f;
    f.name = safe_string(j, "name");
    f.size = static_cast<uint64_t>(json_util::safe_int64(j, "size", 0));
    f.size_h = safe_string(j, "size_h");
    f.mtime = json_util::safe_int64(j, "mtime", 0);
    return f;
}

json PrinterInfo::to_json() const {
    json j = {{"name", name}, {"state", state}, {"is_default", is_default}};
    j["accepting"] = accepting ? json(*accepting) : json(nullptr);
    j["display_name"] = display_name ? json(*display_name) : json(nullptr);
    return j;
}

PrinterInfo PrinterInfo::from_json(const json& j) {
    PrinterInfo p;
    p.name = safe_string(j, "name");
    p.state = safe_string(j, "state");
    p.is_default = safe_bool(j, "is_default", false);
    if (j.contains("accepting") && j["accepting"].is_boolean()) {
        p.accepting = j["accepting"].get<bool>();
    }
    if (j.contains("display_name") && j["display_name"].is_string()) {
        p.display_name = j["display_name"].get<std::string>();
    }
    return p;
}

json QueueJob::to_json() const {
    return {{"job_id", job_id},
            {"queue_id", queue_id},
            {"user", user},
            {"size", size},
            {"raw", raw}};
}

QueueJob QueueJob::from_json(const json& j) {
    QueueJob q;
    q.job_id = safe_int(j, "job_id", 0);
    q.queue_id = safe_string(j, "queue_id");
    q.user = safe_string(j, "user");
    q.size = safe_string(j, "size");
    q.raw = safe_string(j, "raw");
    return q;
}

json JobStats::to_json() const {
    return {{"active_jobs", active_jobs},
            {"completed_jobs", completed_jobs},
            {"last_completed_raw", last_completed_raw}};
}

JobStats JobStats::from_json(const json& j) {
    JobStats s;
    s.active_jobs = safe_int(j, "active_jobs", 0);
    s.completed_jobs = safe_int(j, "completed_jobs", 0);
    s.last_completed_raw = safe_string(j, "last_completed_raw");
    return s;
}

json SchedulerStatus::to_json() const {
    json j = {{"cups_scheduler_running", running}, {"raw", raw}};
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

json StatusSnapshot::to_json() const {
    json printers_json = json::array();
    for (const auto& p : printers) {
        printers_json.push_back(p.to_json());
    }
    json jobs_json = json::array();
    for (const auto& q : jobs) {
        jobs_json.push_back(q.to_json());
    }

    return {{"cups_available", cups_available},
            {"scheduler", scheduler.to_json()},
            {"default_printer", default_printer},
            {"default_printer_display", default_printer_display},
            {"default_printer_label", default_printer_label},
            {"printers", printers_json},
            {"jobs", jobs_json},
            {"stats", stats.to_json()},
            {"airprint", {{"enabled", airprint_enabled}}}};
}

StatusSnapshot StatusSnapshot::from_json(const json& j) {
    StatusSnapshot s;
    s.cups_available = safe_bool(j, "cups_available", false);
    s.default_printer = safe_string(j, "default_printer");
    s.default_printer_display = safe_string(j, "default_printer_display");
    s.default_printer_label = safe_string(j, "default_printer_label");

    if (j.contains("printers") && j["printers"].is_array()) {
        for (const auto& p : j["printers"]) {
            s.printers.push_back(PrinterInfo::from_json(p));
        }
    }
    if (j.contains("jobs") && j["jobs"].is_array()) {
        for (const auto& q : j["jobs"]) {
            s.jobs.push_back(QueueJob::from_json(q));
        }
    }
    if (j.contains("stats") && j["stats"].is_object()) {
        s.stats = JobStats::from_json(j["stats"]);
    }
    if (j.contains("scheduler") && j["scheduler"].is_object()) {
        s.scheduler.running = safe_bool(j["scheduler"], "cups_scheduler_running", false);
        s.scheduler.raw = safe_string(j["scheduler"], "raw");
        s.scheduler.error = safe_string(j["scheduler"], "error");
    }
    if (j.contains("airprint") && j["airprint"].is_object()) {
        s.airprint_enabled = safe_bool(j["airprint"], "enabled", false);
    }
    return s;
}

bool StatusSnapshot::has_printer(const std::string& printer_name) const {
    return std::any_of(printers.begin(), printers.end(),
                       [&](const PrinterInfo& p) { return p.name == printer_name; });
}

bool is_valid_print_mode(const std::string& mode) {
    const auto& modes = print_modes();
    return std::find(modes.begin(), modes.end(), mode) != modes.end();
}

json PrintRequest::to_json() const {
    return {{"filename", filename}, {"mode", mode}, {"printer", printer}, {"copies", copies},
            {"page", page}};
}

json make_status_event(int64_t ts, const std::vector<UploadedFile>& files,
                       const StatusSnapshot& status) {
    json files_json = json::array();
    for (const auto& f : files) {
        files_json.push_back(f.to_json());
    }
    return {{"ts", ts}, {"files", files_json}, {"status", status.to_json()}};
}

} // namespace printerpal
