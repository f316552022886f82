// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sse_parser.h"

namespace printerpal {

SseParser::SseParser(EventCallback on_event) : on_event_(std::move(on_event)) {}

void SseParser::reset() {
    buffer_.clear();
    event_.clear();
    data_.clear();
    has_data_ = false;
}

void SseParser::feed(const char* data, size_t size) {
    buffer_.append(data, size);

    size_t start = 0;
    for (;;) {
        size_t nl = buffer_.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        size_t end = nl;
        if (end > start && buffer_[end - 1] == '\r') {
            --end;
        }
        process_line(buffer_.substr(start, end - start));
        start = nl + 1;
    }
    buffer_.erase(0, start);
}

void SseParser::process_line(const std::string& line) {
    if (line.empty()) {
        dispatch();
        return;
    }
    if (line[0] == ':') {
        return; // comment / keep-alive
    }

    std::string field;
    std::string value;
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        field = line;
    } else {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') {
            value.erase(0, 1);
        }
    }

    if (field == "event") {
        event_ = value;
    } else if (field == "data") {
        if (has_data_) {
            data_ += '\n';
        }
        data_ += value;
        has_data_ = true;
    }
}

void SseParser::dispatch() {
    if (has_data_ && on_event_) {
        on_event_(event_.empty() ? "message" : event_, data_);
    }
    event_.clear();
    data_.clear();
    has_data_ = false;
}

} // namespace printerpal
