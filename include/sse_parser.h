// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <string>

namespace printerpal {

/**
 * @brief Incremental text/event-stream decoder
 *
 * Bytes arrive in arbitrary chunks; a complete event is dispatched on the
 * blank line that ends it. Supports `event:`, `data:` (multiple lines joined
 * with '\n'), comment lines and CRLF line endings. `id:` and `retry:` are
 * accepted and ignored.
 */
class SseParser {
  public:
    /// (event name, data); name is "message" when the event omitted it
    using EventCallback = std::function<void(const std::string&, const std::string&)>;

    explicit SseParser(EventCallback on_event);

    void feed(const char* data, size_t size);
    void feed(const std::string& chunk) {
        feed(chunk.data(), chunk.size());
    }

    /// Forget partial input (after a reconnect)
    void reset();

  private:
    void process_line(const std::string& line);
    void dispatch();

    EventCallback on_event_;
    std::string buffer_;
    std::string event_;
    std::string data_;
    bool has_data_ = false;
};

} // namespace printerpal
