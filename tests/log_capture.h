// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <string>

// ============================================================================
// Log capture utility for verifying warning/error output
// ============================================================================

class LogCapture {
  public:
    LogCapture() {
        // Create a sink that writes to our stringstream
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured_);
        sink->set_pattern("%l %v"); // Level and message, no timestamps

        capture_logger_ = std::make_shared<spdlog::logger>("test_capture", sink);
        capture_logger_->set_level(spdlog::level::trace);

        // Save the default logger and replace it
        original_logger_ = spdlog::default_logger();
        spdlog::set_default_logger(capture_logger_);
    }

    ~LogCapture() {
        spdlog::set_default_logger(original_logger_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string get_captured() const {
        return captured_.str();
    }

    void clear() {
        captured_.str("");
    }

    bool contains(const std::string& text) const {
        return captured_.str().find(text) != std::string::npos;
    }

  private:
    std::ostringstream captured_;
    std::shared_ptr<spdlog::logger> capture_logger_;
    std::shared_ptr<spdlog::logger> original_logger_;
};
