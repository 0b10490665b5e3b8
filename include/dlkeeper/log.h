/*
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <functional>

namespace dlkeeper {

// Log verbosity levels, most severe first
enum class LogLevel {
    ERROR,
    WARNING,
    INFO,
    DEBUG
};

using LogSink = std::function<void(LogLevel level, const std::string& message)>;

const char* level_to_string(LogLevel level);

// Messages less severe than the threshold are dropped (default INFO)
void set_log_level(LogLevel level);
LogLevel log_level();

// Replace the output sink; an empty sink restores the stderr default
void set_log_sink(LogSink sink);

void log_message(LogLevel level, const std::string& message);

inline void log_error(const std::string& message) { log_message(LogLevel::ERROR, message); }
inline void log_warning(const std::string& message) { log_message(LogLevel::WARNING, message); }
inline void log_info(const std::string& message) { log_message(LogLevel::INFO, message); }
inline void log_debug(const std::string& message) { log_message(LogLevel::DEBUG, message); }

} // namespace dlkeeper
