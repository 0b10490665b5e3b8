/*
 * src/log.cpp - Leveled logging with a replaceable sink
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/log.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace dlkeeper {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_sink_mutex;
LogSink g_sink;

void stderr_sink(LogLevel level, const std::string& message) {
    std::cerr << "[dlkeeper] " << level_to_string(level) << ": " << message << std::endl;
}

} // namespace

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        default: return "UNKNOWN";
    }
}

void set_log_level(LogLevel level) {
    g_level = level;
}

LogLevel log_level() {
    return g_level.load();
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void log_message(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) > static_cast<int>(g_level.load())) return;

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, message);
    } else {
        stderr_sink(level, message);
    }
}

} // namespace dlkeeper
