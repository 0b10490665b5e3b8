/*
 * src/transfer.cpp - Derived values and formatting for transfers
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/transfer.h"
#include <sstream>
#include <iomanip>

namespace dlkeeper {

namespace {

constexpr double KB = 1024.0;
constexpr double MB = KB * 1024.0;
constexpr double GB = MB * 1024.0;

std::string format_scaled(double value, const char* suffix, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value << " " << suffix;
    return oss.str();
}

} // namespace

std::string format_bytes(uint64_t bytes) {
    double value = static_cast<double>(bytes);
    if (value >= GB) return format_scaled(value / GB, "GB", 1);
    if (value >= MB) return format_scaled(value / MB, "MB", 1);
    if (value >= KB) return format_scaled(value / KB, "KB", 0);
    return std::to_string(bytes) + " B";
}

std::string format_speed(double bps) {
    if (bps >= GB) return format_scaled(bps / GB, "GB/s", 1);
    if (bps >= MB) return format_scaled(bps / MB, "MB/s", 1);
    if (bps >= KB) return format_scaled(bps / KB, "KB/s", 0);
    return format_scaled(bps, "B/s", 0);
}

std::string format_duration(uint64_t seconds) {
    std::ostringstream oss;
    if (seconds >= 3600) {
        oss << seconds / 3600 << "h " << (seconds % 3600) / 60 << "m";
    } else if (seconds >= 60) {
        oss << seconds / 60 << "m " << seconds % 60 << "s";
    } else {
        oss << seconds << "s";
    }
    return oss.str();
}

double Transfer::progress() const {
    if (total_bytes == 0) return 0.0;
    return static_cast<double>(received_bytes) / static_cast<double>(total_bytes);
}

double Transfer::speed_bps() const {
    if (!is_active() || received_bytes == 0) return 0.0;

    auto elapsed = std::chrono::system_clock::now() - started_at;
    double secs = std::chrono::duration<double>(elapsed).count();
    if (secs <= 0) return 0.0;
    return static_cast<double>(received_bytes) / secs;
}

std::optional<uint64_t> Transfer::eta_seconds() const {
    if (!is_active() || total_bytes == 0) return std::nullopt;

    uint64_t remaining = total_bytes > received_bytes ? total_bytes - received_bytes : 0;
    if (remaining == 0) return 0;

    double speed = speed_bps();
    if (speed <= 0) return std::nullopt;
    return static_cast<uint64_t>(static_cast<double>(remaining) / speed);
}

std::string Transfer::size_string() const {
    if (total_bytes > 0) {
        return format_bytes(received_bytes) + " / " + format_bytes(total_bytes);
    }
    return format_bytes(received_bytes);
}

std::string Transfer::speed_string() const {
    return format_speed(speed_bps());
}

std::string Transfer::eta_string() const {
    auto eta = eta_seconds();
    if (!eta) return "calculating...";
    if (*eta == 0) return "finishing...";
    return format_duration(*eta);
}

std::string Transfer::status_text() const {
    switch (status) {
        case TransferStatus::IN_PROGRESS:
            return speed_string() + " - " + eta_string() + " left - " + size_string();
        case TransferStatus::PAUSED:
            if (supports_resume) return "Paused - " + size_string();
            return "Paused (resume not supported) - " + size_string();
        case TransferStatus::COMPLETED:
            return "Completed";
        case TransferStatus::FAILED:
            return "Failed: " + error_message;
        case TransferStatus::CANCELLED:
            return "Cancelled";
    }
    return "";
}

} // namespace dlkeeper
