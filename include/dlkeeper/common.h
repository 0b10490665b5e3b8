/*
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace dlkeeper {

using TransferId = uint64_t;
using SubscriptionId = uint64_t;

// Transfer lifecycle state
enum class TransferStatus {
    IN_PROGRESS,
    PAUSED,
    COMPLETED,
    FAILED,       // reason stored alongside
    CANCELLED
};

// Constants
constexpr size_t CHUNK_SIZE = 64 * 1024;
constexpr int MAX_NAME_ATTEMPTS = 1000;
constexpr size_t DEFAULT_LIST_LIMIT = 10;
constexpr int CONNECT_TIMEOUT_SECONDS = 30;
constexpr int LOW_SPEED_TIME_SECONDS = 60;   // abort when below 1 B/s for this long
constexpr const char* BACKUP_SUFFIX = ".part";
constexpr const char* USER_AGENT = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

inline const char* status_to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::IN_PROGRESS: return "IN_PROGRESS";
        case TransferStatus::PAUSED: return "PAUSED";
        case TransferStatus::COMPLETED: return "COMPLETED";
        case TransferStatus::FAILED: return "FAILED";
        case TransferStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

inline bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

// Human readable sizes, as shown in download rows
std::string format_bytes(uint64_t bytes);
std::string format_speed(double bps);
std::string format_duration(uint64_t seconds);

} // namespace dlkeeper
