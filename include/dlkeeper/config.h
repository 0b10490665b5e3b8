/*
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <cstddef>
#include "dlkeeper/common.h"

namespace dlkeeper {

// Transfer settings shared by both backends
struct TransferConfig {
    std::string download_dir;       // Auto-save target for non "Save As" downloads
    std::string user_agent = USER_AGENT;
    int connect_timeout_seconds = CONNECT_TIMEOUT_SECONDS;
    int low_speed_time_seconds = LOW_SPEED_TIME_SECONDS;
    size_t chunk_size = CHUNK_SIZE;
    std::string backup_suffix = BACKUP_SUFFIX;
    int max_name_attempts = MAX_NAME_ATTEMPTS;
    size_t list_limit = DEFAULT_LIST_LIMIT;
};

// $XDG_DOWNLOAD_DIR, then $HOME/Downloads, then the working directory
std::string default_download_directory();

// Config with download_dir resolved
TransferConfig make_default_config();

} // namespace dlkeeper
