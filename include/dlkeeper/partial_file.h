/*
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "dlkeeper/common.h"

namespace dlkeeper {

// First free path among dir/name, dir/stem.(1).ext, dir/stem.(2).ext, ...
// tried up to max_attempts, then dir/stem.<unix seconds>.ext
std::string unique_destination(const std::string& dir, const std::string& filename,
                               int max_attempts = MAX_NAME_ATTEMPTS);

// "<destination><suffix>"
std::string backup_path_for(const std::string& destination,
                            const std::string& suffix = BACKUP_SUFFIX);

// Copy a partial download aside before the engine deletes it.
// Failures are logged; returns false when no backup was written.
bool backup_partial(const std::string& destination,
                    const std::string& suffix = BACKUP_SUFFIX);

// Move the backup back over a missing destination.
// Returns false with error_message set if the rename fails; a missing
// backup or an existing destination is not an error.
bool restore_partial(const std::string& destination, std::string& error_message,
                     const std::string& suffix = BACKUP_SUFFIX);

// Delete the backup once it is no longer needed (completion, cancel).
// Returns true if a backup was removed.
bool discard_partial(const std::string& destination,
                     const std::string& suffix = BACKUP_SUFFIX);

// Size of the file at path, or nullopt if it does not exist
std::optional<uint64_t> existing_file_size(const std::string& path);

// Last path component, or the whole string if there is none
std::string file_name_of(const std::string& path);

// Name to save a URL under: the last path segment without query or
// fragment, percent-decoded; "download" when the path has none
std::string filename_from_url(const std::string& url);

} // namespace dlkeeper
