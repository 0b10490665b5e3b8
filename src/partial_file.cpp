/*
 * src/partial_file.cpp - Destination naming and partial file backups
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/partial_file.h"
#include "dlkeeper/log.h"
#include <cctype>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace dlkeeper {

std::string unique_destination(const std::string& dir, const std::string& filename,
                               int max_attempts) {
    fs::path base_path = fs::path(dir) / filename;
    std::error_code ec;
    if (!fs::exists(base_path, ec)) {
        return base_path.string();
    }

    // Split on the last dot: "archive.tar.gz" -> "archive.tar" + ".gz"
    std::string stem = filename;
    std::string ext;
    size_t dot = filename.rfind('.');
    if (dot != std::string::npos) {
        stem = filename.substr(0, dot);
        ext = filename.substr(dot);
    }

    for (int counter = 1; counter < max_attempts; ++counter) {
        fs::path candidate = fs::path(dir) / (stem + ".(" + std::to_string(counter) + ")" + ext);
        if (!fs::exists(candidate, ec)) {
            return candidate.string();
        }
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return (fs::path(dir) / (stem + "." + std::to_string(seconds) + ext)).string();
}

std::string backup_path_for(const std::string& destination, const std::string& suffix) {
    return destination + suffix;
}

bool backup_partial(const std::string& destination, const std::string& suffix) {
    std::string backup = backup_path_for(destination, suffix);

    std::error_code ec;
    fs::copy_file(destination, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        log_warning("Failed to backup partial download " + destination + ": " + ec.message());
        return false;
    }

    log_info("Backed up partial download to " + backup);
    return true;
}

bool restore_partial(const std::string& destination, std::string& error_message,
                     const std::string& suffix) {
    std::string backup = backup_path_for(destination, suffix);

    std::error_code ec;
    if (!fs::exists(backup, ec) || fs::exists(destination, ec)) {
        return true;
    }

    fs::rename(backup, destination, ec);
    if (ec) {
        error_message = "Failed to restore backup: " + ec.message();
        log_error(error_message);
        return false;
    }

    log_info("Restored backup file from " + backup);
    return true;
}

bool discard_partial(const std::string& destination, const std::string& suffix) {
    std::string backup = backup_path_for(destination, suffix);

    std::error_code ec;
    if (!fs::remove(backup, ec)) {
        if (ec) {
            log_warning("Failed to remove backup " + backup + ": " + ec.message());
        }
        return false;
    }

    log_debug("Removed backup file " + backup);
    return true;
}

std::optional<uint64_t> existing_file_size(const std::string& path) {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

std::string file_name_of(const std::string& path) {
    std::string name = fs::path(path).filename().string();
    return name.empty() ? path : name;
}

std::string filename_from_url(const std::string& url) {
    std::string path = url;
    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }

    size_t scheme = path.find("://");
    if (scheme != std::string::npos) {
        size_t slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? "" : path.substr(slash);
    }

    std::string segment = path.substr(path.rfind('/') + 1);

    std::string name;
    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '%' && i + 2 < segment.size() &&
            std::isxdigit(static_cast<unsigned char>(segment[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(segment[i + 2]))) {
            name += static_cast<char>(std::stoi(segment.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            name += segment[i];
        }
    }

    // Never let a decoded name escape the download directory
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        return "download";
    }
    return name;
}

} // namespace dlkeeper
