/*
 * src/config.cpp - Default transfer configuration
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/config.h"
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace dlkeeper {

std::string default_download_directory() {
    const char* xdg = std::getenv("XDG_DOWNLOAD_DIR");
    if (xdg && *xdg) {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (fs::path(home) / "Downloads").string();
    }

    return ".";
}

TransferConfig make_default_config() {
    TransferConfig config;
    config.download_dir = default_download_directory();
    return config;
}

} // namespace dlkeeper
