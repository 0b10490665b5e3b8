/*
 * transfer.h - A single tracked download and its derived display values
 * Copyright © 2026 Kirn Gill II <segin2005@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include "dlkeeper/common.h"

namespace dlkeeper {

// One in-flight or finished download
struct Transfer {
    TransferId id = 0;
    std::string url;            // Source locator
    std::string filename;       // Display name
    std::string destination;    // Absolute path being written
    uint64_t total_bytes = 0;   // 0 until known
    uint64_t received_bytes = 0;
    TransferStatus status = TransferStatus::IN_PROGRESS;
    std::string error_message;  // Set with FAILED
    std::chrono::system_clock::time_point started_at;
    bool supports_resume = false;  // Server answered Accept-Ranges

    // Fraction 0.0 - 1.0, 0 when the total is unknown
    double progress() const;

    bool is_active() const { return status == TransferStatus::IN_PROGRESS; }
    bool is_paused() const { return status == TransferStatus::PAUSED; }
    bool can_resume() const { return is_paused() && supports_resume; }

    double speed_bps() const;
    std::optional<uint64_t> eta_seconds() const;

    std::string size_string() const;
    std::string speed_string() const;
    std::string eta_string() const;

    // Caption for a download row ("Paused - 1 MB / 4 MB", "Failed: ...")
    std::string status_text() const;
};

} // namespace dlkeeper
