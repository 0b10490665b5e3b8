/*
 * http_session.h - Streaming HTTP fetches with cooperative cancellation
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

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "dlkeeper/config.h"
#include "dlkeeper/cookie.h"

typedef void CURL;

namespace dlkeeper {

// Shared flag flipped by the canceller, polled by the transfer loop
class CancelToken {
public:
    void cancel() { cancelled_ = true; }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Response headers we care about
struct ResponseHeaders {
    int64_t content_length = -1;    // -1 if not sent
    std::string content_type;
    std::string accept_ranges;      // Empty if not sent
    std::string content_range;
};

// Parse one raw header line into headers. A status line ("HTTP/1.1 302")
// starts a new response and clears what was collected so far.
// Returns true if the line was recognized.
bool parse_header_line(const std::string& line, ResponseHeaders& headers);

// True when an Accept-Ranges value allows byte ranges
bool accepts_ranges(const std::string& accept_ranges);

struct FetchRequest {
    std::string url;
    std::optional<uint64_t> range_start;    // Sends "Range: bytes=N-" when set
    std::shared_ptr<CancelToken> cancel;    // May be null
};

// Receives a streamed response. Returning false from either method
// aborts the transfer.
class FetchHandler {
public:
    virtual ~FetchHandler() = default;
    virtual bool on_response(int http_code, const ResponseHeaders& headers) = 0;
    virtual bool on_chunk(const char* data, size_t length) = 0;
};

struct FetchResult {
    bool success = false;
    int http_code = 0;
    std::string error_message;
    bool cancelled = false;
    int64_t bytes_received = 0;
};

struct HeadResult {
    bool success = false;
    int http_code = 0;
    ResponseHeaders headers;
    std::string error_message;
};

class HttpSession {
public:
    virtual ~HttpSession() = default;

    // GET url, delivering the body in chunks of at most chunk_size bytes.
    // Blocks until the body ends, fails, or is cancelled.
    virtual FetchResult fetch(const FetchRequest& request, FetchHandler& handler) = 0;
};

// libcurl implementation; one easy handle per call, so concurrent
// fetches from different threads are fine
class CurlSession : public HttpSession {
public:
    explicit CurlSession(const TransferConfig& config);

    CurlSession(const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    FetchResult fetch(const FetchRequest& request, FetchHandler& handler) override;

    // HEAD request for Accept-Ranges / Content-Length
    HeadResult head(const std::string& url);

    // Cookies sent with every request whose URL they match
    void set_cookie_jar(std::shared_ptr<CookieJar> jar);
    void set_user_agent(const std::string& user_agent);

private:
    void setup_common_options(CURL* curl, const std::string& url, CancelToken* token);

    TransferConfig config_;
    std::shared_ptr<CookieJar> cookie_jar_;
    mutable std::mutex mutex_;  // Guards cookie_jar_ and config_.user_agent
};

// RAII wrapper for CURL global init
class CurlGlobalInit {
public:
    CurlGlobalInit();
    ~CurlGlobalInit();
    static CurlGlobalInit& instance();
private:
    static std::once_flag init_flag_;
    static std::unique_ptr<CurlGlobalInit> instance_;
};

} // namespace dlkeeper
