/*
 * src/http_session.cpp - libcurl streaming fetches
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/http_session.h"
#include "dlkeeper/log.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace dlkeeper {

// Static members for global init
std::once_flag CurlGlobalInit::init_flag_;
std::unique_ptr<CurlGlobalInit> CurlGlobalInit::instance_;

CurlGlobalInit::CurlGlobalInit() {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlGlobalInit::~CurlGlobalInit() {
    curl_global_cleanup();
}

CurlGlobalInit& CurlGlobalInit::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<CurlGlobalInit>(new CurlGlobalInit());
    });
    return *instance_;
}

namespace {

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    size_t end = value.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return value.substr(start, end - start + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Owns an easy handle for the duration of one request
struct EasyHandle {
    CURL* curl = curl_easy_init();
    struct curl_slist* headers = nullptr;

    ~EasyHandle() {
        if (headers) curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
};

// State shared with the libcurl callbacks of one fetch
struct StreamState {
    CURL* curl = nullptr;
    FetchHandler* handler = nullptr;
    CancelToken* token = nullptr;
    ResponseHeaders headers;
    std::vector<char> buffer;
    size_t chunk_size = CHUNK_SIZE;
    bool response_delivered = false;
    bool aborted = false;   // Handler refused the response or a chunk
    int64_t received = 0;

    bool deliver_response() {
        if (response_delivered) return true;
        response_delivered = true;

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        if (!handler->on_response(static_cast<int>(http_code), headers)) {
            aborted = true;
            return false;
        }
        return true;
    }

    bool deliver(size_t length) {
        if (length == 0) return true;
        if (token && token->is_cancelled()) return false;
        if (!handler->on_chunk(buffer.data(), length)) {
            aborted = true;
            return false;
        }
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(length));
        return true;
    }
};

size_t stream_write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t real_size = size * nmemb;
    auto* state = static_cast<StreamState*>(userp);

    if (state->token && state->token->is_cancelled()) {
        return 0;  // Abort transfer
    }
    if (!state->deliver_response()) {
        return 0;
    }

    const char* bytes = static_cast<const char*>(contents);
    state->buffer.insert(state->buffer.end(), bytes, bytes + real_size);
    state->received += static_cast<int64_t>(real_size);

    while (state->buffer.size() >= state->chunk_size) {
        if (!state->deliver(state->chunk_size)) {
            return 0;
        }
    }

    return real_size;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t real_size = size * nitems;
    auto* headers = static_cast<ResponseHeaders*>(userdata);
    parse_header_line(std::string(buffer, real_size), *headers);
    return real_size;
}

// Progress callback for cancellation
int progress_callback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* token = static_cast<CancelToken*>(clientp);
    return token && token->is_cancelled() ? 1 : 0;  // Non-zero aborts
}

} // namespace

bool parse_header_line(const std::string& line, ResponseHeaders& headers) {
    if (line.compare(0, 5, "HTTP/") == 0) {
        headers = ResponseHeaders{};
        return true;
    }

    size_t pos = line.find(':');
    if (pos == std::string::npos) return false;

    std::string name = to_lower(trim(line.substr(0, pos)));
    std::string value = trim(line.substr(pos + 1));

    if (name == "content-length") {
        try {
            headers.content_length = std::stoll(value);
        } catch (const std::exception&) {
            headers.content_length = -1;
        }
        return true;
    }
    if (name == "content-type") {
        headers.content_type = value;
        return true;
    }
    if (name == "accept-ranges") {
        headers.accept_ranges = value;
        return true;
    }
    if (name == "content-range") {
        headers.content_range = value;
        return true;
    }
    return false;
}

bool accepts_ranges(const std::string& accept_ranges) {
    std::string value = to_lower(trim(accept_ranges));
    return !value.empty() && value != "none";
}

CurlSession::CurlSession(const TransferConfig& config) : config_(config) {
    CurlGlobalInit::instance();  // Ensure global init
}

void CurlSession::set_cookie_jar(std::shared_ptr<CookieJar> jar) {
    std::lock_guard<std::mutex> lock(mutex_);
    cookie_jar_ = std::move(jar);
}

void CurlSession::set_user_agent(const std::string& user_agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.user_agent = user_agent;
}

void CurlSession::setup_common_options(CURL* curl, const std::string& url, CancelToken* token) {
    std::string user_agent;
    std::shared_ptr<CookieJar> jar;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        user_agent = config_.user_agent;
        jar = cookie_jar_;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    if (jar) {
        std::string cookie = jar->cookie_header_for(url);
        if (!cookie.empty()) {
            curl_easy_setopt(curl, CURLOPT_COOKIE, cookie.c_str());
        }
    }

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.low_speed_time_seconds));

    // Progress/cancellation support
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, token);

    // Enable TCP keepalive
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 120L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 60L);
}

FetchResult CurlSession::fetch(const FetchRequest& request, FetchHandler& handler) {
    FetchResult result;

    EasyHandle easy;
    if (!easy.curl) {
        result.error_message = "Failed to initialize CURL handle";
        return result;
    }

    CancelToken* token = request.cancel.get();
    setup_common_options(easy.curl, request.url, token);

    if (request.range_start) {
        std::string range = "Range: bytes=" + std::to_string(*request.range_start) + "-";
        easy.headers = curl_slist_append(easy.headers, range.c_str());
        curl_easy_setopt(easy.curl, CURLOPT_HTTPHEADER, easy.headers);
    }

    StreamState state;
    state.curl = easy.curl;
    state.handler = &handler;
    state.token = token;
    state.chunk_size = config_.chunk_size > 0 ? config_.chunk_size : CHUNK_SIZE;
    state.buffer.reserve(state.chunk_size * 2);

    curl_easy_setopt(easy.curl, CURLOPT_BUFFERSIZE, static_cast<long>(state.chunk_size));
    curl_easy_setopt(easy.curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(easy.curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(easy.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(easy.curl, CURLOPT_HEADERDATA, &state.headers);

    CURLcode res = curl_easy_perform(easy.curl);

    long http_code = 0;
    curl_easy_getinfo(easy.curl, CURLINFO_RESPONSE_CODE, &http_code);
    result.http_code = static_cast<int>(http_code);
    result.bytes_received = state.received;

    if (token && token->is_cancelled()) {
        result.cancelled = true;
        result.error_message = "Download cancelled";
        return result;
    }

    if (res != CURLE_OK) {
        result.error_message = state.aborted ? "Transfer aborted" : curl_easy_strerror(res);
        return result;
    }

    // Empty bodies never reach the write callback; flush the tail otherwise
    if (!state.deliver_response() || !state.deliver(state.buffer.size())) {
        result.cancelled = token && token->is_cancelled();
        result.error_message = result.cancelled ? "Download cancelled" : "Transfer aborted";
        return result;
    }

    result.success = true;
    return result;
}

HeadResult CurlSession::head(const std::string& url) {
    HeadResult result;

    EasyHandle easy;
    if (!easy.curl) {
        result.error_message = "Failed to initialize CURL handle";
        return result;
    }

    setup_common_options(easy.curl, url, nullptr);
    curl_easy_setopt(easy.curl, CURLOPT_NOBODY, 1L);  // HEAD request
    curl_easy_setopt(easy.curl, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(easy.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(easy.curl, CURLOPT_HEADERDATA, &result.headers);

    CURLcode res = curl_easy_perform(easy.curl);

    long http_code = 0;
    curl_easy_getinfo(easy.curl, CURLINFO_RESPONSE_CODE, &http_code);
    result.http_code = static_cast<int>(http_code);

    if (res != CURLE_OK) {
        result.error_message = curl_easy_strerror(res);
        log_debug("HEAD " + url + " failed: " + result.error_message);
        return result;
    }

    result.success = http_code >= 200 && http_code < 300;
    if (!result.success) {
        result.error_message = "HTTP error: " + std::to_string(http_code);
    }
    return result;
}

} // namespace dlkeeper
