/*
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "dlkeeper/config.h"
#include "dlkeeper/dispatcher.h"
#include "dlkeeper/http_session.h"
#include "dlkeeper/range_backend.h"
#include "dlkeeper/thread_pool.h"
#include "dlkeeper/transfer_registry.h"

namespace dlkeeper {
namespace test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("dlkeeper-test-" + std::to_string(rd()));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Non-repeating test payload of n bytes
inline std::string make_body(size_t n) {
    std::string body(n, '\0');
    for (size_t i = 0; i < n; ++i) {
        body[i] = static_cast<char>((i * 31 + i / 7) % 251);
    }
    return body;
}

// What the fake server returns for a URL
struct FakeResource {
    std::string body;
    std::string accept_ranges = "bytes";    // Empty: header not sent
    bool honor_range = true;                // false: answer 200 to ranged requests
    int status = 0;                         // Non-zero: fixed status, empty body
    size_t chunk_size = 16;
    size_t stall_after_chunks = 0;          // Non-zero: block until cancelled
    std::string fail_after_chunks_with;     // Non-empty: network error after stall point
    std::string throw_with;                 // Non-empty: fetch throws std::runtime_error
};

// In-process HttpSession serving FakeResources
class FakeHttpSession : public HttpSession {
public:
    void serve(const std::string& url, FakeResource resource) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = std::move(resource);
    }

    std::vector<std::optional<uint64_t>> range_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ranges_;
    }

    FetchResult fetch(const FetchRequest& request, FetchHandler& handler) override {
        FetchResult result;
        FakeResource resource;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ranges_.push_back(request.range_start);
            auto it = resources_.find(request.url);
            if (it == resources_.end()) {
                result.error_message = "Couldn't resolve host name";
                return result;
            }
            resource = it->second;
        }

        if (!resource.throw_with.empty()) {
            throw std::runtime_error(resource.throw_with);
        }

        CancelToken* token = request.cancel.get();
        auto cancelled = [&]() {
            result.cancelled = true;
            result.error_message = "Download cancelled";
            return result;
        };

        ResponseHeaders headers;
        headers.accept_ranges = resource.accept_ranges;

        if (resource.status != 0) {
            result.http_code = resource.status;
            headers.content_length = 0;
            if (!handler.on_response(resource.status, headers)) {
                result.error_message = "Transfer aborted";
                return result;
            }
            result.success = true;
            return result;
        }

        size_t start = 0;
        int code = 200;
        if (request.range_start && resource.honor_range) {
            start = static_cast<size_t>(*request.range_start);
            code = 206;
        }
        result.http_code = code;
        headers.content_length = static_cast<int64_t>(resource.body.size() - start);

        if (token && token->is_cancelled()) return cancelled();
        if (!handler.on_response(code, headers)) {
            if (token && token->is_cancelled()) return cancelled();
            result.error_message = "Transfer aborted";
            return result;
        }

        size_t chunks = 0;
        for (size_t pos = start; pos < resource.body.size(); pos += resource.chunk_size) {
            if (resource.stall_after_chunks != 0 && chunks == resource.stall_after_chunks) {
                if (!resource.fail_after_chunks_with.empty()) {
                    result.error_message = resource.fail_after_chunks_with;
                    return result;
                }
                auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
                while (!(token && token->is_cancelled()) &&
                       std::chrono::steady_clock::now() < deadline) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
            }
            if (token && token->is_cancelled()) return cancelled();

            size_t length = std::min(resource.chunk_size, resource.body.size() - pos);
            if (!handler.on_chunk(resource.body.data() + pos, length)) {
                if (token && token->is_cancelled()) return cancelled();
                result.error_message = "Transfer aborted";
                return result;
            }
            result.bytes_received += static_cast<int64_t>(length);
            chunks++;
        }

        result.success = true;
        return result;
    }

private:
    std::map<std::string, FakeResource> resources_;
    std::vector<std::optional<uint64_t>> ranges_;
    mutable std::mutex mutex_;
};

// Registry, queue dispatcher, fake HTTP and a range backend wired together.
// The pool is drained in the destructor before the backend goes away.
struct RangeHarness {
    explicit RangeHarness(const std::string& download_dir)
        : pool(2), backend(registry, dispatcher, http, pool, make_config(download_dir)) {}

    ~RangeHarness() {
        pool.shutdown();
    }

    static TransferConfig make_config(const std::string& download_dir) {
        TransferConfig config;
        config.download_dir = download_dir;
        return config;
    }

    bool wait_for(const std::function<bool()>& done) {
        return dispatcher.run_until(done, std::chrono::seconds(10));
    }

    TransferStatus status(TransferId id) const {
        return registry.get(id)->status;
    }

    TransferRegistry registry;
    QueueDispatcher dispatcher;
    FakeHttpSession http;
    ThreadPool pool;
    RangeBackend backend;
};

} // namespace test
} // namespace dlkeeper
