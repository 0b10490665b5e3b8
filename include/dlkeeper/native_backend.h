/*
 * native_backend.h - Bridge between engine-managed downloads and the registry
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

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include "dlkeeper/config.h"
#include "dlkeeper/range_backend.h"
#include "dlkeeper/transfer_registry.h"

namespace dlkeeper {

// A download owned by the embedded web engine
class NativeDownload {
public:
    virtual ~NativeDownload() = default;

    virtual std::string source_url() const = 0;
    virtual void set_destination(const std::string& path) = 0;
    virtual void cancel() = 0;

    virtual uint64_t received_bytes() const = 0;
    virtual uint64_t expected_bytes() const = 0;    // 0 if unknown

    // True once response headers can be read
    virtual bool has_response() const = 0;
    virtual std::optional<std::string> response_header(const std::string& name) const = 0;
};

// URLs the user asked to "Save As", plus the folder they last saved into
class SaveAsIntents {
public:
    void mark(const std::string& url);

    // Returns whether url was marked, and unmarks it
    bool take(const std::string& url);

    std::string last_directory() const { return last_directory_; }
    void set_last_directory(const std::string& dir) { last_directory_ = dir; }

private:
    std::set<std::string> urls_;
    std::string last_directory_;
};

// Asks the user where to save. The callback receives the chosen path, or
// nullopt if the dialog was dismissed.
class DestinationChooser {
public:
    using Callback = std::function<void(std::optional<std::string> path)>;

    virtual ~DestinationChooser() = default;
    virtual void choose(const std::string& suggested_name, const std::string& initial_dir,
                        Callback done) = 0;
};

class NativeDownloadAdapter;

// Tracks one engine download; the engine's event handlers call into it.
// All methods run on the registry thread.
class NativeTransfer : public std::enable_shared_from_this<NativeTransfer> {
public:
    NativeTransfer(NativeDownloadAdapter& adapter, std::shared_ptr<NativeDownload> download);

    void on_decide_destination(const std::string& suggested_filename);
    void on_received_data();
    void on_finished();
    void on_failed(const std::string& message);

    // Set once a destination was accepted
    std::optional<TransferId> id() const { return id_; }

private:
    void accept_chosen(const std::string& suggested_filename, const std::string& path);
    void accept_automatic(const std::string& suggested_filename);
    bool detached();
    void check_resume_support();

    NativeDownloadAdapter& adapter_;
    std::shared_ptr<NativeDownload> download_;
    std::optional<TransferId> id_;
    bool resume_checked_ = false;
    bool detached_ = false;
};

class NativeDownloadAdapter {
public:
    NativeDownloadAdapter(TransferRegistry& registry, SaveAsIntents& intents,
                          DestinationChooser& chooser, RangeBackend& range_backend,
                          const TransferConfig& config);

    NativeDownloadAdapter(const NativeDownloadAdapter&) = delete;
    NativeDownloadAdapter& operator=(const NativeDownloadAdapter&) = delete;

    // Wrap a download the engine just started
    std::shared_ptr<NativeTransfer> track(std::shared_ptr<NativeDownload> download);

    TransferRegistry& registry() { return registry_; }
    SaveAsIntents& intents() { return intents_; }
    DestinationChooser& chooser() { return chooser_; }
    RangeBackend& range_backend() { return range_backend_; }
    const TransferConfig& config() const { return config_; }

    // Where downloads without a Save-As intent go from now on
    void set_download_dir(const std::string& dir) { config_.download_dir = dir; }

private:
    TransferRegistry& registry_;
    SaveAsIntents& intents_;
    DestinationChooser& chooser_;
    RangeBackend& range_backend_;
    TransferConfig config_;
};

} // namespace dlkeeper
