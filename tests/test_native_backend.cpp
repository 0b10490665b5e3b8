#include "dlkeeper/native_backend.h"
#include "dlkeeper/partial_file.h"
#include "test_support.h"
#include <iostream>
#include <cassert>
#include <filesystem>

using namespace dlkeeper;
using namespace dlkeeper::test;

namespace {

const std::string URL = "http://files.example.com/payload.bin";

// Stands in for an engine download. Cancelling deletes the partial file,
// as the web engine does.
class FakeNativeDownload : public NativeDownload {
public:
    FakeNativeDownload(std::string url, uint64_t expected, std::optional<std::string> accept_ranges)
        : url_(std::move(url)), expected_(expected), accept_ranges_(std::move(accept_ranges)) {}

    std::string source_url() const override { return url_; }
    void set_destination(const std::string& path) override { destination = path; }

    void cancel() override {
        cancel_calls++;
        if (!destination.empty()) {
            std::error_code ec;
            std::filesystem::remove(destination, ec);
        }
    }

    uint64_t received_bytes() const override { return received_; }
    uint64_t expected_bytes() const override { return expected_; }
    bool has_response() const override { return responded_ && !headers_pending; }

    std::optional<std::string> response_header(const std::string& name) const override {
        if (name == "Accept-Ranges") return accept_ranges_;
        return std::nullopt;
    }

    void deliver(const std::string& data) {
        responded_ = true;
        std::ofstream out(destination, std::ios::binary | std::ios::app);
        out << data;
        received_ += data.size();
    }

    std::string destination;
    int cancel_calls = 0;
    bool headers_pending = false;   // Data flows but headers are not readable yet

private:
    std::string url_;
    uint64_t expected_;
    std::optional<std::string> accept_ranges_;
    uint64_t received_ = 0;
    bool responded_ = false;
};

// Answers every dialog with a preset path (or dismissal)
class ScriptedChooser : public DestinationChooser {
public:
    void choose(const std::string& suggested_name, const std::string& initial_dir,
                Callback done) override {
        calls++;
        last_suggested = suggested_name;
        last_initial_dir = initial_dir;
        done(answer);
    }

    std::optional<std::string> answer;
    std::string last_suggested;
    std::string last_initial_dir;
    int calls = 0;
};

struct NativeHarness {
    explicit NativeHarness(const TempDir& dir)
        : range(dir.path()),
          adapter(range.registry, intents, chooser, range.backend,
                  RangeHarness::make_config(dir.path())) {}

    RangeHarness range;
    SaveAsIntents intents;
    ScriptedChooser chooser;
    NativeDownloadAdapter adapter;
};

} // namespace

void test_pause_backup_and_range_resume() {
    TempDir dir;
    NativeHarness h(dir);
    std::string body = make_body(100);
    FakeResource resource;
    resource.body = body;
    resource.chunk_size = 10;
    h.range.http.serve(URL, resource);

    auto download = std::make_shared<FakeNativeDownload>(URL, 100, std::string("bytes"));
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("payload.bin");

    assert(transfer->id());
    TransferId id = *transfer->id();
    std::string dest = dir.file("payload.bin");
    assert(download->destination == dest);
    assert(h.chooser.calls == 0);

    download->deliver(body.substr(0, 50));
    transfer->on_received_data();

    auto state = h.range.registry.get(id);
    assert(state->received_bytes == 50);
    assert(state->total_bytes == 100);
    assert(state->supports_resume);

    h.range.registry.pause(id);
    assert(download->cancel_calls == 1);
    assert(!std::filesystem::exists(dest));
    assert(read_file(dest + ".part") == body.substr(0, 50));

    // The engine reports its own cancellation afterwards
    transfer->on_failed("Download cancelled");
    transfer->on_received_data();
    assert(h.range.status(id) == TransferStatus::PAUSED);

    h.range.registry.resume(id);
    assert(h.range.wait_for([&]() {
        return h.range.status(id) == TransferStatus::COMPLETED;
    }));

    assert(read_file(dest) == body);
    assert(h.range.registry.get(id)->received_bytes == 100);
    auto ranges = h.range.http.range_requests();
    assert(ranges.size() == 1);
    assert(ranges[0] && *ranges[0] == 50);

    // Nothing the old download says can touch the finished transfer
    transfer->on_finished();
    assert(h.range.status(id) == TransferStatus::COMPLETED);

    std::cout << "test_pause_backup_and_range_resume passed!" << std::endl;
}

void test_auto_save_picks_unique_name() {
    TempDir dir;
    NativeHarness h(dir);
    write_file(dir.file("report.pdf"), "old");
    write_file(dir.file("report.(1).pdf"), "older");

    auto download = std::make_shared<FakeNativeDownload>("http://x/report.pdf", 10, std::nullopt);
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("report.pdf");

    assert(download->destination == dir.file("report.(2).pdf"));
    auto state = h.range.registry.get(*transfer->id());
    assert(state->filename == "report.(2).pdf");
    assert(state->destination == dir.file("report.(2).pdf"));
    assert(h.range.registry.has_cancel_action(state->id));
    assert(h.range.registry.has_resume_action(state->id));

    std::cout << "test_auto_save_picks_unique_name passed!" << std::endl;
}

void test_completion() {
    TempDir dir;
    NativeHarness h(dir);

    auto download = std::make_shared<FakeNativeDownload>(URL, 100, std::string("none"));
    auto transfer = h.adapter.track(download);

    // Nothing is recorded before a destination is accepted
    transfer->on_received_data();
    transfer->on_finished();
    assert(h.range.registry.size() == 0);

    transfer->on_decide_destination("payload.bin");
    TransferId id = *transfer->id();

    // Sizes are recorded even before the response headers are readable
    transfer->on_received_data();
    assert(h.range.registry.get(id)->total_bytes == 100);
    assert(h.range.registry.get(id)->received_bytes == 0);

    download->deliver(make_body(100));
    transfer->on_received_data();
    assert(!h.range.registry.get(id)->supports_resume);

    transfer->on_finished();
    auto state = h.range.registry.get(id);
    assert(state->status == TransferStatus::COMPLETED);
    assert(state->received_bytes == 100);
    assert(!h.range.registry.has_cancel_action(id));
    assert(!h.range.registry.has_resume_action(id));

    std::cout << "test_completion passed!" << std::endl;
}

void test_unknown_size_completion() {
    TempDir dir;
    NativeHarness h(dir);

    auto download = std::make_shared<FakeNativeDownload>(URL, 0, std::nullopt);
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("payload.bin");
    TransferId id = *transfer->id();

    download->deliver(make_body(40));
    transfer->on_received_data();
    transfer->on_finished();

    auto state = h.range.registry.get(id);
    assert(state->status == TransferStatus::COMPLETED);
    assert(state->received_bytes == 40);
    assert(state->total_bytes == 40);

    std::cout << "test_unknown_size_completion passed!" << std::endl;
}

void test_short_finish_is_cancelled() {
    TempDir dir;
    NativeHarness h(dir);

    auto download = std::make_shared<FakeNativeDownload>(URL, 100, std::string("bytes"));
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("payload.bin");
    TransferId id = *transfer->id();

    download->deliver(make_body(30));
    transfer->on_received_data();
    transfer->on_finished();

    assert(h.range.status(id) == TransferStatus::CANCELLED);
    assert(!h.range.registry.has_cancel_action(id));

    std::cout << "test_short_finish_is_cancelled passed!" << std::endl;
}

void test_failure_keeps_resume_action() {
    TempDir dir;
    NativeHarness h(dir);

    auto download = std::make_shared<FakeNativeDownload>(URL, 100, std::string("bytes"));
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("payload.bin");
    TransferId id = *transfer->id();

    download->deliver(make_body(20));
    transfer->on_received_data();
    transfer->on_failed("Network disconnected");

    auto state = h.range.registry.get(id);
    assert(state->status == TransferStatus::FAILED);
    assert(state->error_message == "Network disconnected");
    assert(!h.range.registry.has_cancel_action(id));
    assert(h.range.registry.has_resume_action(id));

    std::cout << "test_failure_keeps_resume_action passed!" << std::endl;
}

void test_save_as_dismissed() {
    TempDir dir;
    NativeHarness h(dir);
    h.intents.mark(URL);

    auto download = std::make_shared<FakeNativeDownload>(URL, 100, std::string("bytes"));
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("payload.bin");

    assert(h.chooser.calls == 1);
    assert(h.chooser.last_suggested == "payload.bin");
    assert(h.chooser.last_initial_dir == dir.path());
    assert(!transfer->id());
    assert(download->cancel_calls == 1);
    assert(h.range.registry.size() == 0);

    // The intent is used up
    assert(!h.intents.take(URL));

    std::cout << "test_save_as_dismissed passed!" << std::endl;
}

void test_save_as_chosen_path() {
    TempDir dir;
    NativeHarness h(dir);
    std::string chosen_dir = dir.file("chosen");
    std::filesystem::create_directories(chosen_dir);

    h.intents.mark(URL);
    h.chooser.answer = chosen_dir + "/renamed.bin";

    auto download = std::make_shared<FakeNativeDownload>(URL, 100, std::string("bytes"));
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("payload.bin");

    TransferId id = *transfer->id();
    assert(download->destination == chosen_dir + "/renamed.bin");
    assert(h.intents.last_directory() == chosen_dir);

    auto state = h.range.registry.get(id);
    assert(state->destination == chosen_dir + "/renamed.bin");
    assert(h.range.registry.has_cancel_action(id));
    assert(!h.range.registry.has_resume_action(id));

    // Cancelling reaches the engine and no backup is made
    download->deliver(make_body(10));
    h.range.registry.cancel(id);
    assert(download->cancel_calls == 1);
    assert(!std::filesystem::exists(chosen_dir + "/renamed.bin.part"));
    transfer->on_failed("Download cancelled");
    assert(h.range.status(id) == TransferStatus::CANCELLED);

    // Next dialog opens where the last file went
    h.intents.mark(URL);
    h.chooser.answer = std::nullopt;
    auto second = h.adapter.track(std::make_shared<FakeNativeDownload>(URL, 1, std::nullopt));
    second->on_decide_destination("payload.bin");
    assert(h.chooser.last_initial_dir == chosen_dir);

    std::cout << "test_save_as_chosen_path passed!" << std::endl;
}

void test_lost_backup_fails_resume() {
    TempDir dir;
    NativeHarness h(dir);
    std::string body = make_body(100);
    FakeResource resource;
    resource.body = body;
    h.range.http.serve(URL, resource);

    auto download = std::make_shared<FakeNativeDownload>(URL, 100, std::string("bytes"));
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("payload.bin");
    TransferId id = *transfer->id();
    std::string dest = dir.file("payload.bin");

    download->deliver(body.substr(0, 50));
    transfer->on_received_data();
    h.range.registry.pause(id);
    transfer->on_failed("Download cancelled");

    // Backup lost: nothing to append the remaining bytes to
    std::filesystem::remove(dest + ".part");
    h.range.registry.resume(id);
    h.range.pool.wait_all();
    h.range.dispatcher.run_pending();

    auto state = h.range.registry.get(id);
    assert(state->status == TransferStatus::FAILED);
    assert(state->error_message == "Partial file missing: " + dest);
    assert(h.range.http.range_requests().empty());
    assert(!std::filesystem::exists(dest));

    std::cout << "test_lost_backup_fails_resume passed!" << std::endl;
}

void test_pause_before_headers_stays_resumable() {
    TempDir dir;
    NativeHarness h(dir);
    std::string body = make_body(100);
    FakeResource resource;
    resource.body = body;
    h.range.http.serve(URL, resource);

    auto download = std::make_shared<FakeNativeDownload>(URL, 100, std::string("bytes"));
    download->headers_pending = true;
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("payload.bin");
    TransferId id = *transfer->id();
    std::string dest = dir.file("payload.bin");

    download->deliver(body.substr(0, 50));
    transfer->on_received_data();
    assert(h.range.registry.get(id)->received_bytes == 50);
    assert(!h.range.registry.get(id)->supports_resume);

    h.range.registry.pause(id);
    transfer->on_failed("Download cancelled");

    // Headers become readable only after the pause
    download->headers_pending = false;
    transfer->on_received_data();
    auto state = h.range.registry.get(id);
    assert(state->status == TransferStatus::PAUSED);
    assert(state->supports_resume);
    assert(state->received_bytes == 50);

    h.range.registry.resume(id);
    assert(h.range.wait_for([&]() {
        return h.range.status(id) == TransferStatus::COMPLETED;
    }));
    assert(read_file(dest) == body);

    std::cout << "test_pause_before_headers_stays_resumable passed!" << std::endl;
}

void test_cancel_after_pause_drops_backup() {
    TempDir dir;
    NativeHarness h(dir);

    auto download = std::make_shared<FakeNativeDownload>(URL, 100, std::string("bytes"));
    auto transfer = h.adapter.track(download);
    transfer->on_decide_destination("payload.bin");
    TransferId id = *transfer->id();
    std::string dest = dir.file("payload.bin");

    download->deliver(make_body(50));
    transfer->on_received_data();
    h.range.registry.pause(id);
    assert(std::filesystem::exists(dest + ".part"));

    h.range.registry.cancel(id);
    assert(h.range.status(id) == TransferStatus::CANCELLED);
    assert(!std::filesystem::exists(dest + ".part"));

    std::cout << "test_cancel_after_pause_drops_backup passed!" << std::endl;
}

int main() {
    try {
        test_pause_backup_and_range_resume();
        test_auto_save_picks_unique_name();
        test_completion();
        test_unknown_size_completion();
        test_short_finish_is_cancelled();
        test_failure_keeps_resume_action();
        test_save_as_dismissed();
        test_save_as_chosen_path();
        test_lost_backup_fails_resume();
        test_pause_before_headers_stays_resumable();
        test_cancel_after_pause_drops_backup();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
