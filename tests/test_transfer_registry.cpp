#include "dlkeeper/transfer_registry.h"
#include <iostream>
#include <cassert>
#include <vector>

using namespace dlkeeper;

namespace {

// Records what the registry had stored when the action ran
class RecordingCancelAction : public CancelAction {
public:
    explicit RecordingCancelAction(TransferRegistry& registry) : registry_(registry) {}

    void cancel(TransferId id, TransferStatus recorded) override {
        calls.push_back(recorded);
        seen_status.push_back(registry_.get(id)->status);
    }

    std::vector<TransferStatus> calls;
    std::vector<TransferStatus> seen_status;

private:
    TransferRegistry& registry_;
};

class CountingResumeAction : public ResumeAction {
public:
    void resume(TransferId id) override {
        last_id = id;
        count++;
    }

    int count = 0;
    TransferId last_id = 0;
};

} // namespace

void test_ids_are_monotonic() {
    TransferRegistry registry;
    TransferId a = registry.add("http://x/a", "a", "/tmp/a");
    TransferId b = registry.add("http://x/b", "b", "/tmp/b");
    registry.remove(a);
    TransferId c = registry.add("http://x/c", "c", "/tmp/c");

    assert(a == 1);
    assert(b > a);
    assert(c > b);
    assert(registry.get(b)->status == TransferStatus::IN_PROGRESS);

    std::cout << "test_ids_are_monotonic passed!" << std::endl;
}

void test_unknown_ids_are_ignored() {
    TransferRegistry registry;
    int notifications = 0;
    registry.subscribe([&notifications]() { notifications++; });

    registry.update_progress(42, 10, 100);
    registry.set_status(42, TransferStatus::FAILED, "boom");
    registry.set_supports_resume(42, true);
    registry.cancel(42);
    registry.pause(42);
    registry.resume(42);

    assert(registry.size() == 0);
    assert(!registry.has_any());
    assert(!registry.get(42));
    assert(notifications == 0);

    std::cout << "test_unknown_ids_are_ignored passed!" << std::endl;
}

void test_cancel_records_status_before_action() {
    TransferRegistry registry;
    TransferId id = registry.add("http://x/a", "a", "/tmp/a");
    auto action = std::make_shared<RecordingCancelAction>(registry);
    registry.register_cancel_action(id, action);

    registry.cancel(id);

    assert(action->calls.size() == 1);
    assert(action->calls[0] == TransferStatus::CANCELLED);
    assert(action->seen_status[0] == TransferStatus::CANCELLED);

    // Late failure from the backend is suppressed
    registry.set_status(id, TransferStatus::FAILED, "connection reset");
    assert(registry.get(id)->status == TransferStatus::CANCELLED);
    assert(registry.get(id)->error_message.empty());

    // Cancelling again does not rerun the action
    registry.cancel(id);
    assert(action->calls.size() == 1);

    std::cout << "test_cancel_records_status_before_action passed!" << std::endl;
}

void test_pause_passes_paused_to_action() {
    TransferRegistry registry;
    TransferId id = registry.add("http://x/a", "a", "/tmp/a");
    auto action = std::make_shared<RecordingCancelAction>(registry);
    registry.register_cancel_action(id, action);

    registry.pause(id);
    assert(action->calls.size() == 1);
    assert(action->calls[0] == TransferStatus::PAUSED);
    assert(action->seen_status[0] == TransferStatus::PAUSED);
    assert(registry.is_paused(id));
    assert(!registry.is_active(id));

    // Only an in-progress transfer can be paused
    registry.pause(id);
    assert(action->calls.size() == 1);

    // Paused transfers can still be cancelled
    registry.cancel(id);
    assert(action->calls.size() == 2);
    assert(action->calls[1] == TransferStatus::CANCELLED);

    std::cout << "test_pause_passes_paused_to_action passed!" << std::endl;
}

void test_resume_requires_support() {
    TransferRegistry registry;
    TransferId id = registry.add("http://x/a", "a", "/tmp/a");
    auto action = std::make_shared<CountingResumeAction>();
    registry.register_resume_action(id, action);

    // Not paused yet
    registry.resume(id);
    assert(action->count == 0);

    registry.pause(id);
    registry.resume(id);
    assert(action->count == 0);   // Server never advertised ranges

    registry.set_supports_resume(id, true);
    assert(registry.get(id)->can_resume());
    registry.resume(id);
    assert(action->count == 1);
    assert(action->last_id == id);

    // Status is left to the backend
    assert(registry.is_paused(id));

    std::cout << "test_resume_requires_support passed!" << std::endl;
}

void test_terminal_transfers_are_frozen() {
    TransferRegistry registry;
    TransferId id = registry.add("http://x/a", "a", "/tmp/a");
    registry.update_progress(id, 100, 100);
    registry.set_status(id, TransferStatus::COMPLETED);

    registry.update_progress(id, 5, 200);
    registry.set_status(id, TransferStatus::FAILED, "late");
    registry.set_status(id, TransferStatus::IN_PROGRESS);

    auto transfer = registry.get(id);
    assert(transfer->status == TransferStatus::COMPLETED);
    assert(transfer->received_bytes == 100);
    assert(transfer->total_bytes == 100);

    TransferId failed = registry.add("http://x/b", "b", "/tmp/b");
    registry.set_status(failed, TransferStatus::FAILED, "Server returned status 500");
    assert(registry.get(failed)->error_message == "Server returned status 500");
    registry.cancel(failed);
    assert(registry.get(failed)->status == TransferStatus::FAILED);

    std::cout << "test_terminal_transfers_are_frozen passed!" << std::endl;
}

void test_clear_completed_keeps_live_transfers() {
    TransferRegistry registry;
    TransferId running = registry.add("http://x/1", "1", "/tmp/1");
    TransferId paused = registry.add("http://x/2", "2", "/tmp/2");
    TransferId done = registry.add("http://x/3", "3", "/tmp/3");
    TransferId failed = registry.add("http://x/4", "4", "/tmp/4");
    TransferId cancelled = registry.add("http://x/5", "5", "/tmp/5");

    registry.register_resume_action(paused, std::make_shared<CountingResumeAction>());
    registry.register_resume_action(failed, std::make_shared<CountingResumeAction>());

    registry.pause(paused);
    registry.set_status(done, TransferStatus::COMPLETED);
    registry.set_status(failed, TransferStatus::FAILED, "x");
    registry.cancel(cancelled);

    registry.clear_completed();

    assert(registry.size() == 2);
    assert(registry.get(running));
    assert(registry.get(paused));
    assert(!registry.get(done));
    assert(!registry.get(failed));
    assert(!registry.get(cancelled));
    assert(registry.has_resume_action(paused));
    assert(!registry.has_resume_action(failed));

    std::cout << "test_clear_completed_keeps_live_transfers passed!" << std::endl;
}

void test_remove_drops_actions() {
    TransferRegistry registry;
    TransferId id = registry.add("http://x/a", "a", "/tmp/a");
    registry.register_cancel_action(id, std::make_shared<RecordingCancelAction>(registry));
    registry.register_resume_action(id, std::make_shared<CountingResumeAction>());

    registry.remove(id);
    registry.remove(id);

    assert(!registry.get(id));
    assert(!registry.has_cancel_action(id));
    assert(!registry.has_resume_action(id));

    std::cout << "test_remove_drops_actions passed!" << std::endl;
}

void test_list_is_newest_first() {
    TransferRegistry registry;
    for (int i = 0; i < 12; ++i) {
        registry.add("http://x/" + std::to_string(i), std::to_string(i), "/tmp/f");
    }

    auto recent = registry.list(10);
    assert(recent.size() == 10);
    assert(recent.front().id == 12);
    assert(recent.back().id == 3);

    auto all = registry.list(100);
    assert(all.size() == 12);
    assert(all.back().id == 1);

    std::cout << "test_list_is_newest_first passed!" << std::endl;
}

void test_observers() {
    TransferRegistry registry;
    int first = 0;
    int second = 0;

    SubscriptionId sub = 0;
    sub = registry.subscribe([&]() {
        first++;
        // Observers may call back into the registry
        if (first == 2) registry.unsubscribe(sub);
    });
    registry.subscribe([&]() {
        second++;
        assert(registry.has_any());
    });

    TransferId id = registry.add("http://x/a", "a", "/tmp/a");
    registry.update_progress(id, 1, 2);
    registry.update_progress(id, 2, 2);

    assert(first == 2);
    assert(second == 3);
    assert(registry.has_active());

    std::cout << "test_observers passed!" << std::endl;
}

void test_status_text() {
    Transfer transfer;
    transfer.status = TransferStatus::PAUSED;
    transfer.received_bytes = 512;
    transfer.total_bytes = 2048;
    assert(transfer.status_text() == "Paused (resume not supported) - 512 B / 2 KB");
    transfer.supports_resume = true;
    assert(transfer.status_text() == "Paused - 512 B / 2 KB");
    assert(transfer.progress() == 0.25);

    transfer.status = TransferStatus::FAILED;
    transfer.error_message = "Server returned status 404";
    assert(transfer.status_text() == "Failed: Server returned status 404");

    transfer.status = TransferStatus::COMPLETED;
    assert(transfer.status_text() == "Completed");
    assert(transfer.speed_bps() == 0.0);
    assert(!transfer.eta_seconds());

    assert(format_bytes(0) == "0 B");
    assert(format_bytes(1536) == "2 KB");
    assert(format_bytes(5 * 1024 * 1024 + 512 * 1024) == "5.5 MB");
    assert(format_bytes(3ULL * 1024 * 1024 * 1024) == "3.0 GB");
    assert(format_speed(2048.0) == "2 KB/s");
    assert(format_duration(42) == "42s");
    assert(format_duration(125) == "2m 5s");
    assert(format_duration(7322) == "2h 2m");

    Transfer unknown_total;
    unknown_total.total_bytes = 0;
    unknown_total.received_bytes = 100;
    assert(unknown_total.progress() == 0.0);
    assert(unknown_total.size_string() == "100 B");

    std::cout << "test_status_text passed!" << std::endl;
}

int main() {
    try {
        test_ids_are_monotonic();
        test_unknown_ids_are_ignored();
        test_cancel_records_status_before_action();
        test_pause_passes_paused_to_action();
        test_resume_requires_support();
        test_terminal_transfers_are_frozen();
        test_clear_completed_keeps_live_transfers();
        test_remove_drops_actions();
        test_list_is_newest_first();
        test_observers();
        test_status_text();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
