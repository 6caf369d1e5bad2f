#include "PartitionAssigner.hpp"
#include "StateStore.hpp"
#include "TestDoubles.hpp"

#include <atomic>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

using testing_support::TempDir;

namespace {

void testWorkItemLifecycle() {
    TempDir dir("state_lifecycle");
    StateStore state(dir.path() / "state.db");

    state.upsertWorkItem("w1", "j1", "first");
    // insert-if-absent keeps the original row
    state.upsertWorkItem("w1", "j1", "renamed");
    auto row = state.getWorkItem("w1", "j1");
    assert(row);
    assert(row->name == "first");
    assert(row->status == Status::Pending);
    assert(row->files_total == 0);
    assert(!row->started_at);

    assert(row->workitem_id == "w1");
    assert(row->job_id == "j1");

    // same id under another job is a different item
    state.upsertWorkItem("w1", "j2", "other job");
    auto rows = state.listWorkItems();
    assert(rows.size() == 2);
    for (const auto& r : rows) {
        assert(r.workitem_id == "w1");
        assert((r.job_id == "j1" && r.name == "first") || (r.job_id == "j2" && r.name == "other job"));
    }

    state.setWorkItemStatus("w1", "j1", Status::InProgress);
    row = state.getWorkItem("w1", "j1");
    assert(row->status == Status::InProgress);
    assert(row->started_at);
    assert(!row->completed_at);

    state.setWorkItemStatus("w1", "j1", Status::Failed, std::string("boom"));
    row = state.getWorkItem("w1", "j1");
    assert(row->status == Status::Failed);
    assert(row->completed_at);
    assert(row->error_message && *row->error_message == "boom");

    bool threw = false;
    try {
        state.setWorkItemStatus("missing", "j1", Status::Completed);
    }
    catch (const StoreError&) {
        threw = true;
    }
    assert(threw);
    assert(!state.getWorkItemStatus("missing", "j1"));
}

void testFileClaims() {
    TempDir dir("state_claims");
    StateStore state(dir.path() / "state.db");
    state.upsertWorkItem("w1", "j1", "name");
    state.setFilesTotal("w1", "j1", 2);

    state.upsertFile("w1", "j1", "a.json", "uri/a");
    state.upsertFile("w1", "j1", "a.json", "uri/changed");
    auto file = state.getFile("w1", "j1", "a.json");
    assert(file && file->source_uri == "uri/a");
    assert(file->status == Status::Pending);

    assert(state.claimFile("w1", "j1", "a.json"));
    assert(!state.claimFile("w1", "j1", "a.json"));
    assert(!state.claimFile("w1", "j1", "nope.json"));

    // a failed file may be claimed again
    state.setFileStatus("w1", "j1", "a.json", Status::Failed, std::string("download failed"));
    file = state.getFile("w1", "j1", "a.json");
    assert(file->error_message && *file->error_message == "download failed");
    assert(state.claimFile("w1", "j1", "a.json"));
    assert(!state.getFile("w1", "j1", "a.json")->error_message);

    state.setFileStatus("w1", "j1", "a.json", Status::Completed);
    state.setFileStatus("w1", "j1", "a.json", Status::Completed);
    assert(state.getWorkItem("w1", "j1")->files_processed == 1);
    assert(!state.claimFile("w1", "j1", "a.json"));

    bool threw = false;
    try {
        state.setFileStatus("w1", "j1", "ghost.json", Status::Completed);
    }
    catch (const StoreError&) {
        threw = true;
    }
    assert(threw);
    assert(state.getWorkItem("w1", "j1")->files_processed == 1);

    // files belong to a known work item
    threw = false;
    try {
        state.upsertFile("orphan", "j1", "x.json", "uri/x");
    }
    catch (const StoreError&) {
        threw = true;
    }
    assert(threw);
}

void testConcurrentClaimHasOneWinner() {
    TempDir dir("state_race");
    StateStore state(dir.path() / "state.db", 16);
    state.upsertWorkItem("w1", "j1", "name");
    const int files = 20;
    for (int i = 0; i < files; ++i) {
        state.upsertFile("w1", "j1", "f" + std::to_string(i), "uri");
    }

    const int threads = 8;
    std::vector<std::atomic<int>> wins(files);
    for (auto& w : wins) w.store(0);
    std::atomic<bool> go{false};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            while (!go.load()) std::this_thread::yield();
            for (int i = 0; i < files; ++i) {
                if (state.claimFile("w1", "j1", "f" + std::to_string(i))) ++wins[i];
            }
        });
    }
    go.store(true);
    for (auto& w : workers) w.join();

    for (auto& w : wins) assert(w.load() == 1);
}

void testConcurrentCompletionCountsOnce() {
    TempDir dir("state_complete_race");
    StateStore state(dir.path() / "state.db", 8);
    state.upsertWorkItem("w1", "j1", "name");
    state.upsertFile("w1", "j1", "a.json", "uri");

    std::vector<std::thread> workers;
    for (int t = 0; t < 6; ++t) {
        workers.emplace_back([&] { state.setFileStatus("w1", "j1", "a.json", Status::Completed); });
    }
    for (auto& w : workers) w.join();
    assert(state.getWorkItem("w1", "j1")->files_processed == 1);
}

void testPendingListAndSummary() {
    TempDir dir("state_summary");
    StateStore state(dir.path() / "state.db");
    state.upsertWorkItem("w3", "j", "c");
    state.upsertWorkItem("w1", "j", "a");
    state.upsertWorkItem("w2", "j", "b");
    state.upsertWorkItem("w4", "j", "d");
    state.setWorkItemStatus("w2", "j", Status::Completed);
    state.setWorkItemStatus("w3", "j", Status::Failed, std::string("x"));
    state.setWorkItemStatus("w4", "j", Status::InProgress);

    auto pending = state.getPendingWorkItems();
    assert(pending.size() == 3);
    assert(pending[0].workitem_id == "w1");
    assert(pending[1].workitem_id == "w3");
    assert(pending[2].workitem_id == "w4");

    assert(state.listWorkItems(Status::Completed).size() == 1);

    state.upsertFile("w1", "j", "a", "u");
    state.upsertFile("w1", "j", "b", "u");
    state.upsertFile("w2", "j", "c", "u");
    state.setFileStatus("w2", "j", "c", Status::Completed);
    assert(state.claimFile("w1", "j", "a"));

    Summary s = state.getSummary();
    assert(s.total == 4);
    assert(s.pending == 1);
    assert(s.in_progress == 1);
    assert(s.completed == 1);
    assert(s.failed == 1);
    assert(s.total_files == 3);
    assert(s.processed_files == 1);

    auto completed = state.listCompletedFiles();
    assert(completed.size() == 1);
    assert(completed[0].workitem_name == "b");
    assert(completed[0].filename == "c");

    assert(state.rearmStrandedFiles() == 1);
    assert(state.getFileStatus("w1", "j", "a") == Status::Pending);
    assert(state.rearmStrandedFiles() == 0);
}

void testRearmIsScopedToPartition() {
    TempDir dir("state_rearm_partition");
    StateStore state(dir.path() / "state.db");
    PartitionAssigner mine(0, 2);

    std::string owned;
    std::string foreign;
    for (int i = 0; owned.empty() || foreign.empty(); ++i) {
        std::string id = "item" + std::to_string(i);
        if (mine.belongs(id)) {
            if (owned.empty()) owned = id;
        }
        else if (foreign.empty()) {
            foreign = id;
        }
    }

    for (const auto& id : {owned, foreign}) {
        state.upsertWorkItem(id, "j", id);
        state.upsertFile(id, "j", "a.json", "u");
        state.upsertFile(id, "j", "b.json", "u");
        assert(state.claimFile(id, "j", "a.json"));
        assert(state.claimFile(id, "j", "b.json"));
    }

    assert(state.rearmStrandedFiles(&mine) == 2);
    assert(state.getFileStatus(owned, "j", "a.json") == Status::Pending);
    assert(state.getFileStatus(owned, "j", "b.json") == Status::Pending);
    // another instance's in-flight files are left alone
    assert(state.getFileStatus(foreign, "j", "a.json") == Status::InProgress);
    assert(state.getFileStatus(foreign, "j", "b.json") == Status::InProgress);

    assert(state.rearmStrandedFiles() == 2);
    assert(state.getFileStatus(foreign, "j", "a.json") == Status::Pending);
}

void testStatePersistsAcrossOpens() {
    TempDir dir("state_reopen");
    auto db = dir.path() / "state.db";
    {
        StateStore state(db);
        state.upsertWorkItem("w1", "j1", "name");
        state.upsertFile("w1", "j1", "a.json", "uri");
        state.setFileStatus("w1", "j1", "a.json", Status::Completed);
        state.setWorkItemStatus("w1", "j1", Status::Completed);
    }
    StateStore reopened(db);
    assert(reopened.getWorkItemStatus("w1", "j1") == Status::Completed);
    assert(reopened.getFileStatus("w1", "j1", "a.json") == Status::Completed);
    assert(reopened.getPendingWorkItems().empty());
}

} // namespace

int main() {
    testWorkItemLifecycle();
    testFileClaims();
    testConcurrentClaimHasOneWinner();
    testConcurrentCompletionCountsOnce();
    testPendingListAndSummary();
    testRearmIsScopedToPartition();
    testStatePersistsAcrossOpens();
    return 0;
}
