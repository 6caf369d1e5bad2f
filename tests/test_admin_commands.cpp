#include "AdminCommands.hpp"
#include "Coordinator.hpp"
#include "StateStore.hpp"
#include "TestDoubles.hpp"

#include <cassert>
#include <sstream>
#include <string>

using namespace testing_support;

namespace {

void seedState(StateStore& state) {
    state.upsertWorkItem("W1", "j1", "first");
    state.upsertWorkItem("W2", "j1", "second");
    state.upsertWorkItem("W1", "j2", "first-again");
    state.setWorkItemStatus("W1", "j1", Status::Completed);

    state.upsertFile("W1", "j1", "out/a.perf-lab-report.json", "src/a");
    state.upsertFile("W1", "j1", "out/b.perf-lab-report.json", "src/b");
    state.upsertFile("W2", "j1", "c.perf-lab-report.json", "src/c");
    state.setFileStatus("W1", "j1", "out/a.perf-lab-report.json", Status::Completed);
    state.setFileStatus("W1", "j1", "out/b.perf-lab-report.json", Status::Completed);
}

void testFilterDropsCompletedItems() {
    TempDir dir("admin_filter");
    StateStore state(dir.path() / "state.db");
    seedState(state);

    std::istringstream in(
        "WorkItemId,WorkItemName,JobId\n"
        "W1,first,j1\n"
        "W2,\"second, quoted\",j1\n"
        "W1,first-again,j2\n"
        "W3,third,j1\n");
    std::ostringstream out;
    FilterResult result = filterCompleted(state, in, out);

    assert(result.total == 4);
    assert(result.filtered == 1);
    assert(result.remaining == 3);
    assert(out.str() ==
        "WorkItemId,WorkItemName,JobId\n"
        "W2,\"second, quoted\",j1\n"
        "W1,first-again,j2\n"
        "W3,third,j1\n");

    std::string text = formatFilterResult(result);
    assert(text.find("Already Completed:        1 (25.0%)") != std::string::npos);
    assert(text.find("Remaining to Process:     3 (75.0%)") != std::string::npos);
}

void testValidateFindsMissingUploads() {
    TempDir dir("admin_validate");
    StateStore state(dir.path() / "state.db");
    seedState(state);

    MemoryObjectStore target;
    target.seed("first-a.perf-lab-report.json", "{}");

    ValidationResult result = validateUploads(state, target);
    assert(result.checked == 2);
    assert(result.found == 1);
    assert(result.missing == 1);
    assert(result.missing_uploads.size() == 1);
    assert(result.missing_uploads[0].blob_name == "first-b.perf-lab-report.json");
    assert(result.missing_uploads[0].workitem_id == "W1");

    std::string text = formatValidation(result);
    assert(text.find("VALIDATION SUMMARY") != std::string::npos);
    assert(text.find("first-b.perf-lab-report.json (WorkItem: W1, File: out/b.perf-lab-report.json)")
           != std::string::npos);

    result.missing_uploads.assign(3, result.missing_uploads[0]);
    text = formatValidation(result, 2);
    assert(text.find("... and 1 more") != std::string::npos);
}

void testSummaryReport() {
    TempDir dir("admin_summary");
    StateStore state(dir.path() / "state.db");
    seedState(state);

    std::string text = formatSummary(state.getSummary());
    assert(text.find("REUPLOAD SUMMARY") != std::string::npos);
    assert(text.find("Total WorkItems:       3") != std::string::npos);
    assert(text.find("  Completed:           1") != std::string::npos);
    assert(text.find("Total Files:           3") != std::string::npos);
    assert(text.find("  Processed:           2") != std::string::npos);
}

} // namespace

int main() {
    testFilterDropsCompletedItems();
    testValidateFindsMissingUploads();
    testSummaryReport();
    return 0;
}
