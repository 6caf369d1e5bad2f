#include "Csv.hpp"
#include "InputList.hpp"
#include "MetadataResolver.hpp"
#include "StateStore.hpp"
#include "TestDoubles.hpp"

#include <cassert>
#include <sstream>
#include <string>
#include <vector>

using testing_support::TempDir;

namespace {

void testReaderQuoting() {
    std::istringstream in(
        "a,b,c\r\n"
        "\"quoted, comma\",\"say \"\"hi\"\"\",plain\n"
        "\"multi\nline\",,last\n");
    CsvReader reader(in);
    std::vector<std::string> row;

    assert(reader.readRow(row));
    assert((row == std::vector<std::string>{"a", "b", "c"}));

    assert(reader.readRow(row));
    assert(row.size() == 3);
    assert(row[0] == "quoted, comma");
    assert(row[1] == "say \"hi\"");
    assert(row[2] == "plain");

    assert(reader.readRow(row));
    assert(row[0] == "multi\nline");
    assert(row[1].empty());
    assert(row[2] == "last");

    assert(!reader.readRow(row));

    assert(csvEscape("plain") == "plain");
    assert(csvEscape("a,b") == "\"a,b\"");
    assert(csvEscape("say \"x\"") == "\"say \"\"x\"\"\"");
    assert(csvLine({"a", "b,c"}) == "a,\"b,c\"");
}

void testHeaderLookup() {
    CsvHeader header({"JobId", "workitem_id", "Other"});
    assert(header.find({"WorkItemId", "workitem_id"}) == std::size_t(1));
    assert(header.find({"JobId"}) == std::size_t(0));
    assert(!header.find({"WorkItemName", "workitem_name"}));
}

void testInputListSkipsBadRows() {
    std::istringstream in(
        "WorkItemId,WorkItemName,JobId\n"
        "w1,First,j1\n"
        ",NoId,j1\n"
        "w3,,j1\n"
        "w4,NoJob,\n"
        "\n"
        "w5,Fifth,j2\n");
    InputList list = readInputList(in);
    assert(list.rows.size() == 3);
    assert(list.skipped_invalid == 2);
    assert(list.skipped_partition == 0);
    assert(list.rows[0].workitem_id == "w1");
    assert(list.rows[0].workitem_name == "First");
    // a missing name falls back to the id
    assert(list.rows[1].workitem_name == "w3");
    assert(list.rows[2].job_id == "j2");

    std::istringstream bad("Name,Job\nx,y\n");
    bool threw = false;
    try {
        readInputList(bad);
    }
    catch (const InputError&) {
        threw = true;
    }
    assert(threw);
}

void testInputListPartitionFilter() {
    std::ostringstream csv;
    csv << "workitem_id,job_id\n";
    for (int i = 0; i < 50; ++i) csv << "item" << i << ",job\n";

    int seen = 0;
    for (int idx = 0; idx < 3; ++idx) {
        PartitionAssigner partition(idx, 3);
        std::istringstream in(csv.str());
        InputList list = readInputList(in, &partition);
        assert(static_cast<int>(list.rows.size()) + list.skipped_partition == 50);
        for (const auto& r : list.rows) assert(partition.belongs(r.workitem_id));
        seen += static_cast<int>(list.rows.size());
    }
    assert(seen == 50);
}

void testSeedIsIdempotent() {
    TempDir dir("csv_seed");
    StateStore state(dir.path() / "state.db");
    std::vector<InputRow> rows{{"w1", "First", "j1"}, {"w2", "Second", "j1"}};
    seedWorkItems(state, rows);
    state.setWorkItemStatus("w1", "j1", Status::Completed);
    seedWorkItems(state, rows);
    assert(state.listWorkItems().size() == 2);
    assert(state.getWorkItemStatus("w1", "j1") == Status::Completed);

    auto path = dir.write("input.csv", "WorkItemId,WorkItemName,JobId\nw9,Ninth,j9\n");
    InputList loaded = loadInputList(path);
    assert(loaded.rows.size() == 1);

    bool threw = false;
    try {
        loadInputList(dir.path() / "missing.csv");
    }
    catch (const InputError&) {
        threw = true;
    }
    assert(threw);
}

void testManifestResolver() {
    TempDir dir("csv_manifest");
    auto manifest = dir.write("manifest.csv",
        "JobId,WorkItemId,WorkItemName,Uri,FileName\n"
        "j1,w1,First,src/w1/b.perf-lab-report.json,out/b.perf-lab-report.json\n"
        "j1,w1,First,src/w1/a.perf-lab-report.json,out/a.perf-lab-report.json\n"
        "j1,w1,First,src/w1/console.log,console.log\n"
        "j1,w2,,src/w2/c.perf-lab-report.json,c.perf-lab-report.json\n"
        "j1,,First,src/orphan.json,orphan.perf-lab-report.json\n");

    ManifestResolver resolver(manifest, "perf-lab-report.json");
    assert(resolver.fileCount() == 3);

    auto files = resolver.resolve("w1", "j1");
    assert(files.size() == 2);
    assert(files[0].filename == "out/a.perf-lab-report.json");
    assert(files[1].filename == "out/b.perf-lab-report.json");
    assert(files[0].source_uri == "src/w1/a.perf-lab-report.json");
    assert(files[0].workitem_name == "First");

    auto w2 = resolver.resolve("w2", "j1");
    assert(w2.size() == 1);
    assert(w2[0].workitem_name == "w2");

    assert(resolver.resolve("w1", "other-job").empty());
    assert(resolver.resolve("unknown", "j1").empty());
}

} // namespace

int main() {
    testReaderQuoting();
    testHeaderLookup();
    testInputListSkipsBadRows();
    testInputListPartitionFilter();
    testSeedIsIdempotent();
    testManifestResolver();
    return 0;
}
