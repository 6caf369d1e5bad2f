#include "InputList.hpp"
#include "Csv.hpp"
#include "Log.hpp"
#include "StateStore.hpp"
#include <fstream>

InputList readInputList(std::istream& in, const PartitionAssigner* partition) {
    InputList list;
    CsvReader reader(in);
    std::vector<std::string> row;
    if (!reader.readRow(row)) return list;

    CsvHeader header(row);
    auto idCol = header.find({"WorkItemId", "workitem_id"});
    auto nameCol = header.find({"WorkItemName", "workitem_name"});
    auto jobCol = header.find({"JobId", "job_id"});
    if (!idCol || !jobCol) {
        throw InputError("input CSV needs WorkItemId and JobId columns");
    }

    while (reader.readRow(row)) {
        if (row.size() == 1 && row[0].empty()) continue;

        auto field = [&](std::optional<std::size_t> col) {
            return (col && *col < row.size()) ? row[*col] : std::string();
        };
        InputRow r{field(idCol), field(nameCol), field(jobCol)};

        if (r.workitem_id.empty() || r.job_id.empty()) {
            logWarning("Skipping row with missing data at line " + std::to_string(reader.line()) +
                       ": " + csvLine(row));
            ++list.skipped_invalid;
            continue;
        }
        if (partition && !partition->belongs(r.workitem_id)) {
            ++list.skipped_partition;
            continue;
        }
        if (r.workitem_name.empty()) {
            logWarning("No WorkItemName for " + r.workitem_id + ", using WorkItemId as name");
            r.workitem_name = r.workitem_id;
        }
        list.rows.push_back(std::move(r));
    }

    if (partition) {
        logInfo("Loaded " + std::to_string(list.rows.size()) + " workitems for partition " +
                std::to_string(partition->index() + 1) + "/" + std::to_string(partition->total()) +
                " (skipped " + std::to_string(list.skipped_partition) + " from other partitions)");
    }
    else {
        logInfo("Loaded " + std::to_string(list.rows.size()) + " workitems");
    }
    return list;
}

InputList loadInputList(const std::filesystem::path& csv, const PartitionAssigner* partition) {
    std::ifstream in(csv, std::ios::binary);
    if (!in) throw InputError("cannot open input CSV " + csv.string());
    return readInputList(in, partition);
}

void seedWorkItems(StateStore& state, const std::vector<InputRow>& rows) {
    for (const auto& r : rows) {
        state.upsertWorkItem(r.workitem_id, r.job_id, r.workitem_name);
    }
}
