#include "AdminCommands.hpp"
#include "Csv.hpp"
#include "FileTransfer.hpp"
#include "Log.hpp"
#include "ObjectStore.hpp"
#include "StateStore.hpp"
#include <iomanip>
#include <set>
#include <sstream>

static std::string percent(int part, int whole) {
    if (whole <= 0) return "";
    std::ostringstream oss;
    oss << " (" << std::fixed << std::setprecision(1) << (100.0 * part / whole) << "%)";
    return oss.str();
}

FilterResult filterCompleted(StateStore& state, std::istream& in, std::ostream& out) {
    std::set<WorkItemKey> completed;
    for (auto& row : state.listWorkItems(Status::Completed)) {
        completed.insert(WorkItemKey{row.workitem_id, row.job_id});
    }
    logInfo("Found " + std::to_string(completed.size()) + " completed workitems");

    FilterResult result;
    CsvReader reader(in);
    std::vector<std::string> row;
    if (!reader.readRow(row)) return result;

    CsvHeader header(row);
    auto idCol = header.find({"WorkItemId", "workitem_id"});
    auto jobCol = header.find({"JobId", "job_id"});
    if (!idCol || !jobCol) throw InputError("input CSV needs WorkItemId and JobId columns");
    out << csvLine(header.names()) << "\n";

    while (reader.readRow(row)) {
        if (row.size() == 1 && row[0].empty()) continue;
        ++result.total;
        WorkItemKey key{
            *idCol < row.size() ? row[*idCol] : std::string(),
            *jobCol < row.size() ? row[*jobCol] : std::string()
        };
        if (completed.count(key)) {
            ++result.filtered;
            continue;
        }
        out << csvLine(row) << "\n";
        ++result.remaining;
    }
    return result;
}

ValidationResult validateUploads(StateStore& state, ObjectStore& target) {
    ValidationResult result;
    for (const auto& f : state.listCompletedFiles()) {
        FileMetadata meta;
        meta.workitem_id = f.workitem_id;
        meta.workitem_name = f.workitem_name;
        meta.filename = f.filename;
        std::string blob = FileTransfer::destinationKey(meta);

        ++result.checked;
        if (target.exists(blob)) {
            ++result.found;
        }
        else {
            ++result.missing;
            result.missing_uploads.push_back(MissingUpload{f.workitem_id, f.filename, blob});
        }
    }
    return result;
}

std::string formatFilterResult(const FilterResult& r) {
    std::ostringstream oss;
    oss << "Total WorkItems in CSV:     " << r.total << "\n"
        << "  Already Completed:        " << r.filtered << percent(r.filtered, r.total) << "\n"
        << "  Remaining to Process:     " << r.remaining << percent(r.remaining, r.total);
    return oss.str();
}

std::string formatValidation(const ValidationResult& r, std::size_t max_listed) {
    const std::string rule(80, '=');
    std::vector<std::string> lines;
    lines.push_back(rule);
    lines.push_back("VALIDATION SUMMARY");
    lines.push_back(rule);
    lines.push_back("Total Files Checked:    " + std::to_string(r.checked));
    lines.push_back("  Found in Target:      " + std::to_string(r.found) + percent(r.found, r.checked));
    lines.push_back("  Missing:              " + std::to_string(r.missing) + percent(r.missing, r.checked));
    lines.push_back(rule);

    if (!r.missing_uploads.empty()) {
        lines.push_back("MISSING BLOBS (first " + std::to_string(max_listed) + "):");
        std::size_t shown = 0;
        for (const auto& m : r.missing_uploads) {
            if (shown++ == max_listed) break;
            lines.push_back("  " + m.blob_name + " (WorkItem: " + m.workitem_id + ", File: " + m.filename + ")");
        }
        if (r.missing_uploads.size() > max_listed) {
            lines.push_back("  ... and " + std::to_string(r.missing_uploads.size() - max_listed) + " more");
        }
    }
    return joinLines(lines);
}
