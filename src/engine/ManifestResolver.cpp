#include "MetadataResolver.hpp"
#include "Csv.hpp"
#include "Log.hpp"
#include <algorithm>
#include <fstream>

ManifestResolver::ManifestResolver(const std::filesystem::path& manifest, std::string filename_suffix) {
    std::ifstream in(manifest, std::ios::binary);
    if (!in) throw InputError("cannot open manifest " + manifest.string());

    CsvReader reader(in);
    std::vector<std::string> row;
    if (!reader.readRow(row)) throw InputError("manifest is empty: " + manifest.string());

    CsvHeader header(row);
    auto jobCol = header.find({"JobId", "job_id"});
    auto idCol = header.find({"WorkItemId", "workitem_id"});
    auto nameCol = header.find({"WorkItemName", "workitem_name"});
    auto uriCol = header.find({"Uri", "uri", "source_uri"});
    auto fileCol = header.find({"FileName", "filename"});
    if (!jobCol || !idCol || !uriCol || !fileCol) {
        throw InputError("manifest " + manifest.string() +
            " needs JobId, WorkItemId, Uri and FileName columns");
    }

    while (reader.readRow(row)) {
        auto field = [&](std::optional<std::size_t> col) {
            return (col && *col < row.size()) ? row[*col] : std::string();
        };
        FileMetadata f;
        f.job_id = field(jobCol);
        f.workitem_id = field(idCol);
        f.workitem_name = field(nameCol);
        f.source_uri = field(uriCol);
        f.filename = field(fileCol);

        if (f.job_id.empty() || f.workitem_id.empty() || f.filename.empty()) {
            if (row.size() > 1 || !row[0].empty()) {
                logWarning("Skipping manifest line " + std::to_string(reader.line()) + " with missing data");
            }
            continue;
        }
        if (!filename_suffix.empty() && !endsWith(f.filename, filename_suffix)) continue;
        if (f.workitem_name.empty()) f.workitem_name = f.workitem_id;

        files_[WorkItemKey{f.workitem_id, f.job_id}].push_back(std::move(f));
        ++file_count_;
    }

    for (auto& entry : files_) {
        std::stable_sort(entry.second.begin(), entry.second.end(),
            [](const FileMetadata& a, const FileMetadata& b) { return a.filename < b.filename; });
    }
    logInfo("Loaded " + std::to_string(file_count_) + " manifest entries for " +
            std::to_string(files_.size()) + " workitems from " + manifest.string());
}

std::vector<FileMetadata> ManifestResolver::resolve(const std::string& workitem_id, const std::string& job_id) {
    auto it = files_.find(WorkItemKey{workitem_id, job_id});
    if (it == files_.end()) {
        logInfo("Found 0 files for WorkItem " + workitem_id + " (Job " + job_id + ")");
        return {};
    }
    logInfo("Found " + std::to_string(it->second.size()) + " files for WorkItem " + workitem_id +
            " (Job " + job_id + ")");
    return it->second;
}
