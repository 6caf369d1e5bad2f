#pragma once
#include "common.hpp"
#include "CancellationToken.hpp"
#include <cstddef>
#include <string>
#include <vector>

class StateStore;
class MetadataResolver;
class FileTransfer;

// How one work item ended in this run. Skipped means neither completed nor
// failed: the item was left (or put back) in pending because of a stop request.
enum class Outcome {
    Completed,
    Failed,
    Skipped
};

const char* toString(Outcome outcome);

// Drives a single work item from pending to a terminal status:
// resolve its files, drop duplicate destinations, claim the files that still
// need work, transfer them on a bounded pool and reconcile the results.
class WorkItemProcessor {
public:
    static constexpr std::size_t kMaxListedFailures = 5;

    WorkItemProcessor(StateStore& state, MetadataResolver& resolver, FileTransfer& transfer,
                      const CancellationToken& cancel, std::size_t file_workers);

    // Never throws; storage and resolver errors fail this item only.
    Outcome process(const std::string& workitem_id, const std::string& job_id);

    // First occurrence of each destination wins.
    static std::vector<FileMetadata> dedupe(const std::vector<FileMetadata>& files, std::size_t& duplicates);

    // "<n> files failed: a, b, c, d, e and <k> more"
    static std::string failureSummary(const std::vector<std::string>& failed_files);

private:
    struct FileOutcome {
        std::string filename;
        bool ok{};
    };

    StateStore& state_;
    MetadataResolver& resolver_;
    FileTransfer& transfer_;
    const CancellationToken& cancel_;
    std::size_t file_workers_;

    Outcome run(const WorkItemKey& key);
    Outcome dispatch(const WorkItemKey& key, const std::vector<FileMetadata>& claimed);
    FileOutcome transferOne(const WorkItemKey& key, const FileMetadata& file);
};
