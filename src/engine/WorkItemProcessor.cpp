#include "WorkItemProcessor.hpp"
#include "FileTransfer.hpp"
#include "Log.hpp"
#include "MetadataResolver.hpp"
#include "StateStore.hpp"
#include "TaskPool.hpp"
#include <algorithm>
#include <unordered_set>

const char* toString(Outcome outcome) {
    switch (outcome) {
    case Outcome::Completed: return "completed";
    case Outcome::Failed:    return "failed";
    case Outcome::Skipped:   return "skipped";
    }
    return "unknown";
}

WorkItemProcessor::WorkItemProcessor(StateStore& state, MetadataResolver& resolver, FileTransfer& transfer,
                                     const CancellationToken& cancel, std::size_t file_workers)
    : state_(state), resolver_(resolver), transfer_(transfer), cancel_(cancel), file_workers_(file_workers) {
    if (file_workers_ == 0) {
        throw ConfigError("file workers must be > 0");
    }
}

Outcome WorkItemProcessor::process(const std::string& workitem_id, const std::string& job_id) {
    const WorkItemKey key{workitem_id, job_id};
    try {
        return run(key);
    }
    catch (const std::exception& ex) {
        std::string msg = std::string("Unexpected error: ") + ex.what();
        logError("Failed to process WorkItem " + workitem_id + ": " + msg);
        try {
            state_.setWorkItemStatus(workitem_id, job_id, Status::Failed, msg);
        }
        catch (const std::exception& inner) {
            logError("Could not record failure of WorkItem " + workitem_id + ": " + inner.what());
        }
        return Outcome::Failed;
    }
}

Outcome WorkItemProcessor::run(const WorkItemKey& key) {
    const std::string& id = key.workitem_id;
    const std::string& job = key.job_id;

    auto status = state_.getWorkItemStatus(id, job);
    if (!status) {
        throw StoreError("WorkItem " + id + " (Job " + job + ") is not tracked");
    }
    if (*status == Status::Completed) {
        logInfo("WorkItem " + id + " already completed, skipping");
        return Outcome::Completed;
    }
    if (cancel_.cancelled()) {
        logInfo("Skipping WorkItem " + id + " due to shutdown");
        return Outcome::Skipped;
    }

    logInfo("Processing WorkItem " + id + " (Job " + job + ")");
    state_.setWorkItemStatus(id, job, Status::InProgress);

    std::vector<FileMetadata> files;
    try {
        files = resolver_.resolve(id, job);
    }
    catch (const std::exception& ex) {
        std::string msg = std::string("Metadata query failed: ") + ex.what();
        logError("Metadata query failed for WorkItem " + id + ": " + ex.what());
        state_.setWorkItemStatus(id, job, Status::Failed, msg);
        return Outcome::Failed;
    }

    if (files.empty()) {
        logWarning("No files found for WorkItem " + id);
        state_.setFilesTotal(id, job, 0);
        state_.setWorkItemStatus(id, job, Status::Completed);
        return Outcome::Completed;
    }

    std::size_t duplicates = 0;
    std::vector<FileMetadata> unique = dedupe(files, duplicates);
    if (duplicates > 0) {
        logInfo("Detected " + std::to_string(duplicates) + " duplicate file entries for WorkItem " + id +
                " (resolved " + std::to_string(files.size()) + ", unique " + std::to_string(unique.size()) + ")");
    }

    if (cancel_.cancelled()) {
        logInfo("Aborting WorkItem " + id + " - shutdown requested");
        state_.setWorkItemStatus(id, job, Status::Pending, std::string("Shutdown requested before dispatch"));
        return Outcome::Skipped;
    }

    state_.setFilesTotal(id, job, static_cast<int>(unique.size()));

    std::vector<FileMetadata> claimed;
    int skipped_completed = 0;
    int skipped_claimed = 0;
    for (const auto& file : unique) {
        state_.upsertFile(id, job, file.filename, file.source_uri);
        if (state_.getFileStatus(id, job, file.filename) == Status::Completed) {
            ++skipped_completed;
            continue;
        }
        if (state_.claimFile(id, job, file.filename)) {
            claimed.push_back(file);
        }
        else {
            ++skipped_claimed;
        }
    }

    if (skipped_completed > 0) {
        logInfo("Skipping " + std::to_string(skipped_completed) + " already-completed files for WorkItem " + id);
    }
    if (skipped_claimed > 0) {
        logInfo("Skipping " + std::to_string(skipped_claimed) + " files already claimed for WorkItem " + id);
    }
    if (claimed.empty()) {
        state_.setWorkItemStatus(id, job, Status::Completed);
        logInfo("All files already completed or claimed for WorkItem " + id);
        return Outcome::Completed;
    }

    return dispatch(key, claimed);
}

Outcome WorkItemProcessor::dispatch(const WorkItemKey& key, const std::vector<FileMetadata>& claimed) {
    const std::string& id = key.workitem_id;
    std::vector<std::string> failed;
    std::size_t next = 0;
    bool stopping = false;

    {
        TaskPool<FileOutcome> pool(std::min(file_workers_, claimed.size()));
        for (;;) {
            while (!stopping && next < claimed.size() && pool.hasCapacity()) {
                if (cancel_.cancelled()) {
                    stopping = true;
                    break;
                }
                const FileMetadata& file = claimed[next++];
                pool.submit([this, &key, &file] { return transferOne(key, file); });
            }
            if (pool.outstanding() == 0) break;

            FileOutcome done = pool.next();
            if (!done.ok) failed.push_back(done.filename);
            if (cancel_.cancelled()) stopping = true;
        }
    }

    if (next < claimed.size()) {
        logInfo("Canceling remaining files for WorkItem " + id + " (" +
                std::to_string(claimed.size() - next) + " not dispatched)");
        state_.setWorkItemStatus(id, key.job_id, Status::Pending, std::string("Shutdown requested mid-processing"));
        return Outcome::Skipped;
    }

    if (!failed.empty()) {
        std::string msg = failureSummary(failed);
        logError("WorkItem " + id + ": " + msg);
        state_.setWorkItemStatus(id, key.job_id, Status::Failed, msg);
        return Outcome::Failed;
    }

    state_.setWorkItemStatus(id, key.job_id, Status::Completed);
    logInfo("Successfully processed WorkItem " + id);
    return Outcome::Completed;
}

WorkItemProcessor::FileOutcome WorkItemProcessor::transferOne(const WorkItemKey& key, const FileMetadata& file) {
    TransferResult result = transfer_.transfer(file);
    try {
        if (result.ok) {
            state_.setFileStatus(key.workitem_id, key.job_id, file.filename, Status::Completed);
        }
        else {
            state_.setFileStatus(key.workitem_id, key.job_id, file.filename, Status::Failed, result.error);
        }
    }
    catch (const std::exception& ex) {
        logError("Could not record status of " + file.filename + " for WorkItem " + key.workitem_id +
                 ": " + ex.what());
        return {file.filename, false};
    }
    return {file.filename, result.ok};
}

std::vector<FileMetadata> WorkItemProcessor::dedupe(const std::vector<FileMetadata>& files, std::size_t& duplicates) {
    std::vector<FileMetadata> unique;
    std::unordered_set<std::string> seen;
    duplicates = 0;
    for (const auto& file : files) {
        if (!seen.insert(FileTransfer::destinationKey(file)).second) {
            ++duplicates;
            logDebug("Duplicate file entry for WorkItem " + file.workitem_id + ": " + file.filename +
                     " (source " + file.source_uri + ")");
            continue;
        }
        unique.push_back(file);
    }
    return unique;
}

std::string WorkItemProcessor::failureSummary(const std::vector<std::string>& failed_files) {
    std::size_t listed = std::min(failed_files.size(), kMaxListedFailures);
    std::vector<std::string> names(failed_files.begin(), failed_files.begin() + static_cast<std::ptrdiff_t>(listed));
    std::string msg = std::to_string(failed_files.size()) + " files failed: " + joinStrings(names, ", ");
    if (failed_files.size() > kMaxListedFailures) {
        msg += " and " + std::to_string(failed_files.size() - kMaxListedFailures) + " more";
    }
    return msg;
}
