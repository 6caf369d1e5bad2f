#pragma once
#include "common.hpp"
#include "ConnectionPool.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

class PartitionAssigner;

struct WorkItemRow {
    std::string workitem_id;
    std::string job_id;
    std::string name;
    Status      status{Status::Pending};
    int         files_total{};
    int         files_processed{};
    std::optional<std::string> error_message;
    std::optional<std::string> started_at;
    std::optional<std::string> completed_at;
};

struct FileRow {
    std::string workitem_id;
    std::string job_id;
    std::string filename;
    std::string source_uri;
    Status      status{Status::Pending};
    std::optional<std::string> error_message;
    std::optional<std::string> uploaded_at;
};

// A completed file joined with the name of its work item.
struct CompletedFileRow {
    std::string workitem_id;
    std::string workitem_name;
    std::string filename;
};

struct Summary {
    int total{};
    int pending{};
    int in_progress{};
    int completed{};
    int failed{};
    int total_files{};
    int processed_files{};
};

// Durable ledger of work-item and file progress. Every call leases its own
// connection and runs one short statement or transaction; failures throw
// StoreError.
class StateStore {
public:
    explicit StateStore(const std::filesystem::path& db_path, std::size_t max_connections = 32);

    void upsertWorkItem(const std::string& workitem_id, const std::string& job_id, const std::string& name);
    void setWorkItemStatus(const std::string& workitem_id, const std::string& job_id, Status status,
                           const std::optional<std::string>& error = std::nullopt);
    void setFilesTotal(const std::string& workitem_id, const std::string& job_id, int files_total);

    void upsertFile(const std::string& workitem_id, const std::string& job_id,
                    const std::string& filename, const std::string& source_uri);

    // Moves a pending or failed file to in_progress. Returns true only for
    // the caller that performed the transition.
    bool claimFile(const std::string& workitem_id, const std::string& job_id, const std::string& filename);

    // A transition into completed also bumps the parent's files_processed,
    // in the same transaction.
    void setFileStatus(const std::string& workitem_id, const std::string& job_id, const std::string& filename,
                       Status status, const std::optional<std::string>& error = std::nullopt);

    std::optional<Status> getWorkItemStatus(const std::string& workitem_id, const std::string& job_id);
    std::optional<Status> getFileStatus(const std::string& workitem_id, const std::string& job_id,
                                        const std::string& filename);
    std::optional<WorkItemRow> getWorkItem(const std::string& workitem_id, const std::string& job_id);
    std::optional<FileRow> getFile(const std::string& workitem_id, const std::string& job_id,
                                   const std::string& filename);

    // pending, failed and in_progress items, ordered by id.
    std::vector<WorkItemKey> getPendingWorkItems();
    std::vector<WorkItemRow> listWorkItems(std::optional<Status> status = std::nullopt);
    std::vector<CompletedFileRow> listCompletedFiles();

    // Files stuck in_progress from an interrupted run go back to pending.
    // With a partition, only files of work items it owns are touched.
    int rearmStrandedFiles(const PartitionAssigner* partition = nullptr);

    Summary getSummary();

    const std::filesystem::path& path() const { return pool_.path(); }

private:
    ConnectionPool pool_;

    void ensureSchema();
};
