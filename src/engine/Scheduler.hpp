#pragma once
#include "common.hpp"
#include "CancellationToken.hpp"
#include <cstddef>
#include <vector>

class StateStore;
class MetadataResolver;
class FileTransfer;

struct RunTotals {
    int completed{};
    int failed{};
    int skipped{};
    bool interrupted{};
};

// Outer level of the two-level fan-out: runs up to workitem_workers
// processors at once, each with its own pool of file_workers transfers.
// Once the token is cancelled no new work item is started; running ones
// reach their next checkpoint and the rest are counted as skipped.
class Scheduler {
public:
    static constexpr int kProgressInterval = 10;

    Scheduler(StateStore& state, MetadataResolver& resolver, FileTransfer& transfer,
              const CancellationToken& cancel, std::size_t workitem_workers, std::size_t file_workers);

    RunTotals run(const std::vector<WorkItemKey>& worklist);

private:
    StateStore& state_;
    MetadataResolver& resolver_;
    FileTransfer& transfer_;
    const CancellationToken& cancel_;
    std::size_t workitem_workers_;
    std::size_t file_workers_;
};
