#include "Scheduler.hpp"
#include "Log.hpp"
#include "TaskPool.hpp"
#include "WorkItemProcessor.hpp"
#include <algorithm>

Scheduler::Scheduler(StateStore& state, MetadataResolver& resolver, FileTransfer& transfer,
                     const CancellationToken& cancel, std::size_t workitem_workers, std::size_t file_workers)
    : state_(state), resolver_(resolver), transfer_(transfer), cancel_(cancel),
      workitem_workers_(workitem_workers), file_workers_(file_workers) {
    if (workitem_workers_ == 0) throw ConfigError("workitem workers must be > 0");
    if (file_workers_ == 0) throw ConfigError("file workers must be > 0");
}

RunTotals Scheduler::run(const std::vector<WorkItemKey>& worklist) {
    RunTotals totals;
    if (worklist.empty()) return totals;

    const int total = static_cast<int>(worklist.size());
    std::size_t next = 0;
    bool announced = false;

    TaskPool<Outcome> pool(std::min(workitem_workers_, worklist.size()));
    for (;;) {
        while (next < worklist.size() && pool.hasCapacity() && !cancel_.cancelled()) {
            const WorkItemKey& key = worklist[next++];
            pool.submit([this, &key] {
                WorkItemProcessor processor(state_, resolver_, transfer_, cancel_, file_workers_);
                return processor.process(key.workitem_id, key.job_id);
            });
        }
        if (cancel_.cancelled() && !announced) {
            logWarning("Shutdown in progress - not starting remaining WorkItems...");
            announced = true;
        }
        if (pool.outstanding() == 0) break;

        switch (pool.next()) {
        case Outcome::Completed: ++totals.completed; break;
        case Outcome::Failed:    ++totals.failed; break;
        case Outcome::Skipped:   ++totals.skipped; break;
        }

        int done = totals.completed + totals.failed + totals.skipped;
        if (done % kProgressInterval == 0) {
            logInfo("Progress: " + std::to_string(done) + "/" + std::to_string(total) +
                    " (Completed: " + std::to_string(totals.completed) +
                    ", Failed: " + std::to_string(totals.failed) +
                    ", Skipped: " + std::to_string(totals.skipped) + ")");
        }
    }

    if (next < worklist.size()) {
        totals.skipped += static_cast<int>(worklist.size() - next);
    }
    totals.interrupted = cancel_.cancelled();
    return totals;
}
