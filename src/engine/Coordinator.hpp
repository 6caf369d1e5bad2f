#pragma once
#include "CancellationToken.hpp"
#include "FileTransfer.hpp"
#include "MetadataResolver.hpp"
#include "ObjectStore.hpp"
#include "RunConfig.hpp"
#include "Scheduler.hpp"
#include "StateStore.hpp"
#include <memory>
#include <string>

// Collaborators of one run, built once and handed to everything that needs
// them.
struct RunContext {
    std::unique_ptr<StateStore>       state;
    std::unique_ptr<MetadataResolver> resolver;
    std::unique_ptr<ObjectStore>      source;
    std::unique_ptr<ObjectStore>      target;
    std::unique_ptr<Notifier>         notifier;     // null when notifications are off
    std::unique_ptr<FileTransfer>     transfer;

    // Builds the transfer over source, target and notifier.
    void connectTransfer(const std::string& container, RetryPolicy retry = RetryPolicy{});

    // State database, manifest resolver, directory stores and spool notifier.
    static RunContext fromConfig(const RunConfig& config);
};

struct RunReport {
    RunTotals totals;
    Summary   summary;
    int       worklist_size{};
    int       rearmed_files{};

    // 0 when nothing failed and the run was not interrupted.
    int exitCode() const;
};

// One run over one state database: re-arm stranded files, seed from the
// input list (or resume), schedule the pending work items.
class Coordinator {
public:
    Coordinator(RunConfig config, RunContext& context, const CancellationToken& cancel);

    RunReport run();

private:
    RunConfig config_;
    RunContext& context_;
    const CancellationToken& cancel_;
};

std::string formatSummary(const Summary& summary);
