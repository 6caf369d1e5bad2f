#include "Coordinator.hpp"
#include "DirectoryObjectStore.hpp"
#include "InputList.hpp"
#include "Log.hpp"
#include "PartitionAssigner.hpp"
#include "SpoolNotifier.hpp"
#include <iomanip>
#include <sstream>

void RunContext::connectTransfer(const std::string& container, RetryPolicy retry) {
    if (!source || !target) throw ConfigError("transfer needs both a source and a target store");
    transfer = std::make_unique<FileTransfer>(*source, *target, notifier.get(), container, retry);
}

RunContext RunContext::fromConfig(const RunConfig& config) {
    RunContext ctx;
    ctx.state = std::make_unique<StateStore>(config.state_db, config.stateConnections());
    ctx.resolver = std::make_unique<ManifestResolver>(config.manifest, config.filename_suffix);
    ctx.source = std::make_unique<DirectoryObjectStore>(config.source_dir);
    ctx.target = std::make_unique<DirectoryObjectStore>(config.target_dir);
    if (config.queue_dir && !config.no_queue) {
        ctx.notifier = std::make_unique<SpoolNotifier>(*config.queue_dir);
    }
    ctx.connectTransfer(config.container);
    return ctx;
}

int RunReport::exitCode() const {
    return (totals.failed > 0 || totals.interrupted) ? 1 : 0;
}

Coordinator::Coordinator(RunConfig config, RunContext& context, const CancellationToken& cancel)
    : config_(std::move(config)), context_(context), cancel_(cancel) {
    if (!context_.state || !context_.resolver || !context_.transfer) {
        throw ConfigError("run context is missing a collaborator");
    }
}

RunReport Coordinator::run() {
    RunReport report;
    StateStore& state = *context_.state;

    std::unique_ptr<PartitionAssigner> partition;
    if (config_.partition && config_.total_partitions) {
        partition = std::make_unique<PartitionAssigner>(*config_.partition, *config_.total_partitions);
        logInfo("Running in partition mode: partition " + std::to_string(partition->index() + 1) + "/" +
                std::to_string(partition->total()));
    }

    report.rearmed_files = state.rearmStrandedFiles(partition.get());
    if (report.rearmed_files > 0) {
        logInfo("Re-armed " + std::to_string(report.rearmed_files) +
                " files left in progress by an earlier run");
    }

    if (!config_.resume) {
        logInfo("Loading workitems from CSV " + config_.input_csv.string());
        InputList input = loadInputList(config_.input_csv, partition.get());
        seedWorkItems(state, input.rows);
    }
    else {
        logInfo("Resuming from previous run...");
    }

    std::vector<WorkItemKey> worklist;
    for (auto& key : state.getPendingWorkItems()) {
        if (partition && !partition->belongs(key.workitem_id)) continue;
        worklist.push_back(std::move(key));
    }
    report.worklist_size = static_cast<int>(worklist.size());
    logInfo("Processing " + std::to_string(worklist.size()) + " workitems");

    if (worklist.empty()) {
        logInfo("No pending workitems to process");
    }
    else {
        Scheduler scheduler(state, *context_.resolver, *context_.transfer, cancel_,
                            config_.workitem_workers, config_.file_workers);
        report.totals = scheduler.run(worklist);
    }

    report.summary = state.getSummary();

    if (report.totals.failed > 0) {
        logWarning(std::to_string(report.totals.failed) + " workitems failed - check state DB for details");
    }
    else if (report.totals.interrupted) {
        logWarning("Run interrupted - rerun with --resume to continue");
    }
    else {
        logInfo("All workitems processed successfully!");
    }
    return report;
}

std::string formatSummary(const Summary& s) {
    const std::string rule(60, '=');
    auto row = [](const std::string& label, int value) {
        std::ostringstream oss;
        oss << std::left << std::setw(23) << label << value;
        return oss.str();
    };

    std::vector<std::string> lines;
    lines.push_back(rule);
    lines.push_back("REUPLOAD SUMMARY");
    lines.push_back(rule);
    lines.push_back(row("Total WorkItems:", s.total));
    lines.push_back(row("  Completed:", s.completed));
    lines.push_back(row("  Failed:", s.failed));
    lines.push_back(row("  In Progress:", s.in_progress));
    lines.push_back(row("  Pending:", s.pending));
    lines.push_back("");
    lines.push_back(row("Total Files:", s.total_files));
    lines.push_back(row("  Processed:", s.processed_files));
    lines.push_back(rule);
    return joinLines(lines);
}
