#include "RunConfig.hpp"
#include "common.hpp"
#include "PartitionAssigner.hpp"
#include <algorithm>
#include <sstream>

static constexpr std::size_t kMaxStateConnections = 64;

std::size_t RunConfig::stateConnections() const {
    return std::min(workitem_workers * (file_workers + 1), kMaxStateConnections);
}

static int parseInt(const std::string& flag, const std::string& value) {
    std::size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(value, &used);
    }
    catch (const std::exception&) {
        throw ConfigError(flag + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) throw ConfigError(flag + " expects an integer, got '" + value + "'");
    return n;
}

static std::size_t parseCount(const std::string& flag, const std::string& value) {
    int n = parseInt(flag, value);
    if (n <= 0) throw ConfigError(flag + " must be > 0");
    return static_cast<std::size_t>(n);
}

RunConfig parseArgs(const std::vector<std::string>& args) {
    RunConfig c;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw ConfigError(flag + " needs a value");
            return args[++i];
        };

        if (flag == "--csv") c.input_csv = value();
        else if (flag == "--state-db") c.state_db = value();
        else if (flag == "--manifest") c.manifest = value();
        else if (flag == "--source-dir") c.source_dir = value();
        else if (flag == "--target-dir") c.target_dir = value();
        else if (flag == "--queue-dir") c.queue_dir = std::filesystem::path(value());
        else if (flag == "--container") c.container = value();
        else if (flag == "--suffix") c.filename_suffix = value();
        else if (flag == "--workitem-workers") c.workitem_workers = parseCount(flag, value());
        else if (flag == "--file-workers") c.file_workers = parseCount(flag, value());
        else if (flag == "--partition") c.partition = parseInt(flag, value());
        else if (flag == "--total-partitions") c.total_partitions = parseInt(flag, value());
        else if (flag == "--resume") c.resume = true;
        else if (flag == "--no-queue") c.no_queue = true;
        else if (flag == "--verbose" || flag == "-v") c.verbose = true;
        else if (flag == "--help" || flag == "-h") c.help = true;
        else throw ConfigError("unknown argument '" + flag + "'");
    }
    return c;
}

void validateConfig(const RunConfig& c) {
    if (c.partition.has_value() != c.total_partitions.has_value()) {
        throw ConfigError("--partition and --total-partitions must be used together");
    }
    if (c.partition) {
        PartitionAssigner check(*c.partition, *c.total_partitions);
        (void)check;
    }
    if (!c.resume && c.input_csv.empty()) throw ConfigError("--csv is required unless --resume is given");
    if (c.manifest.empty()) throw ConfigError("--manifest is required");
    if (c.source_dir.empty()) throw ConfigError("--source-dir is required");
    if (c.target_dir.empty()) throw ConfigError("--target-dir is required");
    if (c.workitem_workers == 0 || c.file_workers == 0) throw ConfigError("worker counts must be > 0");
}

std::string usage() {
    std::ostringstream oss;
    oss << "Usage: reupload --csv <workitems.csv> --manifest <files.csv>\n"
           "                --source-dir <dir> --target-dir <dir> [options]\n"
           "\n"
           "Options:\n"
           "  --state-db <path>          SQLite state database (default: reupload_state.db)\n"
           "  --queue-dir <dir>          spool directory for upload notifications\n"
           "  --no-queue                 do not send upload notifications\n"
           "  --container <name>         container named in notifications (default: results)\n"
           "  --suffix <text>            only transfer files ending in this (default: perf-lab-report.json)\n"
           "  --workitem-workers <n>     parallel work items (default: 20)\n"
           "  --file-workers <n>         parallel files per work item (default: 10)\n"
           "  --partition <i>            0-based partition of this instance\n"
           "  --total-partitions <n>     number of cooperating instances (>= 2)\n"
           "  --resume                   continue from the state database, skip reading the CSV\n"
           "  --verbose                  debug logging\n";
    return oss.str();
}
