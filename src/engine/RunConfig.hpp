#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct RunConfig {
    std::filesystem::path input_csv;
    std::filesystem::path state_db{"reupload_state.db"};
    std::filesystem::path manifest;
    std::filesystem::path source_dir;
    std::filesystem::path target_dir;
    std::optional<std::filesystem::path> queue_dir;
    std::string container{"results"};
    std::string filename_suffix{"perf-lab-report.json"};
    std::size_t workitem_workers{20};
    std::size_t file_workers{10};
    std::optional<int> partition;
    std::optional<int> total_partitions;
    bool resume{false};
    bool no_queue{false};
    bool verbose{false};
    bool help{false};

    bool partitioned() const { return partition.has_value(); }
    std::size_t stateConnections() const;
};

// Parses "--flag value" style arguments (without argv[0]). Throws
// ConfigError on unknown flags, missing values or malformed numbers.
RunConfig parseArgs(const std::vector<std::string>& args);

// Cross-field checks, run before any work starts. Throws ConfigError.
void validateConfig(const RunConfig& config);

std::string usage();
