#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Lifecycle shared by work items and files.
enum class Status {
    Pending,
    InProgress,
    Completed,
    Failed
};

const char* toString(Status status);
std::optional<Status> parseStatus(const std::string& text);
bool isTerminal(Status status);

struct WorkItemKey {
    std::string workitem_id;
    std::string job_id;
};

bool operator==(const WorkItemKey& a, const WorkItemKey& b);
bool operator<(const WorkItemKey& a, const WorkItemKey& b);

// One result file as reported by the metadata resolver.
struct FileMetadata {
    std::string job_id;
    std::string workitem_id;
    std::string workitem_name;
    std::string source_uri;
    std::string filename;
};

class StoreError : public std::runtime_error {
public: using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public: using std::runtime_error::runtime_error;
};

class InputError : public std::runtime_error {
public: using std::runtime_error::runtime_error;
};

std::string joinLines(const std::vector<std::string>& lines);
std::string joinStrings(const std::vector<std::string>& items, const std::string& sep);

// Last path component; handles both '/' and '\\' separators.
std::string baseName(const std::string& path);
bool endsWith(const std::string& text, const std::string& suffix);

// UTC, ISO-8601 with seconds, e.g. 2024-05-01T12:00:00Z
std::string utcTimestamp();
