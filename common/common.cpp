#include "common.hpp"
#include <ctime>
#include <tuple>

const char* toString(Status status) {
    switch (status) {
    case Status::Pending:    return "pending";
    case Status::InProgress: return "in_progress";
    case Status::Completed:  return "completed";
    case Status::Failed:     return "failed";
    }
    return "unknown";
}

std::optional<Status> parseStatus(const std::string& text) {
    if (text == "pending") return Status::Pending;
    if (text == "in_progress") return Status::InProgress;
    if (text == "completed") return Status::Completed;
    if (text == "failed") return Status::Failed;
    return std::nullopt;
}

bool isTerminal(Status status) {
    return status == Status::Completed || status == Status::Failed;
}

bool operator==(const WorkItemKey& a, const WorkItemKey& b) {
    return a.workitem_id == b.workitem_id && a.job_id == b.job_id;
}

bool operator<(const WorkItemKey& a, const WorkItemKey& b) {
    return std::tie(a.workitem_id, a.job_id) < std::tie(b.workitem_id, b.job_id);
}

std::string joinLines(const std::vector<std::string>& lines) {
    return joinStrings(lines, "\n");
}

std::string joinStrings(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        out += items[i];
        if (i + 1 < items.size()) out += sep;
    }
    return out;
}

std::string baseName(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string utcTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}
