#pragma once
#include "common.hpp"
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

class ResolveError : public std::runtime_error {
public: using std::runtime_error::runtime_error;
};

// Looks up the result files of a work item. Throws ResolveError when the
// lookup itself fails; an item without files yields an empty list.
class MetadataResolver {
public:
    virtual ~MetadataResolver() = default;

    virtual std::vector<FileMetadata> resolve(const std::string& workitem_id, const std::string& job_id) = 0;
};

// Resolver over a CSV manifest with the columns
// JobId,WorkItemId,WorkItemName,Uri,FileName. Only files whose name ends in
// the configured suffix are returned, ordered by file name.
class ManifestResolver : public MetadataResolver {
public:
    ManifestResolver(const std::filesystem::path& manifest, std::string filename_suffix);

    std::vector<FileMetadata> resolve(const std::string& workitem_id, const std::string& job_id) override;

    std::size_t fileCount() const { return file_count_; }

private:
    std::map<WorkItemKey, std::vector<FileMetadata>> files_;
    std::size_t file_count_{0};
};
