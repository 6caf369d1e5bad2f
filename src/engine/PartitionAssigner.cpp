#include "PartitionAssigner.hpp"
#include "common.hpp"

static constexpr std::uint64_t kFnvOffset = 14695981039346656037ull;
static constexpr std::uint64_t kFnvPrime = 1099511628211ull;

PartitionAssigner::PartitionAssigner(int partition_index, int total_partitions)
    : index_(partition_index), total_(total_partitions) {
    if (total_ < 2) {
        throw ConfigError("total partitions must be at least 2");
    }
    if (index_ < 0 || index_ >= total_) {
        throw ConfigError("partition must be between 0 and " + std::to_string(total_ - 1));
    }
}

bool PartitionAssigner::belongs(const std::string& workitem_id) const {
    return stableHash(workitem_id) % static_cast<std::uint64_t>(total_) == static_cast<std::uint64_t>(index_);
}

std::uint64_t PartitionAssigner::stableHash(const std::string& id) {
    std::uint64_t h = kFnvOffset;
    for (unsigned char c : id) {
        h ^= c;
        h *= kFnvPrime;
    }
    return h;
}

bool belongsToPartition(const std::string& workitem_id, int partition_index, int total_partitions) {
    return PartitionAssigner(partition_index, total_partitions).belongs(workitem_id);
}
