#pragma once
#include <cstdint>
#include <string>

// Static sharding of work items across cooperating instances.
class PartitionAssigner {
public:
    // Throws ConfigError unless 0 <= partition_index < total_partitions and
    // total_partitions >= 2.
    PartitionAssigner(int partition_index, int total_partitions);

    bool belongs(const std::string& workitem_id) const;

    int index() const { return index_; }
    int total() const { return total_; }

    // 64-bit FNV-1a; identical on every platform and run.
    static std::uint64_t stableHash(const std::string& id);

private:
    int index_;
    int total_;
};

bool belongsToPartition(const std::string& workitem_id, int partition_index, int total_partitions);
