#pragma once
#include "PartitionAssigner.hpp"
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

class StateStore;

struct InputRow {
    std::string workitem_id;
    std::string workitem_name;
    std::string job_id;
};

struct InputList {
    std::vector<InputRow> rows;
    int skipped_invalid{};
    int skipped_partition{};
};

// Reads WorkItemId, WorkItemName (optional, falls back to the id) and JobId
// columns. Rows without an id or job are skipped with a warning; with a
// partition, rows owned by other partitions are dropped.
InputList readInputList(std::istream& in, const PartitionAssigner* partition = nullptr);
InputList loadInputList(const std::filesystem::path& csv, const PartitionAssigner* partition = nullptr);

// insert-if-absent for every row
void seedWorkItems(StateStore& state, const std::vector<InputRow>& rows);
