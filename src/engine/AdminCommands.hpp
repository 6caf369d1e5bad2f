#pragma once
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

class StateStore;
class ObjectStore;

struct FilterResult {
    int total{};
    int filtered{};
    int remaining{};
};

// Copies the input CSV to out, dropping rows whose work item is completed.
FilterResult filterCompleted(StateStore& state, std::istream& in, std::ostream& out);

struct MissingUpload {
    std::string workitem_id;
    std::string filename;
    std::string blob_name;
};

struct ValidationResult {
    int checked{};
    int found{};
    int missing{};
    std::vector<MissingUpload> missing_uploads;
};

// Checks that every file recorded as completed exists in the target store.
ValidationResult validateUploads(StateStore& state, ObjectStore& target);

std::string formatFilterResult(const FilterResult& result);
std::string formatValidation(const ValidationResult& result, std::size_t max_listed = 20);
