#include "common.hpp"
#include "PartitionAssigner.hpp"

#include <cassert>
#include <string>
#include <vector>

namespace {

bool throwsConfigError(int index, int total) {
    try {
        PartitionAssigner p(index, total);
        (void)p;
    }
    catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    // FNV-1a 64-bit reference values
    assert(PartitionAssigner::stableHash("") == 14695981039346656037ULL);
    assert(PartitionAssigner::stableHash("a") == 0xaf63dc4c8601ec8cULL);

    assert(throwsConfigError(0, 1));
    assert(throwsConfigError(-1, 4));
    assert(throwsConfigError(4, 4));
    assert(!throwsConfigError(3, 4));

    std::vector<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.push_back("workitem-" + std::to_string(i * 7919));
    }

    for (int total = 2; total <= 7; ++total) {
        std::vector<PartitionAssigner> parts;
        for (int i = 0; i < total; ++i) parts.emplace_back(i, total);

        std::vector<int> per_partition(total, 0);
        for (const auto& id : ids) {
            int owners = 0;
            for (int i = 0; i < total; ++i) {
                if (parts[i].belongs(id)) {
                    ++owners;
                    ++per_partition[i];
                }
                assert(parts[i].belongs(id) == belongsToPartition(id, i, total));
            }
            // every id has exactly one owner
            assert(owners == 1);
        }
        for (int count : per_partition) assert(count > 0);
    }

    // stable across calls
    PartitionAssigner p(1, 3);
    for (const auto& id : ids) assert(p.belongs(id) == p.belongs(id));
    assert(p.index() == 1);
    assert(p.total() == 3);

    return 0;
}
