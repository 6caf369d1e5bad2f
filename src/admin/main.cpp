#include "common.hpp"
#include "AdminCommands.hpp"
#include "Coordinator.hpp"
#include "DirectoryObjectStore.hpp"
#include "StateStore.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

static int doSummary(const std::string& db) {
    StateStore state(db, 1);
    std::cout << formatSummary(state.getSummary()) << "\n";
    return 0;
}

static int doFilter(const std::string& db, const std::string& input, const std::string& output) {
    StateStore state(db, 1);
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        std::cout << "Input CSV not found: " << input << "\n";
        return 1;
    }
    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cout << "Cannot write output CSV: " << output << "\n";
        return 1;
    }

    FilterResult result = filterCompleted(state, in, out);
    out.close();
    if (!out) {
        std::cout << "Failed writing output CSV: " << output << "\n";
        return 1;
    }

    std::cout << formatFilterResult(result) << "\n\n";
    std::cout << "Output written to: " << output << "\n";
    return 0;
}

static int doValidate(const std::string& db, const std::string& targetDir) {
    if (!std::filesystem::is_directory(targetDir)) {
        std::cout << "Target directory not found: " << targetDir << "\n";
        return 1;
    }
    StateStore state(db, 1);
    DirectoryObjectStore target(targetDir);
    ValidationResult result = validateUploads(state, target);
    std::cout << formatValidation(result) << "\n";
    return result.missing == 0 ? 0 : 1;
}

static void printUsage() {
    std::cout << "Usage:\n"
        "  reupload-admin summary <state-db>\n"
        "  reupload-admin filter <state-db> <input-csv> <output-csv>\n"
        "  reupload-admin validate <state-db> <target-dir>\n";
}

int main(int argc, char** argv) {
    try {
        std::string cmd = (argc >= 2) ? argv[1] : "";
        if (argc >= 3 && !std::filesystem::exists(argv[2])) {
            std::cout << "State database not found: " << argv[2] << "\n";
            return 1;
        }

        if (cmd == "summary" && argc == 3) {
            return doSummary(argv[2]);
        }
        else if (cmd == "filter" && argc == 5) {
            return doFilter(argv[2], argv[3], argv[4]);
        }
        else if (cmd == "validate" && argc == 4) {
            return doValidate(argv[2], argv[3]);
        }

        printUsage();
        return 2;
    }
    catch (const std::exception& ex) {
        std::cerr << "Admin error: " << ex.what() << "\n";
        return 1;
    }
}
