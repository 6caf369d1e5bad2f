#include <iostream>
#include <string>
#include <vector>
#include "common.hpp"
#include "Log.hpp"
#include "Coordinator.hpp"
#include "ShutdownCoordinator.hpp"

int main(int argc, char** argv) {
    RunConfig config;
    try {
        config = parseArgs(std::vector<std::string>(argv + 1, argv + argc));
        if (config.help) {
            std::cout << usage();
            return 0;
        }
        validateConfig(config);
    }
    catch (const ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n" << usage();
        return 2;
    }

    setLogLevel(config.verbose ? LogLevel::Debug : LogLevel::Info);

    try {
        CancellationToken cancel;
        ShutdownCoordinator shutdown(cancel);

        logInfo("Starting reupload");
        logInfo("CSV input: " + (config.resume ? std::string("(resume)") : config.input_csv.string()));
        logInfo("State DB: " + config.state_db.string());
        logInfo("WorkItem workers: " + std::to_string(config.workitem_workers));
        logInfo("File workers per WorkItem: " + std::to_string(config.file_workers));

        RunContext context = RunContext::fromConfig(config);
        Coordinator coordinator(config, context, cancel);
        RunReport report = coordinator.run();

        std::cout << "\n" << formatSummary(report.summary) << "\n\n";
        return report.exitCode();
    }
    catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
