#pragma once
#include "CancellationToken.hpp"
#include <csignal>

// Turns SIGINT/SIGTERM into a cooperative stop. The first signal cancels the
// token; a second one terminates the process at once, accepting that state
// written by in-flight work may be lost. Only one coordinator may be
// installed at a time.
class ShutdownCoordinator {
public:
    explicit ShutdownCoordinator(CancellationToken& token);
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    int signalsReceived() const;

    // Entry point shared by the installed handlers; exposed for tests.
    static void handleSignal(int signo);

private:
    struct sigaction previous_int_{};
    struct sigaction previous_term_{};
};
