#include "ShutdownCoordinator.hpp"
#include "common.hpp"
#include <atomic>
#include <cstring>
#include <unistd.h>

static std::atomic<CancellationToken*> g_token{nullptr};
static std::atomic<int> g_signals{0};

static void writeStderr(const char* text) {
    ssize_t rc = ::write(STDERR_FILENO, text, std::strlen(text));
    (void)rc;   // nothing useful to do from a signal handler
}

ShutdownCoordinator::ShutdownCoordinator(CancellationToken& token) {
    CancellationToken* expected = nullptr;
    if (!g_token.compare_exchange_strong(expected, &token)) {
        throw ConfigError("a shutdown coordinator is already installed");
    }
    g_signals.store(0);

    struct sigaction sa{};
    sa.sa_handler = &ShutdownCoordinator::handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, &previous_int_);
    sigaction(SIGTERM, &sa, &previous_term_);
}

ShutdownCoordinator::~ShutdownCoordinator() {
    sigaction(SIGINT, &previous_int_, nullptr);
    sigaction(SIGTERM, &previous_term_, nullptr);
    g_token.store(nullptr);
}

int ShutdownCoordinator::signalsReceived() const {
    return g_signals.load();
}

void ShutdownCoordinator::handleSignal(int) {
    int seen = g_signals.fetch_add(1);
    if (seen == 0) {
        if (CancellationToken* token = g_token.load()) token->cancel();
        writeStderr("\nShutdown requested. Finishing current WorkItems and saving state...\n"
                    "Press Ctrl+C again to force quit (may lose progress)\n");
        return;
    }
    writeStderr("\nForce quit! State may be incomplete.\n");
    ::_exit(1);
}
