#pragma once
#include <atomic>

// Process-wide stop request. Only polled at checkpoints; setting it never
// interrupts work that is already running. Safe to set from a signal handler.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};
