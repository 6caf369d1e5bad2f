#pragma once
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

// Fixed set of worker threads with an unordered completion stream.
//
// Callers keep at most width() tasks outstanding (hasCapacity()), so a task
// is handed to a worker as soon as it is submitted and nothing sits queued
// behind a stop request. next() returns results in completion order and
// rethrows whatever a task threw. The destructor waits for running tasks.
template <typename Result>
class TaskPool {
public:
    explicit TaskPool(std::size_t width) : width_(width) {
        if (width_ == 0) {
            throw std::invalid_argument("pool width must be > 0");
        }
        threads_.reserve(width_);
        for (std::size_t i = 0; i < width_; ++i) {
            threads_.emplace_back(&TaskPool::workerThread, this);
        }
    }

    ~TaskPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        jobs_cv_.notify_all();
        for (auto& thread : threads_) {
            if (thread.joinable()) thread.join();
        }
    }

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    std::size_t width() const { return width_; }

    // Submitted tasks whose result has not been collected with next().
    std::size_t outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

    bool hasCapacity() const { return outstanding() < width_; }

    void submit(std::function<Result()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push(std::move(task));
            ++outstanding_;
        }
        jobs_cv_.notify_one();
    }

    // Blocks until some outstanding task finishes. Must not be called with
    // nothing outstanding.
    Result next() {
        Completion done;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (outstanding_ == 0) {
                throw std::logic_error("next() called with no outstanding task");
            }
            done_cv_.wait(lock, [&] { return !done_.empty(); });
            done = std::move(done_.front());
            done_.pop();
            --outstanding_;
        }
        if (done.error) std::rethrow_exception(done.error);
        return std::move(*done.value);
    }

private:
    struct Completion {
        std::optional<Result> value;
        std::exception_ptr error;
    };

    void workerThread() {
        while (true) {
            std::function<Result()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                jobs_cv_.wait(lock, [&] { return stop_ || !jobs_.empty(); });
                if (stop_ && jobs_.empty()) {
                    break;
                }
                job = std::move(jobs_.front());
                jobs_.pop();
            }

            Completion done;
            try {
                done.value.emplace(job());
            }
            catch (...) {
                done.error = std::current_exception();
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                done_.push(std::move(done));
            }
            done_cv_.notify_one();
        }
    }

    std::size_t width_;

    mutable std::mutex mutex_;
    std::condition_variable jobs_cv_;
    std::condition_variable done_cv_;
    std::queue<std::function<Result()>> jobs_;
    std::queue<Completion> done_;
    std::size_t outstanding_{0};
    bool stop_{false};
    std::vector<std::thread> threads_;
};
