#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace clipstash {

/**
 * @brief Runs a callback at a fixed interval on a background thread
 *
 * Each run completes before the next interval starts, so runs never overlap.
 * Exceptions from the callback are logged and the loop continues.
 *
 * The wait is done in slices of at most 100ms so stop() returns promptly
 * regardless of the interval.
 */
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback);

    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Start the loop (spawns background thread); no-op if running
     */
    void start();

    /**
     * @brief Stop the loop (joins background thread)
     */
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] uint64_t runs() const { return runs_.load(); }
    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

private:
    void run_loop(std::stop_token stop);

    std::string name_;
    std::chrono::milliseconds interval_;
    Callback callback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0};
    std::jthread thread_;
};

} // namespace clipstash
