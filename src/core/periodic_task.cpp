#include "core/periodic_task.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace clipstash {

namespace {
constexpr std::chrono::milliseconds kSleepSlice{100};
}

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback)
    : name_(std::move(name)),
      interval_(std::max(interval, std::chrono::milliseconds{1})),
      callback_(std::move(callback)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.load()) return;
    running_.store(true);
    thread_ = std::jthread([this](std::stop_token stop) {
        run_loop(std::move(stop));
    });
    utils::log::info(std::format("{} started: every {}ms", name_, interval_.count()));
}

void PeriodicTask::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    utils::log::info(std::format("{} stopped after {} runs", name_, runs_.load()));
}

void PeriodicTask::run_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep in slices for responsive shutdown
        auto remaining = interval_;
        while (remaining.count() > 0 && !stop.stop_requested()) {
            const auto slice = std::min(remaining, kSleepSlice);
            std::this_thread::sleep_for(slice);
            remaining -= slice;
        }

        if (stop.stop_requested()) break;

        try {
            callback_();
        } catch (const std::exception& e) {
            utils::log::error(std::format("{}: run failed: {}", name_, e.what()));
        }
        runs_.fetch_add(1);
    }
}

} // namespace clipstash
