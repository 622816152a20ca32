#include "airwaiter/poll_loop.h"

#include <exception>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/time_utils.h"

namespace airwaiter {

PollLoop::PollLoop(const WaitPolicy& policy, std::string name)
    : policy_(policy),
      name_(std::move(name)) {
}

bool PollLoop::ShouldStop(std::chrono::steady_clock::duration remaining, int calls_count) const {
    if (policy_.HasTimeout() && remaining < std::chrono::steady_clock::duration::zero()) {
        return true;
    }
    return policy_.HasMaxAttempts() && calls_count >= policy_.GetMaxAttempts();
}

bool PollLoop::Run(const Attempt& attempt, PollStats& stats) const {
    stats = PollStats();

    const auto start_time = std::chrono::steady_clock::now();
    const auto end_time = SaturatingDeadline(start_time, policy_.GetTimeout());
    const std::chrono::milliseconds progress_log_interval(ONE_MINUTE_MS);
    auto next_progress_log = start_time + progress_log_interval;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        auto remaining = end_time - now;
        stats.elapsed = ToMilliseconds(now - start_time);

        if (ShouldStop(remaining, stats.calls_count)) {
            SPDLOG_WARN(
                "Wait for condition [{}] timeout after {} calls, {}ms", name_, stats.calls_count, stats.elapsed.count());
            return false;
        }

        if (now >= next_progress_log) {
            SPDLOG_INFO(
                "Wait for condition [{}] {}ms, {} calls so far", name_, stats.elapsed.count(), stats.calls_count);
            next_progress_log = NextTickAfter(next_progress_log, now, progress_log_interval);
        }

        std::chrono::steady_clock::duration delay = policy_.ComputeDelay(stats.calls_count);
        // the last call happens at the deadline, never after it
        if (policy_.HasTimeout() && delay > remaining) {
            delay = remaining;
        }
        if (delay > std::chrono::steady_clock::duration::zero()) {
            std::this_thread::sleep_for(delay);
        }

        stats.calls_count++;
        SPDLOG_DEBUG("Wait for condition [{}] attempt {}", name_, stats.calls_count);

        try {
            if (attempt()) {
                stats.elapsed = ElapsedSince(start_time);
                return true;
            }
        } catch (...) {
            auto error = std::current_exception();
            stats.elapsed = ElapsedSince(start_time);
            if (!policy_.GetExceptionFilter().Matches(error)) {
                throw;
            }
            SPDLOG_DEBUG(
                "Wait for condition [{}] ignored exception on attempt {}: {}",
                name_,
                stats.calls_count,
                DescribeException(error));
        }
    }
}

} // namespace airwaiter
