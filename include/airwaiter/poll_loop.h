#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "airwaiter/wait_policy.h"

namespace airwaiter {

/**
 * Counters of one poll run, updated while the run is in progress so they stay
 * valid when an action exception escapes the loop.
 */
struct PollStats {
    int calls_count = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * The poll loop state machine, independent of the action's result type.
 *
 * Before every attempt the loop checks the limits, then sleeps the policy delay
 * (never past the deadline when a timeout is set) and calls the attempt.
 * A final attempt is made right at the deadline instead of being skipped.
 */
class PollLoop {
 public:
    /**
     * One attempt: calls the action and returns true when the predicate holds.
     */
    using Attempt = std::function<bool()>;

    /**
     * @param policy the policy to poll with, must outlive the loop
     * @param name a description of the polled condition used in logs
     */
    explicit PollLoop(const WaitPolicy& policy, std::string name = "action");

    /**
     * Runs attempts until one succeeds or the policy limits are reached.
     * Exceptions matching the policy filter are ignored, the rest propagate.
     *
     * @param attempt the attempt to run
     * @param stats counters of this run, reset on entry
     * @return true if an attempt succeeded, false if the limits were reached
     */
    bool Run(const Attempt& attempt, PollStats& stats) const;

 private:
    [[nodiscard]] bool ShouldStop(std::chrono::steady_clock::duration remaining, int calls_count) const;

    const WaitPolicy& policy_;
    std::string name_;
};

} // namespace airwaiter
