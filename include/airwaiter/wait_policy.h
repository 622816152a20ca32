#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "airwaiter/exception_filter.h"

namespace airwaiter {

constexpr std::chrono::milliseconds DEFAULT_WAIT_INTERVAL{100};

/**
 * Static configuration of a waiter: limits, delay between attempts and the
 * exceptions to ignore.
 *
 * A zero timeout means no time limit, zero max attempts means no count limit;
 * at least one of them must be set. The constructor validates the combination.
 */
class WaitPolicy {
 public:
    /**
     * Builder for WaitPolicy
     */
    class Builder {
     public:
        Builder();

        /**
         * @param timeout max total duration to poll for, 0 for no time limit
         * @return the builder
         */
        Builder& WithTimeout(std::chrono::milliseconds timeout);

        /**
         * @param max_attempts max number of action calls, 0 for no count limit
         * @return the builder
         */
        Builder& WithMaxAttempts(int max_attempts);

        /**
         * @param interval sleep interval before every action call
         * @return the builder
         */
        Builder& WithInterval(std::chrono::milliseconds interval);

        /**
         * interval will be doubled after every action call.
         *
         * @return the builder
         */
        Builder& WithExponentialBackoff();

        /**
         * @param max_interval ceiling of the exponential interval, 0 for none
         * @return the builder
         */
        Builder& WithMaxInterval(std::chrono::milliseconds max_interval);

        template <typename E>
        Builder& IgnoreException() {
            exceptions_to_ignore_.Ignore<E>();
            return *this;
        }

        Builder& IgnoreExceptionIf(std::string name, ExceptionFilter::Matcher matcher);

        Builder& WithExceptionFilter(ExceptionFilter filter);

        /**
         * @return the validated policy
         */
        [[nodiscard]] WaitPolicy Build() const;

     private:
        std::chrono::milliseconds timeout_;
        int max_attempts_;
        std::chrono::milliseconds interval_;
        bool is_exponential_;
        std::chrono::milliseconds max_interval_;
        ExceptionFilter exceptions_to_ignore_;
    };

    /**
     * @return a builder
     */
    static Builder CreateBuilder();

    WaitPolicy(
        std::chrono::milliseconds timeout,
        int max_attempts,
        std::chrono::milliseconds interval = DEFAULT_WAIT_INTERVAL,
        bool is_exponential = false,
        std::chrono::milliseconds max_interval = std::chrono::milliseconds(0),
        ExceptionFilter exceptions_to_ignore = ExceptionFilter());

    /**
     * Delay to sleep before the next action call.
     *
     * @param calls_count action calls made so far in the current poll run
     */
    [[nodiscard]] std::chrono::milliseconds ComputeDelay(int calls_count) const;

    [[nodiscard]] std::chrono::milliseconds GetTimeout() const { return timeout_; }
    [[nodiscard]] int GetMaxAttempts() const { return max_attempts_; }
    [[nodiscard]] std::chrono::milliseconds GetInterval() const { return interval_; }
    [[nodiscard]] bool IsExponential() const { return is_exponential_; }
    [[nodiscard]] std::chrono::milliseconds GetMaxInterval() const { return max_interval_; }
    [[nodiscard]] const ExceptionFilter& GetExceptionFilter() const { return exceptions_to_ignore_; }

    [[nodiscard]] bool HasTimeout() const { return timeout_.count() != 0; }
    [[nodiscard]] bool HasMaxAttempts() const { return max_attempts_ != 0; }

    [[nodiscard]] std::string ToString() const;

 private:
    void Validate() const;

    std::chrono::milliseconds timeout_;
    int max_attempts_;
    std::chrono::milliseconds interval_;
    bool is_exponential_;
    std::chrono::milliseconds max_interval_;
    ExceptionFilter exceptions_to_ignore_;
};

} // namespace airwaiter
