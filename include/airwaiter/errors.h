#pragma once

#include <any>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace airwaiter {

/**
 * Base class for invalid waiter configurations.
 * Thrown while a WaitPolicy is constructed, never during polling.
 */
class WaiterConfigError : public std::invalid_argument {
 public:
    explicit WaiterConfigError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

/**
 * Neither a timeout nor a maximal attempts count bounds the poll loop.
 */
class UnlimitedWaiterError : public WaiterConfigError {
 public:
    UnlimitedWaiterError();
};

/**
 * A max interval was given to a waiter which does not grow its interval.
 */
class UnusedMaxIntervalError : public WaiterConfigError {
 public:
    UnusedMaxIntervalError();
};

/**
 * A duration or count of the waiter configuration is negative.
 */
class InvalidWaiterParameterError : public WaiterConfigError {
 public:
    explicit InvalidWaiterParameterError(const std::string& msg)
        : WaiterConfigError(msg) {}
};

/**
 * The poll loop hit its timeout or attempts limit before the predicate held.
 *
 * The last result is kept type-erased; it is absent when no attempt produced
 * a result (every call threw an ignored exception).
 */
class WaiterTimeoutError : public std::runtime_error {
 public:
    WaiterTimeoutError(
        int calls_count,
        std::chrono::milliseconds elapsed,
        std::any last_result,
        std::optional<std::string> last_result_description);

    [[nodiscard]] int GetCallsCount() const { return calls_count_; }

    [[nodiscard]] std::chrono::milliseconds GetElapsed() const { return elapsed_; }

    [[nodiscard]] bool HasLastResult() const { return last_result_.has_value(); }

    /**
     * @return the last result if there is one and it holds a T
     */
    template <typename T>
    [[nodiscard]] std::optional<T> GetLastResult() const {
        const T* value = std::any_cast<T>(&last_result_);
        if (value == nullptr) {
            return std::nullopt;
        }
        return *value;
    }

    [[nodiscard]] const std::optional<std::string>& GetLastResultDescription() const {
        return last_result_description_;
    }

 private:
    static std::string
    BuildMessage(int calls_count, std::chrono::milliseconds elapsed, const std::optional<std::string>& description);

    int calls_count_;
    std::chrono::milliseconds elapsed_;
    std::any last_result_;
    std::optional<std::string> last_result_description_;
};

} // namespace airwaiter
