#pragma once

#include <any>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "airwaiter/errors.h"
#include "airwaiter/poll_loop.h"
#include "airwaiter/predicates.h"
#include "airwaiter/value_format.h"
#include "airwaiter/wait_policy.h"

namespace airwaiter {

/**
 * Calls an action until its result satisfies a predicate, or until the
 * policy's timeout or max attempts are reached.
 *
 * Every Until* call is an independent poll run. Its call count and results
 * are kept after the run, for diagnostics, until the next run starts.
 * A single waiter must not be polled from several threads at once.
 *
 * @tparam T the action result type
 */
template <typename T>
class Waiter {
    static_assert(!std::is_void_v<T>, "Waiter action must return a value");
    static_assert(std::is_copy_constructible_v<T>, "Waiter action result must be copyable");

 public:
    using Action = std::function<T()>;
    using Predicate = std::function<bool(const T&)>;

    /**
     * @param action the action to call, with all its arguments bound
     * @param policy limits and intervals of the poll runs
     * @param name a description of the action used in logs
     */
    Waiter(Action action, WaitPolicy policy, std::string name = "action");

    /**
     * @return the first truthy result
     */
    T Until() { return UntilTruthy(); }

    /**
     * @return the first result satisfying the predicate
     */
    T Until(const Predicate& predicate) { return Poll(predicate, "predicate"); }

    T UntilTruthy() {
        return Poll([](const T& result) { return IsTruthy(result); }, "truthy");
    }

    T UntilFalsy() {
        return Poll([](const T& result) { return !IsTruthy(result); }, "falsy");
    }

    T UntilNot() { return UntilFalsy(); }

    template <typename U>
    T UntilEqualTo(const U& expected) {
        return Poll([&expected](const T& result) { return result == expected; }, "equal to " + FormatValue(expected));
    }

    template <typename U>
    T UntilNotEqualTo(const U& unexpected) {
        return Poll(
            [&unexpected](const T& result) { return result != unexpected; }, "not equal to " + FormatValue(unexpected));
    }

    /**
     * Waits for a bool `true`, not for any truthy value.
     */
    T UntilTrue() {
        return Poll([](const T& result) { return IsTrueValue(result); }, "true");
    }

    /**
     * Waits for a bool `false`, not for any falsy value.
     */
    T UntilFalse() {
        return Poll([](const T& result) { return IsFalseValue(result); }, "false");
    }

    T UntilNone() {
        return Poll([](const T& result) { return IsNone(result); }, "none");
    }

    T UntilNotNone() {
        return Poll([](const T& result) { return !IsNone(result); }, "not none");
    }

    T UntilIsTrue() { return UntilTrue(); }
    T UntilIsFalse() { return UntilFalse(); }
    T UntilIsNone() { return UntilNone(); }
    T UntilIsNotNone() { return UntilNotNone(); }

    /**
     * @return action calls made by the last poll run
     */
    [[nodiscard]] int GetCallsCount() const { return calls_count_; }

    /**
     * @return results of the last poll run, ignored exceptions excluded
     */
    [[nodiscard]] const std::vector<T>& GetResults() const { return results_; }

    [[nodiscard]] const WaitPolicy& GetPolicy() const { return policy_; }

    [[nodiscard]] const std::string& GetName() const { return name_; }

 private:
    T Poll(const Predicate& predicate, const std::string& condition);

    void Commit(const PollStats& stats, std::vector<T> results) {
        calls_count_ = stats.calls_count;
        results_ = std::move(results);
    }

    Action action_;
    WaitPolicy policy_;
    std::string name_;

    int calls_count_ = 0;
    std::vector<T> results_;
};

template <typename T>
Waiter<T>::Waiter(Action action, WaitPolicy policy, std::string name)
    : action_(std::move(action)),
      policy_(std::move(policy)),
      name_(std::move(name)) {
    if (!action_) {
        throw std::invalid_argument("Waiter action must not be empty");
    }
}

template <typename T>
T Waiter<T>::Poll(const Predicate& predicate, const std::string& condition) {
    PollStats stats;
    std::vector<T> results;
    std::optional<T> satisfied;

    PollLoop loop(policy_, name_ + " until " + condition);
    bool done = false;
    try {
        done = loop.Run(
            [this, &predicate, &results, &satisfied]() {
                results.push_back(action_());
                if (!predicate(results.back())) {
                    return false;
                }
                satisfied.emplace(results.back());
                return true;
            },
            stats);
    } catch (...) {
        Commit(stats, std::move(results));
        throw;
    }

    if (done) {
        Commit(stats, std::move(results));
        return std::move(*satisfied);
    }

    std::any last_result;
    std::optional<std::string> last_result_description;
    if (!results.empty()) {
        // a copy, results may be std::vector<bool> which hands out proxies
        const T last = results.back();
        last_result = std::make_any<T>(last);
        last_result_description = FormatValue(last);
    }
    Commit(stats, std::move(results));
    throw WaiterTimeoutError(
        stats.calls_count, stats.elapsed, std::move(last_result), std::move(last_result_description));
}

/**
 * Binds the arguments to the function once and builds a waiter calling it.
 *
 * @param policy limits and intervals of the poll runs
 * @param func the function to call on every attempt
 * @param args arguments passed to every call
 */
template <typename F, typename... Args>
auto MakeWaiter(WaitPolicy policy, F&& func, Args&&... args) {
    using Result = std::decay_t<std::invoke_result_t<std::decay_t<F>&, std::decay_t<Args>&...>>;
    return Waiter<Result>(
        [func = std::forward<F>(func), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> Result {
            return std::apply(func, bound);
        },
        std::move(policy));
}

} // namespace airwaiter
