#include "airwaiter/wait_policy.h"

#include <algorithm>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "airwaiter/errors.h"

namespace airwaiter {

namespace {

// Delays saturate here instead of overflowing once converted to clock ticks.
constexpr auto UNBOUNDED_DELAY = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::duration::max());

// 2^62 ms is already far beyond UNBOUNDED_DELAY.
constexpr int MAX_DOUBLINGS = 62;

} // namespace

WaitPolicy::WaitPolicy(
    std::chrono::milliseconds timeout,
    int max_attempts,
    std::chrono::milliseconds interval,
    bool is_exponential,
    std::chrono::milliseconds max_interval,
    ExceptionFilter exceptions_to_ignore)
    : timeout_(timeout),
      max_attempts_(max_attempts),
      interval_(interval),
      is_exponential_(is_exponential),
      max_interval_(max_interval),
      exceptions_to_ignore_(std::move(exceptions_to_ignore)) {
    Validate();
}

void WaitPolicy::Validate() const {
    if (timeout_.count() == 0 && max_attempts_ == 0) {
        throw UnlimitedWaiterError();
    }
    if (max_interval_.count() != 0 && !is_exponential_) {
        throw UnusedMaxIntervalError();
    }
    if (timeout_.count() < 0) {
        throw InvalidWaiterParameterError("Timeout must be a positive number, or 0");
    }
    if (max_attempts_ < 0) {
        throw InvalidWaiterParameterError("Max attempts must be a positive number, or 0");
    }
    if (interval_.count() < 0) {
        throw InvalidWaiterParameterError("Interval must be a positive number, or 0");
    }
    if (max_interval_.count() < 0) {
        throw InvalidWaiterParameterError("Max interval must be a positive number, or 0");
    }
}

WaitPolicy::Builder WaitPolicy::CreateBuilder() {
    return {};
}

std::chrono::milliseconds WaitPolicy::ComputeDelay(int calls_count) const {
    if (!is_exponential_ || interval_.count() == 0) {
        return interval_;
    }

    const int64_t base = interval_.count();
    const int64_t ceiling = max_interval_.count() != 0 ? max_interval_.count() : UNBOUNDED_DELAY.count();
    if (calls_count >= MAX_DOUBLINGS || base > (ceiling >> calls_count)) {
        return std::chrono::milliseconds(ceiling);
    }
    return std::chrono::milliseconds(std::min(base << calls_count, ceiling));
}

std::string WaitPolicy::ToString() const {
    return fmt::format(
        "{{timeout: {}ms, max_attempts: {}, interval: {}ms, exponential: {}, max_interval: {}ms, ignored: {}}}",
        timeout_.count(),
        max_attempts_,
        interval_.count(),
        is_exponential_,
        max_interval_.count(),
        exceptions_to_ignore_.Size());
}

// Builder
WaitPolicy::Builder::Builder()
    : timeout_(std::chrono::milliseconds(0)),
      max_attempts_(0),
      interval_(DEFAULT_WAIT_INTERVAL),
      is_exponential_(false),
      max_interval_(std::chrono::milliseconds(0)) {
}

WaitPolicy::Builder& WaitPolicy::Builder::WithTimeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    return *this;
}

WaitPolicy::Builder& WaitPolicy::Builder::WithMaxAttempts(int max_attempts) {
    max_attempts_ = max_attempts;
    return *this;
}

WaitPolicy::Builder& WaitPolicy::Builder::WithInterval(std::chrono::milliseconds interval) {
    interval_ = interval;
    return *this;
}

WaitPolicy::Builder& WaitPolicy::Builder::WithExponentialBackoff() {
    is_exponential_ = true;
    return *this;
}

WaitPolicy::Builder& WaitPolicy::Builder::WithMaxInterval(std::chrono::milliseconds max_interval) {
    max_interval_ = max_interval;
    return *this;
}

WaitPolicy::Builder& WaitPolicy::Builder::IgnoreExceptionIf(std::string name, ExceptionFilter::Matcher matcher) {
    exceptions_to_ignore_.IgnoreIf(std::move(name), std::move(matcher));
    return *this;
}

WaitPolicy::Builder& WaitPolicy::Builder::WithExceptionFilter(ExceptionFilter filter) {
    exceptions_to_ignore_ = std::move(filter);
    return *this;
}

WaitPolicy WaitPolicy::Builder::Build() const {
    return WaitPolicy(timeout_, max_attempts_, interval_, is_exponential_, max_interval_, exceptions_to_ignore_);
}

} // namespace airwaiter
