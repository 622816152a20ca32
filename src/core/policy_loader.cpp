#include "core/policy_loader.h"

#include <chrono>
#include <cstdint>
#include <utility>

#include <spdlog/spdlog.h>

namespace airwaiter {

WaitPolicy LoadWaitPolicy(const Options& options, ExceptionFilter exceptions_to_ignore) {
    auto builder = WaitPolicy::CreateBuilder();
    builder.WithTimeout(std::chrono::milliseconds(GetOptionValue<int64_t>(options, AIRWAITER_WAIT_TIMEOUT_MS)))
        .WithMaxAttempts(GetOptionValue<int>(options, AIRWAITER_WAIT_MAX_ATTEMPTS))
        .WithInterval(std::chrono::milliseconds(GetOptionValue<int64_t>(options, AIRWAITER_WAIT_INTERVAL_MS)))
        .WithMaxInterval(std::chrono::milliseconds(GetOptionValue<int64_t>(options, AIRWAITER_WAIT_MAX_INTERVAL_MS)))
        .WithExceptionFilter(std::move(exceptions_to_ignore));
    if (GetOptionValue<bool>(options, AIRWAITER_WAIT_EXPONENTIAL)) {
        builder.WithExponentialBackoff();
    }

    auto policy = builder.Build();
    SPDLOG_INFO("Loaded wait policy: {}", policy.ToString());
    return policy;
}

} // namespace airwaiter
