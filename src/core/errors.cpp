#include "airwaiter/errors.h"

#include <utility>

#include <spdlog/fmt/fmt.h>

namespace airwaiter {

UnlimitedWaiterError::UnlimitedWaiterError()
    : WaiterConfigError("Waiter must be limited by timeout or by max attempts, both are 0") {
}

UnusedMaxIntervalError::UnusedMaxIntervalError()
    : WaiterConfigError("Max interval is used only by the exponential waiter") {
}

WaiterTimeoutError::WaiterTimeoutError(
    int calls_count,
    std::chrono::milliseconds elapsed,
    std::any last_result,
    std::optional<std::string> last_result_description)
    : std::runtime_error(BuildMessage(calls_count, elapsed, last_result_description)),
      calls_count_(calls_count),
      elapsed_(elapsed),
      last_result_(std::move(last_result)),
      last_result_description_(std::move(last_result_description)) {
}

std::string WaiterTimeoutError::BuildMessage(
    int calls_count, std::chrono::milliseconds elapsed, const std::optional<std::string>& description) {
    if (description.has_value()) {
        return fmt::format(
            "Waiter timeout after {} action calls ({}ms) with last result {}", calls_count, elapsed.count(), *description);
    }
    return fmt::format("Waiter timeout after {} action calls ({}ms) with no result", calls_count, elapsed.count());
}

} // namespace airwaiter
