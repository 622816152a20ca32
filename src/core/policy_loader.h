#pragma once

#include "airwaiter/exception_filter.h"
#include "airwaiter/wait_policy.h"
#include "common/option.h"

namespace airwaiter {

/**
 * Builds a wait policy from the AIRWAITER_WAIT_* options, falling back to
 * their defaults.
 *
 * @param options the loaded options
 * @param exceptions_to_ignore exceptions the policy ignores, not configurable by options
 * @return the validated policy
 * @throws WaiterConfigError if the configured values are not a valid policy
 */
WaitPolicy LoadWaitPolicy(const Options& options, ExceptionFilter exceptions_to_ignore = ExceptionFilter());

} // namespace airwaiter
