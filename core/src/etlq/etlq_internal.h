#pragma once

#include "etlq/etlq.h"
#include "../plan/plan.h"

namespace etlq {

/// Interprets plan steps in order against the registry's adapters.
/// MUST wrap adapter failures as ExtractFailed/LoadFailed and MUST NOT
/// return a partial relation when any step throws.
/// Inputs are plan/registry/observer; side effects are adapter I/O only.
ExecutionResult run_plan(const Plan& plan, const AdapterRegistry& registry, ExecutionObserver* observer);

}  // namespace etlq
