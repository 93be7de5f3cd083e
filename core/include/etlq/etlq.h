#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "etlq/adapters.h"
#include "etlq/errors.h"
#include "etlq/relation.h"

namespace etlq {

/// Receives per-step progress from the engine (used by --verbose).
/// MUST NOT throw; implementations only report.
class ExecutionObserver {
 public:
  virtual ~ExecutionObserver() = default;
  virtual void on_step_begin(size_t index, const std::string& description) = 0;
  virtual void on_step_end(size_t index, const Relation& result) = 0;
};

/// Carries the materialized relation and, when INTO/INSERT ran, where it went.
struct ExecutionResult {
  Relation relation;
  std::optional<std::string> loaded_to;
};

/// Parses, plans, and runs one statement.
/// MUST be all-or-nothing: any failure throws QueryError and no partial result escapes.
/// Inputs are query text/registry/observer; side effects are adapter I/O only.
ExecutionResult execute_query(const std::string& query,
                              const AdapterRegistry& registry,
                              ExecutionObserver* observer = nullptr);

/// Parses and plans one statement and renders the plan as JSON without running it.
std::string explain_query(const std::string& query, int indent = 2);

/// Joins two relations on one key pair with kind inner, left, right, or outer.
/// MUST apply the empty-input rules before checking key columns.
Relation join(const Relation& left,
              const Relation& right,
              const std::string& left_col,
              const std::string& right_col,
              const std::string& kind);

/// Joins on several key pairs that must all be equal.
Relation join(const Relation& left,
              const Relation& right,
              const std::vector<std::pair<std::string, std::string>>& keys,
              const std::string& kind);

}  // namespace etlq
