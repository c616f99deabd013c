#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/dedup/connection_maintenance.hpp"
#include "internal/dedup/pass_pipeline.hpp"
#include "internal/dedup/plan.hpp"
#include "internal/dedup/plan_executor.hpp"
#include "internal/dedup/rules.hpp"
#include "internal/names/protected_names.hpp"
#include "internal/util/cancellation.hpp"

namespace roster::dedup {

struct CoordinatorOptions {
  std::string      plan_path = "data/dedup-plan.json";
  ExecutionOptions execution;
};

struct DryRunReport {
  PipelineReport    pipeline;
  DeduplicationPlan plan;
  bool              written = false; // false when cancelled
};

struct ApplyReport {
  PipelineReport pipeline;
  std::int64_t   person_count_before = 0;
  std::int64_t   person_count_after  = 0;

  // absent when the run was cancelled
  std::optional<ConnectionDedupeReport> connections;
};

struct ExecutePlanReport {
  ExecutionReport                       execution;
  std::optional<ConnectionDedupeReport> connections;
};

/*
  Coordinator

  Entry point for the operating modes:

    dry-run              passes 0-6 into a pending plan, written to plan_path
    apply                passes 0-6 against the store, then connection cleanup
    execute-plan         replay of a reviewed plan, then connection cleanup
    dedupe-connections
    recompute-counts

  Every run reads a fresh RunSnapshot; nothing survives between runs.
*/
class Coordinator {
 public:
  Coordinator(std::shared_ptr<db::Repository> repository, names::ProtectedNames protected_names, DedupRules rules,
              CoordinatorOptions options, const util::CancellationToken* cancel = nullptr);

  DryRunReport DryRun();

  ApplyReport Apply();

  // Throws util::NotFound for a missing plan file, util::PlanFormatError
  // for a malformed one; both before any mutation.
  ExecutePlanReport ExecutePlan(const std::string& path, std::size_t batch_size = 0);

  ConnectionDedupeReport DedupeConnections();

  std::size_t RecomputeCounts();

  // Replaces the pause between batches; tests use it to avoid sleeping.
  void SetPause(PlanExecutor::Pause pause) {
    pause_ = std::move(pause);
  }

 private:
  std::int64_t CountPersons();

  std::shared_ptr<db::Repository> repository_;
  names::ProtectedNames           protected_names_;
  DedupRules                      rules_;
  CoordinatorOptions              options_;
  const util::CancellationToken*  cancel_;
  PlanExecutor::Pause             pause_;
};

} // namespace roster::dedup
