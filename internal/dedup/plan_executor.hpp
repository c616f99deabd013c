#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/dedup/cascade_delete.hpp"
#include "internal/dedup/merge_executor.hpp"
#include "internal/dedup/plan.hpp"
#include "internal/util/cancellation.hpp"

namespace roster::dedup {

struct ExecutionOptions {
  // 0 = no batching
  std::size_t               batch_size = 0;
  std::chrono::milliseconds batch_pause{2000};
  std::int64_t              drift_warning_threshold = 50;
  std::size_t               delete_chunk_size       = CascadeDelete::kDefaultChunkSize;
};

struct ExecutionReport {
  std::size_t executed = 0;
  std::size_t skipped  = 0;
  std::size_t failed   = 0; // skipped after a store error, not counted in `skipped`
  std::size_t remaining = 0;

  // non-pending actions found in the plan on entry, rejected included
  std::size_t already_done = 0;

  std::int64_t person_count_after = 0;
  std::int64_t drift              = 0;

  bool cancelled     = false;
  bool nothing_to_do = false;
};

/*
  PlanExecutor

  Replays the pending actions of a reviewed plan, in plan order, with
  every target re-checked against the store first:

    delete  existing targets cascade-deleted -> executed, none left -> skipped
    merge   canonical gone or no duplicate left -> skipped, else merged -> executed

  A store failure is logged and the action is marked skipped, so every
  pending action ends executed or skipped. Rejected actions are never
  touched.

  The checkpoint callback receives the plan at every batch boundary,
  on cancellation and at the end, so a later run resumes at the first
  action still pending.
*/
class PlanExecutor {
 public:
  using Checkpoint = std::function<void(const DeduplicationPlan&)>;
  using Pause      = std::function<void(std::chrono::milliseconds)>;

  PlanExecutor(std::shared_ptr<db::Repository> repository, ExecutionOptions options,
               const util::CancellationToken* cancel = nullptr, Checkpoint checkpoint = {}, Pause pause = {});

  ExecutionReport Execute(DeduplicationPlan& plan);

 private:
  enum class Outcome { kExecuted, kSkipped, kFailed };

  Outcome ExecuteDelete(DeduplicationAction& action);
  Outcome ExecuteMerge(DeduplicationAction& action);

  std::int64_t CurrentPersonCount();
  void         Save(const DeduplicationPlan& plan);

  std::shared_ptr<db::Repository> repository_;
  ExecutionOptions                options_;
  const util::CancellationToken*  cancel_;
  Checkpoint                      checkpoint_;
  Pause                           pause_;

  MergeExecutor merger_;
  CascadeDelete cascade_;
};

} // namespace roster::dedup
