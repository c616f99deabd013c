#include "internal/dedup/plan_executor.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace roster::dedup {
namespace {

using observability::IntField;
using observability::StringField;

std::vector<PersonId> RefIds(const std::vector<PersonRef>& refs) {
  std::vector<PersonId> ids;
  ids.reserve(refs.size());
  for (const auto& r : refs) ids.push_back(r.id);
  return ids;
}

} // namespace

PlanExecutor::PlanExecutor(std::shared_ptr<db::Repository> repository, ExecutionOptions options,
                           const util::CancellationToken* cancel, Checkpoint checkpoint, Pause pause)
    : repository_(std::move(repository)),
      options_(options),
      cancel_(cancel),
      checkpoint_(std::move(checkpoint)),
      pause_(std::move(pause)),
      merger_(repository_),
      cascade_(repository_, options_.delete_chunk_size) {
  if (!pause_) {
    pause_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

std::int64_t PlanExecutor::CurrentPersonCount() {
  auto tx    = repository_->Begin();
  auto count = static_cast<std::int64_t>(repository_->CountPersons(*tx));
  tx->Rollback();
  return count;
}

void PlanExecutor::Save(const DeduplicationPlan& plan) {
  if (checkpoint_) checkpoint_(plan);
}

ExecutionReport PlanExecutor::Execute(DeduplicationPlan& plan) {
  ExecutionReport report;

  std::vector<DeduplicationAction*> pending;
  for (auto& action : plan.actions) {
    if (action.status == ActionStatus::kPending) {
      pending.push_back(&action);
    } else {
      ++report.already_done;
    }
  }

  if (pending.empty()) {
    report.nothing_to_do      = true;
    report.person_count_after = CurrentPersonCount();
    ROSTER_LOG_INFO("no pending actions, nothing to do",
                    {IntField("actions", static_cast<std::int64_t>(plan.actions.size()))});
    return report;
  }

  const auto count_now = CurrentPersonCount();
  report.drift         = count_now - plan.person_count_before;
  if (std::llabs(report.drift) > options_.drift_warning_threshold) {
    ROSTER_LOG_WARN("person count drifted since the plan was generated",
                    {IntField("plan_count", plan.person_count_before), IntField("current_count", count_now),
                     IntField("drift", report.drift)});
  }

  ROSTER_LOG_INFO("executing plan", {IntField("pending", static_cast<std::int64_t>(pending.size())),
                                     IntField("done", static_cast<std::int64_t>(report.already_done)),
                                     IntField("batch", static_cast<std::int64_t>(options_.batch_size))});

  std::size_t processed = 0;
  try {
    for (auto* action : pending) {
      if (cancel_ && cancel_->IsCancelled()) {
        report.cancelled = true;
        ROSTER_LOG_WARN("cancellation requested, stopping before next action",
                        {IntField("action", action->id)});
        break;
      }

      Outcome outcome = Outcome::kFailed;
      try {
        outcome = action->type == ActionType::kDelete ? ExecuteDelete(*action) : ExecuteMerge(*action);
      } catch (const std::exception& e) {
        ROSTER_LOG_ERROR("action failed, skipped",
                         {IntField("action", action->id), IntField("pass", action->pass),
                          StringField("error", e.what())});
      }

      switch (outcome) {
        case Outcome::kExecuted:
          action->TransitionTo(ActionStatus::kExecuted);
          ++report.executed;
          break;
        case Outcome::kSkipped:
          action->TransitionTo(ActionStatus::kSkipped);
          ++report.skipped;
          break;
        case Outcome::kFailed:
          action->TransitionTo(ActionStatus::kSkipped);
          ++report.failed;
          break;
      }
      ++processed;

      if (options_.batch_size > 0 && processed % options_.batch_size == 0 && processed < pending.size()) {
        Save(plan);
        ROSTER_LOG_INFO("batch complete", {IntField("processed", static_cast<std::int64_t>(processed)),
                                           IntField("executed", static_cast<std::int64_t>(report.executed)),
                                           IntField("skipped", static_cast<std::int64_t>(report.skipped))});
        pause_(options_.batch_pause);
      }
    }
  } catch (...) {
    Save(plan);
    throw;
  }

  Save(plan);

  report.remaining          = plan.CountWithStatus(ActionStatus::kPending);
  report.person_count_after = CurrentPersonCount();

  ROSTER_LOG_INFO("plan execution finished",
                  {IntField("executed", static_cast<std::int64_t>(report.executed)),
                   IntField("skipped", static_cast<std::int64_t>(report.skipped)),
                   IntField("failed", static_cast<std::int64_t>(report.failed)),
                   IntField("remaining", static_cast<std::int64_t>(report.remaining)),
                   IntField("persons", report.person_count_after),
                   observability::BoolField("cancelled", report.cancelled)});
  return report;
}

PlanExecutor::Outcome PlanExecutor::ExecuteDelete(DeduplicationAction& action) {
  std::vector<PersonId> existing;
  {
    auto tx  = repository_->Begin();
    existing = repository_->ExistingPersonIds(*tx, RefIds(action.targets));
    tx->Rollback();
  }
  if (existing.empty()) return Outcome::kSkipped;

  auto result = cascade_.Delete(existing);
  return result.failed.empty() ? Outcome::kExecuted : Outcome::kFailed;
}

PlanExecutor::Outcome PlanExecutor::ExecuteMerge(DeduplicationAction& action) {
  if (!action.canonical) return Outcome::kSkipped;

  const auto canonical_id = action.canonical->id;

  std::string           canonical_name;
  std::vector<PersonId> existing;
  {
    auto tx        = repository_->Begin();
    auto canonical = repository_->GetPerson(*tx, canonical_id);
    if (canonical) {
      canonical_name = canonical->name;
      existing       = repository_->ExistingPersonIds(*tx, RefIds(action.duplicates));
    }
    tx->Rollback();
    if (!canonical) return Outcome::kSkipped;
  }

  std::vector<PersonId> duplicates;
  for (auto id : existing) {
    if (id != canonical_id) duplicates.push_back(id);
  }
  if (duplicates.empty()) return Outcome::kSkipped;

  std::vector<std::string> names{canonical_name};
  for (const auto& ref : action.duplicates) {
    if (std::find(duplicates.begin(), duplicates.end(), ref.id) != duplicates.end()) names.push_back(ref.name);
  }

  try {
    return merger_.Merge(canonical_id, duplicates, names) > 0 ? Outcome::kExecuted : Outcome::kSkipped;
  } catch (const util::NotFound&) {
    // canonical vanished between the check and the merge
    return Outcome::kSkipped;
  }
}

} // namespace roster::dedup
