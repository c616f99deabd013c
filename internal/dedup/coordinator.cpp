#include "internal/dedup/coordinator.hpp"

#include "internal/dedup/action_sink.hpp"
#include "internal/dedup/plan_store.hpp"
#include "internal/dedup/run_snapshot.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace roster::dedup {
namespace {

using observability::IntField;
using observability::StringField;

} // namespace

Coordinator::Coordinator(std::shared_ptr<db::Repository> repository, names::ProtectedNames protected_names,
                         DedupRules rules, CoordinatorOptions options, const util::CancellationToken* cancel)
    : repository_(std::move(repository)),
      protected_names_(std::move(protected_names)),
      rules_(std::move(rules)),
      options_(std::move(options)),
      cancel_(cancel) {
}

std::int64_t Coordinator::CountPersons() {
  auto tx    = repository_->Begin();
  auto count = static_cast<std::int64_t>(repository_->CountPersons(*tx));
  tx->Rollback();
  return count;
}

DryRunReport Coordinator::DryRun() {
  const auto start = util::Now();

  auto snapshot = RunSnapshot::Load(*repository_);

  DryRunReport report;
  report.plan.created_at          = start;
  report.plan.person_count_before = snapshot.person_count_before;

  PlanSink     sink(report.plan.actions);
  PassPipeline pipeline(snapshot, protected_names_, rules_, *repository_, sink, cancel_);
  report.pipeline = pipeline.Run();

  Summarize(report.plan);

  if (report.pipeline.cancelled) {
    ROSTER_LOG_WARN("dry-run cancelled, plan not written",
                    {IntField("actions", static_cast<std::int64_t>(report.plan.TotalActions()))});
    return report;
  }

  PlanStore(options_.plan_path).Save(report.plan);
  report.written = true;

  ROSTER_LOG_INFO("dry-run plan written",
                  {StringField("path", options_.plan_path),
                   IntField("actions", static_cast<std::int64_t>(report.plan.TotalActions())),
                   IntField("persons", report.plan.person_count_before),
                   IntField("elapsed_ms", util::MillisSince(start))});
  return report;
}

ApplyReport Coordinator::Apply() {
  const auto start = util::Now();

  auto snapshot = RunSnapshot::Load(*repository_);

  ApplyReport report;
  report.person_count_before = snapshot.person_count_before;

  ApplySink    sink(repository_, options_.execution.delete_chunk_size);
  PassPipeline pipeline(snapshot, protected_names_, rules_, *repository_, sink, cancel_);
  report.pipeline = pipeline.Run();

  if (!report.pipeline.cancelled) {
    report.connections = dedup::DedupeConnections(*repository_);
  }

  report.person_count_after = CountPersons();

  ROSTER_LOG_INFO("apply finished", {IntField("persons_before", report.person_count_before),
                                     IntField("persons_after", report.person_count_after),
                                     observability::BoolField("cancelled", report.pipeline.cancelled),
                                     IntField("elapsed_ms", util::MillisSince(start))});
  return report;
}

ExecutePlanReport Coordinator::ExecutePlan(const std::string& path, std::size_t batch_size) {
  PlanStore store(path);
  auto      plan = store.Load();

  auto options       = options_.execution;
  options.batch_size = batch_size;

  PlanExecutor executor(
      repository_, options, cancel_, [&store](const DeduplicationPlan& p) { store.Save(p); }, pause_);

  ExecutePlanReport report;
  report.execution = executor.Execute(plan);

  if (!report.execution.cancelled && !report.execution.nothing_to_do) {
    report.connections = dedup::DedupeConnections(*repository_);
  }
  return report;
}

ConnectionDedupeReport Coordinator::DedupeConnections() {
  return dedup::DedupeConnections(*repository_);
}

std::size_t Coordinator::RecomputeCounts() {
  return dedup::RecomputeCounts(*repository_);
}

} // namespace roster::dedup
