#include "internal/dedup/plan_executor.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/dedup/coordinator.hpp"
#include "internal/dedup/plan_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/faulty_repository.hpp"
#include "tests/support/person_graph.hpp"
#include "tests/support/sample_corpus.hpp"

namespace {

using roster::dedup::ActionStatus;
using roster::dedup::Coordinator;
using roster::dedup::CoordinatorOptions;
using roster::dedup::DeduplicationPlan;
using roster::dedup::ExecutionOptions;
using roster::dedup::PlanExecutor;
using roster::dedup::PlanStore;
using roster::names::ProtectedNames;
using roster::testing::FaultyRepository;
using roster::testing::PersonGraph;
using roster::testing::PersonId;
using roster::testing::SampleCorpus;

std::string PlanPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "roster_plan_executor_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".json");
  std::filesystem::remove(path);
  return path.string();
}

CoordinatorOptions Options(const std::string& plan_path) {
  CoordinatorOptions options;
  options.plan_path             = plan_path;
  options.execution.batch_pause = std::chrono::milliseconds(0);
  return options;
}

// Dry-run on a seeded graph, returning the plan written to `path`.
DeduplicationPlan GeneratePlan(const std::string& path) {
  PersonGraph g;
  SampleCorpus::Seed(g);
  Coordinator coordinator(g.Repo(), ProtectedNames{}, SampleCorpus::Rules(), Options(path));
  auto        report = coordinator.DryRun();
  assert(report.written);
  return PlanStore(path).Load();
}

void TestRoundTripCompleteness() {
  const auto path = PlanPath("round_trip");
  const auto plan = GeneratePlan(path);
  assert(plan.TotalActions() == 8);
  assert(plan.CountWithStatus(ActionStatus::kPending) == 8);
  assert(plan.person_count_before == 15);

  PersonGraph g;
  SampleCorpus::Seed(g);
  Coordinator coordinator(g.Repo(), ProtectedNames{}, SampleCorpus::Rules(), Options(path));
  auto        report = coordinator.ExecutePlan(path);

  assert(report.execution.executed == 8);
  assert(report.execution.skipped == 0);
  assert(report.execution.remaining == 0);
  assert(report.execution.person_count_after == 6);
  assert(report.connections.has_value());
  assert(g.PersonIds() == SampleCorpus::Survivors());

  const auto after = PlanStore(path).Load();
  assert(after.CountWithStatus(ActionStatus::kPending) == 0);
  assert(after.CountWithStatus(ActionStatus::kExecuted) + after.CountWithStatus(ActionStatus::kSkipped) == 8);

  // a second execution finds nothing left to do
  auto again = coordinator.ExecutePlan(path);
  assert(again.execution.nothing_to_do);
  assert(!again.connections.has_value());
}

void TestAlreadyAppliedActionsAreSkipped() {
  const auto path = PlanPath("skipped");
  GeneratePlan(path);

  PersonGraph g;
  SampleCorpus::Seed(g);
  Coordinator coordinator(g.Repo(), ProtectedNames{}, SampleCorpus::Rules(), Options(path));
  coordinator.Apply();

  auto report = coordinator.ExecutePlan(path);
  assert(report.execution.executed == 0);
  assert(report.execution.skipped == 8);
  assert(report.execution.remaining == 0);
}

void TestCancellationCheckpointsAndResumes() {
  const auto path = PlanPath("resume");
  GeneratePlan(path);

  PersonGraph g;
  SampleCorpus::Seed(g);

  roster::util::CancellationToken cancel;
  Coordinator coordinator(g.Repo(), ProtectedNames{}, SampleCorpus::Rules(), Options(path), &cancel);

  int pauses = 0;
  coordinator.SetPause([&](std::chrono::milliseconds) {
    ++pauses;
    // the checkpoint precedes the pause
    assert(PlanStore(path).Load().CountWithStatus(ActionStatus::kPending) == 5);
    cancel.Cancel();
  });

  auto first = coordinator.ExecutePlan(path, 3);
  assert(pauses == 1);
  assert(first.execution.cancelled);
  assert(first.execution.executed == 3);
  assert(first.execution.remaining == 5);
  assert(!first.connections.has_value());
  assert(PlanStore(path).Load().CountWithStatus(ActionStatus::kPending) == 5);

  roster::util::CancellationToken fresh;
  Coordinator resumed(g.Repo(), ProtectedNames{}, SampleCorpus::Rules(), Options(path), &fresh);
  resumed.SetPause([](std::chrono::milliseconds) {});
  auto second = resumed.ExecutePlan(path, 3);
  assert(!second.execution.cancelled);
  assert(second.execution.already_done == 3);
  assert(second.execution.executed == 5);
  assert(second.execution.remaining == 0);
  assert(g.PersonIds() == SampleCorpus::Survivors());
}

void TestRejectedActionsUntouched() {
  const auto path = PlanPath("rejected");
  auto       plan = GeneratePlan(path);

  // reject the pass 0 delete of AUSA
  for (auto& action : plan.actions) {
    if (action.pass == 0) action.status = ActionStatus::kRejected;
  }
  PlanStore(path).Save(plan);

  PersonGraph g;
  SampleCorpus::Seed(g);
  Coordinator coordinator(g.Repo(), ProtectedNames{}, SampleCorpus::Rules(), Options(path));
  auto        report = coordinator.ExecutePlan(path);

  assert(report.execution.already_done == 1);
  assert(report.execution.executed == 7);
  assert(g.Exists(SampleCorpus::kAusa));

  const auto after = PlanStore(path).Load();
  assert(after.CountWithStatus(ActionStatus::kRejected) == 1);
}

void TestDriftIsOnlyAWarning() {
  const auto path = PlanPath("drift");
  auto       plan = GeneratePlan(path);
  plan.person_count_before = 1000;

  PersonGraph g;
  SampleCorpus::Seed(g);

  ExecutionOptions options;
  options.drift_warning_threshold = 5;
  PlanExecutor executor(g.Repo(), options);
  auto         report = executor.Execute(plan);

  assert(report.drift == 15 - 1000);
  assert(report.executed == 8);
}

void TestMergeWithVanishedCanonicalSkipped() {
  const auto path = PlanPath("vanished");
  auto       plan = GeneratePlan(path);

  PersonGraph g;
  SampleCorpus::Seed(g);
  {
    roster::dedup::CascadeDelete cascade(g.Repo());
    cascade.Delete({SampleCorpus::kGlennDubin});
  }

  PlanExecutor executor(g.Repo(), ExecutionOptions{});
  auto         report = executor.Execute(plan);

  // pass 2 and pass 6 both merge into Glenn Dubin
  assert(report.skipped == 2);
  assert(report.executed == 6);
  assert(g.Exists(SampleCorpus::kDubin));
  assert(g.Exists(SampleCorpus::kGlenDubin));
}

void TestStoreFailureMarksActionSkipped() {
  const auto path = PlanPath("store_failure");
  auto       plan = GeneratePlan(path);

  auto        repo = std::make_shared<FaultyRepository>();
  PersonGraph g(repo);
  SampleCorpus::Seed(g);
  repo->Poison(SampleCorpus::kAusa);

  PlanExecutor executor(g.Repo(), ExecutionOptions{});
  auto         report = executor.Execute(plan);

  assert(repo->InjectedFailures() == 1);
  assert(report.failed == 1);
  assert(report.executed == 7);
  assert(report.skipped == 0);
  assert(report.remaining == 0);
  assert(report.person_count_after == 7);
  assert(plan.CountWithStatus(ActionStatus::kPending) == 0);
  assert(plan.CountWithStatus(ActionStatus::kRejected) == 0);

  for (const auto& action : plan.actions) {
    if (action.pass == 0) {
      assert(action.status == ActionStatus::kSkipped);
    } else {
      assert(action.status == ActionStatus::kExecuted);
    }
  }
  // the failed cascade left no partial delete behind
  assert(g.Exists(SampleCorpus::kAusa));
}

void TestMissingPlanIsFatal() {
  PersonGraph g;
  SampleCorpus::Seed(g);
  Coordinator coordinator(g.Repo(), ProtectedNames{}, SampleCorpus::Rules(), Options(PlanPath("unused")));

  bool threw = false;
  try {
    (void)coordinator.ExecutePlan(PlanPath("missing"));
  } catch (const roster::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(g.PersonIds().size() == 15);
}

void TestCancelledDryRunWritesNothing() {
  const auto path = PlanPath("cancelled_dry_run");

  PersonGraph g;
  SampleCorpus::Seed(g);
  roster::util::CancellationToken cancel;
  cancel.Cancel();
  Coordinator coordinator(g.Repo(), ProtectedNames{}, SampleCorpus::Rules(), Options(path), &cancel);

  auto report = coordinator.DryRun();
  assert(!report.written);
  assert(!std::filesystem::exists(path));
}

} // namespace

int main() {
  TestRoundTripCompleteness();
  TestAlreadyAppliedActionsAreSkipped();
  TestCancellationCheckpointsAndResumes();
  TestRejectedActionsUntouched();
  TestDriftIsOnlyAWarning();
  TestMergeWithVanishedCanonicalSkipped();
  TestStoreFailureMarksActionSkipped();
  TestMissingPlanIsFatal();
  TestCancelledDryRunWritesNothing();

  std::cout << "roster_unit_plan_executor: pass\n";
  return 0;
}
