#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "cmd/roster-resolver/cli_args.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/dedup/plan.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cancellation.hpp"

using roster::dedup::kPassCount;
using roster::dedup::PassInfoFor;
using roster::dedup::PipelineReport;

namespace {

roster::util::CancellationToken g_cancel;

void HandleSignal(int) {
  g_cancel.Cancel();
}

void PrintUsage() {
  std::cerr << "Usage: roster-resolver --config <config.yaml> <command>\n"
               "\n"
               "Commands:\n"
               "  dry-run                               write a plan of proposed changes\n"
               "  apply                                 run every pass against the store\n"
               "  execute-plan [<path>] [--batch N]     replay pending actions of a plan\n"
               "  dedupe-connections                    keep one connection per person pair\n"
               "  recompute-counts                      refresh document/connection counts\n";
}

void PrintPasses(const PipelineReport& report) {
  for (int pass = 0; pass < kPassCount; ++pass) {
    const auto& info = PassInfoFor(pass);
    std::cout << "  Pass " << pass << " (" << info.label << "): " << report.counts[static_cast<std::size_t>(pass)]
              << "\n";
  }
  if (report.ambiguous > 0) std::cout << "  Ambiguous, left alone: " << report.ambiguous << "\n";
  if (report.cancelled) std::cout << "  Interrupted before all passes finished\n";
}

int RunCommand(const roster::cli::Args& args, roster::dedup::Coordinator& coordinator,
               const std::string& default_plan_path) {
  if (args.command == "dry-run") {
    auto report = coordinator.DryRun();
    std::cout << "Dry run: " << report.plan.TotalActions() << " proposed actions over "
              << report.plan.person_count_before << " persons\n";
    PrintPasses(report.pipeline);
    if (report.written) std::cout << "Plan written to " << default_plan_path << "\n";
    return 0;
  }

  if (args.command == "apply") {
    auto report = coordinator.Apply();
    std::cout << "Apply: " << report.person_count_before << " -> " << report.person_count_after << " persons\n";
    PrintPasses(report.pipeline);
    if (report.connections) std::cout << "  Duplicate connections removed: " << report.connections->removed << "\n";
    return 0;
  }

  if (args.command == "execute-plan") {
    const auto path = args.plan_path.value_or(default_plan_path);

    auto        report = coordinator.ExecutePlan(path, args.batch_size);
    const auto& e      = report.execution;
    if (e.nothing_to_do) {
      std::cout << "No pending actions in " << path << "\n";
      return 0;
    }
    std::cout << "Executed: " << e.executed << "\n"
              << "Skipped: " << e.skipped << "\n"
              << "Failed: " << e.failed << "\n"
              << "Remaining: " << e.remaining << "\n"
              << "Person count: " << e.person_count_after << "\n";
    if (e.cancelled) std::cout << "Interrupted; re-run to resume\n";
    return 0;
  }

  if (args.command == "dedupe-connections") {
    auto report = coordinator.DedupeConnections();
    std::cout << "Connections: " << report.before << " -> " << report.after << " (" << report.removed
              << " removed)\n";
    return 0;
  }

  if (args.command == "recompute-counts") {
    std::cout << "Persons with updated counts: " << coordinator.RecomputeCounts() << "\n";
    return 0;
  }

  return 1;
}

} // namespace

int main(int argc, char** argv) {
  const auto parsed = roster::cli::ParseArgs(argc, argv);
  if (!parsed) {
    PrintUsage();
    return 1;
  }
  const auto& args = *parsed;

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = roster::config::ConfigLoader::LoadFromYaml(args.config_path);

    roster::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = roster::factory::Build(config, &g_cancel);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const std::string plan_path =
        config.dedup().plan_path().empty() ? roster::config::kDefaultPlanPath : config.dedup().plan_path();

    const int rc = RunCommand(args, *app.coordinator, plan_path);

    roster::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    ROSTER_LOG_ERROR("Fatal error", {roster::observability::StringField("error", e.what())});
    roster::observability::ShutdownLogging();
    return 2;
  }
}
