#include "cmd/roster-resolver/cli_args.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <vector>

namespace {

using roster::cli::Args;
using roster::cli::ParseArgs;
using roster::cli::ParseBatchSize;

std::optional<Args> Parse(std::vector<const char*> argv) {
  argv.insert(argv.begin(), "roster-resolver");
  return ParseArgs(static_cast<int>(argv.size()), argv.data());
}

void TestCommands() {
  auto dry = Parse({"--config", "c.yaml", "dry-run"});
  assert(dry && dry->command == "dry-run" && dry->config_path == "c.yaml");

  auto recompute = Parse({"recompute-counts", "--config", "c.yaml"});
  assert(recompute && recompute->command == "recompute-counts");

  assert(!Parse({"dry-run"}));
  assert(!Parse({"--config"}));
  assert(!Parse({"--config", "c.yaml"}));
  assert(!Parse({"--config", "c.yaml", "merge-everything"}));
  assert(!Parse({"--config", "c.yaml", "apply", "extra"}));
}

void TestExecutePlanOptions() {
  auto defaults = Parse({"--config", "c.yaml", "execute-plan"});
  assert(defaults && !defaults->plan_path && defaults->batch_size == 0);

  auto full = Parse({"--config", "c.yaml", "execute-plan", "plans/p.json", "--batch", "25"});
  assert(full && full->plan_path == "plans/p.json" && full->batch_size == 25);

  auto batch_first = Parse({"--config", "c.yaml", "execute-plan", "--batch", "3", "p.json"});
  assert(batch_first && batch_first->plan_path == "p.json" && batch_first->batch_size == 3);

  // malformed batch sizes are usage errors, not runtime failures
  assert(!Parse({"--config", "c.yaml", "execute-plan", "--batch", "abc"}));
  assert(!Parse({"--config", "c.yaml", "execute-plan", "--batch"}));
  assert(!Parse({"--config", "c.yaml", "execute-plan", "--batch", "0"}));
  assert(!Parse({"--config", "c.yaml", "execute-plan", "a.json", "b.json"}));
}

void TestBatchSize() {
  assert(ParseBatchSize("1") == 1u);
  assert(ParseBatchSize("500") == 500u);

  assert(!ParseBatchSize(""));
  assert(!ParseBatchSize("0"));
  assert(!ParseBatchSize("-3"));
  assert(!ParseBatchSize("+3"));
  assert(!ParseBatchSize("12abc"));
  assert(!ParseBatchSize(" 12"));
  assert(!ParseBatchSize("99999999999999999999999999"));
}

} // namespace

int main() {
  TestCommands();
  TestExecutePlanOptions();
  TestBatchSize();

  std::cout << "roster_unit_cli_args: pass\n";
  return 0;
}
