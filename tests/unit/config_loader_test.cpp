#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using roster::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "roster_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const roster::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  backend: sqlite
  sqlite:
    path: "/var/lib/roster/roster.db"
    wal_mode: true
logging:
  level: debug
dedup:
  protected_names_path: "data/persons-raw.json"
  rules_path: "config/dedup-rules.yaml"
  plan_path: "/tmp/plan.json"
  batch_pause_ms: 250
  drift_warning_threshold: 10
  delete_chunk_size: 100
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().backend() == "sqlite");
  assert(config.database().sqlite().path() == "/var/lib/roster/roster.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.dedup().plan_path() == "/tmp/plan.json");
  assert(config.dedup().batch_pause_ms() == 250);
  assert(config.dedup().drift_warning_threshold() == 10);
  assert(config.dedup().delete_chunk_size() == 100);
}

void TestDefaultsFilled() {
  const auto yaml_path = WriteYaml("defaults", "logging:\n  level: info\n");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().backend() == "sqlite");
  assert(config.database().sqlite().path() == "roster.db");
  assert(config.dedup().plan_path() == roster::config::kDefaultPlanPath);
  assert(config.dedup().batch_pause_ms() == roster::config::kDefaultBatchPauseMs);
  assert(config.dedup().drift_warning_threshold() == roster::config::kDefaultDriftThreshold);
  assert(config.dedup().delete_chunk_size() == roster::config::kDefaultDeleteChunkSize);
}

void TestExplicitZeroPauseKept() {
  const auto yaml_path = WriteYaml("zero_pause", "database:\n  backend: memory\ndedup:\n  batch_pause_ms: 0\n");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().backend() == "memory");
  assert(config.dedup().has_batch_pause_ms());
  assert(config.dedup().batch_pause_ms() == 0);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\roster\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\roster\\\"quoted\"\\db.sqlite");
}

void TestInvalidConfigsRejected() {
  assert(Rejects("unknown_field", "database:\n  backend: memory\nunknown_field: 123\n"));
  assert(Rejects("unknown_backend", "database:\n  backend: mysql\n"));
  assert(Rejects("postgres_without_conninfo", "database:\n  backend: postgres\n"));
  assert(Rejects("zero_chunk", "database:\n  backend: memory\ndedup:\n  delete_chunk_size: 0\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/roster-resolver.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject a missing file.");
}

void TestShippedSampleLoads() {
  auto config = ConfigLoader::LoadFromYaml(std::string(ROSTER_TEST_DATA_DIR) + "/roster-resolver.yaml");
  assert(config.database().backend() == "sqlite");
  assert(!config.dedup().rules_path().empty());
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsFilled();
  TestExplicitZeroPauseKept();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestInvalidConfigsRejected();
  TestShippedSampleLoads();

  std::cout << "roster_unit_config_loader: pass\n";
  return 0;
}
