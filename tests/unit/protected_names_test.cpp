#include "internal/names/protected_names.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using roster::names::ProtectedNames;

std::filesystem::path WriteFile(const std::string& name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "roster_protected_names_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / name;
  std::ofstream out(file_path);
  out << content;
  out.close();
  return file_path;
}

void TestLoadsJsonStringsAndObjects() {
  const auto path = WriteFile("roster.json", R"([
  "Ghislaine Maxwell",
  {"name": "Maxwell, Christine", "role": "sister"},
  "Mr."
])");

  auto names = ProtectedNames::LoadFromFile(path.string());
  assert(names.Size() == 2);
  assert(names.Contains("GHISLAINE MAXWELL"));
  assert(names.Contains("Christine Maxwell"));
  assert(!names.Contains("Maxwell"));
  // "Mr." normalizes to nothing and protects nothing
  assert(!names.Contains("***"));
}

void TestLoadsYamlList() {
  const auto path  = WriteFile("roster.yaml", "- Glenn Dubin\n- name: Eva Dubin\n");
  auto       names = ProtectedNames::LoadFromFile(path.string());
  assert(names.Size() == 2);
  assert(names.Contains("glenn dubin"));
  assert(names.ContainsNormalized("eva dubin"));
}

void TestMissingFileYieldsEmptyRoster() {
  auto names = ProtectedNames::LoadFromFile("/nonexistent/roster/protected.json");
  assert(names.Size() == 0);
  assert(ProtectedNames::LoadFromFile("").Size() == 0);
}

void TestMalformedFileRejected() {
  const auto not_a_list = WriteFile("map.yaml", "name: Glenn Dubin\n");
  const auto bad_entry  = WriteFile("nested.yaml", "- [a, b]\n");

  for (const auto& path : {not_a_list, bad_entry}) {
    bool threw = false;
    try {
      (void)ProtectedNames::LoadFromFile(path.string());
    } catch (const roster::util::ConfigError&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestLoadsJsonStringsAndObjects();
  TestLoadsYamlList();
  TestMissingFileYieldsEmptyRoster();
  TestMalformedFileRejected();

  std::cout << "roster_unit_protected_names: pass\n";
  return 0;
}
