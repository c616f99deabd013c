#include "internal/dedup/rules.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

#include "internal/util/errors.hpp"

namespace roster::dedup {
namespace {

std::vector<std::string> ReadNames(const YAML::Node& node, const std::string& where) {
  std::vector<std::string> names;
  if (!node) return names;
  if (!node.IsSequence()) {
    throw util::ConfigError(where + ": expected a list of names");
  }
  for (const auto& item : node) {
    if (!item.IsScalar()) {
      throw util::ConfigError(where + ": every entry must be a string");
    }
    names.push_back(item.Scalar());
  }
  return names;
}

std::string ReadCanonical(const YAML::Node& entry, const std::string& where) {
  if (!entry.IsMap() || !entry["canonical"] || !entry["canonical"].IsScalar() ||
      entry["canonical"].Scalar().empty()) {
    throw util::ConfigError(where + ": missing canonical name");
  }
  return entry["canonical"].Scalar();
}

DedupRules FromNode(const YAML::Node& root) {
  if (!root.IsMap()) {
    throw util::ConfigError("dedup rules: expected a mapping at the top level");
  }

  DedupRules rules;
  if (!root["version"]) {
    throw util::ConfigError("dedup rules: missing version");
  }
  rules.version = root["version"].as<int>();
  if (rules.version != kRulesVersion) {
    throw util::ConfigError("dedup rules: unsupported version " + std::to_string(rules.version));
  }

  if (const auto figures = root["key_figures"]) {
    if (!figures.IsSequence()) throw util::ConfigError("dedup rules: key_figures must be a list");
    for (std::size_t i = 0; i < figures.size(); ++i) {
      const auto where = "key_figures[" + std::to_string(i) + "]";
      KeyFigureRule rule;
      rule.canonical    = ReadCanonical(figures[i], where);
      rule.variants     = ReadNames(figures[i]["variants"], where + ".variants");
      rule.delete_names = ReadNames(figures[i]["delete"], where + ".delete");
      rules.key_figures.push_back(std::move(rule));
    }
  }

  if (const auto nicknames = root["ocr_nicknames"]) {
    if (!nicknames.IsSequence()) throw util::ConfigError("dedup rules: ocr_nicknames must be a list");
    for (std::size_t i = 0; i < nicknames.size(); ++i) {
      const auto where = "ocr_nicknames[" + std::to_string(i) + "]";
      NicknameRule rule;
      rule.canonical = ReadCanonical(nicknames[i], where);
      rule.variants  = ReadNames(nicknames[i]["variants"], where + ".variants");
      rules.ocr_nicknames.push_back(std::move(rule));
    }
  }

  return rules;
}

} // namespace

DedupRules DedupRules::LoadFromFile(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw util::ConfigError("dedup rules file not found: " + path);
  }
  try {
    return FromNode(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw util::ConfigError("dedup rules " + path + ": " + e.what());
  }
}

DedupRules DedupRules::Parse(const std::string& yaml_text) {
  try {
    return FromNode(YAML::Load(yaml_text));
  } catch (const YAML::Exception& e) {
    throw util::ConfigError(std::string("dedup rules: ") + e.what());
  }
}

} // namespace roster::dedup
