#include "internal/names/protected_names.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

#include "internal/names/name_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace roster::names {

ProtectedNames ProtectedNames::LoadFromFile(const std::string& path) {
  ProtectedNames names;

  if (path.empty() || !std::filesystem::exists(path)) {
    ROSTER_LOG_WARN("protected names file not found, no protected names loaded", {observability::StringField("path", path)});
    return names;
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ConfigError("failed to parse protected names " + path + ": " + e.what());
  }

  if (!root.IsSequence()) {
    throw util::ConfigError("protected names " + path + ": expected a sequence");
  }

  for (std::size_t i = 0; i < root.size(); ++i) {
    const auto& entry = root[i];
    if (entry.IsScalar()) {
      names.Add(entry.Scalar());
    } else if (entry.IsMap() && entry["name"] && entry["name"].IsScalar()) {
      names.Add(entry["name"].Scalar());
    } else {
      throw util::ConfigError("protected names " + path + ": entry " + std::to_string(i) +
                              " is neither a string nor a map with a name");
    }
  }

  ROSTER_LOG_INFO("loaded protected names", {observability::IntField("count", static_cast<std::int64_t>(names.Size()))});
  return names;
}

// an entry normalizing to "" would otherwise protect every symbol-only name
void ProtectedNames::Add(std::string_view raw_name) {
  auto normalized = NormalizeName(raw_name);
  if (!normalized.empty()) normalized_.insert(std::move(normalized));
}

bool ProtectedNames::Contains(std::string_view raw_name) const {
  return ContainsNormalized(NormalizeName(raw_name));
}

} // namespace roster::names
