#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

namespace roster::names {

/*
  ProtectedNames

  Curated roster of trusted names, stored normalized. A protected
  person is never deleted and never absorbed into a different name.
  Loaded once per run and read-only afterwards.
*/
class ProtectedNames {
 public:
  ProtectedNames() = default;

  /*
    Reads a JSON or YAML sequence whose entries are plain strings
    or maps carrying a `name` key.

    Missing file: logs a warning and returns an empty roster.
    Malformed file: throws util::ConfigError.
  */
  static ProtectedNames LoadFromFile(const std::string& path);

  void Add(std::string_view raw_name);

  // Normalizes `raw_name` before the lookup.
  bool Contains(std::string_view raw_name) const;

  bool ContainsNormalized(const std::string& normalized) const {
    return normalized_.count(normalized) > 0;
  }

  std::size_t Size() const {
    return normalized_.size();
  }

 private:
  std::unordered_set<std::string> normalized_;
};

} // namespace roster::names
