#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/person_status.hpp"

namespace roster::db::model {

using PersonId = std::int64_t;

/*
  Persistent person row.

  IMPORTANT:
  - name is the raw upstream string; the normalized form is always
    recomputed, never stored.
  - aliases never contain the current name and hold at most
    kMaxAliases entries in insertion order.
  - document_count / connection_count are derived and can be
    recomputed from the link tables at any time.
*/

inline constexpr std::size_t kMaxAliases = 20;

struct PersonRecord {
  PersonId id = 0;

  std::string              name;
  std::vector<std::string> aliases;

  std::string category = "associate";
  std::string role;
  std::string description;

  roster::model::PersonStatus status = roster::model::PersonStatus::kNamed;

  std::int64_t document_count   = 0;
  std::int64_t connection_count = 0;
};

} // namespace roster::db::model
