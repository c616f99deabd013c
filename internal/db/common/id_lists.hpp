#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/person_record.hpp"

namespace roster::db::common {

using model::PersonId;

/*
  Helpers shared by backends that keep id arrays / alias lists in
  a single column or in memory.
*/

// Replaces members of `from` with `to`, then drops repeats keeping the
// first occurrence. Returns true if `ids` changed.
bool ReplaceIds(std::vector<PersonId>& ids, const std::vector<PersonId>& from, PersonId to);

// Returns true if `ids` changed.
bool RemoveIds(std::vector<PersonId>& ids, const std::vector<PersonId>& remove);

std::string           JoinIds(const std::vector<PersonId>& ids);
std::vector<PersonId> SplitIds(std::string_view text);

std::string              JoinLines(const std::vector<std::string>& lines);
std::vector<std::string> SplitLines(std::string_view text);

} // namespace roster::db::common
