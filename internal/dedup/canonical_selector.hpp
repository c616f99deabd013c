#pragma once

#include <vector>

#include "internal/db/model/person_record.hpp"
#include "internal/names/protected_names.hpp"

namespace roster::dedup {

/*
  CanonicalSelector

  Total order picking the survivor of a candidate group:

    1. protected name
    2. no comma in the raw name
    3. not all-uppercase
    4. more meaningful normalized parts
    5. longer raw name (code points)
    6. lower id
*/
class CanonicalSelector {
 public:
  explicit CanonicalSelector(const names::ProtectedNames& protected_names);

  // True when `a` should survive over `b`.
  bool Prefer(const db::model::PersonRecord& a, const db::model::PersonRecord& b) const;

  // Throws util::InvalidState on an empty group.
  const db::model::PersonRecord& Select(const std::vector<const db::model::PersonRecord*>& group) const;

  bool IsProtected(const db::model::PersonRecord& p) const;

 private:
  const names::ProtectedNames& protected_names_;
};

} // namespace roster::dedup
