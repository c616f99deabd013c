#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

#include "person_record.hpp"

namespace roster::db::model {

/*
  Undirected person <-> person edge.

  person_id_1 != person_id_2 always; the pair is keyed by
  (min, max) so (a,b) and (b,a) are the same connection.
*/

struct ConnectionRecord {
  std::int64_t id = 0;

  PersonId person_id_1 = 0;
  PersonId person_id_2 = 0;

  std::string  connection_type;
  std::string  description;
  std::int32_t strength = 1;
};

inline std::pair<PersonId, PersonId> PairKey(const ConnectionRecord& c) {
  return {std::min(c.person_id_1, c.person_id_2), std::max(c.person_id_1, c.person_id_2)};
}

} // namespace roster::db::model
