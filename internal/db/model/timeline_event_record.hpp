#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "person_record.hpp"

namespace roster::db::model {

/*
  Timeline event referencing persons by id.

  person_ids never contains a deleted or absorbed id, and each id
  appears at most once.
*/

struct TimelineEventRecord {
  std::int64_t id = 0;

  std::string date;
  std::string title;
  std::string category;

  std::vector<PersonId> person_ids;
};

} // namespace roster::db::model
