#pragma once

#include <cstdint>
#include <string>

#include "person_record.hpp"

namespace roster::db::model {

/*
  Mention link: person appears in document.

  After any merge there is at most one row per (person_id, document_id).
*/

struct PersonDocumentRecord {
  std::int64_t id = 0; // row id, assigned by the store when 0

  PersonId     person_id   = 0;
  std::int64_t document_id = 0;

  std::string context;
  std::string mention_type = "mentioned";
};

} // namespace roster::db::model
