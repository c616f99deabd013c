#include "memory_repository.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "internal/db/common/id_lists.hpp"
#include "memory_tx.hpp"

namespace roster::db::memory {

namespace {

bool Contains(const std::vector<PersonId>& ids, PersonId id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

template <typename Map, typename Pred>
void EraseIf(Map& map, Pred pred) {
  for (auto it = map.begin(); it != map.end();) {
    if (pred(it->second)) {
      it = map.erase(it);
    } else {
      ++it;
    }
  }
}

template <typename Map>
std::vector<typename Map::mapped_type> Values(const Map& map) {
  std::vector<typename Map::mapped_type> out;
  out.reserve(map.size());
  for (const auto& [_, record] : map) {
    out.push_back(record);
  }
  return out;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Persons
// ------------------------------------------------------------------

Result MemoryRepository::InsertPerson(Transaction& t, model::PersonRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) {
    r.id = s.next_person_id++;
  } else {
    s.next_person_id = std::max(s.next_person_id, r.id + 1);
  }
  if (s.persons.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "person " + std::to_string(r.id));
  s.persons[r.id] = r;
  return Result::Ok();
}

std::optional<model::PersonRecord> MemoryRepository::GetPerson(Transaction& t, PersonId id) {
  const auto& s  = TX(t).View();
  auto        it = s.persons.find(id);
  if (it == s.persons.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PersonRecord> MemoryRepository::ListPersons(Transaction& t) {
  return Values(TX(t).View().persons);
}

std::vector<PersonId> MemoryRepository::ExistingPersonIds(Transaction& t, const std::vector<PersonId>& ids) {
  const auto&           s = TX(t).View();
  std::vector<PersonId> out;
  for (auto id : ids) {
    if (s.persons.contains(id) && !Contains(out, id)) out.push_back(id);
  }
  return out;
}

std::uint64_t MemoryRepository::CountPersons(Transaction& t) {
  return TX(t).View().persons.size();
}

Result MemoryRepository::UpdatePerson(Transaction& t, const model::PersonRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.persons.contains(r.id)) return Result::Err(ErrorCode::NotFound, "person " + std::to_string(r.id));
  s.persons[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeletePersons(Transaction& t, const std::vector<PersonId>& ids) {
  auto& s = TX(t).Mutable();
  for (auto id : ids) {
    s.persons.erase(id);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Person documents
// ------------------------------------------------------------------

Result MemoryRepository::InsertPersonDocument(Transaction& t, model::PersonDocumentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.persons.contains(r.person_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "person_documents.person_id references missing person");
  }
  if (r.id == 0) {
    r.id = s.next_person_document_id++;
  } else {
    s.next_person_document_id = std::max(s.next_person_document_id, r.id + 1);
  }
  if (s.person_documents.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.person_documents[r.id] = r;
  return Result::Ok();
}

std::vector<model::PersonDocumentRecord> MemoryRepository::ListPersonDocuments(Transaction& t) {
  return Values(TX(t).View().person_documents);
}

std::uint64_t MemoryRepository::CountPersonDocuments(Transaction& t, PersonId id) {
  const auto& rows = TX(t).View().person_documents;
  return std::count_if(rows.begin(), rows.end(), [&](const auto& kv) { return kv.second.person_id == id; });
}

Result MemoryRepository::RepointPersonDocuments(Transaction& t, const std::vector<PersonId>& from, PersonId to) {
  for (auto& [_, row] : TX(t).Mutable().person_documents) {
    if (Contains(from, row.person_id)) row.person_id = to;
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteDuplicatePersonDocuments(Transaction& t, PersonId id) {
  auto&                                 rows = TX(t).Mutable().person_documents;
  std::map<std::int64_t, std::int64_t> first_row_by_document;
  for (const auto& [row_id, row] : rows) {
    if (row.person_id == id) first_row_by_document.try_emplace(row.document_id, row_id);
  }
  EraseIf(rows, [&](const model::PersonDocumentRecord& row) {
    return row.person_id == id && first_row_by_document.at(row.document_id) != row.id;
  });
  return Result::Ok();
}

Result MemoryRepository::DeletePersonDocumentsFor(Transaction& t, const std::vector<PersonId>& ids) {
  EraseIf(TX(t).Mutable().person_documents, [&](const model::PersonDocumentRecord& row) { return Contains(ids, row.person_id); });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Connections
// ------------------------------------------------------------------

Result MemoryRepository::InsertConnection(Transaction& t, model::ConnectionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.persons.contains(r.person_id_1) || !s.persons.contains(r.person_id_2)) {
    return Result::Err(ErrorCode::ConstraintViolation, "connection references missing person");
  }
  if (r.id == 0) {
    r.id = s.next_connection_id++;
  } else {
    s.next_connection_id = std::max(s.next_connection_id, r.id + 1);
  }
  if (s.connections.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.connections[r.id] = r;
  return Result::Ok();
}

std::vector<model::ConnectionRecord> MemoryRepository::ListConnections(Transaction& t) {
  return Values(TX(t).View().connections);
}

std::uint64_t MemoryRepository::CountPersonConnections(Transaction& t, PersonId id) {
  const auto& rows = TX(t).View().connections;
  return std::count_if(rows.begin(), rows.end(),
                       [&](const auto& kv) { return kv.second.person_id_1 == id || kv.second.person_id_2 == id; });
}

Result MemoryRepository::RepointConnections(Transaction& t, const std::vector<PersonId>& from, PersonId to) {
  for (auto& [_, row] : TX(t).Mutable().connections) {
    if (Contains(from, row.person_id_1)) row.person_id_1 = to;
    if (Contains(from, row.person_id_2)) row.person_id_2 = to;
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteSelfLoopConnections(Transaction& t) {
  EraseIf(TX(t).Mutable().connections, [](const model::ConnectionRecord& row) { return row.person_id_1 == row.person_id_2; });
  return Result::Ok();
}

Result MemoryRepository::DeleteConnectionsTouching(Transaction& t, const std::vector<PersonId>& ids) {
  EraseIf(TX(t).Mutable().connections, [&](const model::ConnectionRecord& row) {
    return Contains(ids, row.person_id_1) || Contains(ids, row.person_id_2);
  });
  return Result::Ok();
}

Result MemoryRepository::DeleteConnections(Transaction& t, const std::vector<std::int64_t>& connection_ids) {
  auto& rows = TX(t).Mutable().connections;
  for (auto id : connection_ids) {
    rows.erase(id);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Timeline events
// ------------------------------------------------------------------

Result MemoryRepository::InsertTimelineEvent(Transaction& t, model::TimelineEventRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) {
    r.id = s.next_timeline_event_id++;
  } else {
    s.next_timeline_event_id = std::max(s.next_timeline_event_id, r.id + 1);
  }
  if (s.timeline_events.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.timeline_events[r.id] = r;
  return Result::Ok();
}

std::vector<model::TimelineEventRecord> MemoryRepository::ListTimelineEvents(Transaction& t) {
  return Values(TX(t).View().timeline_events);
}

Result MemoryRepository::ReplaceInTimelineEvents(Transaction& t, const std::vector<PersonId>& from, PersonId to) {
  for (auto& [_, event] : TX(t).Mutable().timeline_events) {
    common::ReplaceIds(event.person_ids, from, to);
  }
  return Result::Ok();
}

Result MemoryRepository::RemoveFromTimelineEvents(Transaction& t, const std::vector<PersonId>& ids) {
  for (auto& [_, event] : TX(t).Mutable().timeline_events) {
    common::RemoveIds(event.person_ids, ids);
  }
  return Result::Ok();
}

} // namespace roster::db::memory
