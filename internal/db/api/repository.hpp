#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/connection_record.hpp"
#include "internal/db/model/person_document_record.hpp"
#include "internal/db/model/person_record.hpp"
#include "internal/db/model/timeline_event_record.hpp"

namespace roster::db {

using model::PersonId;

/*
  Repository abstraction over the person graph.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Writes report failures as Result, never as backend exceptions
  - Bulk listings are ordered by row id so every pass sees the
    same order on every backend

  The store owns four tables:
    persons
    person_documents
    connections
    timeline_events
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Persons
  // ---------------------------------------------------------------------

  // Assigns r.id when it is 0.
  virtual Result InsertPerson(Transaction&, model::PersonRecord& r) = 0;

  virtual std::optional<model::PersonRecord> GetPerson(Transaction&, PersonId id) = 0;

  virtual std::vector<model::PersonRecord> ListPersons(Transaction&) = 0;

  // Subset of ids that still have a person row, in input order.
  virtual std::vector<PersonId> ExistingPersonIds(Transaction&, const std::vector<PersonId>& ids) = 0;

  virtual std::uint64_t CountPersons(Transaction&) = 0;

  virtual Result UpdatePerson(Transaction&, const model::PersonRecord& r) = 0;

  virtual Result DeletePersons(Transaction&, const std::vector<PersonId>& ids) = 0;

  // ---------------------------------------------------------------------
  // Person <-> document mentions
  // ---------------------------------------------------------------------

  virtual Result InsertPersonDocument(Transaction&, model::PersonDocumentRecord& r) = 0;

  virtual std::vector<model::PersonDocumentRecord> ListPersonDocuments(Transaction&) = 0;

  virtual std::uint64_t CountPersonDocuments(Transaction&, PersonId id) = 0;

  virtual Result RepointPersonDocuments(Transaction&, const std::vector<PersonId>& from, PersonId to) = 0;

  // Keeps the lowest row id for every (person_id, document_id) of this person.
  virtual Result DeleteDuplicatePersonDocuments(Transaction&, PersonId id) = 0;

  virtual Result DeletePersonDocumentsFor(Transaction&, const std::vector<PersonId>& ids) = 0;

  // ---------------------------------------------------------------------
  // Connections
  // ---------------------------------------------------------------------

  virtual Result InsertConnection(Transaction&, model::ConnectionRecord& r) = 0;

  virtual std::vector<model::ConnectionRecord> ListConnections(Transaction&) = 0;

  virtual std::uint64_t CountPersonConnections(Transaction&, PersonId id) = 0;

  // Rewrites person_id_1 and person_id_2 independently.
  virtual Result RepointConnections(Transaction&, const std::vector<PersonId>& from, PersonId to) = 0;

  virtual Result DeleteSelfLoopConnections(Transaction&) = 0;

  virtual Result DeleteConnectionsTouching(Transaction&, const std::vector<PersonId>& ids) = 0;

  virtual Result DeleteConnections(Transaction&, const std::vector<std::int64_t>& connection_ids) = 0;

  // ---------------------------------------------------------------------
  // Timeline events
  // ---------------------------------------------------------------------

  virtual Result InsertTimelineEvent(Transaction&, model::TimelineEventRecord& r) = 0;

  virtual std::vector<model::TimelineEventRecord> ListTimelineEvents(Transaction&) = 0;

  // Replaces every id in `from` with `to`, then drops repeated ids
  // keeping the first occurrence.
  virtual Result ReplaceInTimelineEvents(Transaction&, const std::vector<PersonId>& from, PersonId to) = 0;

  virtual Result RemoveFromTimelineEvents(Transaction&, const std::vector<PersonId>& ids) = 0;
};

} // namespace roster::db
