#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace roster::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPerson(Transaction&, model::PersonRecord&) override;
  std::optional<model::PersonRecord> GetPerson(Transaction&, PersonId) override;
  std::vector<model::PersonRecord> ListPersons(Transaction&) override;
  std::vector<PersonId> ExistingPersonIds(Transaction&, const std::vector<PersonId>&) override;
  std::uint64_t CountPersons(Transaction&) override;
  Result UpdatePerson(Transaction&, const model::PersonRecord&) override;
  Result DeletePersons(Transaction&, const std::vector<PersonId>&) override;

  Result InsertPersonDocument(Transaction&, model::PersonDocumentRecord&) override;
  std::vector<model::PersonDocumentRecord> ListPersonDocuments(Transaction&) override;
  std::uint64_t CountPersonDocuments(Transaction&, PersonId) override;
  Result RepointPersonDocuments(Transaction&, const std::vector<PersonId>& from, PersonId to) override;
  Result DeleteDuplicatePersonDocuments(Transaction&, PersonId) override;
  Result DeletePersonDocumentsFor(Transaction&, const std::vector<PersonId>&) override;

  Result InsertConnection(Transaction&, model::ConnectionRecord&) override;
  std::vector<model::ConnectionRecord> ListConnections(Transaction&) override;
  std::uint64_t CountPersonConnections(Transaction&, PersonId) override;
  Result RepointConnections(Transaction&, const std::vector<PersonId>& from, PersonId to) override;
  Result DeleteSelfLoopConnections(Transaction&) override;
  Result DeleteConnectionsTouching(Transaction&, const std::vector<PersonId>&) override;
  Result DeleteConnections(Transaction&, const std::vector<std::int64_t>&) override;

  Result InsertTimelineEvent(Transaction&, model::TimelineEventRecord&) override;
  std::vector<model::TimelineEventRecord> ListTimelineEvents(Transaction&) override;
  Result ReplaceInTimelineEvents(Transaction&, const std::vector<PersonId>& from, PersonId to) override;
  Result RemoveFromTimelineEvents(Transaction&, const std::vector<PersonId>&) override;

private:
  friend class MemoryTransaction;

  // Ordered maps keep listings in row-id order, matching the SQL backends.
  struct State {
    std::map<PersonId, model::PersonRecord>                 persons;
    std::map<std::int64_t, model::PersonDocumentRecord>     person_documents;
    std::map<std::int64_t, model::ConnectionRecord>         connections;
    std::map<std::int64_t, model::TimelineEventRecord>      timeline_events;

    PersonId     next_person_id          = 1;
    std::int64_t next_person_document_id = 1;
    std::int64_t next_connection_id      = 1;
    std::int64_t next_timeline_event_id  = 1;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace roster::db::memory
