#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace roster::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

} // namespace roster::db::postgres
