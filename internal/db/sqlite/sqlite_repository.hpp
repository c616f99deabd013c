#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace roster::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  // Runs `sql` with `ids` bound after `leading` already-bound parameters.
  static Result ExecWithIds(sqlite3* db, const std::string& sql, const std::vector<std::int64_t>& ids,
                            std::int64_t leading = 0, bool has_leading = false);

  template <typename Fn>
  Result RewriteTimelineEvents(Transaction& t, Fn&& rewrite);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace roster::db::sqlite
