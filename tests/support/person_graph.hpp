#pragma once

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace roster::testing {

using db::model::ConnectionRecord;
using db::model::PersonDocumentRecord;
using db::model::PersonId;
using db::model::PersonRecord;
using db::model::TimelineEventRecord;

/*
  Seeds a repository with persons, document links, connections and
  timeline events, one committed transaction per call.
*/
class PersonGraph {
 public:
  explicit PersonGraph(std::shared_ptr<db::Repository> repo = std::make_shared<db::memory::MemoryRepository>())
      : repo_(std::move(repo)) {
  }

  std::shared_ptr<db::Repository> Repo() const {
    return repo_;
  }

  PersonId Person(const std::string& name, PersonId id = 0, std::vector<std::string> aliases = {}) {
    PersonRecord p;
    p.id      = id;
    p.name    = name;
    p.aliases = std::move(aliases);
    auto tx   = repo_->Begin();
    auto inserted = repo_->InsertPerson(*tx, p);
    assert(inserted);
    (void)inserted;
    tx->Commit();
    return p.id;
  }

  void Doc(PersonId person, std::int64_t document) {
    PersonDocumentRecord r;
    r.person_id   = person;
    r.document_id = document;
    auto tx       = repo_->Begin();
    auto inserted = repo_->InsertPersonDocument(*tx, r);
    assert(inserted);
    (void)inserted;
    tx->Commit();
  }

  // `count` distinct documents starting at `first`
  void Docs(PersonId person, std::int64_t first, int count) {
    for (int i = 0; i < count; ++i) Doc(person, first + i);
  }

  std::int64_t Conn(PersonId a, PersonId b, const std::string& description = {}, std::int32_t strength = 1) {
    ConnectionRecord c;
    c.person_id_1 = a;
    c.person_id_2 = b;
    c.description = description;
    c.strength    = strength;
    auto tx       = repo_->Begin();
    auto inserted = repo_->InsertConnection(*tx, c);
    assert(inserted);
    (void)inserted;
    tx->Commit();
    return c.id;
  }

  std::int64_t Event(std::vector<PersonId> ids) {
    TimelineEventRecord e;
    e.title      = "event";
    e.person_ids = std::move(ids);
    auto tx      = repo_->Begin();
    auto inserted = repo_->InsertTimelineEvent(*tx, e);
    assert(inserted);
    (void)inserted;
    tx->Commit();
    return e.id;
  }

  // ------------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------------

  std::vector<PersonId> PersonIds() const {
    auto                  tx = repo_->Begin();
    std::vector<PersonId> ids;
    for (const auto& p : repo_->ListPersons(*tx)) ids.push_back(p.id);
    tx->Rollback();
    return ids;
  }

  bool Exists(PersonId id) const {
    auto ids = PersonIds();
    return std::find(ids.begin(), ids.end(), id) != ids.end();
  }

  PersonRecord Get(PersonId id) const {
    auto tx = repo_->Begin();
    auto p  = repo_->GetPerson(*tx, id);
    tx->Rollback();
    assert(p.has_value());
    return *p;
  }

  std::vector<PersonDocumentRecord> Links() const {
    auto tx    = repo_->Begin();
    auto links = repo_->ListPersonDocuments(*tx);
    tx->Rollback();
    return links;
  }

  std::vector<std::int64_t> DocumentsOf(PersonId id) const {
    std::vector<std::int64_t> docs;
    for (const auto& l : Links()) {
      if (l.person_id == id) docs.push_back(l.document_id);
    }
    std::sort(docs.begin(), docs.end());
    return docs;
  }

  std::vector<ConnectionRecord> Connections() const {
    auto tx    = repo_->Begin();
    auto conns = repo_->ListConnections(*tx);
    tx->Rollback();
    return conns;
  }

  std::vector<TimelineEventRecord> Events() const {
    auto tx     = repo_->Begin();
    auto events = repo_->ListTimelineEvents(*tx);
    tx->Rollback();
    return events;
  }

 private:
  std::shared_ptr<db::Repository> repo_;
};

} // namespace roster::testing
