#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace roster::dedup {

using db::model::PersonId;
using db::model::PersonRecord;

/*
  PersonRoster

  Persons as read at the start of a run, ordered by id. Passes remove
  ids as they delete or merge them (applied or only proposed), so a
  dry-run sees the same roster the apply run would.
*/
class PersonRoster {
 public:
  PersonRoster() = default;
  explicit PersonRoster(std::vector<PersonRecord> persons);

  // Live persons in id order. Pointers stay valid for the roster's lifetime.
  std::vector<const PersonRecord*> Live() const;

  const PersonRecord* Find(PersonId id) const;

  // Exact match after names::FoldCase; lowest id wins.
  const PersonRecord* FindByName(std::string_view name) const;

  bool Contains(PersonId id) const;

  void Remove(PersonId id);
  void Remove(const std::vector<PersonId>& ids);

  std::size_t Size() const {
    return persons_.size() - removed_.size();
  }

 private:
  std::vector<PersonRecord>                         persons_;
  std::unordered_map<PersonId, std::size_t>         index_;
  std::unordered_multimap<std::string, std::size_t> by_lower_name_;
  std::unordered_set<PersonId>                      removed_;
};

/*
  EvidenceIndex

  person -> documents and person -> connected persons, built once per
  run and never refreshed.
*/
class EvidenceIndex {
 public:
  static EvidenceIndex Build(const std::vector<db::model::PersonDocumentRecord>& links,
                             const std::vector<db::model::ConnectionRecord>&     connections);

  std::size_t SharedDocuments(PersonId a, PersonId b) const;
  std::size_t SharedConnections(PersonId a, PersonId b) const;

 private:
  using IdSet = std::unordered_set<std::int64_t>;

  static std::size_t Intersect(const std::unordered_map<PersonId, IdSet>& index, PersonId a, PersonId b);

  std::unordered_map<PersonId, IdSet> docs_by_person_;
  std::unordered_map<PersonId, IdSet> conns_by_person_;
};

/*
  Read-once state for one coordinator run.
*/
struct RunSnapshot {
  std::int64_t  person_count_before = 0;
  PersonRoster  roster;
  EvidenceIndex evidence;

  // Reads persons, document links and connections in one transaction.
  static RunSnapshot Load(db::Repository& repository);
};

} // namespace roster::dedup
