#include "internal/dedup/run_snapshot.hpp"

#include <algorithm>

#include "internal/names/name_normalizer.hpp"

namespace roster::dedup {

// ------------------------------------------------------------------
// PersonRoster
// ------------------------------------------------------------------

PersonRoster::PersonRoster(std::vector<PersonRecord> persons) : persons_(std::move(persons)) {
  std::sort(persons_.begin(), persons_.end(), [](const PersonRecord& a, const PersonRecord& b) { return a.id < b.id; });

  for (std::size_t i = 0; i < persons_.size(); ++i) {
    index_.emplace(persons_[i].id, i);
    by_lower_name_.emplace(names::FoldCase(persons_[i].name), i);
  }
}

std::vector<const PersonRecord*> PersonRoster::Live() const {
  std::vector<const PersonRecord*> out;
  out.reserve(Size());
  for (const auto& p : persons_) {
    if (!removed_.count(p.id)) out.push_back(&p);
  }
  return out;
}

const PersonRecord* PersonRoster::Find(PersonId id) const {
  auto it = index_.find(id);
  if (it == index_.end() || removed_.count(id)) return nullptr;
  return &persons_[it->second];
}

const PersonRecord* PersonRoster::FindByName(std::string_view name) const {
  const PersonRecord* best  = nullptr;
  auto [first, last]        = by_lower_name_.equal_range(names::FoldCase(name));
  for (auto it = first; it != last; ++it) {
    const auto& p = persons_[it->second];
    if (removed_.count(p.id)) continue;
    if (!best || p.id < best->id) best = &p;
  }
  return best;
}

bool PersonRoster::Contains(PersonId id) const {
  return Find(id) != nullptr;
}

void PersonRoster::Remove(PersonId id) {
  if (index_.count(id)) removed_.insert(id);
}

void PersonRoster::Remove(const std::vector<PersonId>& ids) {
  for (auto id : ids) Remove(id);
}

// ------------------------------------------------------------------
// EvidenceIndex
// ------------------------------------------------------------------

EvidenceIndex EvidenceIndex::Build(const std::vector<db::model::PersonDocumentRecord>& links,
                                   const std::vector<db::model::ConnectionRecord>&     connections) {
  EvidenceIndex index;
  for (const auto& link : links) {
    index.docs_by_person_[link.person_id].insert(link.document_id);
  }
  for (const auto& c : connections) {
    index.conns_by_person_[c.person_id_1].insert(c.person_id_2);
    index.conns_by_person_[c.person_id_2].insert(c.person_id_1);
  }
  return index;
}

std::size_t EvidenceIndex::Intersect(const std::unordered_map<PersonId, IdSet>& index, PersonId a, PersonId b) {
  auto ia = index.find(a);
  auto ib = index.find(b);
  if (ia == index.end() || ib == index.end()) return 0;

  const auto& small = ia->second.size() <= ib->second.size() ? ia->second : ib->second;
  const auto& large = ia->second.size() <= ib->second.size() ? ib->second : ia->second;

  std::size_t shared = 0;
  for (auto id : small) {
    if (large.count(id)) ++shared;
  }
  return shared;
}

std::size_t EvidenceIndex::SharedDocuments(PersonId a, PersonId b) const {
  return Intersect(docs_by_person_, a, b);
}

std::size_t EvidenceIndex::SharedConnections(PersonId a, PersonId b) const {
  return Intersect(conns_by_person_, a, b);
}

// ------------------------------------------------------------------
// RunSnapshot
// ------------------------------------------------------------------

RunSnapshot RunSnapshot::Load(db::Repository& repository) {
  auto tx = repository.Begin();

  RunSnapshot snapshot;
  auto persons                 = repository.ListPersons(*tx);
  snapshot.person_count_before = static_cast<std::int64_t>(persons.size());
  snapshot.evidence            = EvidenceIndex::Build(repository.ListPersonDocuments(*tx), repository.ListConnections(*tx));
  snapshot.roster              = PersonRoster(std::move(persons));

  tx->Commit();
  return snapshot;
}

} // namespace roster::dedup
