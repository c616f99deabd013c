#include "internal/dedup/connection_maintenance.hpp"

#include <map>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/dedup/store_errors.hpp"
#include "internal/names/name_normalizer.hpp"
#include "internal/observability/logging.hpp"

namespace roster::dedup {
namespace {

using db::model::ConnectionRecord;

// true when `a` is the better representative of its pair
bool Better(const ConnectionRecord& a, const ConnectionRecord& b) {
  return std::make_tuple(names::CodePointLength(a.description), a.strength, -a.id) >
         std::make_tuple(names::CodePointLength(b.description), b.strength, -b.id);
}

} // namespace

ConnectionDedupeReport DedupeConnections(db::Repository& repository) {
  auto tx          = repository.Begin();
  auto connections = repository.ListConnections(*tx);

  ConnectionDedupeReport report;
  report.before = connections.size();

  std::map<std::pair<db::model::PersonId, db::model::PersonId>, const ConnectionRecord*> best;
  std::vector<std::int64_t> doomed;

  for (const auto& c : connections) {
    if (c.person_id_1 == c.person_id_2) {
      doomed.push_back(c.id);
      continue;
    }
    auto [it, inserted] = best.try_emplace(db::model::PairKey(c), &c);
    if (inserted) continue;
    if (Better(c, *it->second)) {
      doomed.push_back(it->second->id);
      it->second = &c;
    } else {
      doomed.push_back(c.id);
    }
  }

  ThrowIfDbError(repository.DeleteConnections(*tx, doomed), "dedupe connections");
  tx->Commit();

  report.removed = doomed.size();
  report.after   = report.before - report.removed;

  ROSTER_LOG_INFO("deduplicated connections",
                  {observability::IntField("before", static_cast<std::int64_t>(report.before)),
                   observability::IntField("after", static_cast<std::int64_t>(report.after)),
                   observability::IntField("removed", static_cast<std::int64_t>(report.removed))});
  return report;
}

std::size_t RecomputeCounts(db::Repository& repository) {
  auto tx = repository.Begin();

  std::unordered_map<db::model::PersonId, std::int64_t> documents;
  for (const auto& link : repository.ListPersonDocuments(*tx)) {
    ++documents[link.person_id];
  }

  std::unordered_map<db::model::PersonId, std::int64_t> connections;
  for (const auto& c : repository.ListConnections(*tx)) {
    ++connections[c.person_id_1];
    if (c.person_id_2 != c.person_id_1) ++connections[c.person_id_2];
  }

  std::size_t changed = 0;
  for (auto person : repository.ListPersons(*tx)) {
    const auto doc_count  = documents.count(person.id) ? documents[person.id] : 0;
    const auto conn_count = connections.count(person.id) ? connections[person.id] : 0;
    if (person.document_count == doc_count && person.connection_count == conn_count) continue;

    person.document_count   = doc_count;
    person.connection_count = conn_count;
    ThrowIfDbError(repository.UpdatePerson(*tx, person), "recompute counts: person " + std::to_string(person.id));
    ++changed;
  }

  tx->Commit();
  ROSTER_LOG_INFO("recomputed person counts", {observability::IntField("changed", static_cast<std::int64_t>(changed))});
  return changed;
}

} // namespace roster::dedup
