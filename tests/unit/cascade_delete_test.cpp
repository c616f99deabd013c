#include "internal/dedup/cascade_delete.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "tests/support/faulty_repository.hpp"
#include "tests/support/person_graph.hpp"

namespace {

using roster::dedup::CascadeDelete;
using roster::testing::FaultyRepository;
using roster::testing::PersonGraph;
using roster::testing::PersonId;

void TestRemovesEveryTrace() {
  PersonGraph g;
  const auto  junk  = g.Person("The Ambassador");
  const auto  keep  = g.Person("Jeffrey Epstein");
  const auto  other = g.Person("Ghislaine Maxwell");

  g.Doc(junk, 1);
  g.Doc(keep, 1);
  g.Conn(junk, keep);
  g.Conn(keep, other);
  const auto event = g.Event({junk, keep});

  CascadeDelete cascade(g.Repo());
  auto          result = cascade.Delete({junk});
  assert(result.deleted == std::vector<PersonId>{junk});
  assert(result.failed.empty());

  assert(!g.Exists(junk));
  assert(g.Exists(keep));
  for (const auto& l : g.Links()) assert(l.person_id != junk);
  for (const auto& c : g.Connections()) assert(c.person_id_1 != junk && c.person_id_2 != junk);
  assert(g.Connections().size() == 1);
  for (const auto& e : g.Events()) {
    if (e.id == event) assert(e.person_ids == std::vector<PersonId>{keep});
  }

  // aliases of survivors are untouched
  assert(g.Get(keep).aliases.empty());
}

void TestChunksCoverAllIds() {
  PersonGraph           g;
  std::vector<PersonId> doomed;
  for (int i = 0; i < 7; ++i) doomed.push_back(g.Person("Victim-" + std::to_string(i)));
  const auto survivor = g.Person("Glenn Dubin");

  CascadeDelete cascade(g.Repo(), 3);
  auto          result = cascade.Delete(doomed);
  assert(result.deleted.size() == 7);
  assert(result.failed.empty());
  assert(g.PersonIds() == std::vector<PersonId>{survivor});
}

void TestMissingIdsAreHarmless() {
  PersonGraph g;
  const auto  keep = g.Person("Les Wexner");

  CascadeDelete cascade(g.Repo());
  auto          result = cascade.Delete({12345});
  assert(result.failed.empty());
  assert(g.Exists(keep));
}

void TestFailedChunkRollsBackAndLaterChunksRun() {
  auto        repo = std::make_shared<FaultyRepository>();
  PersonGraph g(repo);

  std::vector<PersonId> doomed;
  for (int i = 0; i < 5; ++i) doomed.push_back(g.Person("Officer " + std::to_string(i)));
  const auto keep = g.Person("Jeffrey Epstein");

  // doomed[2] sits in the second chunk of two
  g.Doc(doomed[2], 7);
  g.Doc(doomed[3], 8);
  g.Conn(doomed[3], keep);
  const auto event = g.Event({doomed[2], doomed[4], keep});
  repo->Poison(doomed[2]);

  CascadeDelete cascade(repo, 2);
  auto          result = cascade.Delete(doomed);

  assert((result.deleted == std::vector<PersonId>{doomed[0], doomed[1], doomed[4]}));
  assert((result.failed == std::vector<PersonId>{doomed[2], doomed[3]}));
  assert(repo->InjectedFailures() == 1);

  // the failed chunk left no partial trace
  assert((g.PersonIds() == std::vector<PersonId>{doomed[2], doomed[3], keep}));
  assert(g.DocumentsOf(doomed[2]) == std::vector<std::int64_t>{7});
  assert(g.DocumentsOf(doomed[3]) == std::vector<std::int64_t>{8});
  assert(g.Connections().size() == 1);
  for (const auto& e : g.Events()) {
    if (e.id == event) assert((e.person_ids == std::vector<PersonId>{doomed[2], keep}));
  }

  // a retry after the store recovers finishes the job
  repo->Heal();
  auto retry = cascade.Delete(result.failed);
  assert(retry.failed.empty());
  assert(g.PersonIds() == std::vector<PersonId>{keep});
  assert(g.Connections().empty());
}

} // namespace

int main() {
  TestRemovesEveryTrace();
  TestChunksCoverAllIds();
  TestMissingIdsAreHarmless();
  TestFailedChunkRollsBackAndLaterChunksRun();

  std::cout << "roster_unit_cascade_delete: pass\n";
  return 0;
}
