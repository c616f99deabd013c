#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/dedup/coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/names/protected_names.hpp"
#include "tests/support/person_graph.hpp"
#include "tests/support/sample_corpus.hpp"

#if ROSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ROSTER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using roster::db::ErrorCode;
using roster::db::Repository;
using roster::db::memory::MemoryRepository;
using roster::db::model::ConnectionRecord;
using roster::db::model::PersonDocumentRecord;
using roster::db::model::PersonId;
using roster::db::model::PersonRecord;
using roster::db::model::TimelineEventRecord;
using roster::model::PersonStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

PersonId InsertPerson(Repository& repo, roster::db::Transaction& tx, const std::string& name) {
  PersonRecord p;
  p.name   = name;
  auto res = repo.InsertPerson(tx, p);
  assert(res);
  assert(p.id != 0);
  return p.id;
}

void Link(Repository& repo, roster::db::Transaction& tx, PersonId person, std::int64_t document) {
  PersonDocumentRecord r;
  r.person_id   = person;
  r.document_id = document;
  auto res      = repo.InsertPersonDocument(tx, r);
  assert(res);
}

std::int64_t Connect(Repository& repo, roster::db::Transaction& tx, PersonId a, PersonId b) {
  ConnectionRecord c;
  c.person_id_1 = a;
  c.person_id_2 = b;
  c.description = "flew together";
  auto res      = repo.InsertConnection(tx, c);
  assert(res);
  return c.id;
}

void VerifyPersonLifecycle(Repository& repo) {
  auto tx = repo.Begin();

  PersonRecord p;
  p.name        = "Ghislaine Maxwell";
  p.aliases     = {"GHISLAINE MAXWELL", "Maxwell, Ghislaine"};
  p.role        = "associate";
  p.description = "socialite";
  p.status      = PersonStatus::kConvicted;
  auto insert   = repo.InsertPerson(*tx, p);
  assert(insert);

  auto loaded = repo.GetPerson(*tx, p.id);
  assert(loaded.has_value());
  assert(loaded->name == "Ghislaine Maxwell");
  assert(loaded->aliases == p.aliases);
  assert(loaded->status == PersonStatus::kConvicted);

  loaded->aliases.push_back("G. Maxwell");
  loaded->document_count = 12;
  auto update            = repo.UpdatePerson(*tx, *loaded);
  assert(update);

  auto updated = repo.GetPerson(*tx, p.id);
  assert(updated->aliases.size() == 3);
  assert(updated->document_count == 12);

  tx->Commit();

  // a failed statement poisons a postgres transaction, so use a separate one
  {
    auto dup_tx = repo.Begin();
    PersonRecord duplicate_id;
    duplicate_id.id   = p.id;
    duplicate_id.name = "Someone Else";
    auto dup          = repo.InsertPerson(*dup_tx, duplicate_id);
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    dup_tx->Rollback();
  }

  auto del_tx = repo.Begin();
  auto del    = repo.DeletePersons(*del_tx, {p.id});
  assert(del);
  assert(!repo.GetPerson(*del_tx, p.id).has_value());
  del_tx->Commit();
}

void VerifyExistingIdsAndOrdering(Repository& repo) {
  auto tx = repo.Begin();

  const auto a = InsertPerson(repo, *tx, "Glenn Dubin");
  const auto b = InsertPerson(repo, *tx, "Eva Dubin");
  const auto c = InsertPerson(repo, *tx, "Dubin");

  auto existing = repo.ExistingPersonIds(*tx, {c, 999999, a});
  assert((existing == std::vector<PersonId>{c, a}));

  auto persons = repo.ListPersons(*tx);
  assert(std::is_sorted(persons.begin(), persons.end(),
                        [](const PersonRecord& x, const PersonRecord& y) { return x.id < y.id; }));

  const auto count = repo.CountPersons(*tx);
  auto       del   = repo.DeletePersons(*tx, {a, b, c});
  assert(del);
  assert(repo.CountPersons(*tx) == count - 3);

  tx->Commit();
}

void VerifyDocumentRepoint(Repository& repo) {
  auto tx = repo.Begin();

  const auto canonical = InsertPerson(repo, *tx, "Leslie Wexner");
  const auto dup       = InsertPerson(repo, *tx, "Les Wexner");
  Link(repo, *tx, canonical, 1);
  Link(repo, *tx, canonical, 2);
  Link(repo, *tx, dup, 2);
  Link(repo, *tx, dup, 3);

  auto repoint = repo.RepointPersonDocuments(*tx, {dup}, canonical);
  assert(repoint);
  assert(repo.CountPersonDocuments(*tx, canonical) == 4);

  auto dedupe = repo.DeleteDuplicatePersonDocuments(*tx, canonical);
  assert(dedupe);
  assert(repo.CountPersonDocuments(*tx, canonical) == 3);
  assert(repo.CountPersonDocuments(*tx, dup) == 0);

  // lowest row id survives for the repeated document
  std::vector<std::int64_t> docs;
  for (const auto& l : repo.ListPersonDocuments(*tx)) {
    if (l.person_id == canonical) docs.push_back(l.document_id);
  }
  std::sort(docs.begin(), docs.end());
  assert((docs == std::vector<std::int64_t>{1, 2, 3}));

  auto cleanup = repo.DeletePersonDocumentsFor(*tx, {canonical});
  assert(cleanup);
  auto del = repo.DeletePersons(*tx, {canonical, dup});
  assert(del);
  tx->Commit();
}

void VerifyConnectionRepoint(Repository& repo) {
  auto tx = repo.Begin();

  const auto canonical = InsertPerson(repo, *tx, "Jeffrey Epstein");
  const auto dup       = InsertPerson(repo, *tx, "Jeff Epstein");
  const auto other     = InsertPerson(repo, *tx, "Jean Luc Brunel");

  Connect(repo, *tx, canonical, dup);
  Connect(repo, *tx, other, dup);

  auto repoint = repo.RepointConnections(*tx, {dup}, canonical);
  assert(repoint);
  auto loops = repo.DeleteSelfLoopConnections(*tx);
  assert(loops);

  auto conns = repo.ListConnections(*tx);
  std::size_t touching = 0;
  for (const auto& c : conns) {
    assert(c.person_id_1 != c.person_id_2);
    if (c.person_id_1 == canonical || c.person_id_2 == canonical) {
      ++touching;
      assert(c.person_id_1 == other || c.person_id_2 == other);
    }
  }
  assert(touching == 1);
  assert(repo.CountPersonConnections(*tx, canonical) == 1);
  assert(repo.CountPersonConnections(*tx, dup) == 0);

  auto drop = repo.DeleteConnectionsTouching(*tx, {canonical, other});
  assert(drop);
  assert(repo.CountPersonConnections(*tx, other) == 0);

  auto del = repo.DeletePersons(*tx, {canonical, dup, other});
  assert(del);
  tx->Commit();
}

void VerifyTimelineRewrite(Repository& repo) {
  auto tx = repo.Begin();

  const auto canonical = InsertPerson(repo, *tx, "Prince Andrew");
  const auto dup       = InsertPerson(repo, *tx, "Andrew Windsor");
  const auto other     = InsertPerson(repo, *tx, "Virginia Giuffre");

  TimelineEventRecord event;
  event.date       = "2001-03-10";
  event.title      = "photograph";
  event.person_ids = {dup, other, canonical};
  auto insert      = repo.InsertTimelineEvent(*tx, event);
  assert(insert);

  auto replace = repo.ReplaceInTimelineEvents(*tx, {dup}, canonical);
  assert(replace);

  auto find = [&]() {
    for (auto& e : repo.ListTimelineEvents(*tx)) {
      if (e.id == event.id) return e;
    }
    assert(false && "timeline event vanished");
    return TimelineEventRecord{};
  };

  assert((find().person_ids == std::vector<PersonId>{canonical, other}));

  auto remove = repo.RemoveFromTimelineEvents(*tx, {other});
  assert(remove);
  assert((find().person_ids == std::vector<PersonId>{canonical}));
  assert(find().title == "photograph");

  auto del = repo.DeletePersons(*tx, {canonical, dup, other});
  assert(del);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  PersonId id = 0;
  {
    auto tx = repo.Begin();
    id      = InsertPerson(repo, *tx, "Rolled Back");
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetPerson(*check_tx, id).has_value());
  check_tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, bool supports_parallel_transactions) {
  PersonId id = 0;
  {
    auto tx = repo.Begin();
    id      = InsertPerson(repo, *tx, "Sarah Kellen");
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto r1 = repo.GetPerson(*tx1, id);
  auto r2 = repo.GetPerson(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->document_count = 2;
  r2->document_count = 3;

  auto u1 = repo.UpdatePerson(*tx1, *r1);
  assert(u1);
  tx1->Commit();

  auto u2 = repo.UpdatePerson(*tx2, *r2);
  assert(u2);
  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const std::exception&) {
    conflicted = true;
  }

  auto verify_tx = repo.Begin();
  auto final     = repo.GetPerson(*verify_tx, id);
  assert(final.has_value());
  assert(final->document_count == (conflicted ? 2 : 3));
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto     repo = backend.make_repository();
  PersonId id   = 0;
  {
    auto tx = repo->Begin();

    PersonRecord p;
    p.name    = "Nadia Marcinkova";
    p.aliases = {"Nadia Marcinko"};
    auto res  = repo->InsertPerson(*tx, p);
    assert(res);
    id = p.id;

    Link(*repo, *tx, id, 77);

    TimelineEventRecord event;
    event.person_ids = {id};
    auto ev          = repo->InsertTimelineEvent(*tx, event);
    assert(ev);

    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto p  = repo->GetPerson(*tx, id);
  assert(p.has_value());
  assert(p->aliases == std::vector<std::string>{"Nadia Marcinko"});
  assert(repo->CountPersonDocuments(*tx, id) == 1);

  bool found = false;
  for (const auto& e : repo->ListTimelineEvents(*tx)) {
    if (e.person_ids == std::vector<PersonId>{id}) found = true;
  }
  assert(found);
  tx->Commit();
}

// Runs on an empty store: the corpus seeds fixed ids.
void VerifyPipelineParity(std::shared_ptr<Repository> repo) {
  roster::testing::PersonGraph g(repo);
  roster::testing::SampleCorpus::Seed(g);

  roster::dedup::CoordinatorOptions options;
  options.plan_path = (std::filesystem::temp_directory_path() / ("roster_parity_plan_" + std::to_string(NowMs()) + ".json")).string();

  roster::dedup::Coordinator coordinator(repo, roster::names::ProtectedNames{}, roster::testing::SampleCorpus::Rules(), options);
  auto report = coordinator.Apply();

  assert(report.person_count_before == 15);
  assert(report.person_count_after == static_cast<std::int64_t>(roster::testing::SampleCorpus::Survivors().size()));
  assert(g.PersonIds() == roster::testing::SampleCorpus::Survivors());

  // no orphaned links, no self loops, no dead ids in events
  const auto live = g.PersonIds();
  auto is_live    = [&](PersonId id) { return std::find(live.begin(), live.end(), id) != live.end(); };
  for (const auto& c : g.Connections()) {
    assert(c.person_id_1 != c.person_id_2);
    assert(is_live(c.person_id_1) && is_live(c.person_id_2));
  }
  for (const auto& e : g.Events()) {
    for (auto id : e.person_ids) assert(is_live(id));
  }
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if ROSTER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("roster_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<roster::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : roster::db::sql::SqliteSchema()) db->Exec(sql);
    return std::make_shared<roster::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if ROSTER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ROSTER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ROSTER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  auto open     = [conninfo](bool truncate) {
    {
      pqxx::connection conn(conninfo);
      pqxx::work       tx(conn);
      for (const auto& sql : roster::db::sql::PostgresSchema()) tx.exec(sql);
      if (truncate) tx.exec("TRUNCATE timeline_events, connections, person_documents, persons RESTART IDENTITY;");
      tx.commit();
    }
    auto pool = std::make_shared<roster::db::postgres::PgPool>(conninfo);
    return std::make_shared<roster::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = [open]() { return open(true); },
      .supports_restart               = []() { return true; },
      .restart                        = [open](std::shared_ptr<Repository>& repo) { repo = open(false); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyPipelineParity(repo);

  VerifyPersonLifecycle(*repo);
  VerifyExistingIdsAndOrdering(*repo);
  VerifyDocumentRepoint(*repo);
  VerifyConnectionRepoint(*repo);
  VerifyTimelineRewrite(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyConcurrentUpdates(*repo, backend.supports_parallel_transactions);

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ROSTER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ROSTER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "roster_integration_repository_parity: pass\n";
  return 0;
}
