#include "pg_repository.hpp"

#include <algorithm>

#include "internal/db/common/id_lists.hpp"

namespace roster::db::postgres {

/*
  Id lists travel as comma-joined text and are expanded server side
  with string_to_array(...)::bigint[], aliases as newline-joined text.
*/

namespace {

constexpr const char* kIdArray = "string_to_array($1, ',')::bigint[]";

model::PersonRecord ReadPerson(const pqxx::row& row) {
  model::PersonRecord r;
  r.id               = row[0].as<std::int64_t>();
  r.name             = row[1].c_str();
  r.aliases          = common::SplitLines(row[2].is_null() ? "" : row[2].c_str());
  r.category         = row[3].c_str();
  r.role             = row[4].c_str();
  r.description      = row[5].c_str();
  r.status           = roster::model::PersonStatusFromString(row[6].c_str());
  r.document_count   = row[7].as<std::int64_t>();
  r.connection_count = row[8].as<std::int64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e))
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e))
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e))
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e))
    return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Persons
// ------------------------------------------------------------------

Result PgRepository::InsertPerson(Transaction& t, model::PersonRecord& r) {
  try {
    const auto status  = std::string(roster::model::ToString(r.status));
    const auto aliases = common::JoinLines(r.aliases);
    if (r.id == 0) {
      auto res = TX(t).Work().exec_prepared("insert_person", r.name, aliases, r.category, r.role, r.description, status,
                                            r.document_count, r.connection_count);
      r.id = res[0][0].as<std::int64_t>();
    } else {
      TX(t).Work().exec_prepared("insert_person_with_id", r.id, r.name, aliases, r.category, r.role, r.description,
                                 status, r.document_count, r.connection_count);
      // keep BIGSERIAL ahead of explicit ids
      TX(t).Work().exec(
          "SELECT setval(pg_get_serial_sequence('persons','id'), GREATEST((SELECT MAX(id) FROM persons), 1));");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PersonRecord> PgRepository::GetPerson(Transaction& t, PersonId id) {
  auto res = TX(t).Work().exec_prepared("get_person", id);
  if (res.empty()) return std::nullopt;
  return ReadPerson(res[0]);
}

std::vector<model::PersonRecord> PgRepository::ListPersons(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT id,name,array_to_string(aliases, E'\\n'),category,role,description,status,document_count,connection_count "
      "FROM persons ORDER BY id;");

  std::vector<model::PersonRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) records.push_back(ReadPerson(row));
  return records;
}

std::vector<PersonId> PgRepository::ExistingPersonIds(Transaction& t, const std::vector<PersonId>& ids) {
  std::vector<PersonId> out;
  if (ids.empty()) return out;

  auto res = TX(t).Work().exec_params(std::string("SELECT id FROM persons WHERE id = ANY(") + kIdArray + ");",
                                      common::JoinIds(ids));

  std::vector<PersonId> found;
  for (const auto& row : res) found.push_back(row[0].as<std::int64_t>());

  for (auto id : ids) {
    if (std::find(found.begin(), found.end(), id) != found.end() &&
        std::find(out.begin(), out.end(), id) == out.end()) {
      out.push_back(id);
    }
  }
  return out;
}

std::uint64_t PgRepository::CountPersons(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COUNT(*) FROM persons;");
  return res[0][0].as<std::uint64_t>();
}

Result PgRepository::UpdatePerson(Transaction& t, const model::PersonRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_person", r.id, r.name, common::JoinLines(r.aliases), r.category, r.role,
                                          r.description, std::string(roster::model::ToString(r.status)),
                                          r.document_count, r.connection_count);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "person " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeletePersons(Transaction& t, const std::vector<PersonId>& ids) {
  if (ids.empty()) return Result::Ok();
  try {
    TX(t).Work().exec_params(std::string("DELETE FROM persons WHERE id = ANY(") + kIdArray + ");", common::JoinIds(ids));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Person documents
// ------------------------------------------------------------------

Result PgRepository::InsertPersonDocument(Transaction& t, model::PersonDocumentRecord& r) {
  try {
    if (r.id == 0) {
      auto res = TX(t).Work().exec_params(
          "INSERT INTO person_documents(person_id,document_id,context,mention_type) VALUES($1,$2,$3,$4) RETURNING id;",
          r.person_id, r.document_id, r.context, r.mention_type);
      r.id = res[0][0].as<std::int64_t>();
    } else {
      TX(t).Work().exec_params(
          "INSERT INTO person_documents(id,person_id,document_id,context,mention_type) VALUES($1,$2,$3,$4,$5);",
          r.id, r.person_id, r.document_id, r.context, r.mention_type);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PersonDocumentRecord> PgRepository::ListPersonDocuments(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT id,person_id,document_id,context,mention_type FROM person_documents ORDER BY id;");

  std::vector<model::PersonDocumentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::PersonDocumentRecord r;
    r.id           = row[0].as<std::int64_t>();
    r.person_id    = row[1].as<std::int64_t>();
    r.document_id  = row[2].as<std::int64_t>();
    r.context      = row[3].c_str();
    r.mention_type = row[4].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

std::uint64_t PgRepository::CountPersonDocuments(Transaction& t, PersonId id) {
  auto res = TX(t).Work().exec_prepared("count_person_documents", id);
  return res[0][0].as<std::uint64_t>();
}

Result PgRepository::RepointPersonDocuments(Transaction& t, const std::vector<PersonId>& from, PersonId to) {
  if (from.empty()) return Result::Ok();
  try {
    TX(t).Work().exec_params(std::string("UPDATE person_documents SET person_id=$2 WHERE person_id = ANY(") + kIdArray + ");",
                             common::JoinIds(from), to);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDuplicatePersonDocuments(Transaction& t, PersonId id) {
  try {
    TX(t).Work().exec_params(
        "DELETE FROM person_documents WHERE person_id=$1 AND id NOT IN "
        "(SELECT MIN(id) FROM person_documents WHERE person_id=$1 GROUP BY document_id);",
        id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeletePersonDocumentsFor(Transaction& t, const std::vector<PersonId>& ids) {
  if (ids.empty()) return Result::Ok();
  try {
    TX(t).Work().exec_params(std::string("DELETE FROM person_documents WHERE person_id = ANY(") + kIdArray + ");",
                             common::JoinIds(ids));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Connections
// ------------------------------------------------------------------

Result PgRepository::InsertConnection(Transaction& t, model::ConnectionRecord& r) {
  try {
    if (r.id == 0) {
      auto res = TX(t).Work().exec_params(
          "INSERT INTO connections(person_id_1,person_id_2,connection_type,description,strength) "
          "VALUES($1,$2,$3,$4,$5) RETURNING id;",
          r.person_id_1, r.person_id_2, r.connection_type, r.description, r.strength);
      r.id = res[0][0].as<std::int64_t>();
    } else {
      TX(t).Work().exec_params(
          "INSERT INTO connections(id,person_id_1,person_id_2,connection_type,description,strength) "
          "VALUES($1,$2,$3,$4,$5,$6);",
          r.id, r.person_id_1, r.person_id_2, r.connection_type, r.description, r.strength);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ConnectionRecord> PgRepository::ListConnections(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT id,person_id_1,person_id_2,connection_type,description,strength FROM connections ORDER BY id;");

  std::vector<model::ConnectionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ConnectionRecord r;
    r.id              = row[0].as<std::int64_t>();
    r.person_id_1     = row[1].as<std::int64_t>();
    r.person_id_2     = row[2].as<std::int64_t>();
    r.connection_type = row[3].c_str();
    r.description     = row[4].c_str();
    r.strength        = row[5].as<std::int32_t>();
    out.push_back(std::move(r));
  }
  return out;
}

std::uint64_t PgRepository::CountPersonConnections(Transaction& t, PersonId id) {
  auto res = TX(t).Work().exec_prepared("count_person_connections", id);
  return res[0][0].as<std::uint64_t>();
}

Result PgRepository::RepointConnections(Transaction& t, const std::vector<PersonId>& from, PersonId to) {
  if (from.empty()) return Result::Ok();
  try {
    auto& w   = TX(t).Work();
    auto  ids = common::JoinIds(from);
    w.exec_params(std::string("UPDATE connections SET person_id_1=$2 WHERE person_id_1 = ANY(") + kIdArray + ");", ids, to);
    w.exec_params(std::string("UPDATE connections SET person_id_2=$2 WHERE person_id_2 = ANY(") + kIdArray + ");", ids, to);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSelfLoopConnections(Transaction& t) {
  try {
    TX(t).Work().exec("DELETE FROM connections WHERE person_id_1 = person_id_2;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteConnectionsTouching(Transaction& t, const std::vector<PersonId>& ids) {
  if (ids.empty()) return Result::Ok();
  try {
    TX(t).Work().exec_params(std::string("DELETE FROM connections WHERE person_id_1 = ANY(") + kIdArray +
                                 ") OR person_id_2 = ANY(" + kIdArray + ");",
                             common::JoinIds(ids));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteConnections(Transaction& t, const std::vector<std::int64_t>& connection_ids) {
  if (connection_ids.empty()) return Result::Ok();
  try {
    TX(t).Work().exec_params(std::string("DELETE FROM connections WHERE id = ANY(") + kIdArray + ");",
                             common::JoinIds(connection_ids));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Timeline events
// ------------------------------------------------------------------

Result PgRepository::InsertTimelineEvent(Transaction& t, model::TimelineEventRecord& r) {
  try {
    if (r.id == 0) {
      auto res = TX(t).Work().exec_params(
          "INSERT INTO timeline_events(date,title,category,person_ids) "
          "VALUES($1,$2,$3,string_to_array($4, ',')::bigint[]) RETURNING id;",
          r.date, r.title, r.category, common::JoinIds(r.person_ids));
      r.id = res[0][0].as<std::int64_t>();
    } else {
      TX(t).Work().exec_params(
          "INSERT INTO timeline_events(id,date,title,category,person_ids) "
          "VALUES($1,$2,$3,$4,string_to_array($5, ',')::bigint[]);",
          r.id, r.date, r.title, r.category, common::JoinIds(r.person_ids));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TimelineEventRecord> PgRepository::ListTimelineEvents(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT id,date,title,category,array_to_string(person_ids, ',') FROM timeline_events ORDER BY id;");

  std::vector<model::TimelineEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::TimelineEventRecord r;
    r.id         = row[0].as<std::int64_t>();
    r.date       = row[1].c_str();
    r.title      = row[2].c_str();
    r.category   = row[3].c_str();
    r.person_ids = common::SplitIds(row[4].is_null() ? "" : row[4].c_str());
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::ReplaceInTimelineEvents(Transaction& t, const std::vector<PersonId>& from, PersonId to) {
  if (from.empty()) return Result::Ok();
  try {
    auto& w      = TX(t).Work();
    auto  events = w.exec_params(std::string("SELECT id,array_to_string(person_ids, ',') FROM timeline_events "
                                             "WHERE person_ids && ") + kIdArray + " ORDER BY id;",
                                 common::JoinIds(from));

    for (const auto& row : events) {
      auto ids = common::SplitIds(row[1].c_str());
      if (!common::ReplaceIds(ids, from, to)) continue;
      w.exec_params("UPDATE timeline_events SET person_ids=string_to_array($2, ',')::bigint[] WHERE id=$1;",
                    row[0].as<std::int64_t>(), common::JoinIds(ids));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::RemoveFromTimelineEvents(Transaction& t, const std::vector<PersonId>& ids) {
  if (ids.empty()) return Result::Ok();
  try {
    auto& w      = TX(t).Work();
    auto  events = w.exec_params(std::string("SELECT id,array_to_string(person_ids, ',') FROM timeline_events "
                                             "WHERE person_ids && ") + kIdArray + " ORDER BY id;",
                                 common::JoinIds(ids));

    for (const auto& row : events) {
      auto person_ids = common::SplitIds(row[1].c_str());
      if (!common::RemoveIds(person_ids, ids)) continue;
      w.exec_params("UPDATE timeline_events SET person_ids=string_to_array($2, ',')::bigint[] WHERE id=$1;",
                    row[0].as<std::int64_t>(), common::JoinIds(person_ids));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace roster::db::postgres
