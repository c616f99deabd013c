#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>

#include "internal/db/common/id_lists.hpp"

namespace roster::db::sqlite {

using roster::db::ErrorCode;
using roster::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// 0 means "let the store assign the row id"
static void BindRowId(sqlite3_stmt* st, int idx, std::int64_t v) {
    if (v == 0) {
        sqlite3_bind_null(st, idx);
    } else {
        BindI64(st, idx, v);
    }
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

static std::string InList(std::size_t n) {
    std::string out = "(";
    for (std::size_t i = 0; i < n; ++i) {
        out += (i == 0) ? "?" : ",?";
    }
    out += ")";
    return out;
}

static StatementPtr PrepareOrThrow(sqlite3* db, const std::string& sql) {
    auto st = TryPrepare(db, sql);
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

static constexpr const char* kPersonColumns =
    "id,name,aliases,category,role,description,status,document_count,connection_count";

static model::PersonRecord ReadPerson(sqlite3_stmt* st) {
    model::PersonRecord r;
    r.id               = ColI64(st, 0);
    r.name             = ColText(st, 1);
    r.aliases          = common::SplitLines(ColText(st, 2));
    r.category         = ColText(st, 3);
    r.role             = ColText(st, 4);
    r.description      = ColText(st, 5);
    r.status           = roster::model::PersonStatusFromString(ColText(st, 6));
    r.document_count   = ColI64(st, 7);
    r.connection_count = ColI64(st, 8);
    return r;
}

static std::uint64_t CountWhere(sqlite3* db, const std::string& sql, std::int64_t id) {
    auto st = PrepareOrThrow(db, sql);
    BindI64(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("sqlite count: ") + sqlite3_errmsg(db));
    }
    return static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 0));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int ext = sqlite3_extended_errcode(db);
            if (ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::ExecWithIds(sqlite3* db, const std::string& sql, const std::vector<std::int64_t>& ids,
                                     std::int64_t leading, bool has_leading) {
    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int idx = 1;
    if (has_leading) BindI64(st.get(), idx++, leading);
    for (auto id : ids) BindI64(st.get(), idx++, id);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Persons
// ------------------------------------------------------------------

Result SqliteRepository::InsertPerson(Transaction& t, model::PersonRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO persons(id,name,aliases,category,role,description,status,document_count,connection_count) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindRowId(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, common::JoinLines(r.aliases));
    BindText(st.get(), 4, r.category);
    BindText(st.get(), 5, r.role);
    BindText(st.get(), 6, r.description);
    BindText(st.get(), 7, std::string(roster::model::ToString(r.status)));
    BindI64(st.get(), 8, r.document_count);
    BindI64(st.get(), 9, r.connection_count);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && r.id == 0) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::optional<model::PersonRecord>
SqliteRepository::GetPerson(Transaction& t, PersonId id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, std::string("SELECT ") + kPersonColumns + " FROM persons WHERE id=?;");
    BindI64(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadPerson(st.get());
}

std::vector<model::PersonRecord> SqliteRepository::ListPersons(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, std::string("SELECT ") + kPersonColumns + " FROM persons ORDER BY id;");

    std::vector<model::PersonRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadPerson(st.get()));
    return out;
}

std::vector<PersonId> SqliteRepository::ExistingPersonIds(Transaction& t, const std::vector<PersonId>& ids) {
    std::vector<PersonId> out;
    if (ids.empty()) return out;

    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, "SELECT id FROM persons WHERE id IN " + InList(ids.size()) + ";");
    for (std::size_t i = 0; i < ids.size(); ++i) BindI64(st.get(), static_cast<int>(i + 1), ids[i]);

    std::vector<PersonId> found;
    while (sqlite3_step(st.get()) == SQLITE_ROW) found.push_back(ColI64(st.get(), 0));

    // keep caller order
    for (auto id : ids) {
        if (std::find(found.begin(), found.end(), id) != found.end() &&
            std::find(out.begin(), out.end(), id) == out.end()) {
            out.push_back(id);
        }
    }
    return out;
}

std::uint64_t SqliteRepository::CountPersons(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, "SELECT COUNT(*) FROM persons;");
    if (sqlite3_step(st.get()) != SQLITE_ROW) throw std::runtime_error(std::string("sqlite count: ") + sqlite3_errmsg(db));
    return static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 0));
}

Result SqliteRepository::UpdatePerson(Transaction& t, const model::PersonRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE persons SET name=?,aliases=?,category=?,role=?,description=?,status=?,"
        "document_count=?,connection_count=? WHERE id=?;";

    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.name);
    BindText(st.get(), 2, common::JoinLines(r.aliases));
    BindText(st.get(), 3, r.category);
    BindText(st.get(), 4, r.role);
    BindText(st.get(), 5, r.description);
    BindText(st.get(), 6, std::string(roster::model::ToString(r.status)));
    BindI64(st.get(), 7, r.document_count);
    BindI64(st.get(), 8, r.connection_count);
    BindI64(st.get(), 9, r.id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "person " + std::to_string(r.id));
    return result;
}

Result SqliteRepository::DeletePersons(Transaction& t, const std::vector<PersonId>& ids) {
    if (ids.empty()) return Result::Ok();
    return ExecWithIds(TX(t).Handle(), "DELETE FROM persons WHERE id IN " + InList(ids.size()) + ";", ids);
}

// ------------------------------------------------------------------
// Person documents
// ------------------------------------------------------------------

Result SqliteRepository::InsertPersonDocument(Transaction& t, model::PersonDocumentRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, "INSERT INTO person_documents(id,person_id,document_id,context,mention_type) VALUES(?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindRowId(st.get(), 1, r.id);
    BindI64(st.get(), 2, r.person_id);
    BindI64(st.get(), 3, r.document_id);
    BindText(st.get(), 4, r.context);
    BindText(st.get(), 5, r.mention_type);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && r.id == 0) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::vector<model::PersonDocumentRecord> SqliteRepository::ListPersonDocuments(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, "SELECT id,person_id,document_id,context,mention_type FROM person_documents ORDER BY id;");

    std::vector<model::PersonDocumentRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::PersonDocumentRecord r;
        r.id           = ColI64(st.get(), 0);
        r.person_id    = ColI64(st.get(), 1);
        r.document_id  = ColI64(st.get(), 2);
        r.context      = ColText(st.get(), 3);
        r.mention_type = ColText(st.get(), 4);
        out.push_back(std::move(r));
    }
    return out;
}

std::uint64_t SqliteRepository::CountPersonDocuments(Transaction& t, PersonId id) {
    return CountWhere(TX(t).Handle(), "SELECT COUNT(*) FROM person_documents WHERE person_id=?;", id);
}

Result SqliteRepository::RepointPersonDocuments(Transaction& t, const std::vector<PersonId>& from, PersonId to) {
    if (from.empty()) return Result::Ok();
    return ExecWithIds(TX(t).Handle(), "UPDATE person_documents SET person_id=? WHERE person_id IN " + InList(from.size()) + ";",
                       from, to, true);
}

Result SqliteRepository::DeleteDuplicatePersonDocuments(Transaction& t, PersonId id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "DELETE FROM person_documents WHERE person_id=?1 AND id NOT IN "
        "(SELECT MIN(id) FROM person_documents WHERE person_id=?1 GROUP BY document_id);";

    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(st.get(), 1, id);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeletePersonDocumentsFor(Transaction& t, const std::vector<PersonId>& ids) {
    if (ids.empty()) return Result::Ok();
    return ExecWithIds(TX(t).Handle(), "DELETE FROM person_documents WHERE person_id IN " + InList(ids.size()) + ";", ids);
}

// ------------------------------------------------------------------
// Connections
// ------------------------------------------------------------------

Result SqliteRepository::InsertConnection(Transaction& t, model::ConnectionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db,
                         "INSERT INTO connections(id,person_id_1,person_id_2,connection_type,description,strength) "
                         "VALUES(?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindRowId(st.get(), 1, r.id);
    BindI64(st.get(), 2, r.person_id_1);
    BindI64(st.get(), 3, r.person_id_2);
    BindText(st.get(), 4, r.connection_type);
    BindText(st.get(), 5, r.description);
    BindI64(st.get(), 6, r.strength);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && r.id == 0) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::vector<model::ConnectionRecord> SqliteRepository::ListConnections(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db,
                              "SELECT id,person_id_1,person_id_2,connection_type,description,strength "
                              "FROM connections ORDER BY id;");

    std::vector<model::ConnectionRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::ConnectionRecord r;
        r.id              = ColI64(st.get(), 0);
        r.person_id_1     = ColI64(st.get(), 1);
        r.person_id_2     = ColI64(st.get(), 2);
        r.connection_type = ColText(st.get(), 3);
        r.description     = ColText(st.get(), 4);
        r.strength        = sqlite3_column_int(st.get(), 5);
        out.push_back(std::move(r));
    }
    return out;
}

std::uint64_t SqliteRepository::CountPersonConnections(Transaction& t, PersonId id) {
    return CountWhere(TX(t).Handle(), "SELECT COUNT(*) FROM connections WHERE person_id_1=?1 OR person_id_2=?1;", id);
}

Result SqliteRepository::RepointConnections(Transaction& t, const std::vector<PersonId>& from, PersonId to) {
    if (from.empty()) return Result::Ok();
    auto* db = TX(t).Handle();

    auto r1 = ExecWithIds(db, "UPDATE connections SET person_id_1=? WHERE person_id_1 IN " + InList(from.size()) + ";", from, to, true);
    if (!r1) return r1;
    return ExecWithIds(db, "UPDATE connections SET person_id_2=? WHERE person_id_2 IN " + InList(from.size()) + ";", from, to, true);
}

Result SqliteRepository::DeleteSelfLoopConnections(Transaction& t) {
    return ExecWithIds(TX(t).Handle(), "DELETE FROM connections WHERE person_id_1 = person_id_2;", {});
}

Result SqliteRepository::DeleteConnectionsTouching(Transaction& t, const std::vector<PersonId>& ids) {
    if (ids.empty()) return Result::Ok();
    auto* db = TX(t).Handle();

    auto r1 = ExecWithIds(db, "DELETE FROM connections WHERE person_id_1 IN " + InList(ids.size()) + ";", ids);
    if (!r1) return r1;
    return ExecWithIds(db, "DELETE FROM connections WHERE person_id_2 IN " + InList(ids.size()) + ";", ids);
}

Result SqliteRepository::DeleteConnections(Transaction& t, const std::vector<std::int64_t>& connection_ids) {
    if (connection_ids.empty()) return Result::Ok();
    return ExecWithIds(TX(t).Handle(), "DELETE FROM connections WHERE id IN " + InList(connection_ids.size()) + ";", connection_ids);
}

// ------------------------------------------------------------------
// Timeline events (person_ids kept as comma-joined TEXT)
// ------------------------------------------------------------------

Result SqliteRepository::InsertTimelineEvent(Transaction& t, model::TimelineEventRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, "INSERT INTO timeline_events(id,date,title,category,person_ids) VALUES(?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindRowId(st.get(), 1, r.id);
    BindText(st.get(), 2, r.date);
    BindText(st.get(), 3, r.title);
    BindText(st.get(), 4, r.category);
    BindText(st.get(), 5, common::JoinIds(r.person_ids));

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && r.id == 0) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::vector<model::TimelineEventRecord> SqliteRepository::ListTimelineEvents(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, "SELECT id,date,title,category,person_ids FROM timeline_events ORDER BY id;");

    std::vector<model::TimelineEventRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::TimelineEventRecord r;
        r.id         = ColI64(st.get(), 0);
        r.date       = ColText(st.get(), 1);
        r.title      = ColText(st.get(), 2);
        r.category   = ColText(st.get(), 3);
        r.person_ids = common::SplitIds(ColText(st.get(), 4));
        out.push_back(std::move(r));
    }
    return out;
}

template <typename Fn>
Result SqliteRepository::RewriteTimelineEvents(Transaction& t, Fn&& rewrite) {
    auto* db = TX(t).Handle();

    std::vector<model::TimelineEventRecord> events;
    try {
        events = ListTimelineEvents(t);
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::InternalError, e.what());
    }

    auto st = TryPrepare(db, "UPDATE timeline_events SET person_ids=? WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (auto& event : events) {
        if (!rewrite(event.person_ids)) continue;

        sqlite3_reset(st.get());
        BindText(st.get(), 1, common::JoinIds(event.person_ids));
        BindI64(st.get(), 2, event.id);
        auto result = Translate(db, sqlite3_step(st.get()));
        if (!result) return result;
    }
    return Result::Ok();
}

Result SqliteRepository::ReplaceInTimelineEvents(Transaction& t, const std::vector<PersonId>& from, PersonId to) {
    if (from.empty()) return Result::Ok();
    return RewriteTimelineEvents(t, [&](std::vector<PersonId>& ids) { return common::ReplaceIds(ids, from, to); });
}

Result SqliteRepository::RemoveFromTimelineEvents(Transaction& t, const std::vector<PersonId>& ids) {
    if (ids.empty()) return Result::Ok();
    return RewriteTimelineEvents(t, [&](std::vector<PersonId>& person_ids) { return common::RemoveIds(person_ids, ids); });
}

} // namespace roster::db::sqlite
