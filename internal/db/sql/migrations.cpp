#include "migrations.hpp"

namespace roster::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

/*
  aliases:    newline-joined TEXT
  person_ids: comma-joined TEXT
*/
const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS persons (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, aliases TEXT NOT NULL DEFAULT '', category TEXT NOT NULL DEFAULT 'associate', role TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', status TEXT NOT NULL DEFAULT 'named', document_count INTEGER NOT NULL DEFAULT 0, connection_count INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS person_documents (id INTEGER PRIMARY KEY AUTOINCREMENT, person_id INTEGER NOT NULL REFERENCES persons(id), document_id INTEGER NOT NULL, context TEXT NOT NULL DEFAULT '', mention_type TEXT NOT NULL DEFAULT 'mentioned');",
      "CREATE TABLE IF NOT EXISTS connections (id INTEGER PRIMARY KEY AUTOINCREMENT, person_id_1 INTEGER NOT NULL REFERENCES persons(id), person_id_2 INTEGER NOT NULL REFERENCES persons(id), connection_type TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', strength INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS timeline_events (id INTEGER PRIMARY KEY AUTOINCREMENT, date TEXT NOT NULL DEFAULT '', title TEXT NOT NULL DEFAULT '', category TEXT NOT NULL DEFAULT '', person_ids TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS idx_person_documents_person ON person_documents(person_id);",
      "CREATE INDEX IF NOT EXISTS idx_connections_p1 ON connections(person_id_1);",
      "CREATE INDEX IF NOT EXISTS idx_connections_p2 ON connections(person_id_2);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS persons (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, aliases TEXT[] NOT NULL DEFAULT '{}', category TEXT NOT NULL DEFAULT 'associate', role TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', status TEXT NOT NULL DEFAULT 'named', document_count BIGINT NOT NULL DEFAULT 0, connection_count BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS person_documents (id BIGSERIAL PRIMARY KEY, person_id BIGINT NOT NULL REFERENCES persons(id), document_id BIGINT NOT NULL, context TEXT NOT NULL DEFAULT '', mention_type TEXT NOT NULL DEFAULT 'mentioned');",
      "CREATE TABLE IF NOT EXISTS connections (id BIGSERIAL PRIMARY KEY, person_id_1 BIGINT NOT NULL REFERENCES persons(id), person_id_2 BIGINT NOT NULL REFERENCES persons(id), connection_type TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', strength INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS timeline_events (id BIGSERIAL PRIMARY KEY, date TEXT NOT NULL DEFAULT '', title TEXT NOT NULL DEFAULT '', category TEXT NOT NULL DEFAULT '', person_ids BIGINT[] NOT NULL DEFAULT '{}');",
      "CREATE INDEX IF NOT EXISTS idx_person_documents_person ON person_documents(person_id);",
      "CREATE INDEX IF NOT EXISTS idx_connections_p1 ON connections(person_id_1);",
      "CREATE INDEX IF NOT EXISTS idx_connections_p2 ON connections(person_id_2);"};
  return kSchema;
}

} // namespace roster::db::sql
