#include "pg_pool.hpp"

namespace roster::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
      return Wrap(conn.release());
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_person",
               "SELECT id,name,array_to_string(aliases, E'\\n'),category,role,description,status,"
               "document_count,connection_count FROM persons WHERE id=$1");

  conn.prepare("insert_person",
               "INSERT INTO persons(name,aliases,category,role,description,status,document_count,connection_count) "
               "VALUES($1,string_to_array($2, E'\\n'),$3,$4,$5,$6,$7,$8) RETURNING id");

  conn.prepare("insert_person_with_id",
               "INSERT INTO persons(id,name,aliases,category,role,description,status,document_count,connection_count) "
               "VALUES($1,$2,string_to_array($3, E'\\n'),$4,$5,$6,$7,$8,$9)");

  conn.prepare("update_person",
               "UPDATE persons SET name=$2,aliases=string_to_array($3, E'\\n'),category=$4,role=$5,description=$6,"
               "status=$7,document_count=$8,connection_count=$9 WHERE id=$1");

  conn.prepare("count_person_documents", "SELECT COUNT(*) FROM person_documents WHERE person_id=$1");

  conn.prepare("count_person_connections",
               "SELECT COUNT(*) FROM connections WHERE person_id_1=$1 OR person_id_2=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace roster::db::postgres
