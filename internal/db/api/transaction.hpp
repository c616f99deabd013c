#pragma once

namespace roster::db {

/*
  Unit of work over the person graph.

  One merge or one delete chunk runs inside exactly one transaction,
  so a failure rolls that action back as a whole. Every backend must:

  - hide its writes from other transactions until Commit()
  - roll back from the destructor when neither Commit() nor
    Rollback() was called

    sqlite    BEGIN IMMEDIATE on the shared connection
    postgres  one pqxx::work on a pooled connection
    memory    private copy of the tables, version-checked on commit
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  // Throws when the backend refuses the commit.
  virtual void Commit() = 0;

  virtual void Rollback() = 0;
};

} // namespace roster::db
