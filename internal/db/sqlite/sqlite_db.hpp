#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace omni::db::sqlite {

/*
  Thin RAII wrapper around a single sqlite3* connection.

  SQLite allows one writer at a time; transactions on this connection are
  serialized through TxMutex() so concurrent callers never interleave
  statements of different transactions.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Journal mode, foreign keys, busy timeout
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        wal_mode_ = true;
  std::mutex  tx_mutex_;
};

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  SqliteDB& db_;
};

} // namespace omni::db::sqlite
