#include "sqlite_tx.hpp"

#include <stdexcept>

namespace omni::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (...) {
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::runtime_error& e) {
    if (sqlite3_errcode(db_->Handle()) == SQLITE_BUSY) {
      throw TransactionConflict(std::string("sqlite commit: ") + e.what());
    }
    throw;
  }
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace omni::db::sqlite
