#pragma once

#include <string>
#include <vector>

namespace omni::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order. Statements must be idempotent
  (IF NOT EXISTS / conflict-ignoring inserts) so bootstrap can run on
  every start.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace omni::db::sql
