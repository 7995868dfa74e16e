#include "migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace omni::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  std::size_t applied = 0;
  for (const auto& statement : ordered_sql) {
    try {
      executor.ExecuteSQL(statement);
    } catch (const std::exception& e) {
      OMNI_LOG_ERROR("Schema migration failed",
                     {omni::observability::IntField("statement_index", static_cast<std::int64_t>(applied)),
                      omni::observability::StringField("error", e.what())});
      throw std::runtime_error("schema migration " + std::to_string(applied) + " failed: " + e.what());
    }
    ++applied;
  }
  OMNI_LOG_INFO("Schema bootstrap complete", {omni::observability::IntField("statements", static_cast<std::int64_t>(applied))});
}

} // namespace omni::db::sql
