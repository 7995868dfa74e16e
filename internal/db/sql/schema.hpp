#pragma once

#include <string>
#include <vector>

namespace omni::db::sql {

struct SeedSource {
  const char* name;
  const char* url;
  const char* description;
};

// Reference rows every backend starts with, in id order.
const std::vector<SeedSource>&  DefaultNewsSources();
const std::vector<std::string>& DefaultNewsCategories();

std::vector<std::string> SqliteSchemaStatements();
std::vector<std::string> PostgresSchemaStatements();

} // namespace omni::db::sql
