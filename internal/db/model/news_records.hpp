#pragma once

#include <cstdint>
#include <string>

namespace omni::db::model {

struct NewsSourceRecord {
  uint64_t    id = 0;
  std::string name;
  std::string url;
  std::string description;
};

struct NewsCategoryRecord {
  uint64_t    id = 0;
  std::string name;
};

} // namespace omni::db::model
