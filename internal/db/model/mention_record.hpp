#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/enums.hpp"

namespace omni::db::model {

// Unique per (article_id, asset_type, asset_symbol).
struct MentionRecord {
  uint64_t    article_id = 0;
  AssetType   asset_type = AssetType::kCrypto;
  std::string asset_symbol;
  uint32_t    mention_count = 1;
  bool        is_primary    = false;
};

} // namespace omni::db::model
