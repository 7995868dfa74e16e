#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/enums.hpp"

namespace omni::db::model {

/*
  Tracked cryptocurrency.

  first_seen_ms / last_seen_ms bound the timestamps of stored observations.
*/
struct AssetRecord {
  uint64_t    id = 0;
  std::string symbol;
  std::string name;
  std::string slug;

  uint64_t first_seen_ms = 0;
  uint64_t last_seen_ms  = 0;

  AssetStatus status = AssetStatus::kActive;
};

struct AssetMetadataRecord {
  uint64_t    asset_id = 0;
  std::string logo_url;
  std::string website_url;
  std::string technical_doc;
  std::string description;
  std::string category;
  uint64_t    updated_at_ms = 0;
};

} // namespace omni::db::model
