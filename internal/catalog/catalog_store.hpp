#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace omni::catalog {

/*
  Assets, their metadata, and the seeded news sources and categories.

  Writes retry on transaction conflicts up to `conflict_retry_limit` times.
*/
class CatalogStore {
 public:
  explicit CatalogStore(std::shared_ptr<db::Repository> repository, std::size_t conflict_retry_limit = 3);

  // An existing symbol keeps its id and takes the new name and slug. Empty
  // name defaults to the symbol, empty slug to the lowercased symbol.
  // util::AlreadyExists when the slug belongs to a different symbol.
  db::model::AssetRecord UpsertAsset(const std::string& symbol, const std::string& name, const std::string& slug);

  // util::NotFound for an unknown asset.
  void UpsertAssetMetadata(db::model::AssetMetadataRecord metadata);
  std::optional<db::model::AssetMetadataRecord> GetAssetMetadata(uint64_t asset_id);

  db::model::AssetRecord SetAssetStatus(uint64_t asset_id, db::model::AssetStatus status);

  // Cascades to observations, signals, metadata and any backfill checkpoint.
  void DeleteAsset(uint64_t asset_id);

  std::vector<db::model::AssetRecord>   ListAssets();
  std::optional<db::model::AssetRecord> FindAsset(const std::string& symbol);
  std::optional<db::model::AssetRecord> GetAsset(uint64_t asset_id);

  std::vector<db::model::NewsSourceRecord>   ListSources();
  std::vector<db::model::NewsCategoryRecord> ListCategories();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::size_t                     conflict_retry_limit_;
};

} // namespace omni::catalog
