#include "catalog_store.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace omni::catalog {

using db::model::AssetRecord;

namespace {

std::string LowerCase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string NotFoundMessage(uint64_t asset_id) {
  return "asset not found: " + std::to_string(asset_id);
}

} // namespace

CatalogStore::CatalogStore(std::shared_ptr<db::Repository> repository, std::size_t conflict_retry_limit)
    : repository_(std::move(repository)), conflict_retry_limit_(conflict_retry_limit) {
  if (!repository_) {
    throw std::invalid_argument("CatalogStore requires a repository");
  }
}

AssetRecord CatalogStore::UpsertAsset(const std::string& symbol, const std::string& name, const std::string& slug) {
  if (symbol.empty()) {
    throw util::InvalidArgument("asset symbol is required");
  }

  return db::RunWithConflictRetry(conflict_retry_limit_, "upsert_asset", [&] {
    auto tx = repository_->Begin();

    AssetRecord asset;
    if (auto existing = repository_->GetAssetBySymbol(*tx, symbol)) {
      asset = std::move(*existing);
    } else {
      asset.symbol = symbol;
      asset.status = db::model::AssetStatus::kActive;
    }
    asset.name = name.empty() ? (asset.name.empty() ? symbol : asset.name) : name;
    asset.slug = slug.empty() ? (asset.slug.empty() ? LowerCase(symbol) : asset.slug) : slug;

    const bool created = asset.id == 0;
    db::ThrowIfDbError(created ? repository_->InsertAsset(*tx, asset) : repository_->UpdateAsset(*tx, asset), "upsert asset " + symbol);
    tx->Commit();

    OMNI_LOG_INFO(created ? "Asset created" : "Asset updated",
                  {observability::StringField("symbol", asset.symbol), observability::UintField("asset_id", asset.id)});
    return asset;
  });
}

void CatalogStore::UpsertAssetMetadata(db::model::AssetMetadataRecord metadata) {
  metadata.updated_at_ms = util::NowMillis();
  db::RunWithConflictRetry(conflict_retry_limit_, "upsert_asset_metadata", [&] {
    auto tx = repository_->Begin();
    if (!repository_->GetAssetById(*tx, metadata.asset_id)) {
      throw util::NotFound(NotFoundMessage(metadata.asset_id));
    }
    db::ThrowIfDbError(repository_->UpsertAssetMetadata(*tx, metadata), "upsert asset metadata");
    tx->Commit();
  });
}

std::optional<db::model::AssetMetadataRecord> CatalogStore::GetAssetMetadata(uint64_t asset_id) {
  auto tx       = repository_->Begin();
  auto metadata = repository_->GetAssetMetadata(*tx, asset_id);
  tx->Commit();
  return metadata;
}

AssetRecord CatalogStore::SetAssetStatus(uint64_t asset_id, db::model::AssetStatus status) {
  return db::RunWithConflictRetry(conflict_retry_limit_, "set_asset_status", [&] {
    auto tx    = repository_->Begin();
    auto asset = repository_->GetAssetById(*tx, asset_id);
    if (!asset) {
      throw util::NotFound(NotFoundMessage(asset_id));
    }
    if (asset->status != status) {
      asset->status = status;
      db::ThrowIfDbError(repository_->UpdateAsset(*tx, *asset), "set asset status");
    }
    tx->Commit();
    return *asset;
  });
}

void CatalogStore::DeleteAsset(uint64_t asset_id) {
  db::RunWithConflictRetry(conflict_retry_limit_, "delete_asset", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->DeleteAsset(*tx, asset_id), NotFoundMessage(asset_id));
    tx->Commit();
  });
  OMNI_LOG_INFO("Asset deleted", {observability::UintField("asset_id", asset_id)});
}

std::vector<AssetRecord> CatalogStore::ListAssets() {
  auto tx     = repository_->Begin();
  auto assets = repository_->ListAssets(*tx);
  tx->Commit();
  return assets;
}

std::optional<AssetRecord> CatalogStore::FindAsset(const std::string& symbol) {
  auto tx    = repository_->Begin();
  auto asset = repository_->GetAssetBySymbol(*tx, symbol);
  tx->Commit();
  return asset;
}

std::optional<AssetRecord> CatalogStore::GetAsset(uint64_t asset_id) {
  auto tx    = repository_->Begin();
  auto asset = repository_->GetAssetById(*tx, asset_id);
  tx->Commit();
  return asset;
}

std::vector<db::model::NewsSourceRecord> CatalogStore::ListSources() {
  auto tx      = repository_->Begin();
  auto sources = repository_->ListSources(*tx);
  tx->Commit();
  return sources;
}

std::vector<db::model::NewsCategoryRecord> CatalogStore::ListCategories() {
  auto tx         = repository_->Begin();
  auto categories = repository_->ListCategories(*tx);
  tx->Commit();
  return categories;
}

} // namespace omni::catalog
