#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace omni::db::memory {

class MemoryTransaction;

/*
  In-process repository used by tests and by deployments without a database.

  Every transaction works on a private copy of the committed state. Commit
  replays the transaction's writes on the committed state and throws
  TransactionConflict only when another transaction committed a write to the
  same asset, article, symbol, slug or url after the copy was taken.
  Ids are handed out by the repository, so a rolled back insert leaves a gap.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAsset(Transaction&, model::AssetRecord&) override;
  Result UpdateAsset(Transaction&, const model::AssetRecord&) override;
  std::optional<model::AssetRecord> GetAssetById(Transaction&, uint64_t) override;
  std::optional<model::AssetRecord> GetAssetBySymbol(Transaction&, const std::string&) override;
  std::vector<model::AssetRecord> ListAssets(Transaction&) override;
  Result DeleteAsset(Transaction&, uint64_t) override;
  Result UpsertAssetMetadata(Transaction&, const model::AssetMetadataRecord&) override;
  std::optional<model::AssetMetadataRecord> GetAssetMetadata(Transaction&, uint64_t) override;

  Result InsertObservation(Transaction&, const model::ObservationRecord&) override;
  Result ReplaceObservation(Transaction&, const model::ObservationRecord&) override;
  std::optional<model::ObservationRecord> GetObservation(Transaction&, uint64_t, uint64_t) override;
  std::vector<model::ObservationRecord> ListObservations(Transaction&, uint64_t, uint64_t, uint64_t) override;
  std::vector<model::ObservationRecord> ListObservationsBefore(Transaction&, uint64_t, uint64_t, std::size_t) override;
  std::vector<model::ObservationRecord> ListObservationsFrom(Transaction&, uint64_t, uint64_t, std::size_t) override;

  Result UpsertSignal(Transaction&, const model::SignalRecord&) override;
  std::optional<model::SignalRecord> GetSignal(Transaction&, uint64_t, uint64_t) override;
  std::optional<model::SignalRecord> LatestSignal(Transaction&, uint64_t) override;
  std::vector<model::SignalRecord> ListSignals(Transaction&, uint64_t, uint64_t, uint64_t) override;

  Result UpsertBackfillCheckpoint(Transaction&, const model::BackfillCheckpointRecord&) override;
  std::optional<model::BackfillCheckpointRecord> GetBackfillCheckpoint(Transaction&, uint64_t) override;
  std::vector<model::BackfillCheckpointRecord> ListBackfillCheckpoints(Transaction&) override;
  Result DeleteBackfillCheckpoint(Transaction&, uint64_t) override;

  std::optional<model::NewsSourceRecord> GetSourceByName(Transaction&, const std::string&) override;
  std::optional<model::NewsSourceRecord> GetSourceById(Transaction&, uint64_t) override;
  std::vector<model::NewsSourceRecord> ListSources(Transaction&) override;
  std::optional<model::NewsCategoryRecord> GetCategoryByName(Transaction&, const std::string&) override;
  std::vector<model::NewsCategoryRecord> ListCategories(Transaction&) override;

  Result InsertArticle(Transaction&, model::ArticleRecord&) override;
  Result UpdateArticle(Transaction&, const model::ArticleRecord&) override;
  std::optional<model::ArticleRecord> GetArticleById(Transaction&, uint64_t) override;
  std::optional<model::ArticleRecord> GetArticleByUrl(Transaction&, const std::string&) override;
  std::vector<model::ArticleRecord> ListRecentArticles(Transaction&, std::size_t) override;
  std::vector<model::ArticleRecord> ListUnprocessedArticles(Transaction&, std::size_t) override;
  Result DeleteArticle(Transaction&, uint64_t) override;
  Result AddArticleCategory(Transaction&, uint64_t, uint64_t) override;
  std::vector<model::NewsCategoryRecord> GetArticleCategories(Transaction&, uint64_t) override;

  Result UpsertMention(Transaction&, const model::MentionRecord&) override;
  std::optional<model::MentionRecord> GetMention(Transaction&, uint64_t, model::AssetType, const std::string&) override;
  std::vector<model::MentionRecord> ListMentionsForArticle(Transaction&, uint64_t) override;
  std::vector<model::MentionRecord> ListMentionsForAsset(Transaction&, model::AssetType, const std::string&) override;

  Result UpsertEmbedding(Transaction&, const model::EmbeddingRecord&) override;
  std::optional<model::EmbeddingRecord> GetEmbedding(Transaction&, uint64_t, uint32_t, const std::string&) override;
  Result DeleteEmbeddings(Transaction&, uint64_t, const std::string&) override;
  std::vector<model::EmbeddingRecord> ListEmbeddingsForArticle(Transaction&, uint64_t, const std::string&) override;
  std::vector<model::EmbeddingRecord> ListEmbeddingsByModel(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  // (article_id, asset_type text, symbol); orders like the SQL backends.
  using MentionKey = std::tuple<uint64_t, std::string, std::string>;
  // (article_id, model, chunk_index)
  using EmbeddingKey = std::tuple<uint64_t, std::string, uint32_t>;

  struct State {
    std::map<uint64_t, model::AssetRecord>                                      assets;
    std::unordered_map<uint64_t, model::AssetMetadataRecord>                    asset_metadata;
    std::unordered_map<uint64_t, std::map<uint64_t, model::ObservationRecord>> observations;
    std::unordered_map<uint64_t, std::map<uint64_t, model::SignalRecord>>      signals;
    std::map<uint64_t, model::BackfillCheckpointRecord>                         checkpoints;

    std::map<uint64_t, model::NewsSourceRecord>   sources;
    std::map<uint64_t, model::NewsCategoryRecord> categories;
    std::map<uint64_t, model::ArticleRecord>      articles;
    std::map<uint64_t, std::set<uint64_t>>        article_categories;
    std::map<MentionKey, model::MentionRecord>    mentions;
    std::map<EmbeddingKey, model::EmbeddingRecord> embeddings;
  };

  uint64_t NextAssetId();
  uint64_t NextArticleId();

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
  // row key -> version of the last commit that wrote it
  std::unordered_map<std::string, uint64_t> key_versions_;
  uint64_t                                  next_asset_id_   = 1;
  uint64_t                                  next_article_id_ = 1;
};

} // namespace omni::db::memory
