#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace omni::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction&);
  static Result Translate(const std::exception&);

  std::shared_ptr<PgPool> pool_;
};

} // namespace omni::db::postgres
