#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/article_record.hpp"
#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/backfill_checkpoint_record.hpp"
#include "internal/db/model/embedding_record.hpp"
#include "internal/db/model/mention_record.hpp"
#include "internal/db/model/news_records.hpp"
#include "internal/db/model/observation_record.hpp"
#include "internal/db/model/signal_record.hpp"

namespace omni::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Deleting an asset removes its observations, signals, metadata and
    backfill checkpoint; deleting an article removes its category links,
    mentions and embedding chunks
  - Uniqueness: asset symbol, asset slug, article url,
    (asset, timestamp) for observations and signals,
    (article, type, symbol) for mentions,
    (article, chunk_index, model) for embeddings

  The DB is the source of truth for:
    market history and derived signals
    news content and its embeddings
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Assets
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists on symbol or slug collision.
  virtual Result InsertAsset(Transaction&, model::AssetRecord&) = 0;

  virtual Result UpdateAsset(Transaction&, const model::AssetRecord&) = 0;

  virtual std::optional<model::AssetRecord> GetAssetById(Transaction&, uint64_t asset_id) = 0;

  virtual std::optional<model::AssetRecord> GetAssetBySymbol(Transaction&, const std::string& symbol) = 0;

  virtual std::vector<model::AssetRecord> ListAssets(Transaction&) = 0;

  virtual Result DeleteAsset(Transaction&, uint64_t asset_id) = 0;

  virtual Result UpsertAssetMetadata(Transaction&, const model::AssetMetadataRecord&) = 0;

  virtual std::optional<model::AssetMetadataRecord> GetAssetMetadata(Transaction&, uint64_t asset_id) = 0;

  // ---------------------------------------------------------------------
  // Observations
  // ---------------------------------------------------------------------

  // AlreadyExists when (asset, timestamp) is present; the stored row is kept.
  virtual Result InsertObservation(Transaction&, const model::ObservationRecord&) = 0;

  // Corrective overwrite. NotFound when (asset, timestamp) is absent.
  virtual Result ReplaceObservation(Transaction&, const model::ObservationRecord&) = 0;

  virtual std::optional<model::ObservationRecord> GetObservation(Transaction&, uint64_t asset_id, uint64_t timestamp_ms) = 0;

  // Inclusive range, ascending by timestamp.
  virtual std::vector<model::ObservationRecord> ListObservations(Transaction&, uint64_t asset_id, uint64_t from_ms, uint64_t to_ms) = 0;

  // Up to `limit` observations strictly before `before_ms`, ascending by timestamp.
  virtual std::vector<model::ObservationRecord> ListObservationsBefore(Transaction&, uint64_t asset_id, uint64_t before_ms, std::size_t limit) = 0;

  // Up to `limit` observations at or after `from_ms`, ascending by timestamp.
  virtual std::vector<model::ObservationRecord> ListObservationsFrom(Transaction&, uint64_t asset_id, uint64_t from_ms, std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Signals
  // ---------------------------------------------------------------------

  virtual Result UpsertSignal(Transaction&, const model::SignalRecord&) = 0;

  virtual std::optional<model::SignalRecord> GetSignal(Transaction&, uint64_t asset_id, uint64_t timestamp_ms) = 0;

  virtual std::optional<model::SignalRecord> LatestSignal(Transaction&, uint64_t asset_id) = 0;

  // Inclusive range, ascending by timestamp.
  virtual std::vector<model::SignalRecord> ListSignals(Transaction&, uint64_t asset_id, uint64_t from_ms, uint64_t to_ms) = 0;

  // ---------------------------------------------------------------------
  // Backfill checkpoints
  // ---------------------------------------------------------------------

  virtual Result UpsertBackfillCheckpoint(Transaction&, const model::BackfillCheckpointRecord&) = 0;

  virtual std::optional<model::BackfillCheckpointRecord> GetBackfillCheckpoint(Transaction&, uint64_t asset_id) = 0;

  virtual std::vector<model::BackfillCheckpointRecord> ListBackfillCheckpoints(Transaction&) = 0;

  virtual Result DeleteBackfillCheckpoint(Transaction&, uint64_t asset_id) = 0;

  // ---------------------------------------------------------------------
  // News reference data (seeded by schema bootstrap)
  // ---------------------------------------------------------------------

  virtual std::optional<model::NewsSourceRecord> GetSourceByName(Transaction&, const std::string& name) = 0;

  virtual std::optional<model::NewsSourceRecord> GetSourceById(Transaction&, uint64_t source_id) = 0;

  virtual std::vector<model::NewsSourceRecord> ListSources(Transaction&) = 0;

  virtual std::optional<model::NewsCategoryRecord> GetCategoryByName(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::NewsCategoryRecord> ListCategories(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Articles
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists on url collision.
  virtual Result InsertArticle(Transaction&, model::ArticleRecord&) = 0;

  virtual Result UpdateArticle(Transaction&, const model::ArticleRecord&) = 0;

  virtual std::optional<model::ArticleRecord> GetArticleById(Transaction&, uint64_t article_id) = 0;

  virtual std::optional<model::ArticleRecord> GetArticleByUrl(Transaction&, const std::string& url) = 0;

  // Newest first by published date, then by id descending.
  virtual std::vector<model::ArticleRecord> ListRecentArticles(Transaction&, std::size_t limit) = 0;

  // Oldest first by id.
  virtual std::vector<model::ArticleRecord> ListUnprocessedArticles(Transaction&, std::size_t limit) = 0;

  virtual Result DeleteArticle(Transaction&, uint64_t article_id) = 0;

  // Idempotent.
  virtual Result AddArticleCategory(Transaction&, uint64_t article_id, uint64_t category_id) = 0;

  virtual std::vector<model::NewsCategoryRecord> GetArticleCategories(Transaction&, uint64_t article_id) = 0;

  // ---------------------------------------------------------------------
  // Mentions
  // ---------------------------------------------------------------------

  // Inserts, or adds mention_count to the existing row and ORs is_primary.
  virtual Result UpsertMention(Transaction&, const model::MentionRecord&) = 0;

  virtual std::optional<model::MentionRecord> GetMention(Transaction&, uint64_t article_id, model::AssetType type, const std::string& symbol) = 0;

  virtual std::vector<model::MentionRecord> ListMentionsForArticle(Transaction&, uint64_t article_id) = 0;

  virtual std::vector<model::MentionRecord> ListMentionsForAsset(Transaction&, model::AssetType type, const std::string& symbol) = 0;

  // ---------------------------------------------------------------------
  // Embeddings
  // ---------------------------------------------------------------------

  // Keyed by (article, chunk_index, model). An existing row keeps id and
  // created_at_ms and takes the new text and vector.
  virtual Result UpsertEmbedding(Transaction&, const model::EmbeddingRecord&) = 0;

  virtual std::optional<model::EmbeddingRecord> GetEmbedding(Transaction&, uint64_t article_id, uint32_t chunk_index, const std::string& model) = 0;

  // An empty model deletes the article's chunks of every model.
  virtual Result DeleteEmbeddings(Transaction&, uint64_t article_id, const std::string& model) = 0;

  // Ascending by chunk_index.
  virtual std::vector<model::EmbeddingRecord> ListEmbeddingsForArticle(Transaction&, uint64_t article_id, const std::string& model) = 0;

  virtual std::vector<model::EmbeddingRecord> ListEmbeddingsByModel(Transaction&, const std::string& model) = 0;
};

} // namespace omni::db
