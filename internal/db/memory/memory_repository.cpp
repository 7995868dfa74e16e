#include "memory_repository.hpp"

#include <algorithm>
#include <iterator>

#include "internal/db/sql/schema.hpp"
#include "memory_tx.hpp"

namespace omni::db::memory {

namespace {

std::string TypeKey(model::AssetType type) {
  return std::string(model::ToString(type));
}

// Conflict keys: one per row family a write can race on.
std::string AssetKey(uint64_t asset_id) {
  return "asset/" + std::to_string(asset_id);
}
std::string SymbolKey(const std::string& symbol) {
  return "symbol/" + symbol;
}
std::string SlugKey(const std::string& slug) {
  return "slug/" + slug;
}
std::string ArticleKey(uint64_t article_id) {
  return "article/" + std::to_string(article_id);
}
std::string UrlKey(const std::string& url) {
  return "url/" + url;
}

} // namespace

MemoryRepository::MemoryRepository() {
  uint64_t id = 1;
  for (const auto& seed : sql::DefaultNewsSources()) {
    committed_.sources[id] = model::NewsSourceRecord{id, seed.name, seed.url, seed.description};
    ++id;
  }
  id = 1;
  for (const auto& name : sql::DefaultNewsCategories()) {
    committed_.categories[id] = model::NewsCategoryRecord{id, name};
    ++id;
  }
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

uint64_t MemoryRepository::NextAssetId() {
  std::scoped_lock lock(mutex_);
  return next_asset_id_++;
}

uint64_t MemoryRepository::NextArticleId() {
  std::scoped_lock lock(mutex_);
  return next_article_id_++;
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result MemoryRepository::InsertAsset(Transaction& t, model::AssetRecord& r) {
  for (const auto& [_, existing] : TX(t).View().assets) {
    if (existing.symbol == r.symbol) return Result::Err(ErrorCode::AlreadyExists, "asset symbol exists: " + r.symbol);
    if (existing.slug == r.slug) return Result::Err(ErrorCode::AlreadyExists, "asset slug exists: " + r.slug);
  }
  r.id = NextAssetId();
  TX(t).Write({AssetKey(r.id), SymbolKey(r.symbol), SlugKey(r.slug)}, [r](State& s) { s.assets[r.id] = r; });
  return Result::Ok();
}

Result MemoryRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
  const auto& view = TX(t).View();
  auto        it   = view.assets.find(r.id);
  if (it == view.assets.end()) return Result::Err(ErrorCode::NotFound);
  for (const auto& [id, existing] : view.assets) {
    if (id == r.id) continue;
    if (existing.symbol == r.symbol || existing.slug == r.slug) return Result::Err(ErrorCode::AlreadyExists, "asset symbol or slug exists");
  }
  TX(t).Write({AssetKey(r.id), SymbolKey(it->second.symbol), SlugKey(it->second.slug), SymbolKey(r.symbol), SlugKey(r.slug)},
              [r](State& s) { s.assets[r.id] = r; });
  return Result::Ok();
}

std::optional<model::AssetRecord> MemoryRepository::GetAssetById(Transaction& t, uint64_t asset_id) {
  const auto& s  = TX(t).View();
  auto        it = s.assets.find(asset_id);
  if (it == s.assets.end()) return std::nullopt;
  return it->second;
}

std::optional<model::AssetRecord> MemoryRepository::GetAssetBySymbol(Transaction& t, const std::string& symbol) {
  for (const auto& [_, asset] : TX(t).View().assets) {
    if (asset.symbol == symbol) return asset;
  }
  return std::nullopt;
}

std::vector<model::AssetRecord> MemoryRepository::ListAssets(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::AssetRecord> out;
  out.reserve(s.assets.size());
  for (const auto& [_, asset] : s.assets) {
    out.push_back(asset);
  }
  return out;
}

Result MemoryRepository::DeleteAsset(Transaction& t, uint64_t asset_id) {
  const auto& view = TX(t).View();
  auto        it   = view.assets.find(asset_id);
  if (it == view.assets.end()) return Result::Err(ErrorCode::NotFound);
  TX(t).Write({AssetKey(asset_id), SymbolKey(it->second.symbol), SlugKey(it->second.slug)}, [asset_id](State& s) {
    s.assets.erase(asset_id);
    s.asset_metadata.erase(asset_id);
    s.observations.erase(asset_id);
    s.signals.erase(asset_id);
    s.checkpoints.erase(asset_id);
  });
  return Result::Ok();
}

Result MemoryRepository::UpsertAssetMetadata(Transaction& t, const model::AssetMetadataRecord& r) {
  if (!TX(t).View().assets.contains(r.asset_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown asset");
  TX(t).Write({AssetKey(r.asset_id)}, [r](State& s) { s.asset_metadata[r.asset_id] = r; });
  return Result::Ok();
}

std::optional<model::AssetMetadataRecord> MemoryRepository::GetAssetMetadata(Transaction& t, uint64_t asset_id) {
  const auto& s  = TX(t).View();
  auto        it = s.asset_metadata.find(asset_id);
  if (it == s.asset_metadata.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Observations
// ------------------------------------------------------------------

Result MemoryRepository::InsertObservation(Transaction& t, const model::ObservationRecord& r) {
  const auto& view = TX(t).View();
  if (!view.assets.contains(r.asset_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown asset");
  auto series = view.observations.find(r.asset_id);
  if (series != view.observations.end() && series->second.contains(r.timestamp_ms)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Write({AssetKey(r.asset_id)}, [r](State& s) { s.observations[r.asset_id][r.timestamp_ms] = r; });
  return Result::Ok();
}

Result MemoryRepository::ReplaceObservation(Transaction& t, const model::ObservationRecord& r) {
  const auto& view   = TX(t).View();
  auto        series = view.observations.find(r.asset_id);
  if (series == view.observations.end() || !series->second.contains(r.timestamp_ms)) return Result::Err(ErrorCode::NotFound);
  TX(t).Write({AssetKey(r.asset_id)}, [r](State& s) { s.observations[r.asset_id][r.timestamp_ms] = r; });
  return Result::Ok();
}

std::optional<model::ObservationRecord> MemoryRepository::GetObservation(Transaction& t, uint64_t asset_id, uint64_t timestamp_ms) {
  const auto& s      = TX(t).View();
  auto        series = s.observations.find(asset_id);
  if (series == s.observations.end()) return std::nullopt;
  auto it = series->second.find(timestamp_ms);
  if (it == series->second.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ObservationRecord> MemoryRepository::ListObservations(Transaction& t, uint64_t asset_id, uint64_t from_ms, uint64_t to_ms) {
  const auto&                           s      = TX(t).View();
  std::vector<model::ObservationRecord> out;
  auto                                  series = s.observations.find(asset_id);
  if (series == s.observations.end() || from_ms > to_ms) return out;
  for (auto it = series->second.lower_bound(from_ms); it != series->second.end() && it->first <= to_ms; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::vector<model::ObservationRecord> MemoryRepository::ListObservationsBefore(Transaction& t, uint64_t asset_id, uint64_t before_ms, std::size_t limit) {
  const auto&                           s      = TX(t).View();
  std::vector<model::ObservationRecord> out;
  auto                                  series = s.observations.find(asset_id);
  if (series == s.observations.end()) return out;

  auto end = series->second.lower_bound(before_ms);
  for (auto it = std::make_reverse_iterator(end); it != series->second.rend() && out.size() < limit; ++it) {
    out.push_back(it->second);
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::vector<model::ObservationRecord> MemoryRepository::ListObservationsFrom(Transaction& t, uint64_t asset_id, uint64_t from_ms, std::size_t limit) {
  const auto&                           s      = TX(t).View();
  std::vector<model::ObservationRecord> out;
  auto                                  series = s.observations.find(asset_id);
  if (series == s.observations.end()) return out;

  for (auto it = series->second.lower_bound(from_ms); it != series->second.end() && out.size() < limit; ++it) {
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Signals
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSignal(Transaction& t, const model::SignalRecord& r) {
  if (!TX(t).View().assets.contains(r.asset_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown asset");
  TX(t).Write({AssetKey(r.asset_id)}, [r](State& s) { s.signals[r.asset_id][r.timestamp_ms] = r; });
  return Result::Ok();
}

std::optional<model::SignalRecord> MemoryRepository::GetSignal(Transaction& t, uint64_t asset_id, uint64_t timestamp_ms) {
  const auto& s      = TX(t).View();
  auto        series = s.signals.find(asset_id);
  if (series == s.signals.end()) return std::nullopt;
  auto it = series->second.find(timestamp_ms);
  if (it == series->second.end()) return std::nullopt;
  return it->second;
}

std::optional<model::SignalRecord> MemoryRepository::LatestSignal(Transaction& t, uint64_t asset_id) {
  const auto& s      = TX(t).View();
  auto        series = s.signals.find(asset_id);
  if (series == s.signals.end() || series->second.empty()) return std::nullopt;
  return series->second.rbegin()->second;
}

std::vector<model::SignalRecord> MemoryRepository::ListSignals(Transaction& t, uint64_t asset_id, uint64_t from_ms, uint64_t to_ms) {
  const auto&                      s      = TX(t).View();
  std::vector<model::SignalRecord> out;
  auto                             series = s.signals.find(asset_id);
  if (series == s.signals.end() || from_ms > to_ms) return out;
  for (auto it = series->second.lower_bound(from_ms); it != series->second.end() && it->first <= to_ms; ++it) {
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Backfill checkpoints
// ------------------------------------------------------------------

Result MemoryRepository::UpsertBackfillCheckpoint(Transaction& t, const model::BackfillCheckpointRecord& r) {
  if (!TX(t).View().assets.contains(r.asset_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown asset");
  TX(t).Write({AssetKey(r.asset_id)}, [r](State& s) { s.checkpoints[r.asset_id] = r; });
  return Result::Ok();
}

std::optional<model::BackfillCheckpointRecord> MemoryRepository::GetBackfillCheckpoint(Transaction& t, uint64_t asset_id) {
  const auto& s  = TX(t).View();
  auto        it = s.checkpoints.find(asset_id);
  if (it == s.checkpoints.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BackfillCheckpointRecord> MemoryRepository::ListBackfillCheckpoints(Transaction& t) {
  std::vector<model::BackfillCheckpointRecord> out;
  for (const auto& [_, checkpoint] : TX(t).View().checkpoints) {
    out.push_back(checkpoint);
  }
  return out;
}

Result MemoryRepository::DeleteBackfillCheckpoint(Transaction& t, uint64_t asset_id) {
  if (!TX(t).View().checkpoints.contains(asset_id)) return Result::Ok();
  TX(t).Write({AssetKey(asset_id)}, [asset_id](State& s) { s.checkpoints.erase(asset_id); });
  return Result::Ok();
}

// ------------------------------------------------------------------
// News reference data
// ------------------------------------------------------------------

std::optional<model::NewsSourceRecord> MemoryRepository::GetSourceByName(Transaction& t, const std::string& name) {
  for (const auto& [_, source] : TX(t).View().sources) {
    if (source.name == name) return source;
  }
  return std::nullopt;
}

std::optional<model::NewsSourceRecord> MemoryRepository::GetSourceById(Transaction& t, uint64_t source_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sources.find(source_id);
  if (it == s.sources.end()) return std::nullopt;
  return it->second;
}

std::vector<model::NewsSourceRecord> MemoryRepository::ListSources(Transaction& t) {
  std::vector<model::NewsSourceRecord> out;
  for (const auto& [_, source] : TX(t).View().sources) {
    out.push_back(source);
  }
  return out;
}

std::optional<model::NewsCategoryRecord> MemoryRepository::GetCategoryByName(Transaction& t, const std::string& name) {
  for (const auto& [_, category] : TX(t).View().categories) {
    if (category.name == name) return category;
  }
  return std::nullopt;
}

std::vector<model::NewsCategoryRecord> MemoryRepository::ListCategories(Transaction& t) {
  std::vector<model::NewsCategoryRecord> out;
  for (const auto& [_, category] : TX(t).View().categories) {
    out.push_back(category);
  }
  return out;
}

// ------------------------------------------------------------------
// Articles
// ------------------------------------------------------------------

Result MemoryRepository::InsertArticle(Transaction& t, model::ArticleRecord& r) {
  const auto& view = TX(t).View();
  if (!view.sources.contains(r.source_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown source");
  for (const auto& [_, existing] : view.articles) {
    if (existing.url == r.url) return Result::Err(ErrorCode::AlreadyExists, "article url exists: " + r.url);
  }
  r.id = NextArticleId();
  TX(t).Write({ArticleKey(r.id), UrlKey(r.url)}, [r](State& s) { s.articles[r.id] = r; });
  return Result::Ok();
}

Result MemoryRepository::UpdateArticle(Transaction& t, const model::ArticleRecord& r) {
  const auto& view = TX(t).View();
  auto        it   = view.articles.find(r.id);
  if (it == view.articles.end()) return Result::Err(ErrorCode::NotFound);
  for (const auto& [id, existing] : view.articles) {
    if (id != r.id && existing.url == r.url) return Result::Err(ErrorCode::AlreadyExists, "article url exists: " + r.url);
  }
  TX(t).Write({ArticleKey(r.id), UrlKey(it->second.url), UrlKey(r.url)}, [r](State& s) { s.articles[r.id] = r; });
  return Result::Ok();
}

std::optional<model::ArticleRecord> MemoryRepository::GetArticleById(Transaction& t, uint64_t article_id) {
  const auto& s  = TX(t).View();
  auto        it = s.articles.find(article_id);
  if (it == s.articles.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ArticleRecord> MemoryRepository::GetArticleByUrl(Transaction& t, const std::string& url) {
  for (const auto& [_, article] : TX(t).View().articles) {
    if (article.url == url) return article;
  }
  return std::nullopt;
}

std::vector<model::ArticleRecord> MemoryRepository::ListRecentArticles(Transaction& t, std::size_t limit) {
  std::vector<model::ArticleRecord> out;
  for (const auto& [_, article] : TX(t).View().articles) {
    out.push_back(article);
  }
  std::sort(out.begin(), out.end(), [](const model::ArticleRecord& a, const model::ArticleRecord& b) {
    if (a.published_ms != b.published_ms) return a.published_ms > b.published_ms;
    return a.id > b.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::ArticleRecord> MemoryRepository::ListUnprocessedArticles(Transaction& t, std::size_t limit) {
  std::vector<model::ArticleRecord> out;
  for (const auto& [_, article] : TX(t).View().articles) {
    if (out.size() >= limit) break;
    if (!article.is_processed) out.push_back(article);
  }
  return out;
}

Result MemoryRepository::DeleteArticle(Transaction& t, uint64_t article_id) {
  const auto& view = TX(t).View();
  auto        it   = view.articles.find(article_id);
  if (it == view.articles.end()) return Result::Err(ErrorCode::NotFound);
  TX(t).Write({ArticleKey(article_id), UrlKey(it->second.url)}, [article_id](State& s) {
    s.articles.erase(article_id);
    s.article_categories.erase(article_id);
    std::erase_if(s.mentions, [&](const auto& entry) { return std::get<0>(entry.first) == article_id; });
    std::erase_if(s.embeddings, [&](const auto& entry) { return std::get<0>(entry.first) == article_id; });
  });
  return Result::Ok();
}

Result MemoryRepository::AddArticleCategory(Transaction& t, uint64_t article_id, uint64_t category_id) {
  const auto& view = TX(t).View();
  if (!view.articles.contains(article_id) || !view.categories.contains(category_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown article or category");
  }
  TX(t).Write({ArticleKey(article_id)}, [article_id, category_id](State& s) { s.article_categories[article_id].insert(category_id); });
  return Result::Ok();
}

std::vector<model::NewsCategoryRecord> MemoryRepository::GetArticleCategories(Transaction& t, uint64_t article_id) {
  const auto&                            s = TX(t).View();
  std::vector<model::NewsCategoryRecord> out;
  auto                                   links = s.article_categories.find(article_id);
  if (links == s.article_categories.end()) return out;
  for (auto category_id : links->second) {
    auto it = s.categories.find(category_id);
    if (it != s.categories.end()) out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Mentions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertMention(Transaction& t, const model::MentionRecord& r) {
  const auto& view = TX(t).View();
  if (!view.articles.contains(r.article_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown article");

  MentionKey key{r.article_id, TypeKey(r.asset_type), r.asset_symbol};
  auto       merged = r;
  auto       it     = view.mentions.find(key);
  if (it != view.mentions.end()) {
    merged                = it->second;
    merged.mention_count += r.mention_count;
    merged.is_primary     = it->second.is_primary || r.is_primary;
  }
  TX(t).Write({ArticleKey(r.article_id)}, [key, merged](State& s) { s.mentions[key] = merged; });
  return Result::Ok();
}

std::optional<model::MentionRecord> MemoryRepository::GetMention(Transaction& t, uint64_t article_id, model::AssetType type, const std::string& symbol) {
  const auto& s  = TX(t).View();
  auto        it = s.mentions.find(MentionKey{article_id, TypeKey(type), symbol});
  if (it == s.mentions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MentionRecord> MemoryRepository::ListMentionsForArticle(Transaction& t, uint64_t article_id) {
  std::vector<model::MentionRecord> out;
  for (const auto& [key, mention] : TX(t).View().mentions) {
    if (std::get<0>(key) == article_id) out.push_back(mention);
  }
  return out;
}

std::vector<model::MentionRecord> MemoryRepository::ListMentionsForAsset(Transaction& t, model::AssetType type, const std::string& symbol) {
  const auto                        type_key = TypeKey(type);
  std::vector<model::MentionRecord> out;
  for (const auto& [key, mention] : TX(t).View().mentions) {
    if (std::get<1>(key) == type_key && std::get<2>(key) == symbol) out.push_back(mention);
  }
  return out;
}

// ------------------------------------------------------------------
// Embeddings
// ------------------------------------------------------------------

Result MemoryRepository::UpsertEmbedding(Transaction& t, const model::EmbeddingRecord& r) {
  const auto& view = TX(t).View();
  if (!view.articles.contains(r.article_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown article");

  EmbeddingKey key{r.article_id, r.embedding_model, r.chunk_index};
  auto         stored = r;
  auto         it     = view.embeddings.find(key);
  if (it == view.embeddings.end()) {
    for (const auto& [_, existing] : view.embeddings) {
      if (existing.id == r.id) return Result::Err(ErrorCode::AlreadyExists, "embedding id exists: " + r.id);
    }
  } else {
    stored            = it->second;
    stored.chunk_text = r.chunk_text;
    stored.vector     = r.vector;
  }
  TX(t).Write({ArticleKey(r.article_id)}, [key, stored = std::move(stored)](State& s) { s.embeddings[key] = stored; });
  return Result::Ok();
}

std::optional<model::EmbeddingRecord> MemoryRepository::GetEmbedding(Transaction& t, uint64_t article_id, uint32_t chunk_index, const std::string& model) {
  const auto& s  = TX(t).View();
  auto        it = s.embeddings.find(EmbeddingKey{article_id, model, chunk_index});
  if (it == s.embeddings.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteEmbeddings(Transaction& t, uint64_t article_id, const std::string& model) {
  TX(t).Write({ArticleKey(article_id)}, [article_id, model](State& s) {
    std::erase_if(s.embeddings, [&](const auto& entry) {
      return std::get<0>(entry.first) == article_id && (model.empty() || std::get<1>(entry.first) == model);
    });
  });
  return Result::Ok();
}

std::vector<model::EmbeddingRecord> MemoryRepository::ListEmbeddingsForArticle(Transaction& t, uint64_t article_id, const std::string& model) {
  std::vector<model::EmbeddingRecord> out;
  for (const auto& [key, record] : TX(t).View().embeddings) {
    if (std::get<0>(key) == article_id && std::get<1>(key) == model) out.push_back(record);
  }
  return out;
}

std::vector<model::EmbeddingRecord> MemoryRepository::ListEmbeddingsByModel(Transaction& t, const std::string& model) {
  std::vector<model::EmbeddingRecord> out;
  for (const auto& [key, record] : TX(t).View().embeddings) {
    if (std::get<1>(key) == model) out.push_back(record);
  }
  return out;
}

} // namespace omni::db::memory
