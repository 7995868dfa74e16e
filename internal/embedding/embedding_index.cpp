#include "embedding_index.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "similarity.hpp"

namespace omni::embedding {

using db::model::EmbeddingRecord;

namespace {

bool RanksBefore(const SearchHit& a, const SearchHit& b) {
  if (a.score != b.score) return a.score > b.score;
  if (a.chunk.created_at_ms != b.chunk.created_at_ms) return a.chunk.created_at_ms > b.chunk.created_at_ms;
  return a.chunk.id < b.chunk.id;
}

} // namespace

EmbeddingIndex::EmbeddingIndex(std::shared_ptr<db::Repository> repository, std::shared_ptr<EmbeddingFunction> embedder,
                               config::EmbeddingOptions options)
    : repository_(std::move(repository)),
      embedder_(std::move(embedder)),
      options_(std::move(options)),
      chunker_(options_.max_chunk_chars, options_.chunk_overlap_chars) {
  if (!repository_ || !embedder_) {
    throw std::invalid_argument("EmbeddingIndex requires a repository and an embedder");
  }
  if (embedder_->Dimension() != options_.dimension) {
    throw util::InvalidArgument("embedder dimension " + std::to_string(embedder_->Dimension()) + " does not match configured dimension " +
                                std::to_string(options_.dimension));
  }
}

std::vector<TextChunk> EmbeddingIndex::Chunk(const std::string& content) const {
  return chunker_.Split(content);
}

std::shared_ptr<std::mutex> EmbeddingIndex::ArticleMutex(uint64_t article_id) {
  std::lock_guard<std::mutex> lock(article_mutexes_guard_);
  auto&                       article_mutex = article_mutexes_[article_id];
  if (!article_mutex) {
    article_mutex = std::make_shared<std::mutex>();
  }
  return article_mutex;
}

std::unique_lock<std::mutex> EmbeddingIndex::LockArticle(uint64_t article_id) {
  // entries of article_mutexes_ are never erased, so the mutex outlives the lock
  return std::unique_lock<std::mutex>(*ArticleMutex(article_id));
}

void EmbeddingIndex::RequireDimension(const std::vector<float>& vector, const char* what) const {
  if (vector.size() != options_.dimension) {
    throw util::InvalidArgument(std::string(what) + " has dimension " + std::to_string(vector.size()) + ", expected " +
                                std::to_string(options_.dimension));
  }
}

void EmbeddingIndex::PublishLocked(uint64_t article_id, const std::string& model, std::vector<EmbeddingRecord> rows) {
  auto& entries = cache_[article_id];
  cached_chunks_ -= static_cast<std::size_t>(
      std::erase_if(entries, [&](const EmbeddingRecord& entry) { return entry.embedding_model == model; }));
  cached_chunks_ += rows.size();
  std::move(rows.begin(), rows.end(), std::back_inserter(entries));
  if (entries.empty()) {
    cache_.erase(article_id);
  }
}

void EmbeddingIndex::Hydrate() {
  std::vector<EmbeddingRecord> rows;
  {
    auto tx = repository_->Begin();
    rows    = repository_->ListEmbeddingsByModel(*tx, options_.model);
    tx->Commit();
  }

  std::unordered_map<uint64_t, std::vector<EmbeddingRecord>> fresh;
  std::size_t                                                count = 0;
  for (auto& row : rows) {
    if (row.vector.size() != options_.dimension) {
      OMNI_LOG_WARN("Skipping stored chunk with wrong dimension",
                    {observability::StringField("chunk_id", row.id), observability::UintField("dimension", row.vector.size())});
      continue;
    }
    fresh[row.article_id].push_back(std::move(row));
    ++count;
  }

  {
    std::unique_lock lock(cache_mutex_);
    cache_.swap(fresh);
    cached_chunks_ = count;
  }

  observability::Metrics::Instance().SetIndexedChunks(count);
  OMNI_LOG_INFO("Embedding cache hydrated", {observability::StringField("model", options_.model), observability::UintField("chunks", count)});
}

EmbedResult EmbeddingIndex::ChunkAndEmbed(uint64_t article_id) {
  observability::SpanScope span("embedding.chunk_and_embed");
  span.SetAttribute("article_id", static_cast<std::int64_t>(article_id));

  auto article_lock = LockArticle(article_id);

  std::string content;
  {
    auto tx      = repository_->Begin();
    auto article = repository_->GetArticleById(*tx, article_id);
    tx->Commit();
    if (!article) {
      throw util::NotFound("article not found: " + std::to_string(article_id));
    }
    content = std::move(article->content);
  }

  // embed outside any transaction; the model may be slow
  const auto                      chunks = chunker_.Split(content);
  std::vector<std::vector<float>> vectors;
  vectors.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    auto vector = embedder_->Embed(chunk.text, options_.model);
    RequireDimension(vector, "embedder output");
    vectors.push_back(std::move(vector));
  }

  EmbedResult                  result;
  std::vector<EmbeddingRecord> rows;

  auto tx      = repository_->Begin();
  auto article = repository_->GetArticleById(*tx, article_id);
  if (!article) {
    throw util::NotFound("article deleted while embedding: " + std::to_string(article_id));
  }
  if (article->content != content) {
    tx->Rollback();
    OMNI_LOG_DEBUG("Article content changed during embedding", {observability::UintField("article_id", article_id)});
    return result;
  }

  std::unordered_map<uint32_t, EmbeddingRecord> previous;
  for (auto& row : repository_->ListEmbeddingsForArticle(*tx, article_id, options_.model)) {
    const auto index = row.chunk_index;
    previous.emplace(index, std::move(row));
  }
  db::ThrowIfDbError(repository_->DeleteEmbeddings(*tx, article_id, options_.model), "delete stale chunks");

  const uint64_t now_ms = util::NowMillis();
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    EmbeddingRecord row;
    row.article_id      = article_id;
    row.chunk_index     = chunks[i].index;
    row.chunk_text      = chunks[i].text;
    row.vector          = vectors[i];
    row.embedding_model = options_.model;

    // an unchanged chunk keeps its identity
    const auto prior = previous.find(row.chunk_index);
    if (prior != previous.end() && prior->second.chunk_text == row.chunk_text) {
      row.id            = prior->second.id;
      row.created_at_ms = prior->second.created_at_ms;
    } else {
      row.id            = util::GenerateUUIDString();
      row.created_at_ms = now_ms;
    }

    db::ThrowIfDbError(repository_->UpsertEmbedding(*tx, row), "store chunk");
    rows.push_back(std::move(row));
  }

  article->is_processed = true;
  db::ThrowIfDbError(repository_->UpdateArticle(*tx, *article), "mark article processed");
  tx->Commit();

  result.applied = true;
  result.chunks  = rows.size();

  std::size_t total = 0;
  {
    std::unique_lock lock(cache_mutex_);
    PublishLocked(article_id, options_.model, std::move(rows));
    total = cached_chunks_;
  }
  observability::Metrics::Instance().SetIndexedChunks(total);
  span.SetAttribute("chunks", static_cast<std::int64_t>(result.chunks));
  return result;
}

EmbeddingRecord EmbeddingIndex::Index(uint64_t article_id, uint32_t chunk_index, const std::vector<float>& vector, const std::string& model,
                                      const std::string& chunk_text) {
  RequireDimension(vector, "chunk vector");
  if (model.empty()) {
    throw util::InvalidArgument("embedding model is required");
  }

  auto article_lock = LockArticle(article_id);

  auto tx = repository_->Begin();
  if (!repository_->GetArticleById(*tx, article_id)) {
    throw util::NotFound("article not found: " + std::to_string(article_id));
  }

  EmbeddingRecord row;
  row.article_id      = article_id;
  row.chunk_index     = chunk_index;
  row.chunk_text      = chunk_text;
  row.vector          = vector;
  row.embedding_model = model;
  if (auto existing = repository_->GetEmbedding(*tx, article_id, chunk_index, model)) {
    row.id            = existing->id;
    row.created_at_ms = existing->created_at_ms;
  } else {
    row.id            = util::GenerateUUIDString();
    row.created_at_ms = util::NowMillis();
  }

  db::ThrowIfDbError(repository_->UpsertEmbedding(*tx, row), "store chunk");
  tx->Commit();

  if (model != options_.model) {
    return row;
  }

  {
    std::unique_lock lock(cache_mutex_);
    auto&            entries = cache_[article_id];
    auto             it      = std::find_if(entries.begin(), entries.end(), [&](const EmbeddingRecord& entry) {
      return entry.chunk_index == chunk_index && entry.embedding_model == model;
    });
    if (it != entries.end()) {
      *it = row;
    } else {
      entries.push_back(row);
      ++cached_chunks_;
    }
  }
  return row;
}

std::vector<SearchHit> EmbeddingIndex::Search(const std::vector<float>& query, std::size_t top_k, const SearchFilter& filter) const {
  RequireDimension(query, "query vector");
  if (top_k == 0) {
    return {};
  }

  const auto& model = filter.model.empty() ? options_.model : filter.model;
  const std::unordered_set<uint64_t> articles(filter.article_ids.begin(), filter.article_ids.end());

  std::vector<SearchHit> hits;
  const auto             consider = [&](const EmbeddingRecord& entry) {
    if (!articles.empty() && !articles.contains(entry.article_id)) return;
    if (entry.embedding_model != model) return;
    if (filter.min_created_at_ms && entry.created_at_ms < *filter.min_created_at_ms) return;
    if (entry.vector.size() != query.size()) return;

    SearchHit hit;
    hit.score                 = Similarity(options_.metric, query, entry.vector);
    hit.chunk.id              = entry.id;
    hit.chunk.article_id      = entry.article_id;
    hit.chunk.chunk_index     = entry.chunk_index;
    hit.chunk.chunk_text      = entry.chunk_text;
    hit.chunk.embedding_model = entry.embedding_model;
    hit.chunk.created_at_ms   = entry.created_at_ms;
    hits.push_back(std::move(hit));
  };

  if (model == options_.model) {
    std::shared_lock lock(cache_mutex_);
    for (const auto& [article_id, entries] : cache_) {
      if (!articles.empty() && !articles.contains(article_id)) continue;
      for (const auto& entry : entries) consider(entry);
    }
  } else {
    // other generations are not cached; scan them from the repository
    auto tx   = repository_->Begin();
    auto rows = repository_->ListEmbeddingsByModel(*tx, model);
    tx->Commit();
    for (const auto& row : rows) consider(row);
  }

  if (hits.size() > top_k) {
    std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(top_k), hits.end(), RanksBefore);
    hits.resize(top_k);
  } else {
    std::sort(hits.begin(), hits.end(), RanksBefore);
  }
  return hits;
}

std::vector<SearchHit> EmbeddingIndex::SearchText(const std::string& text, std::size_t top_k, const SearchFilter& filter) const {
  const auto& model = filter.model.empty() ? options_.model : filter.model;
  return Search(embedder_->Embed(text, model), top_k, filter);
}

void EmbeddingIndex::Evict(uint64_t article_id) {
  std::size_t total = 0;
  {
    std::unique_lock lock(cache_mutex_);
    auto             it = cache_.find(article_id);
    if (it != cache_.end()) {
      cached_chunks_ -= it->second.size();
      cache_.erase(it);
    }
    total = cached_chunks_;
  }
  observability::Metrics::Instance().SetIndexedChunks(total);
}

std::size_t EmbeddingIndex::CachedChunks() const {
  std::shared_lock lock(cache_mutex_);
  return cached_chunks_;
}

} // namespace omni::embedding
