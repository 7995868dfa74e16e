#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunker.hpp"
#include "embedding_function.hpp"
#include "internal/config/runtime_options.hpp"
#include "internal/db/api/repository.hpp"

namespace omni::embedding {

struct SearchFilter {
  // empty means the configured model
  std::string             model;
  std::vector<uint64_t>   article_ids;
  std::optional<uint64_t> min_created_at_ms;
};

// chunk carries provenance and text; its vector is left empty
struct SearchHit {
  db::model::EmbeddingRecord chunk;
  double                     score = 0.0;
};

struct EmbedResult {
  // false when the article content changed while it was being embedded;
  // the newer content has its own task
  bool        applied = false;
  std::size_t chunks  = 0;
};

/*
  Chunk store with an in-process similarity search cache.

  The repository is the source of truth. The cache mirrors the stored
  chunks of the configured model and is updated under an exclusive lock only after the owning
  transaction committed, so a search sees an article's old chunk set or its
  new one, never a mix.

  Search is a linear scan ordered by score descending, then created_at
  descending, then chunk id. A search naming another model scans that
  generation from the repository.
*/
class EmbeddingIndex {
 public:
  EmbeddingIndex(std::shared_ptr<db::Repository> repository, std::shared_ptr<EmbeddingFunction> embedder, config::EmbeddingOptions options);

  std::vector<TextChunk> Chunk(const std::string& content) const;

  // Loads every stored chunk of the configured model into the cache.
  void Hydrate();

  // Embeds the article's current content and replaces its chunk set for the
  // configured model, then marks the article processed. Throws
  // util::NotFound for an unknown article; util::EmbeddingUnavailable from
  // the embedder passes through.
  EmbedResult ChunkAndEmbed(uint64_t article_id);

  // Idempotent store of one chunk under (article_id, chunk_index, model).
  db::model::EmbeddingRecord Index(uint64_t article_id, uint32_t chunk_index, const std::vector<float>& vector, const std::string& model,
                                   const std::string& chunk_text);

  // util::InvalidArgument when the query length differs from the dimension.
  std::vector<SearchHit> Search(const std::vector<float>& query, std::size_t top_k, const SearchFilter& filter = {}) const;
  std::vector<SearchHit> SearchText(const std::string& text, std::size_t top_k, const SearchFilter& filter = {}) const;

  // Serializes changes to one article's chunk set. ContentStore holds it
  // across a content rewrite or delete and the Evict that follows, so a
  // concurrent ChunkAndEmbed cannot publish chunks of the old text after
  // they were dropped.
  std::unique_lock<std::mutex> LockArticle(uint64_t article_id);

  // Drops the article's chunks from the cache after they left the repository.
  void Evict(uint64_t article_id);

  std::size_t CachedChunks() const;

  const config::EmbeddingOptions& Options() const {
    return options_;
  }

 private:
  void RequireDimension(const std::vector<float>& vector, const char* what) const;
  void PublishLocked(uint64_t article_id, const std::string& model, std::vector<db::model::EmbeddingRecord> rows);
  std::shared_ptr<std::mutex> ArticleMutex(uint64_t article_id);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<EmbeddingFunction> embedder_;
  config::EmbeddingOptions           options_;
  Chunker                            chunker_;

  mutable std::shared_mutex                                                cache_mutex_;
  std::unordered_map<uint64_t, std::vector<db::model::EmbeddingRecord>> cache_;
  std::size_t                                                              cached_chunks_ = 0;

  std::mutex                                                 article_mutexes_guard_;
  std::unordered_map<uint64_t, std::shared_ptr<std::mutex>> article_mutexes_;
};

} // namespace omni::embedding
