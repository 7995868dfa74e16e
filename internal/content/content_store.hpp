#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace omni::embedding {
class EmbeddingIndex;
class EmbedScheduler;
} // namespace omni::embedding

namespace omni::content {

struct ArticleInput {
  std::string source_name;
  std::string title;
  std::string url;
  uint64_t    published_ms = 0;

  std::string summary;
  std::string content;
  std::string image_url;
  std::string image_alt;

  std::vector<std::string> categories;

  std::optional<double> sentiment_score;
  std::string           sentiment_label;
};

enum class IngestStatus { kInserted, kDuplicate, kRejected };

struct ArticleIngest {
  IngestStatus status     = IngestStatus::kRejected;
  uint64_t     article_id = 0;
  std::string  reason;
};

/*
  Articles keyed by canonical URL, with category links and asset mentions.

  A URL that is already stored yields kDuplicate and leaves the stored row
  untouched. New or changed content is queued for embedding when a
  scheduler is attached; deleting an article also evicts its chunks from
  the search cache.
*/
class ContentStore {
 public:
  ContentStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<embedding::EmbeddingIndex> index,
               std::shared_ptr<embedding::EmbedScheduler> scheduler, std::size_t conflict_retry_limit = 3);

  ArticleIngest IngestArticle(const ArticleInput& input);

  // Adds `count` to the existing mention and ORs is_primary.
  db::model::MentionRecord RecordMention(uint64_t article_id, db::model::AssetType type, const std::string& symbol, uint32_t count,
                                         bool is_primary);

  void UpdateSentiment(uint64_t article_id, double score, const std::string& label);

  // Resets is_processed, drops the old chunks from the repository and the
  // search cache, and queues re-embedding when the content differs. Returns
  // false when the content was unchanged.
  bool UpdateContent(uint64_t article_id, const std::string& content);

  void MarkProcessed(uint64_t article_id);

  void DeleteArticle(uint64_t article_id);

  std::optional<db::model::ArticleRecord> GetArticle(uint64_t article_id);
  std::optional<db::model::ArticleRecord> FindArticleByUrl(const std::string& url);

  // Queues up to `limit` unprocessed articles; used at start-up.
  std::size_t RequeueUnprocessed(std::size_t limit);

 private:
  db::model::ArticleRecord RequireArticle(db::Transaction& tx, uint64_t article_id);
  void                     QueueEmbedding(uint64_t article_id);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<embedding::EmbeddingIndex> index_;
  std::shared_ptr<embedding::EmbedScheduler> scheduler_;
  std::size_t                                conflict_retry_limit_;
};

const char* ToString(IngestStatus status);

} // namespace omni::content
