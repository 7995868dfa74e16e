#include "content_store.hpp"

#include <cmath>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "internal/db/api/tx_helpers.hpp"
#include "internal/embedding/embed_scheduler.hpp"
#include "internal/embedding/embedding_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "url.hpp"

namespace omni::content {

using db::model::ArticleRecord;

namespace {

ArticleIngest Rejected(std::string reason) {
  ArticleIngest outcome;
  outcome.status = IngestStatus::kRejected;
  outcome.reason = std::move(reason);
  return outcome;
}

ArticleIngest Duplicate(uint64_t article_id) {
  ArticleIngest outcome;
  outcome.status     = IngestStatus::kDuplicate;
  outcome.article_id = article_id;
  return outcome;
}

} // namespace

const char* ToString(IngestStatus status) {
  switch (status) {
    case IngestStatus::kInserted:
      return "inserted";
    case IngestStatus::kDuplicate:
      return "duplicate";
    case IngestStatus::kRejected:
      return "rejected";
  }
  return "unknown";
}

ContentStore::ContentStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<embedding::EmbeddingIndex> index,
                           std::shared_ptr<embedding::EmbedScheduler> scheduler, std::size_t conflict_retry_limit)
    : repository_(std::move(repository)),
      index_(std::move(index)),
      scheduler_(std::move(scheduler)),
      conflict_retry_limit_(conflict_retry_limit) {
  if (!repository_) {
    throw std::invalid_argument("ContentStore requires a repository");
  }
}

ArticleRecord ContentStore::RequireArticle(db::Transaction& tx, uint64_t article_id) {
  auto article = repository_->GetArticleById(tx, article_id);
  if (!article) {
    throw util::NotFound("article not found: " + std::to_string(article_id));
  }
  return std::move(*article);
}

void ContentStore::QueueEmbedding(uint64_t article_id) {
  if (scheduler_) {
    scheduler_->Enqueue(article_id);
  }
}

ArticleIngest ContentStore::IngestArticle(const ArticleInput& input) {
  std::string url;
  try {
    url = CanonicalizeUrl(input.url);
  } catch (const util::InvalidArgument& e) {
    return Rejected(e.what());
  }
  if (input.title.empty()) {
    return Rejected("article title is required");
  }

  auto outcome = db::RunWithConflictRetry(conflict_retry_limit_, "ingest_article", [&] {
    auto tx = repository_->Begin();

    if (auto existing = repository_->GetArticleByUrl(*tx, url)) {
      tx->Rollback();
      return Duplicate(existing->id);
    }

    auto source = repository_->GetSourceByName(*tx, input.source_name);
    if (!source) {
      tx->Rollback();
      return Rejected("unknown news source: " + input.source_name);
    }

    ArticleRecord article;
    article.source_id       = source->id;
    article.title           = input.title;
    article.url             = url;
    article.published_ms    = input.published_ms;
    article.fetched_ms      = util::NowMillis();
    article.summary         = input.summary;
    article.content         = input.content;
    article.image_url       = input.image_url;
    article.image_alt       = input.image_alt;
    article.sentiment_score = input.sentiment_score;
    article.sentiment_label = input.sentiment_label;

    const auto inserted = repository_->InsertArticle(*tx, article);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      // lost a race with another delivery of the same url
      tx->Rollback();
      auto again    = repository_->Begin();
      auto existing = repository_->GetArticleByUrl(*again, url);
      again->Commit();
      if (!existing) {
        throw db::TransactionConflict("article url vanished after conflict: " + url);
      }
      return Duplicate(existing->id);
    }
    db::ThrowIfDbError(inserted, "insert article");

    for (const auto& name : input.categories) {
      auto category = repository_->GetCategoryByName(*tx, name);
      if (!category) {
        OMNI_LOG_WARN("Skipping unknown news category", {observability::StringField("category", name), observability::StringField("url", url)});
        continue;
      }
      db::ThrowIfDbError(repository_->AddArticleCategory(*tx, article.id, category->id), "tag article");
    }

    tx->Commit();

    ArticleIngest result;
    result.status     = IngestStatus::kInserted;
    result.article_id = article.id;
    return result;
  });

  if (outcome.status == IngestStatus::kInserted) {
    OMNI_LOG_INFO("Article stored", {observability::UintField("article_id", outcome.article_id), observability::StringField("url", url)});
    QueueEmbedding(outcome.article_id);
  } else if (outcome.status == IngestStatus::kRejected) {
    OMNI_LOG_WARN("Article rejected", {observability::StringField("url", url), observability::StringField("reason", outcome.reason)});
  }
  return outcome;
}

db::model::MentionRecord ContentStore::RecordMention(uint64_t article_id, db::model::AssetType type, const std::string& symbol, uint32_t count,
                                                     bool is_primary) {
  if (symbol.empty()) {
    throw util::InvalidArgument("mention symbol is required");
  }
  if (count == 0) {
    throw util::InvalidArgument("mention count must be positive");
  }

  return db::RunWithConflictRetry(conflict_retry_limit_, "record_mention", [&] {
    auto tx = repository_->Begin();
    RequireArticle(*tx, article_id);

    db::model::MentionRecord mention;
    mention.article_id    = article_id;
    mention.asset_type    = type;
    mention.asset_symbol  = symbol;
    mention.mention_count = count;
    mention.is_primary    = is_primary;
    db::ThrowIfDbError(repository_->UpsertMention(*tx, mention), "record mention");

    auto stored = repository_->GetMention(*tx, article_id, type, symbol);
    tx->Commit();
    return stored.value_or(mention);
  });
}

void ContentStore::UpdateSentiment(uint64_t article_id, double score, const std::string& label) {
  if (!std::isfinite(score)) {
    throw util::InvalidArgument("sentiment score must be finite");
  }

  db::RunWithConflictRetry(conflict_retry_limit_, "update_sentiment", [&] {
    auto tx                 = repository_->Begin();
    auto article            = RequireArticle(*tx, article_id);
    article.sentiment_score = score;
    article.sentiment_label = label;
    db::ThrowIfDbError(repository_->UpdateArticle(*tx, article), "update sentiment");
    tx->Commit();
  });
}

bool ContentStore::UpdateContent(uint64_t article_id, const std::string& content) {
  std::unique_lock<std::mutex> article_lock;
  if (index_) {
    article_lock = index_->LockArticle(article_id);
  }

  const bool changed = db::RunWithConflictRetry(conflict_retry_limit_, "update_content", [&] {
    auto tx      = repository_->Begin();
    auto article = RequireArticle(*tx, article_id);
    if (article.content == content) {
      tx->Rollback();
      return false;
    }
    article.content      = content;
    article.is_processed = false;
    db::ThrowIfDbError(repository_->UpdateArticle(*tx, article), "update content");
    // chunks of the old text must not outlive it
    db::ThrowIfDbError(repository_->DeleteEmbeddings(*tx, article_id, ""), "drop stale chunks");
    tx->Commit();
    return true;
  });

  if (changed) {
    if (index_) {
      index_->Evict(article_id);
    }
    OMNI_LOG_INFO("Article content updated", {observability::UintField("article_id", article_id)});
    QueueEmbedding(article_id);
  }
  return changed;
}

void ContentStore::MarkProcessed(uint64_t article_id) {
  db::RunWithConflictRetry(conflict_retry_limit_, "mark_processed", [&] {
    auto tx      = repository_->Begin();
    auto article = RequireArticle(*tx, article_id);
    if (!article.is_processed) {
      article.is_processed = true;
      db::ThrowIfDbError(repository_->UpdateArticle(*tx, article), "mark processed");
    }
    tx->Commit();
  });
}

void ContentStore::DeleteArticle(uint64_t article_id) {
  std::unique_lock<std::mutex> article_lock;
  if (index_) {
    article_lock = index_->LockArticle(article_id);
  }

  db::RunWithConflictRetry(conflict_retry_limit_, "delete_article", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->DeleteArticle(*tx, article_id), "article not found: " + std::to_string(article_id));
    tx->Commit();
  });

  if (index_) {
    index_->Evict(article_id);
  }
  OMNI_LOG_INFO("Article deleted", {observability::UintField("article_id", article_id)});
}

std::optional<ArticleRecord> ContentStore::GetArticle(uint64_t article_id) {
  auto tx      = repository_->Begin();
  auto article = repository_->GetArticleById(*tx, article_id);
  tx->Commit();
  return article;
}

std::optional<ArticleRecord> ContentStore::FindArticleByUrl(const std::string& url) {
  const auto canonical = CanonicalizeUrl(url);
  auto       tx        = repository_->Begin();
  auto       article   = repository_->GetArticleByUrl(*tx, canonical);
  tx->Commit();
  return article;
}

std::size_t ContentStore::RequeueUnprocessed(std::size_t limit) {
  std::vector<ArticleRecord> pending;
  {
    auto tx = repository_->Begin();
    pending = repository_->ListUnprocessedArticles(*tx, limit);
    tx->Commit();
  }
  for (const auto& article : pending) {
    QueueEmbedding(article.id);
  }
  if (!pending.empty()) {
    OMNI_LOG_INFO("Queued unprocessed articles for embedding", {observability::UintField("articles", pending.size())});
  }
  return scheduler_ ? pending.size() : 0;
}

} // namespace omni::content
