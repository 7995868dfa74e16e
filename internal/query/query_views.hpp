#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/embedding/embedding_index.hpp"

namespace omni::signal {
class SignalEngine;
}

namespace omni::query {

// One row of vw_recent_news.
struct NewsItem {
  db::model::ArticleRecord article;
  std::string              source_name;
  std::vector<std::string> categories;
};

// One row of vw_asset_news.
struct AssetNewsItem {
  db::model::ArticleRecord article;
  std::string              source_name;
  db::model::MentionRecord mention;
};

struct NewsSearchResult {
  embedding::SearchHit     hit;
  db::model::ArticleRecord article;
  std::string              source_name;
};

struct AssetOutlook {
  std::string                            symbol;
  std::optional<db::model::SignalRecord> signal;
  std::string                            text;
};

/*
  Read-only projections over the stores.

  Signal reads go through the SignalEngine so an asset with an unfinished
  backfill is reported without signals. Unknown symbols and article ids
  throw util::NotFound.
*/
class QueryViews {
 public:
  QueryViews(std::shared_ptr<db::Repository> repository, std::shared_ptr<signal::SignalEngine> engine,
             std::shared_ptr<embedding::EmbeddingIndex> index);

  // Newest first by published date.
  std::vector<NewsItem> RecentNews(std::size_t limit);

  std::vector<AssetNewsItem> AssetNews(db::model::AssetType type, const std::string& symbol, std::size_t limit);

  std::optional<db::model::SignalRecord> LatestSignal(const std::string& symbol);

  // util::InconsistentBackfill while the asset is being recomputed.
  std::vector<db::model::SignalRecord> SignalHistory(const std::string& symbol, uint64_t from_ms, uint64_t to_ms);

  // Oldest first, bounds inclusive.
  std::vector<db::model::ObservationRecord>   Observations(const std::string& symbol, uint64_t from_ms, uint64_t to_ms);
  std::optional<db::model::ObservationRecord> LatestObservation(const std::string& symbol);

  // Chunks whose article has been deleted since the search are dropped.
  std::vector<NewsSearchResult> SearchNews(const std::string& query_text, std::size_t top_k, const embedding::SearchFilter& filter = {});

  std::vector<db::model::MentionRecord> AssetsMentionedIn(uint64_t article_id);

  AssetOutlook Outlook(const std::string& symbol);

 private:
  uint64_t ResolveAsset(const std::string& symbol);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<signal::SignalEngine>      engine_;
  std::shared_ptr<embedding::EmbeddingIndex> index_;
};

} // namespace omni::query
