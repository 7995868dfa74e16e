#include "query_views.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "internal/observability/spans.hpp"
#include "internal/signal/signal_engine.hpp"
#include "internal/util/errors.hpp"

namespace omni::query {

using db::model::ArticleRecord;

namespace {

// Resolves source names once per call.
class SourceNames {
 public:
  SourceNames(db::Repository& repository, db::Transaction& tx) : repository_(repository), tx_(tx) {
  }

  const std::string& Get(uint64_t source_id) {
    auto it = names_.find(source_id);
    if (it == names_.end()) {
      auto source = repository_.GetSourceById(tx_, source_id);
      it          = names_.emplace(source_id, source ? source->name : std::string()).first;
    }
    return it->second;
  }

 private:
  db::Repository&                           repository_;
  db::Transaction&                          tx_;
  std::unordered_map<uint64_t, std::string> names_;
};

bool NewerFirst(const ArticleRecord& a, const ArticleRecord& b) {
  if (a.published_ms != b.published_ms) return a.published_ms > b.published_ms;
  return a.id > b.id;
}

} // namespace

QueryViews::QueryViews(std::shared_ptr<db::Repository> repository, std::shared_ptr<signal::SignalEngine> engine,
                       std::shared_ptr<embedding::EmbeddingIndex> index)
    : repository_(std::move(repository)), engine_(std::move(engine)), index_(std::move(index)) {
  if (!repository_ || !engine_ || !index_) {
    throw std::invalid_argument("QueryViews requires a repository, a signal engine and an embedding index");
  }
}

uint64_t QueryViews::ResolveAsset(const std::string& symbol) {
  auto tx    = repository_->Begin();
  auto asset = repository_->GetAssetBySymbol(*tx, symbol);
  tx->Commit();
  if (!asset) {
    throw util::NotFound("unknown asset symbol: " + symbol);
  }
  return asset->id;
}

std::vector<NewsItem> QueryViews::RecentNews(std::size_t limit) {
  auto        tx = repository_->Begin();
  SourceNames sources(*repository_, *tx);

  std::vector<NewsItem> items;
  for (auto& article : repository_->ListRecentArticles(*tx, limit)) {
    NewsItem item;
    item.source_name = sources.Get(article.source_id);
    for (const auto& category : repository_->GetArticleCategories(*tx, article.id)) {
      item.categories.push_back(category.name);
    }
    item.article = std::move(article);
    items.push_back(std::move(item));
  }
  tx->Commit();
  return items;
}

std::vector<AssetNewsItem> QueryViews::AssetNews(db::model::AssetType type, const std::string& symbol, std::size_t limit) {
  auto        tx = repository_->Begin();
  SourceNames sources(*repository_, *tx);

  std::vector<AssetNewsItem> items;
  for (auto& mention : repository_->ListMentionsForAsset(*tx, type, symbol)) {
    auto article = repository_->GetArticleById(*tx, mention.article_id);
    if (!article) continue;

    AssetNewsItem item;
    item.source_name = sources.Get(article->source_id);
    item.article     = std::move(*article);
    item.mention     = std::move(mention);
    items.push_back(std::move(item));
  }
  tx->Commit();

  std::sort(items.begin(), items.end(), [](const AssetNewsItem& a, const AssetNewsItem& b) { return NewerFirst(a.article, b.article); });
  if (items.size() > limit) {
    items.resize(limit);
  }
  return items;
}

std::optional<db::model::SignalRecord> QueryViews::LatestSignal(const std::string& symbol) {
  return engine_->LatestSignal(ResolveAsset(symbol));
}

std::vector<db::model::SignalRecord> QueryViews::SignalHistory(const std::string& symbol, uint64_t from_ms, uint64_t to_ms) {
  if (from_ms > to_ms) {
    throw util::InvalidArgument("signal history range is inverted");
  }
  return engine_->SignalHistory(ResolveAsset(symbol), from_ms, to_ms);
}

std::vector<db::model::ObservationRecord> QueryViews::Observations(const std::string& symbol, uint64_t from_ms, uint64_t to_ms) {
  if (from_ms > to_ms) {
    throw util::InvalidArgument("observation range is inverted");
  }
  const auto asset_id = ResolveAsset(symbol);

  auto tx           = repository_->Begin();
  auto observations = repository_->ListObservations(*tx, asset_id, from_ms, to_ms);
  tx->Commit();
  return observations;
}

std::optional<db::model::ObservationRecord> QueryViews::LatestObservation(const std::string& symbol) {
  const auto asset_id = ResolveAsset(symbol);

  auto tx     = repository_->Begin();
  auto latest = repository_->ListObservationsBefore(*tx, asset_id, std::numeric_limits<uint64_t>::max(), 1);
  tx->Commit();
  if (latest.empty()) {
    return std::nullopt;
  }
  return std::move(latest.front());
}

std::vector<NewsSearchResult> QueryViews::SearchNews(const std::string& query_text, std::size_t top_k, const embedding::SearchFilter& filter) {
  observability::SpanScope span("query.search_news");
  span.SetAttribute("top_k", static_cast<std::int64_t>(top_k));

  const auto hits = index_->SearchText(query_text, top_k, filter);

  auto        tx = repository_->Begin();
  SourceNames sources(*repository_, *tx);

  std::unordered_map<uint64_t, std::optional<ArticleRecord>> articles;
  std::vector<NewsSearchResult>                              results;
  for (const auto& hit : hits) {
    auto it = articles.find(hit.chunk.article_id);
    if (it == articles.end()) {
      it = articles.emplace(hit.chunk.article_id, repository_->GetArticleById(*tx, hit.chunk.article_id)).first;
    }
    if (!it->second) continue;

    NewsSearchResult result;
    result.hit         = hit;
    result.article     = *it->second;
    result.source_name = sources.Get(it->second->source_id);
    results.push_back(std::move(result));
  }
  tx->Commit();

  span.SetAttribute("results", static_cast<std::int64_t>(results.size()));
  return results;
}

std::vector<db::model::MentionRecord> QueryViews::AssetsMentionedIn(uint64_t article_id) {
  auto tx = repository_->Begin();
  if (!repository_->GetArticleById(*tx, article_id)) {
    throw util::NotFound("article not found: " + std::to_string(article_id));
  }
  auto mentions = repository_->ListMentionsForArticle(*tx, article_id);
  tx->Commit();
  return mentions;
}

AssetOutlook QueryViews::Outlook(const std::string& symbol) {
  AssetOutlook outlook;
  outlook.symbol = symbol;
  outlook.signal = LatestSignal(symbol);

  if (!outlook.signal) {
    outlook.text = "No data available to determine a trend.";
    return outlook;
  }

  switch (outlook.signal->signal) {
    case db::model::SignalKind::kBuy:
      outlook.text = "Bullish outlook for " + symbol + " based on RSI signal.";
      break;
    case db::model::SignalKind::kSell:
      outlook.text = "Bearish outlook for " + symbol + " based on RSI signal.";
      break;
    case db::model::SignalKind::kHold:
      outlook.text = "Neutral signals for " + symbol + " at the moment.";
      break;
  }
  return outlook;
}

} // namespace omni::query
