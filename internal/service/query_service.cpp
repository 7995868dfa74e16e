#include "query_service.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include "conversions.hpp"
#include "internal/query/query_views.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace omni::service {

using namespace omni::v1;

namespace {

constexpr std::size_t kDefaultLimit = 20;
constexpr std::size_t kMaxLimit     = 500;
constexpr std::size_t kDefaultTopK  = 10;

std::size_t ClampLimit(uint32_t requested, std::size_t fallback) {
  if (requested == 0) return fallback;
  return std::min<std::size_t>(requested, kMaxLimit);
}

} // namespace

QueryService::QueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.views) {
    throw std::invalid_argument("QueryService requires query views");
  }
}

LatestSignalResponse QueryService::LatestSignal(const LatestSignalRequest& req) {
  return ObserveRpc("QueryService.LatestSignal", [&] {
    LatestSignalResponse resp;
    if (auto signal = ctx_.views->LatestSignal(req.symbol())) {
      resp.set_found(true);
      *resp.mutable_signal() = ToProto(*signal, req.symbol());
    }
    return resp;
  });
}

SignalHistoryResponse QueryService::SignalHistory(const SignalHistoryRequest& req) {
  return ObserveRpc("QueryService.SignalHistory", [&] {
    const uint64_t to_ms = req.to_ms() == 0 ? std::numeric_limits<uint64_t>::max() : req.to_ms();

    SignalHistoryResponse resp;
    for (const auto& signal : ctx_.views->SignalHistory(req.symbol(), req.from_ms(), to_ms)) {
      *resp.add_signals() = ToProto(signal, req.symbol());
    }
    return resp;
  });
}

ObservationHistoryResponse QueryService::ObservationHistory(const ObservationHistoryRequest& req) {
  return ObserveRpc("QueryService.ObservationHistory", [&] {
    const uint64_t to_ms = req.to_ms() == 0 ? std::numeric_limits<uint64_t>::max() : req.to_ms();

    ObservationHistoryResponse resp;
    for (const auto& observation : ctx_.views->Observations(req.symbol(), req.from_ms(), to_ms)) {
      *resp.add_observations() = ToProto(observation, req.symbol());
    }
    return resp;
  });
}

LatestObservationResponse QueryService::LatestObservation(const LatestObservationRequest& req) {
  return ObserveRpc("QueryService.LatestObservation", [&] {
    LatestObservationResponse resp;
    if (auto observation = ctx_.views->LatestObservation(req.symbol())) {
      resp.set_found(true);
      *resp.mutable_observation() = ToProto(*observation, req.symbol());
    }
    return resp;
  });
}

SearchNewsResponse QueryService::SearchNews(const SearchNewsRequest& req) {
  return ObserveRpc("QueryService.SearchNews", [&] {
    if (req.query_text().empty()) {
      throw util::InvalidArgument("query_text is required");
    }

    embedding::SearchFilter filter;
    filter.article_ids.assign(req.article_ids().begin(), req.article_ids().end());
    if (req.min_created_ms() > 0) {
      filter.min_created_at_ms = req.min_created_ms();
    }

    SearchNewsResponse resp;
    for (const auto& result : ctx_.views->SearchNews(req.query_text(), ClampLimit(req.top_k(), kDefaultTopK), filter)) {
      auto* hit = resp.add_hits();
      hit->set_chunk_id(result.hit.chunk.id);
      hit->set_article_id(result.hit.chunk.article_id);
      hit->set_chunk_index(result.hit.chunk.chunk_index);
      hit->set_chunk_text(result.hit.chunk.chunk_text);
      hit->set_model(result.hit.chunk.embedding_model);
      hit->set_score(result.hit.score);
      hit->set_created_ms(result.hit.chunk.created_at_ms);
      hit->set_article_title(result.article.title);
      hit->set_article_url(result.article.url);
      hit->set_source_name(result.source_name);
    }
    return resp;
  });
}

AssetsMentionedInResponse QueryService::AssetsMentionedIn(const AssetsMentionedInRequest& req) {
  return ObserveRpc("QueryService.AssetsMentionedIn", [&] {
    AssetsMentionedInResponse resp;
    for (const auto& mention : ctx_.views->AssetsMentionedIn(req.article_id())) {
      *resp.add_mentions() = ToProto(mention);
    }
    return resp;
  });
}

NewsResponse QueryService::RecentNews(const RecentNewsRequest& req) {
  return ObserveRpc("QueryService.RecentNews", [&] {
    NewsResponse resp;
    for (const auto& item : ctx_.views->RecentNews(ClampLimit(req.limit(), kDefaultLimit))) {
      *resp.add_articles() = ToProto(item.article, item.source_name, item.categories);
    }
    return resp;
  });
}

NewsResponse QueryService::AssetNews(const AssetNewsRequest& req) {
  return ObserveRpc("QueryService.AssetNews", [&] {
    if (req.symbol().empty()) {
      throw util::InvalidArgument("symbol is required");
    }

    NewsResponse resp;
    for (const auto& item : ctx_.views->AssetNews(FromProto(req.asset_type()), req.symbol(), ClampLimit(req.limit(), kDefaultLimit))) {
      *resp.add_articles() = ToProto(item.article, item.source_name);
    }
    return resp;
  });
}

AssetOutlookResponse QueryService::AssetOutlook(const AssetOutlookRequest& req) {
  return ObserveRpc("QueryService.AssetOutlook", [&] {
    AssetOutlookResponse resp;
    resp.set_outlook(ctx_.views->Outlook(req.symbol()).text);
    return resp;
  });
}

} // namespace omni::service
