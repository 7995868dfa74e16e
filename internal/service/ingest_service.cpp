#include "ingest_service.hpp"

#include <stdexcept>
#include <utility>

#include "conversions.hpp"
#include "internal/catalog/catalog_store.hpp"
#include "internal/content/content_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/signal/signal_engine.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace omni::service {

using namespace omni::v1;

namespace {

IngestOutcome Outcome(IngestStatus status, uint64_t id, std::string reason = {}) {
  IngestOutcome outcome;
  outcome.set_status(status);
  outcome.set_id(id);
  outcome.set_reason(std::move(reason));
  return outcome;
}

IngestOutcome ObservationOutcome(const signal::ObservationIngest& result) {
  return Outcome(result.stored ? INGEST_STATUS_INSERTED : INGEST_STATUS_DUPLICATE, result.asset_id);
}

} // namespace

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.engine || !ctx_.catalog || !ctx_.content || !ctx_.repository) {
    throw std::invalid_argument("IngestService requires engine, catalog, content and repository");
  }
}

IngestOutcome IngestService::IngestObservation(const IngestObservationRequest& req) {
  return ObserveRpc("IngestService.IngestObservation", [&] {
    if (!req.has_observation()) {
      return Outcome(INGEST_STATUS_REJECTED, 0, "observation is required");
    }
    const auto& observation = req.observation();
    try {
      return ObservationOutcome(ctx_.engine->IngestBySymbol(observation.symbol(), FromProto(observation), observation.name(), observation.slug()));
    } catch (const util::InvalidObservation& e) {
      return Outcome(INGEST_STATUS_REJECTED, 0, e.what());
    }
  });
}

IngestOutcome IngestService::CorrectObservation(const CorrectObservationRequest& req) {
  return ObserveRpc("IngestService.CorrectObservation", [&] {
    if (!req.has_observation()) {
      return Outcome(INGEST_STATUS_REJECTED, 0, "observation is required");
    }
    const auto& observation = req.observation();
    const auto  asset       = ctx_.catalog->FindAsset(observation.symbol());
    if (!asset) {
      throw util::NotFound("unknown asset symbol: " + observation.symbol());
    }
    try {
      return ObservationOutcome(ctx_.engine->CorrectObservation(asset->id, FromProto(observation)));
    } catch (const util::InvalidObservation& e) {
      return Outcome(INGEST_STATUS_REJECTED, asset->id, e.what());
    }
  });
}

IngestOutcome IngestService::IngestArticle(const IngestArticleRequest& req) {
  return ObserveRpc("IngestService.IngestArticle", [&] {
    content::ArticleInput input;
    input.source_name  = req.source_name();
    input.title        = req.title();
    input.url          = req.url();
    input.published_ms = req.published_ms();
    input.summary      = req.summary();
    input.content      = req.content();
    input.image_url    = req.image_url();
    input.image_alt    = req.image_alt();
    input.categories.assign(req.categories().begin(), req.categories().end());

    const auto result = ctx_.content->IngestArticle(input);
    switch (result.status) {
      case content::IngestStatus::kInserted:
        return Outcome(INGEST_STATUS_INSERTED, result.article_id);
      case content::IngestStatus::kDuplicate:
        return Outcome(INGEST_STATUS_DUPLICATE, result.article_id);
      case content::IngestStatus::kRejected:
        break;
    }
    return Outcome(INGEST_STATUS_REJECTED, 0, result.reason);
  });
}

RecordMentionResponse IngestService::RecordMention(const RecordMentionRequest& req) {
  return ObserveRpc("IngestService.RecordMention", [&] {
    if (!req.has_mention()) {
      throw util::InvalidArgument("mention is required");
    }
    const auto& mention = req.mention();
    const auto  count   = mention.mention_count() == 0 ? 1u : mention.mention_count();

    RecordMentionResponse resp;
    *resp.mutable_mention() =
        ToProto(ctx_.content->RecordMention(mention.article_id(), FromProto(mention.asset_type()), mention.asset_symbol(), count, mention.is_primary()));
    return resp;
  });
}

UpdateSentimentResponse IngestService::UpdateSentiment(const UpdateSentimentRequest& req) {
  return ObserveRpc("IngestService.UpdateSentiment", [&] {
    ctx_.content->UpdateSentiment(req.article_id(), req.score(), req.label());

    auto article = ctx_.content->GetArticle(req.article_id());
    if (!article) {
      throw util::NotFound("article not found: " + std::to_string(req.article_id()));
    }

    std::string              source_name;
    std::vector<std::string> categories;
    {
      auto tx = ctx_.repository->Begin();
      if (auto source = ctx_.repository->GetSourceById(*tx, article->source_id)) {
        source_name = source->name;
      }
      for (const auto& category : ctx_.repository->GetArticleCategories(*tx, article->id)) {
        categories.push_back(category.name);
      }
      tx->Commit();
    }

    UpdateSentimentResponse resp;
    *resp.mutable_article() = ToProto(*article, source_name, categories);
    return resp;
  });
}

} // namespace omni::service
