#pragma once

#include "omni/v1.hpp"
#include "service_context.hpp"

namespace omni::service {

/*
  Write side of the API.

  Feed rejections (malformed observations, unknown sources, bad urls) come
  back as IngestOutcome REJECTED; duplicates as DUPLICATE. Everything else
  that fails throws and is mapped to a status by the transport.
*/
class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  omni::v1::IngestOutcome IngestObservation(const omni::v1::IngestObservationRequest& req);

  omni::v1::IngestOutcome CorrectObservation(const omni::v1::CorrectObservationRequest& req);

  omni::v1::IngestOutcome IngestArticle(const omni::v1::IngestArticleRequest& req);

  omni::v1::RecordMentionResponse RecordMention(const omni::v1::RecordMentionRequest& req);

  omni::v1::UpdateSentimentResponse UpdateSentiment(const omni::v1::UpdateSentimentRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace omni::service
