#pragma once

#include "omni/v1.hpp"
#include "service_context.hpp"

namespace omni::service {

/*
  Read side of the API. Zero limits and top_k fall back to defaults.
*/
class QueryService {
 public:
  explicit QueryService(ServiceContext ctx);

  omni::v1::LatestSignalResponse LatestSignal(const omni::v1::LatestSignalRequest& req);

  omni::v1::SignalHistoryResponse SignalHistory(const omni::v1::SignalHistoryRequest& req);

  omni::v1::ObservationHistoryResponse ObservationHistory(const omni::v1::ObservationHistoryRequest& req);

  omni::v1::LatestObservationResponse LatestObservation(const omni::v1::LatestObservationRequest& req);

  omni::v1::SearchNewsResponse SearchNews(const omni::v1::SearchNewsRequest& req);

  omni::v1::AssetsMentionedInResponse AssetsMentionedIn(const omni::v1::AssetsMentionedInRequest& req);

  omni::v1::NewsResponse RecentNews(const omni::v1::RecentNewsRequest& req);

  omni::v1::NewsResponse AssetNews(const omni::v1::AssetNewsRequest& req);

  omni::v1::AssetOutlookResponse AssetOutlook(const omni::v1::AssetOutlookRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace omni::service
