#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/query_service.hpp"
#include "omni/v1/query_service.grpc.pb.h"

namespace omni::grpc {

class QueryServer final : public omni::v1::QueryService::Service {
 public:
  explicit QueryServer(std::shared_ptr<omni::service::QueryService> svc);

  ::grpc::Status LatestSignal(::grpc::ServerContext*, const omni::v1::LatestSignalRequest*, omni::v1::LatestSignalResponse*) override;

  ::grpc::Status SignalHistory(::grpc::ServerContext*, const omni::v1::SignalHistoryRequest*, omni::v1::SignalHistoryResponse*) override;

  ::grpc::Status ObservationHistory(::grpc::ServerContext*, const omni::v1::ObservationHistoryRequest*,
                                    omni::v1::ObservationHistoryResponse*) override;

  ::grpc::Status LatestObservation(::grpc::ServerContext*, const omni::v1::LatestObservationRequest*, omni::v1::LatestObservationResponse*) override;

  ::grpc::Status SearchNews(::grpc::ServerContext*, const omni::v1::SearchNewsRequest*, omni::v1::SearchNewsResponse*) override;

  ::grpc::Status AssetsMentionedIn(::grpc::ServerContext*, const omni::v1::AssetsMentionedInRequest*, omni::v1::AssetsMentionedInResponse*) override;

  ::grpc::Status RecentNews(::grpc::ServerContext*, const omni::v1::RecentNewsRequest*, omni::v1::NewsResponse*) override;

  ::grpc::Status AssetNews(::grpc::ServerContext*, const omni::v1::AssetNewsRequest*, omni::v1::NewsResponse*) override;

  ::grpc::Status AssetOutlook(::grpc::ServerContext*, const omni::v1::AssetOutlookRequest*, omni::v1::AssetOutlookResponse*) override;

 private:
  std::shared_ptr<omni::service::QueryService> service_;
};

} // namespace omni::grpc
