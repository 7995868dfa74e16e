#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/ingest_service.hpp"
#include "omni/v1/ingest_service.grpc.pb.h"

namespace omni::grpc {

class IngestServer final : public omni::v1::IngestService::Service {
 public:
  explicit IngestServer(std::shared_ptr<omni::service::IngestService> svc);

  ::grpc::Status IngestObservation(::grpc::ServerContext*, const omni::v1::IngestObservationRequest*, omni::v1::IngestOutcome*) override;

  ::grpc::Status CorrectObservation(::grpc::ServerContext*, const omni::v1::CorrectObservationRequest*, omni::v1::IngestOutcome*) override;

  ::grpc::Status IngestArticle(::grpc::ServerContext*, const omni::v1::IngestArticleRequest*, omni::v1::IngestOutcome*) override;

  ::grpc::Status RecordMention(::grpc::ServerContext*, const omni::v1::RecordMentionRequest*, omni::v1::RecordMentionResponse*) override;

  ::grpc::Status UpdateSentiment(::grpc::ServerContext*, const omni::v1::UpdateSentimentRequest*, omni::v1::UpdateSentimentResponse*) override;

 private:
  std::shared_ptr<omni::service::IngestService> service_;
};

} // namespace omni::grpc
