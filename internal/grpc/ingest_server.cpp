#include "ingest_server.hpp"

#include "grpc_error.hpp"

namespace omni::grpc {

IngestServer::IngestServer(std::shared_ptr<omni::service::IngestService> svc) : service_(std::move(svc)) {
}

::grpc::Status IngestServer::IngestObservation(::grpc::ServerContext*, const omni::v1::IngestObservationRequest* req, omni::v1::IngestOutcome* resp) {
  try {
    *resp = service_->IngestObservation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::CorrectObservation(::grpc::ServerContext*, const omni::v1::CorrectObservationRequest* req, omni::v1::IngestOutcome* resp) {
  try {
    *resp = service_->CorrectObservation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::IngestArticle(::grpc::ServerContext*, const omni::v1::IngestArticleRequest* req, omni::v1::IngestOutcome* resp) {
  try {
    *resp = service_->IngestArticle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::RecordMention(::grpc::ServerContext*, const omni::v1::RecordMentionRequest* req, omni::v1::RecordMentionResponse* resp) {
  try {
    *resp = service_->RecordMention(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::UpdateSentiment(::grpc::ServerContext*, const omni::v1::UpdateSentimentRequest* req,
                                             omni::v1::UpdateSentimentResponse* resp) {
  try {
    *resp = service_->UpdateSentiment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace omni::grpc
