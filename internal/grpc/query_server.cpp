#include "query_server.hpp"

#include "grpc_error.hpp"

namespace omni::grpc {

QueryServer::QueryServer(std::shared_ptr<omni::service::QueryService> svc) : service_(std::move(svc)) {
}

::grpc::Status QueryServer::LatestSignal(::grpc::ServerContext*, const omni::v1::LatestSignalRequest* req, omni::v1::LatestSignalResponse* resp) {
  try {
    *resp = service_->LatestSignal(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::SignalHistory(::grpc::ServerContext*, const omni::v1::SignalHistoryRequest* req, omni::v1::SignalHistoryResponse* resp) {
  try {
    *resp = service_->SignalHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::ObservationHistory(::grpc::ServerContext*, const omni::v1::ObservationHistoryRequest* req,
                                               omni::v1::ObservationHistoryResponse* resp) {
  try {
    *resp = service_->ObservationHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::LatestObservation(::grpc::ServerContext*, const omni::v1::LatestObservationRequest* req,
                                              omni::v1::LatestObservationResponse* resp) {
  try {
    *resp = service_->LatestObservation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::SearchNews(::grpc::ServerContext*, const omni::v1::SearchNewsRequest* req, omni::v1::SearchNewsResponse* resp) {
  try {
    *resp = service_->SearchNews(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::AssetsMentionedIn(::grpc::ServerContext*, const omni::v1::AssetsMentionedInRequest* req,
                                              omni::v1::AssetsMentionedInResponse* resp) {
  try {
    *resp = service_->AssetsMentionedIn(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::RecentNews(::grpc::ServerContext*, const omni::v1::RecentNewsRequest* req, omni::v1::NewsResponse* resp) {
  try {
    *resp = service_->RecentNews(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::AssetNews(::grpc::ServerContext*, const omni::v1::AssetNewsRequest* req, omni::v1::NewsResponse* resp) {
  try {
    *resp = service_->AssetNews(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::AssetOutlook(::grpc::ServerContext*, const omni::v1::AssetOutlookRequest* req, omni::v1::AssetOutlookResponse* resp) {
  try {
    *resp = service_->AssetOutlook(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace omni::grpc
