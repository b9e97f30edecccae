#include "gateway_server.hpp"

#include "grpc_error.hpp"
#include "edgesync/v1.hpp"

namespace edgesync::grpc {

GatewayServer::GatewayServer(std::shared_ptr<edgesync::service::GatewayService> svc) : service_(std::move(svc)) {
}

::grpc::Status GatewayServer::Authenticate(::grpc::ServerContext*, const edgesync::v1::AuthenticateRequest* req,
                                           edgesync::v1::AuthenticateResponse* resp) {
  try {
    *resp = service_->Authenticate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GatewayServer::Submit(::grpc::ServerContext*, const edgesync::v1::SubmitRequest* req, edgesync::v1::SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GatewayServer::FetchDownlink(::grpc::ServerContext*, const edgesync::v1::FetchDownlinkRequest* req,
                                            edgesync::v1::FetchDownlinkResponse* resp) {
  try {
    *resp = service_->FetchDownlink(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace edgesync::grpc
