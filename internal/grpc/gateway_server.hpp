#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "edgesync/v1/gateway_service.grpc.pb.h"
#include "internal/service/gateway_service.hpp"

namespace edgesync::grpc {

class GatewayServer final : public edgesync::v1::SyncGatewayService::Service {
public:
  explicit GatewayServer(std::shared_ptr<edgesync::service::GatewayService> svc);

  ::grpc::Status Authenticate(::grpc::ServerContext*,
                              const edgesync::v1::AuthenticateRequest*,
                              edgesync::v1::AuthenticateResponse*) override;

  ::grpc::Status Submit(::grpc::ServerContext*,
                        const edgesync::v1::SubmitRequest*,
                        edgesync::v1::SubmitResponse*) override;

  ::grpc::Status FetchDownlink(::grpc::ServerContext*,
                               const edgesync::v1::FetchDownlinkRequest*,
                               edgesync::v1::FetchDownlinkResponse*) override;

private:
  std::shared_ptr<edgesync::service::GatewayService> service_;
};

}
