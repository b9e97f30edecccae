#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <mutex>
#include <string>

#include "edgesync/v1.hpp"
#include "internal/transport/gateway_transport.hpp"

namespace edgesync::transport {

struct GrpcTransportOptions {
  std::string address;
  bool        use_tls = false;
  std::string root_cert_path; // empty = system roots
};

/*
  GatewayTransport over the SyncGatewayService gRPC API. Every call carries
  a deadline; a deadline miss on Submit is reported as kTimeout.
*/
class GrpcGatewayTransport final : public GatewayTransport {
 public:
  explicit GrpcGatewayTransport(GrpcTransportOptions options);

  void       Connect(std::chrono::milliseconds timeout) override;
  AuthResult Authenticate(const AuthRequest& request, std::chrono::milliseconds timeout) override;
  SendResult Send(const std::string& session_id, const model::SyncRecord& record, std::chrono::milliseconds timeout) override;
  std::vector<std::string> FetchDownlink(const std::string& session_id, std::uint32_t max_records,
                                         std::chrono::milliseconds timeout) override;
  void                     Close() override;

 private:
  std::shared_ptr<edgesync::v1::SyncGatewayService::Stub> Stub();

  GrpcTransportOptions options_;

  std::mutex                                              mutex_;
  std::shared_ptr<grpc::Channel>                          channel_;
  std::shared_ptr<edgesync::v1::SyncGatewayService::Stub> stub_;
};

} // namespace edgesync::transport
