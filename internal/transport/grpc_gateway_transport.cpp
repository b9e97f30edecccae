#include "grpc_gateway_transport.hpp"

#include <fstream>
#include <sstream>

#include "internal/codec/record_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace edgesync::transport {

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::shared_ptr<grpc::ChannelCredentials> MakeCredentials(const GrpcTransportOptions& options) {
  if (!options.use_tls) {
    return grpc::InsecureChannelCredentials();
  }
  grpc::SslCredentialsOptions ssl;
  if (!options.root_cert_path.empty()) {
    ssl.pem_root_certs = ReadFile(options.root_cert_path);
  }
  return grpc::SslCredentials(ssl);
}

void SetDeadline(grpc::ClientContext& ctx, std::chrono::milliseconds timeout) {
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
}

std::string Describe(const grpc::Status& status) {
  return std::to_string(static_cast<int>(status.error_code())) + " " + status.error_message();
}

} // namespace

GrpcGatewayTransport::GrpcGatewayTransport(GrpcTransportOptions options) : options_(std::move(options)) {
}

void GrpcGatewayTransport::Connect(std::chrono::milliseconds timeout) {
  auto channel = grpc::CreateChannel(options_.address, MakeCredentials(options_));
  if (!channel->WaitForConnected(std::chrono::system_clock::now() + timeout)) {
    throw util::ConnectionLost("gateway " + options_.address + " unreachable");
  }

  std::lock_guard lock(mutex_);
  channel_ = std::move(channel);
  stub_    = edgesync::v1::SyncGatewayService::NewStub(channel_);
}

std::shared_ptr<edgesync::v1::SyncGatewayService::Stub> GrpcGatewayTransport::Stub() {
  std::lock_guard lock(mutex_);
  if (!stub_) {
    throw util::ConnectionLost("transport not connected");
  }
  return stub_;
}

AuthResult GrpcGatewayTransport::Authenticate(const AuthRequest& request, std::chrono::milliseconds timeout) {
  auto stub = Stub();

  edgesync::v1::AuthenticateRequest req;
  req.set_node_id(request.node_id);
  req.set_public_key(std::string(reinterpret_cast<const char*>(request.public_key.data()), request.public_key.size()));
  req.set_token(request.token);
  req.set_last_sequence(request.head.last_sequence);
  req.set_last_hash(std::string(reinterpret_cast<const char*>(request.head.last_hash.data()), request.head.last_hash.size()));
  req.set_node_time_ms(request.node_time_ms);

  edgesync::v1::AuthenticateResponse resp;
  grpc::ClientContext                ctx;
  SetDeadline(ctx, timeout);

  const auto status = stub->Authenticate(&ctx, req, &resp);
  if (!status.ok()) {
    if (status.error_code() == grpc::StatusCode::UNAUTHENTICATED || status.error_code() == grpc::StatusCode::PERMISSION_DENIED) {
      throw util::AuthenticationFailed(status.error_message());
    }
    throw util::ConnectionLost("authenticate failed: " + Describe(status));
  }

  return AuthResult{resp.session_id(), resp.gateway_time_ms(), resp.last_stored_sequence()};
}

SendResult GrpcGatewayTransport::Send(const std::string& session_id, const model::SyncRecord& record, std::chrono::milliseconds timeout) {
  SendResult result;

  std::shared_ptr<edgesync::v1::SyncGatewayService::Stub> stub;
  try {
    stub = Stub();
  } catch (const util::ConnectionLost& e) {
    result.detail = e.what();
    return result;
  }

  edgesync::v1::SubmitRequest req;
  req.set_session_id(session_id);
  req.set_record(codec::EncodeWire(record));

  edgesync::v1::SubmitResponse resp;
  grpc::ClientContext          ctx;
  SetDeadline(ctx, timeout);

  const auto started = util::SteadyClock::now();
  const auto status  = stub->Submit(&ctx, req, &resp);
  result.latency     = std::chrono::duration_cast<std::chrono::milliseconds>(util::SteadyClock::now() - started);

  if (!status.ok()) {
    result.status = status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED ? SendStatus::kTimeout : SendStatus::kTransportError;
    result.detail = Describe(status);
    return result;
  }

  if (resp.record_id().size() == record.id.size()) {
    result.record_id = util::FromBytes(resp.record_id());
  }
  result.reason = resp.reason();
  result.detail = resp.detail();
  result.status = resp.status() == edgesync::v1::ACK_STATUS_ACCEPTED ? SendStatus::kAcked : SendStatus::kRejected;
  return result;
}

std::vector<std::string> GrpcGatewayTransport::FetchDownlink(const std::string& session_id, std::uint32_t max_records,
                                                             std::chrono::milliseconds timeout) {
  auto stub = Stub();

  edgesync::v1::FetchDownlinkRequest req;
  req.set_session_id(session_id);
  req.set_max_records(max_records);

  edgesync::v1::FetchDownlinkResponse resp;
  grpc::ClientContext                 ctx;
  SetDeadline(ctx, timeout);

  const auto status = stub->FetchDownlink(&ctx, req, &resp);
  if (!status.ok()) {
    throw util::ConnectionLost("fetch downlink failed: " + Describe(status));
  }
  return {resp.records().begin(), resp.records().end()};
}

void GrpcGatewayTransport::Close() {
  std::lock_guard lock(mutex_);
  stub_.reset();
  channel_.reset();
}

} // namespace edgesync::transport
