#include "server.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace edgesync::runtime {

namespace {

std::string ReadPem(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot read " + path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

} // namespace

ServerOptions ServerOptions::FromConfig(const config::ServerConfig& config) {
  ServerOptions options;
  options.tls_cert_path = config.tls_cert_path();
  options.tls_key_path  = config.tls_key_path();
  if (config.max_message_bytes() > 0) options.max_message_bytes = static_cast<int>(config.max_message_bytes());
  if (config.shutdown_grace_ms() > 0) options.shutdown_grace = std::chrono::milliseconds(config.shutdown_grace_ms());
  return options;
}

Server::Server(std::string bind_address, std::vector<std::shared_ptr<grpc::Service>> services, ServerOptions options)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), options_(std::move(options)) {
}

Server::~Server() {
  Stop();
}

std::shared_ptr<grpc::ServerCredentials> Server::Credentials() const {
  if (options_.tls_cert_path.empty() && options_.tls_key_path.empty()) {
    EDGESYNC_LOG_WARN("gateway serving plaintext", {observability::StringField("bind_address", bind_address_)});
    return grpc::InsecureServerCredentials();
  }
  if (options_.tls_cert_path.empty() || options_.tls_key_path.empty()) {
    throw std::invalid_argument("server TLS needs both tls_cert_path and tls_key_path");
  }

  grpc::SslServerCredentialsOptions ssl;
  ssl.pem_key_cert_pairs.push_back({ReadPem(options_.tls_key_path), ReadPem(options_.tls_cert_path)});
  return grpc::SslServerCredentials(ssl);
}

void Server::Start() {
  grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, Credentials(), &port_);
  builder.SetMaxReceiveMessageSize(options_.max_message_bytes);
  builder.SetMaxSendMessageSize(options_.max_message_bytes);

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || port_ == 0) {
    throw std::runtime_error("cannot start gateway server on " + bind_address_);
  }

  EDGESYNC_LOG_INFO("gateway listening", {observability::StringField("bind_address", bind_address_), observability::IntField("port", port_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;
  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();
}

} // namespace edgesync::runtime
