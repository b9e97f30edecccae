#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

namespace edgesync::runtime::config {
class ServerConfig;
}

namespace edgesync::runtime {

struct ServerOptions {
  std::string               tls_cert_path;
  std::string               tls_key_path;
  int                       max_message_bytes = 16 * 1024 * 1024;
  std::chrono::milliseconds shutdown_grace{2000};

  static ServerOptions FromConfig(const config::ServerConfig& config);
};

/*
  Hosts the gateway ingestion services. Plaintext unless a certificate
  and key are configured.
*/
class Server {
 public:
  Server(std::string bind_address, std::vector<std::shared_ptr<grpc::Service>> services, ServerOptions options = {});
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();

  // in-flight uploads get shutdown_grace to finish
  void Stop();

  // Port actually bound; useful with "host:0".
  int Port() const {
    return port_;
  }

 private:
  std::shared_ptr<grpc::ServerCredentials> Credentials() const;

  std::string                                 bind_address_;
  std::vector<std::shared_ptr<grpc::Service>> services_;
  ServerOptions                               options_;
  std::unique_ptr<grpc::Server>               grpc_server_;
  int                                         port_ = 0;
};

} // namespace edgesync::runtime
