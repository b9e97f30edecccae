#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace edgesync::grpc {

/*
  Gateway side: maps a failure while handling an ingestion RPC onto the
  status code a node's transport interprets. UNAUTHENTICATED makes the
  node stop and re-authenticate; everything else is a transient link
  failure from its point of view.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace edgesync::grpc
