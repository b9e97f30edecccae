#pragma once

#include "edgesync/v1/types.pb.h"
#include "edgesync/v1/gateway_service.pb.h"
#include "edgesync/v1/gateway_service.grpc.pb.h"
