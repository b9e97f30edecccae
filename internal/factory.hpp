#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/chain/chain_builder.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/connection/connection_manager.hpp"
#include "internal/db/api/record_repository.hpp"
#include "internal/ingest/ingest_queue.hpp"
#include "internal/ingest/ingest_worker.hpp"
#include "internal/queue/priority_queue_manager.hpp"
#include "internal/store/local_data_store.hpp"
#include "internal/sync/clock_drift_monitor.hpp"
#include "internal/sync/downlink_dispatcher.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/transport/gateway_transport.hpp"

namespace edgesync::factory {

struct PublishResult {
  model::RecordId     id{};
  ingest::OfferResult outcome = ingest::OfferResult::kAccepted;
};

/*
  EdgeNode

  Owns every long-lived component of a field node. Producers call Publish
  from any thread; it never blocks on storage or network.
*/
class EdgeNode {
 public:
  EdgeNode() = default;
  ~EdgeNode();

  EdgeNode(const EdgeNode&)            = delete;
  EdgeNode& operator=(const EdgeNode&) = delete;

  void Start();
  void Stop();

  PublishResult Publish(std::uint8_t priority, edgesync::v1::MessageType type, std::string_view payload);

  std::shared_ptr<store::LocalDataStore>         store;
  std::shared_ptr<chain::ChainBuilder>           chain;
  std::shared_ptr<queue::PriorityQueueManager>   queue;
  std::shared_ptr<transport::GatewayTransport>   transport;
  std::shared_ptr<connection::ConnectionManager> connection;
  std::shared_ptr<sync::ClockDriftMonitor>       clock;
  std::shared_ptr<sync::DownlinkDispatcher>      downlink;
  std::shared_ptr<sync::SyncEngine>              engine;
  std::shared_ptr<ingest::IngestQueue>           ingest_queue;
  std::shared_ptr<ingest::IngestWorker>          ingest_worker;

  std::unique_ptr<codec::PayloadCodec> payload_codec;

 private:
  bool started_ = false;
};

/*
  Composition root. The ONLY place allowed to know concrete DB and
  transport types.
*/
std::shared_ptr<db::RecordRepository> BuildRepository(const edgesync::runtime::config::RuntimeConfig& config);

std::shared_ptr<store::LocalDataStore> BuildStore(const edgesync::runtime::config::RuntimeConfig& config);

std::shared_ptr<const crypto::Ed25519Signer> LoadNodeKey(const edgesync::runtime::config::RuntimeConfig& config);

// transport == nullptr builds the gRPC transport from config.gateway.
std::unique_ptr<EdgeNode> BuildNode(const edgesync::runtime::config::RuntimeConfig& config,
                                    std::shared_ptr<transport::GatewayTransport> transport = nullptr);

} // namespace edgesync::factory
