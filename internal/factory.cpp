#include "factory.hpp"

#include <stdexcept>

#include "internal/chain/chain_verifier.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transport/grpc_gateway_transport.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace edgesync::factory {

using edgesync::runtime::config::RuntimeConfig;
using observability::StringField;
using observability::UintField;

namespace {

bool IsUplink(edgesync::v1::MessageType type) {
  return type >= edgesync::v1::MESSAGE_TYPE_EVIDENCE && type <= edgesync::v1::MESSAGE_TYPE_DEBUG_LOG;
}

void RebuildQueue(store::LocalDataStore& store, queue::PriorityQueueManager& queue) {
  for (std::uint8_t p = 0; p < model::kPriorityCount; ++p) {
    for (auto& record : store.IterByPriority(p)) {
      queue.Enqueue(std::move(record));
    }
  }
}

} // namespace

std::shared_ptr<db::RecordRepository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    db::sqlite::SqliteDB::Options options;
    options.synchronous_full = !database.sqlite().synchronous_normal();
    if (database.sqlite().busy_timeout_ms() > 0) options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  EDGESYNC_LOG_WARN("using in-memory record store; records do not survive restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<store::LocalDataStore> BuildStore(const RuntimeConfig& config) {
  return std::make_shared<store::LocalDataStore>(BuildRepository(config), config.storage().quota_bytes());
}

std::shared_ptr<const crypto::Ed25519Signer> LoadNodeKey(const RuntimeConfig& config) {
  const auto& path = config.node().private_key_path();
  if (path.empty()) {
    EDGESYNC_LOG_WARN("node.private_key_path not set, using an ephemeral signing key");
    return crypto::Ed25519Signer::Generate();
  }
  return crypto::Ed25519Signer::LoadOrCreatePem(path);
}

std::unique_ptr<EdgeNode> BuildNode(const RuntimeConfig& config, std::shared_ptr<transport::GatewayTransport> transport) {
  auto node = std::make_unique<EdgeNode>();

  // ------------------------------------------------------------------
  // Storage + chain
  // ------------------------------------------------------------------
  node->store         = BuildStore(config);
  node->payload_codec = std::make_unique<codec::PayloadCodec>(codec::PayloadCodec::FromConfig(config.storage().compression()));

  auto signer = LoadNodeKey(config);
  node->chain = std::make_shared<chain::ChainBuilder>(node->store, signer);
  node->queue = std::make_shared<queue::PriorityQueueManager>();

  std::weak_ptr<queue::PriorityQueueManager> weak_queue = node->queue;
  node->store->SetEvictionListener([weak_queue](const std::vector<model::RecordId>& evicted) {
    if (auto q = weak_queue.lock()) q->RemoveAll(evicted);
  });

  // Rows chained by an earlier run first, then anything a crash left unchained.
  RebuildQueue(*node->store, *node->queue);
  node->chain->ResumePending([&](const model::SyncRecord& record) { node->queue->Enqueue(record); });

  EDGESYNC_LOG_INFO("record queue rebuilt", {UintField("queued", node->queue->TotalLen()),
                                             UintField("used_bytes", node->store->UsedBytes())});

  // ------------------------------------------------------------------
  // Link
  // ------------------------------------------------------------------
  if (!transport) {
    transport::GrpcTransportOptions options;
    options.address        = config.gateway().address();
    options.use_tls        = config.gateway().use_tls();
    options.root_cert_path = config.gateway().root_cert_path();
    transport              = std::make_shared<transport::GrpcGatewayTransport>(std::move(options));
  }
  node->transport = transport;

  std::weak_ptr<chain::ChainBuilder> weak_chain = node->chain;
  node->connection = std::make_shared<connection::ConnectionManager>(
      transport, signer->Public(),
      [weak_chain] {
        auto c = weak_chain.lock();
        return c ? c->Head() : model::ChainState{};
      },
      connection::ConnectionOptions::FromConfig(config));

  node->clock = std::make_shared<sync::ClockDriftMonitor>(std::chrono::milliseconds(config.clock().drift_threshold_ms()));
  std::weak_ptr<sync::ClockDriftMonitor> weak_clock = node->clock;
  node->connection->SetAuthListener([weak_clock](const transport::AuthResult& auth) {
    if (auto c = weak_clock.lock()) c->Observe(auth.gateway_time_ms, util::ToUnixMillis(util::Now()));
  });

  // ------------------------------------------------------------------
  // Downlink
  // ------------------------------------------------------------------
  std::optional<crypto::PublicKey> gateway_key;
  if (!config.node().gateway_public_key_path().empty()) {
    gateway_key = crypto::LoadPublicKey(config.node().gateway_public_key_path());
  } else {
    EDGESYNC_LOG_WARN("node.gateway_public_key_path not set, downlink signatures are not checked");
  }
  node->downlink = std::make_shared<sync::DownlinkDispatcher>(gateway_key);
  node->downlink->Register(edgesync::v1::MESSAGE_TYPE_TIME_SYNC, [weak_clock](const model::SyncRecord&, const std::string& payload) {
    if (payload.size() != 8) {
      throw util::CodecError("time sync payload must be 8 bytes");
    }
    if (auto c = weak_clock.lock()) c->Observe(util::ReadU64BE(payload), util::ToUnixMillis(util::Now()));
  });

  // ------------------------------------------------------------------
  // Engine + ingest
  // ------------------------------------------------------------------
  auto options = sync::SyncEngineOptions::FromConfig(config);
  std::optional<chain::ChainVerifier> verifier;
  if (options.self_check) verifier.emplace(signer->Public());

  node->engine = std::make_shared<sync::SyncEngine>(node->store, node->queue, node->connection, transport, std::move(verifier),
                                                    node->downlink, options);

  node->ingest_queue = std::make_shared<ingest::IngestQueue>(config.ingest().capacity());
  std::weak_ptr<sync::SyncEngine> weak_engine = node->engine;
  node->ingest_worker = std::make_shared<ingest::IngestWorker>(node->ingest_queue, node->store, node->chain, node->queue, [weak_engine] {
    if (auto e = weak_engine.lock()) e->Wake();
  });

  return node;
}

EdgeNode::~EdgeNode() {
  Stop();
}

void EdgeNode::Start() {
  if (started_) return;
  ingest_worker->Start();
  engine->Start();
  started_ = true;
}

void EdgeNode::Stop() {
  if (!started_) return;
  // Drain producer handoff first so accepted records reach the store.
  ingest_worker->Stop();
  engine->Stop();
  transport->Close();
  started_ = false;
}

PublishResult EdgeNode::Publish(std::uint8_t priority, edgesync::v1::MessageType type, std::string_view payload) {
  if (!model::IsValidPriority(priority)) {
    throw std::invalid_argument("priority out of range: " + std::to_string(priority));
  }
  if (!IsUplink(type)) {
    throw std::invalid_argument("not an uplink message type: " + edgesync::v1::MessageType_Name(type));
  }

  const auto now = util::Now();

  model::SyncRecord record;
  record.id           = util::GenerateUUIDv7(now);
  record.priority     = priority;
  record.msg_type     = type;
  record.payload      = payload_codec->Compress(payload);
  record.digest       = codec::PayloadCodec::Digest(payload);
  record.timestamp_ms = util::ToUnixMillis(now);

  PublishResult result;
  result.id      = record.id;
  result.outcome = ingest_queue->Offer(std::move(record));
  return result;
}

} // namespace edgesync::factory
