#include "sync_engine.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::sync {

using observability::IntField;
using observability::StringField;
using observability::UintField;
using transport::SendStatus;

SyncEngineOptions SyncEngineOptions::FromConfig(const edgesync::runtime::config::RuntimeConfig& config) {
  const auto&       sync = config.sync();
  SyncEngineOptions options;
  options.tick_interval                = std::chrono::milliseconds(sync.tick_interval_ms());
  options.authenticated_budget         = sync.authenticated_budget();
  options.degraded_budget              = sync.degraded_budget();
  options.persistent_failure_threshold = sync.persistent_failure_threshold();
  options.self_check                   = sync.self_check();
  options.ack_timeout                  = std::chrono::milliseconds(config.gateway().ack_timeout_ms());
  options.eviction_interval            = std::chrono::milliseconds(sync.eviction_interval_ms());
  options.downlink_interval            = std::chrono::milliseconds(sync.downlink_interval_ms());
  options.downlink_batch               = sync.downlink_batch();
  return options;
}

SyncEngine::SyncEngine(std::shared_ptr<store::LocalDataStore> store, std::shared_ptr<queue::PriorityQueueManager> queue,
                       std::shared_ptr<connection::ConnectionManager> connection, std::shared_ptr<transport::GatewayTransport> transport,
                       std::optional<chain::ChainVerifier> verifier, std::shared_ptr<DownlinkDispatcher> downlink, SyncEngineOptions options)
    : store_(std::move(store)),
      queue_(std::move(queue)),
      connection_(std::move(connection)),
      transport_(std::move(transport)),
      verifier_(std::move(verifier)),
      downlink_(std::move(downlink)),
      options_(options) {
  if (!store_ || !queue_ || !connection_ || !transport_) {
    throw std::invalid_argument("SyncEngine: store, queue, connection and transport are required");
  }
  if (options_.self_check && !verifier_) {
    throw std::invalid_argument("SyncEngine: self_check requires a verifier");
  }
}

SyncEngine::~SyncEngine() {
  Stop();
}

void SyncEngine::Start() {
  std::lock_guard lock(loop_mutex_);
  if (thread_.joinable()) return;
  stopped_ = false;
  thread_  = std::thread(&SyncEngine::Run, this);
}

void SyncEngine::Stop() {
  {
    std::lock_guard lock(loop_mutex_);
    stopped_ = true;
  }
  loop_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void SyncEngine::Wake() {
  {
    std::lock_guard lock(loop_mutex_);
    wake_ = true;
  }
  loop_cv_.notify_all();
}

void SyncEngine::Run() {
  EDGESYNC_LOG_INFO("sync engine started", {UintField("tick_ms", static_cast<std::uint64_t>(options_.tick_interval.count()))});

  while (true) {
    {
      std::unique_lock lock(loop_mutex_);
      loop_cv_.wait_for(lock, options_.tick_interval, [&] { return stopped_ || wake_; });
      if (stopped_) break;
      wake_ = false;
    }

    try {
      Tick(util::SteadyClock::now());
    } catch (const util::ChainIntegrityViolation& e) {
      Halt(e.what(), e.Sequence());
    } catch (const std::exception& e) {
      EDGESYNC_LOG_ERROR("sync tick failed", {StringField("error", e.what())});
      std::lock_guard lock(stats_mutex_);
      stats_.last_error = e.what();
    }
  }

  EDGESYNC_LOG_INFO("sync engine stopped");
}

void SyncEngine::Tick(util::SteadyTimePoint now) {
  if (halted_) return;

  {
    std::lock_guard lock(stats_mutex_);
    ++stats_.ticks;
  }

  if (!next_eviction_ || now >= *next_eviction_) {
    RunEviction();
    next_eviction_ = now + options_.eviction_interval;
  }

  if (!connection_->CanSend()) {
    connection_->Reconnect(now);
    return;
  }

  const auto state   = connection_->State();
  const auto session = connection_->SessionId();
  if (!session) return;

  std::uint32_t budget = options_.authenticated_budget;
  if (std::holds_alternative<connection::Degraded>(state)) {
    budget = options_.degraded_budget;
  }
  Drain(*session, budget);

  if (downlink_ && !halted_ && connection_->CanSend() && (!next_downlink_ || now >= *next_downlink_)) {
    next_downlink_ = now + options_.downlink_interval;
    PollDownlink(*session);
  }
}

void SyncEngine::RunEviction() {
  const auto evicted = store_->EvictExpired(util::Now());
  if (evicted == 0) return;

  std::lock_guard lock(stats_mutex_);
  stats_.evicted += evicted;
}

void SyncEngine::Drain(const std::string& session_id, std::uint32_t budget) {
  std::uint32_t sent = 0;

  for (std::uint8_t p = 0; p < model::kPriorityCount; ++p) {
    while (auto record = queue_->Peek(p)) {
      if (halted_) return;
      if (budget != 0 && sent >= budget) return;

      if (options_.self_check) {
        try {
          verifier_->VerifyRecord(*record);
        } catch (const util::ChainIntegrityViolation& e) {
          Halt(std::string("local self-check failed: ") + e.what(), e.Sequence());
          return;
        }
      }

      const auto result = transport_->Send(session_id, *record, options_.ack_timeout);
      ++sent;
      {
        std::lock_guard lock(stats_mutex_);
        ++stats_.sent;
      }

      switch (result.status) {
        case SendStatus::kAcked:
          if (result.record_id != record->id) {
            CountFailure(*record, "ack for unexpected id " + util::ToString(result.record_id));
            connection_->ReportSendResult(false, result.latency);
            return;
          }
          observability::Metrics::Instance().ObserveAckLatencyMs(static_cast<double>(result.latency.count()));
          connection_->ReportSendResult(true, result.latency);
          AcceptRemoval(*record);
          {
            std::lock_guard lock(stats_mutex_);
            ++stats_.acked;
          }
          break;

        case SendStatus::kRejected:
          switch (result.reason) {
            case edgesync::v1::REJECT_REASON_DUPLICATE:
              EDGESYNC_LOG_WARN("gateway already holds record, removing locally",
                                {StringField("record_id", util::ToString(record->id)), UintField("sequence", record->sequence)});
              connection_->ReportSendResult(true, result.latency);
              AcceptRemoval(*record);
              {
                std::lock_guard lock(stats_mutex_);
                ++stats_.duplicates;
              }
              break;
            case edgesync::v1::REJECT_REASON_BAD_SIGNATURE:
            case edgesync::v1::REJECT_REASON_SEQUENCE_GAP:
              Halt("gateway rejected record (" + edgesync::v1::RejectReason_Name(result.reason) + "): " + result.detail,
                   record->sequence);
              return;
            case edgesync::v1::REJECT_REASON_UNAUTHENTICATED:
              CountFailure(*record, "session rejected");
              connection_->ReportTransportFailure("session rejected by gateway");
              return;
            default:
              CountFailure(*record, "rejected: " + edgesync::v1::RejectReason_Name(result.reason) + " " + result.detail);
              connection_->ReportSendResult(false, result.latency);
              return;
          }
          break;

        case SendStatus::kTimeout:
          CountFailure(*record, "ack timeout");
          connection_->ReportSendResult(false, options_.ack_timeout);
          return;

        case SendStatus::kTransportError:
          CountFailure(*record, "transport error: " + result.detail);
          connection_->ReportTransportFailure(result.detail);
          return;
      }
    }
  }
}

void SyncEngine::AcceptRemoval(const model::SyncRecord& record) {
  queue_->Remove(record.id);
  if (!store_->Remove(record.id)) {
    EDGESYNC_LOG_DEBUG("acked record already evicted", {StringField("record_id", util::ToString(record.id))});
  }
  observability::Metrics::Instance().RecordSend(record.priority, true);
  if (failing_id_ == record.id) {
    failing_count_ = 0;
  }
}

void SyncEngine::CountFailure(const model::SyncRecord& record, const std::string& reason) {
  if (failing_id_ != record.id) {
    failing_id_    = record.id;
    failing_count_ = 0;
  }
  ++failing_count_;

  observability::Metrics::Instance().RecordSend(record.priority, false);
  {
    std::lock_guard lock(stats_mutex_);
    ++stats_.failures;
    stats_.last_error = reason;
  }

  const auto threshold = options_.persistent_failure_threshold;
  if (threshold != 0 && failing_count_ >= threshold && failing_count_ % threshold == 0) {
    EDGESYNC_LOG_WARN("record keeps failing to send",
                      {observability::AlertField("persistent_send_failure"), StringField("record_id", util::ToString(record.id)),
                       UintField("sequence", record.sequence), IntField("priority", record.priority),
                       UintField("consecutive_failures", failing_count_), StringField("reason", reason)});
  } else {
    EDGESYNC_LOG_DEBUG("send failed", {StringField("record_id", util::ToString(record.id)), StringField("reason", reason)});
  }
}

void SyncEngine::Halt(const std::string& reason, std::uint64_t sequence) {
  halted_ = true;
  {
    std::lock_guard lock(stats_mutex_);
    stats_.halted     = true;
    stats_.last_error = reason;
  }
  EDGESYNC_LOG_ERROR("sync engine halted, operator intervention required",
                     {observability::AlertField("chain_integrity"), UintField("sequence", sequence), StringField("reason", reason)});
}

void SyncEngine::PollDownlink(const std::string& session_id) {
  std::vector<std::string> records;
  try {
    records = transport_->FetchDownlink(session_id, options_.downlink_batch, options_.ack_timeout);
  } catch (const util::ConnectionLost& e) {
    connection_->ReportTransportFailure(e.what());
    return;
  }

  std::uint64_t handled = 0;
  for (const auto& wire : records) {
    if (downlink_->Dispatch(wire)) ++handled;
  }

  std::lock_guard lock(stats_mutex_);
  stats_.downlinks += handled;
}

SyncStats SyncEngine::Stats() const {
  std::lock_guard lock(stats_mutex_);
  SyncStats       stats = stats_;
  stats.halted          = halted_.load();
  return stats;
}

} // namespace edgesync::sync
