#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "config/config.pb.h"
#include "internal/chain/chain_verifier.hpp"
#include "internal/connection/connection_manager.hpp"
#include "internal/queue/priority_queue_manager.hpp"
#include "internal/store/local_data_store.hpp"
#include "internal/sync/downlink_dispatcher.hpp"
#include "internal/transport/gateway_transport.hpp"
#include "internal/util/time.hpp"

namespace edgesync::sync {

struct SyncEngineOptions {
  std::chrono::milliseconds tick_interval{1000};
  std::uint32_t             authenticated_budget = 0; // 0 = unlimited
  std::uint32_t             degraded_budget      = 10;
  std::uint32_t             persistent_failure_threshold = 10;
  bool                      self_check           = false;
  std::chrono::milliseconds ack_timeout{5000};
  std::chrono::milliseconds eviction_interval{60000};
  std::chrono::milliseconds downlink_interval{30000};
  std::uint32_t             downlink_batch = 32;

  static SyncEngineOptions FromConfig(const edgesync::runtime::config::RuntimeConfig& config);
};

struct SyncStats {
  std::uint64_t ticks      = 0;
  std::uint64_t sent       = 0;
  std::uint64_t acked      = 0;
  std::uint64_t duplicates = 0;
  std::uint64_t failures   = 0;
  std::uint64_t evicted    = 0;
  std::uint64_t downlinks  = 0;
  bool          halted     = false;
  std::string   last_error;
};

/*
  Sync Engine.

  One control loop on a dedicated thread. Each tick:
    - runs retention eviction when due
    - if the link cannot send, runs one reconnect step and stops
    - drains queues P0..P5 in strict priority, one record in flight,
      removing a record only on an ack for its exact id
    - polls downlink when due

  A timeout, NACK or transport error stops draining for the tick. A chain
  integrity failure, local or reported by the gateway, halts the engine
  until an operator restarts it.
*/
class SyncEngine {
 public:
  SyncEngine(std::shared_ptr<store::LocalDataStore> store, std::shared_ptr<queue::PriorityQueueManager> queue,
             std::shared_ptr<connection::ConnectionManager> connection, std::shared_ptr<transport::GatewayTransport> transport,
             std::optional<chain::ChainVerifier> verifier, std::shared_ptr<DownlinkDispatcher> downlink, SyncEngineOptions options);
  ~SyncEngine();

  SyncEngine(const SyncEngine&)            = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  void Start();

  // Lets the in-flight send finish, then joins the loop thread.
  void Stop();

  // Runs the next tick early.
  void Wake();

  // One loop iteration; the thread calls this, tests may call it directly.
  void Tick(util::SteadyTimePoint now);

  SyncStats Stats() const;
  bool      Halted() const {
    return halted_.load();
  }

 private:
  void Run();
  void Drain(const std::string& session_id, std::uint32_t budget);
  void PollDownlink(const std::string& session_id);
  void RunEviction();

  // Consecutive failure bookkeeping for the record at the head of a queue.
  void CountFailure(const model::SyncRecord& record, const std::string& reason);
  void AcceptRemoval(const model::SyncRecord& record);
  void Halt(const std::string& reason, std::uint64_t sequence);

  std::shared_ptr<store::LocalDataStore>         store_;
  std::shared_ptr<queue::PriorityQueueManager>   queue_;
  std::shared_ptr<connection::ConnectionManager> connection_;
  std::shared_ptr<transport::GatewayTransport>   transport_;
  std::optional<chain::ChainVerifier>            verifier_;
  std::shared_ptr<DownlinkDispatcher>            downlink_;
  SyncEngineOptions                              options_;

  std::atomic<bool> halted_{false};

  mutable std::mutex stats_mutex_;
  SyncStats          stats_;

  model::RecordId failing_id_{};
  std::uint32_t   failing_count_ = 0;

  std::optional<util::SteadyTimePoint> next_eviction_;
  std::optional<util::SteadyTimePoint> next_downlink_;

  std::mutex              loop_mutex_;
  std::condition_variable loop_cv_;
  bool                    wake_    = false;
  bool                    stopped_ = false;
  std::thread             thread_;
};

} // namespace edgesync::sync
