#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "internal/chain/chain_builder.hpp"
#include "internal/ingest/ingest_queue.hpp"
#include "internal/queue/priority_queue_manager.hpp"
#include "internal/store/local_data_store.hpp"

namespace edgesync::ingest {

struct IngestStats {
  std::uint64_t ingested      = 0;
  std::uint64_t storage_full  = 0;
  std::uint64_t failed        = 0;
};

/*
  Background worker that moves records from the handoff queue into the
  durable chain:

      store.Append -> chain.ChainAppend -> queue.Enqueue -> on_enqueued
*/
class IngestWorker {
 public:
  IngestWorker(std::shared_ptr<IngestQueue> input, std::shared_ptr<store::LocalDataStore> store,
               std::shared_ptr<chain::ChainBuilder> chain, std::shared_ptr<queue::PriorityQueueManager> queue,
               std::function<void()> on_enqueued = {});
  ~IngestWorker();

  void Start();

  // Drains what is already queued, then joins.
  void Stop();

  // Processes one record synchronously. Returns false if it was not queued.
  bool Process(const model::SyncRecord& record);

  IngestStats Stats() const;

 private:
  void Run();

  std::shared_ptr<IngestQueue>                 input_;
  std::shared_ptr<store::LocalDataStore>       store_;
  std::shared_ptr<chain::ChainBuilder>         chain_;
  std::shared_ptr<queue::PriorityQueueManager> queue_;
  std::function<void()>                        on_enqueued_;

  std::atomic<std::uint64_t> ingested_{0};
  std::atomic<std::uint64_t> storage_full_{0};
  std::atomic<std::uint64_t> failed_{0};

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace edgesync::ingest
