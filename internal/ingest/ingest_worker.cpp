#include "ingest_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::ingest {

using observability::StringField;

IngestWorker::IngestWorker(std::shared_ptr<IngestQueue> input, std::shared_ptr<store::LocalDataStore> store,
                           std::shared_ptr<chain::ChainBuilder> chain, std::shared_ptr<queue::PriorityQueueManager> queue,
                           std::function<void()> on_enqueued)
    : input_(std::move(input)),
      store_(std::move(store)),
      chain_(std::move(chain)),
      queue_(std::move(queue)),
      on_enqueued_(std::move(on_enqueued)) {
}

IngestWorker::~IngestWorker() {
  Stop();
}

void IngestWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&IngestWorker::Run, this);
}

void IngestWorker::Stop() {
  input_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void IngestWorker::Run() {
  while (true) {
    auto record = input_->Take();
    if (!record) break;
    Process(*record);
  }
}

bool IngestWorker::Process(const model::SyncRecord& record) {
  const auto id = util::ToString(record.id);

  try {
    store_->Append(record);
  } catch (const util::StorageFull& e) {
    ++storage_full_;
    EDGESYNC_LOG_ERROR("record dropped at ingest", {observability::AlertField("storage_full"), StringField("record_id", id),
                                                    StringField("error", e.what())});
    return false;
  } catch (const std::exception& e) {
    ++failed_;
    EDGESYNC_LOG_ERROR("store append failed", {StringField("record_id", id), StringField("error", e.what())});
    return false;
  }

  try {
    queue_->Enqueue(chain_->ChainAppend(record));
  } catch (const std::exception& e) {
    // Stays unchained in the store; ResumePending picks it up on restart.
    ++failed_;
    EDGESYNC_LOG_ERROR("chain append failed", {StringField("record_id", id), StringField("error", e.what())});
    return false;
  }

  ++ingested_;
  if (on_enqueued_) on_enqueued_();
  return true;
}

IngestStats IngestWorker::Stats() const {
  return IngestStats{ingested_.load(), storage_full_.load(), failed_.load()};
}

} // namespace edgesync::ingest
