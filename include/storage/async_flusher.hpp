#pragma once

#include "storage/record_store.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace wdi {

/**
 * @brief Documents of one kind handed to the store in a single insert_many()
 */
struct FlushBatch {
    RecordKind kind = RecordKind::Items;
    std::vector<nlohmann::json> documents;
};

/**
 * @brief Background writer that drains batches into a RecordStore
 *
 * A single worker thread owns all store writes, so the store needs no locking.
 * The queue is bounded; enqueue() blocks while it is full.
 *
 * A failed insert is logged and counted. If the store reports itself
 * unavailable after the failure the flusher turns fatal and discards every
 * later batch.
 */
class AsyncFlusher {
public:
    explicit AsyncFlusher(RecordStore& store, size_t max_queued = 16);
    ~AsyncFlusher();

    AsyncFlusher(const AsyncFlusher&) = delete;
    AsyncFlusher& operator=(const AsyncFlusher&) = delete;

    /**
     * @brief Queue a batch for writing
     *
     * @param block Wait for room when the queue is full
     * @return false if the batch was not queued (queue full without blocking, or stopped)
     */
    bool enqueue(FlushBatch batch, bool block = true);

    /**
     * @brief Queue a batch only if there is room right now
     *
     * The batch is moved from only when it was queued; on false it is left intact.
     */
    bool try_enqueue(FlushBatch& batch);

    /**
     * @brief Block until every queued batch has been written or discarded
     */
    void wait_all();

    /**
     * @brief Drain the queue and join the worker; later enqueues are rejected
     */
    void stop();

    bool fatal() const { return fatal_.load(); }
    std::string fatal_message() const;

    size_t batches_flushed() const { return batches_flushed_.load(); }
    size_t batches_failed() const { return batches_failed_.load(); }
    size_t records_written(RecordKind kind) const;

private:
    void worker();
    void write(const FlushBatch& batch);

    RecordStore& store_;
    size_t max_queued_;

    std::queue<FlushBatch> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool stop_ = false;
    bool busy_ = false;

    std::atomic<bool> fatal_{false};
    std::string fatal_message_;
    std::atomic<size_t> batches_flushed_{0};
    std::atomic<size_t> batches_failed_{0};
    std::map<RecordKind, size_t> records_written_;
};

} // namespace wdi
