#pragma once

#include "entity/entity.hpp"
#include "storage/async_flusher.hpp"
#include <map>
#include <mutex>
#include <vector>

namespace wdi {

/**
 * @brief Per-kind buffers in front of the flusher
 *
 * append() is safe from any number of worker threads. A buffer that reaches
 * batch_size is swapped out under the lock and handed to the flusher outside
 * it, so each document is flushed exactly once.
 */
class BatchWriter {
public:
    explicit BatchWriter(AsyncFlusher& flusher, size_t batch_size = 100);

    BatchWriter(const BatchWriter&) = delete;
    BatchWriter& operator=(const BatchWriter&) = delete;

    void append(RecordKind kind, nlohmann::json document);

    /**
     * @brief Append the item, object, literal and type records of one entity
     */
    void append(const EntityRecords& records);

    /**
     * @brief Hand a partially filled buffer to the flusher
     */
    void flush(RecordKind kind);

    /**
     * @brief Flush every non-empty buffer; used at end of stream
     */
    void flush_all();

    size_t buffered(RecordKind kind) const;
    size_t flushes() const;
    size_t batch_size() const { return batch_size_; }

private:
    void hand_off(RecordKind kind, std::vector<nlohmann::json> documents);

    AsyncFlusher& flusher_;
    size_t batch_size_;

    mutable std::mutex mutex_;
    std::map<RecordKind, std::vector<nlohmann::json>> buffers_;
    size_t flushes_ = 0;
};

} // namespace wdi
