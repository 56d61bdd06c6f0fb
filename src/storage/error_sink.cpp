#include "storage/error_sink.hpp"
#include "util/logger.hpp"

namespace wdi {

StoreErrorSink::StoreErrorSink(AsyncFlusher& flusher, size_t max_pending)
    : flusher_(flusher), max_pending_(max_pending == 0 ? 1 : max_pending) {}

void StoreErrorSink::record(const ErrorRecord& error) {
    recorded_++;

    std::lock_guard<std::mutex> lock(mutex_);
    if (flusher_.fatal()) {
        if (!unavailable_logged_) {
            Logger::warn("Error log unavailable, errors are no longer persisted");
            unavailable_logged_ = true;
        }
        Logger::debug("Unpersisted error for " + (error.entity.empty() ? std::string("<unknown>") : error.entity) +
                      ": " + error.error);
        return;
    }

    if (pending_.size() >= max_pending_ && !try_hand_off(false)) {
        dropped_++;
        if (!overflow_logged_) {
            Logger::warn("Error log backlog full, dropping error records");
            overflow_logged_ = true;
        }
        return;
    }

    pending_.push_back(error.to_json());
    try_hand_off(false);
}

void StoreErrorSink::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dropped_.load() > 0) {
        Logger::warn("Dropped " + std::to_string(dropped_.load()) + " error records while the log was backed up");
    }
    if (pending_.empty()) {
        return;
    }
    size_t count = pending_.size();
    if (flusher_.fatal() || !try_hand_off(true)) {
        Logger::warn("Discarded " + std::to_string(count) + " error records");
        pending_.clear();
    }
}

size_t StoreErrorSink::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool StoreErrorSink::try_hand_off(bool block) {
    FlushBatch batch;
    batch.kind = RecordKind::Errors;
    batch.documents.swap(pending_);

    bool queued = block ? flusher_.enqueue(std::move(batch), true) : flusher_.try_enqueue(batch);
    if (!queued && !block) {
        pending_.swap(batch.documents);
    }
    return queued;
}

} // namespace wdi
