#include "storage/async_flusher.hpp"
#include "util/logger.hpp"

namespace wdi {

AsyncFlusher::AsyncFlusher(RecordStore& store, size_t max_queued)
    : store_(store), max_queued_(max_queued == 0 ? 1 : max_queued) {
    thread_ = std::thread(&AsyncFlusher::worker, this);
}

AsyncFlusher::~AsyncFlusher() {
    stop();
}

bool AsyncFlusher::enqueue(FlushBatch batch, bool block) {
    if (batch.documents.empty()) {
        return true;
    }
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (block) {
            cv_.wait(lock, [this] { return queue_.size() < max_queued_ || stop_; });
        } else if (queue_.size() >= max_queued_) {
            return false;
        }
        if (stop_) return false;
        queue_.push(std::move(batch));
    }
    cv_.notify_all();
    return true;
}

bool AsyncFlusher::try_enqueue(FlushBatch& batch) {
    if (batch.documents.empty()) {
        return true;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ || queue_.size() >= max_queued_) {
            return false;
        }
        queue_.push(std::move(batch));
    }
    cv_.notify_all();
    batch.documents.clear();
    return true;
}

void AsyncFlusher::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void AsyncFlusher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::string AsyncFlusher::fatal_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fatal_message_;
}

size_t AsyncFlusher::records_written(RecordKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_written_.find(kind);
    return it == records_written_.end() ? 0 : it->second;
}

void AsyncFlusher::worker() {
    while (true) {
        FlushBatch batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
            if (queue_.empty()) break;
            batch = std::move(queue_.front());
            queue_.pop();
            busy_ = true;
        }
        cv_.notify_all();

        write(batch);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        cv_.notify_all();
    }
}

void AsyncFlusher::write(const FlushBatch& batch) {
    if (fatal_.load()) {
        batches_failed_++;
        return;
    }

    try {
        store_.insert_many(batch.kind, batch.documents);
        batches_flushed_++;
        std::lock_guard<std::mutex> lock(mutex_);
        records_written_[batch.kind] += batch.documents.size();
    } catch (const std::exception& e) {
        batches_failed_++;
        Logger::error("Flush of " + std::to_string(batch.documents.size()) + " " +
                      to_string(batch.kind) + " records failed: " + e.what());

        if (!store_.is_available()) {
            std::lock_guard<std::mutex> lock(mutex_);
            fatal_message_ = std::string("Record store ") + store_.get_name() +
                             " became unavailable: " + e.what();
            fatal_.store(true);
        }
    }
}

} // namespace wdi
