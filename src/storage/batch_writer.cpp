#include "storage/batch_writer.hpp"
#include "util/logger.hpp"

namespace wdi {

BatchWriter::BatchWriter(AsyncFlusher& flusher, size_t batch_size)
    : flusher_(flusher), batch_size_(batch_size == 0 ? 1 : batch_size) {}

void BatchWriter::append(RecordKind kind, nlohmann::json document) {
    std::vector<nlohmann::json> full;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& buffer = buffers_[kind];
        buffer.push_back(std::move(document));
        if (buffer.size() < batch_size_) {
            return;
        }
        full.swap(buffer);
        buffer.reserve(batch_size_);
        flushes_++;
    }
    hand_off(kind, std::move(full));
}

void BatchWriter::append(const EntityRecords& records) {
    append(RecordKind::Items, records.item.to_json());
    append(RecordKind::Objects, records.objects.to_json());
    append(RecordKind::Literals, records.literals.to_json());
    append(RecordKind::Types, records.types.to_json());
}

void BatchWriter::flush(RecordKind kind) {
    std::vector<nlohmann::json> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = buffers_.find(kind);
        if (it == buffers_.end() || it->second.empty()) {
            return;
        }
        pending.swap(it->second);
        flushes_++;
    }
    hand_off(kind, std::move(pending));
}

void BatchWriter::flush_all() {
    std::vector<RecordKind> kinds;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : buffers_) kinds.push_back(entry.first);
    }
    for (RecordKind kind : kinds) {
        flush(kind);
    }
}

size_t BatchWriter::buffered(RecordKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(kind);
    return it == buffers_.end() ? 0 : it->second.size();
}

size_t BatchWriter::flushes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flushes_;
}

void BatchWriter::hand_off(RecordKind kind, std::vector<nlohmann::json> documents) {
    FlushBatch batch;
    batch.kind = kind;
    batch.documents = std::move(documents);
    const size_t count = batch.documents.size();
    if (!flusher_.enqueue(std::move(batch))) {
        Logger::warn("Dropped " + std::to_string(count) + " " + to_string(kind) +
                     " records: flusher is stopped");
    }
}

} // namespace wdi
