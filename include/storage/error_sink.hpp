#pragma once

#include "entity/entity.hpp"
#include "storage/async_flusher.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace wdi {

/**
 * @brief Side channel for per-entity processing failures
 *
 * record() never blocks on the backend and never throws.
 */
class ErrorSink {
public:
    virtual ~ErrorSink() = default;

    virtual void record(const ErrorRecord& error) = 0;

    void record(const std::string& entity_id, const std::string& error, const std::string& context) {
        ErrorRecord rec;
        rec.entity = entity_id;
        rec.error = error;
        rec.context = context;
        record(rec);
    }

    /**
     * @brief Hand over anything still pending; called once at end of run
     */
    virtual void close() {}

    virtual size_t recorded() const = 0;
};

/**
 * @brief Writes error records to the error-log collection through the flusher
 *
 * Records are queued without waiting; while the flusher queue is full they are
 * kept locally, up to max_pending, and retried on the next record() or on close().
 * Records arriving beyond that limit are dropped and counted. Once the flusher
 * has turned fatal the sink only logs locally.
 */
class StoreErrorSink : public ErrorSink {
public:
    explicit StoreErrorSink(AsyncFlusher& flusher, size_t max_pending = 10000);

    using ErrorSink::record;
    void record(const ErrorRecord& error) override;
    void close() override;
    size_t recorded() const override { return recorded_.load(); }

    size_t pending() const;
    size_t dropped() const { return dropped_.load(); }

private:
    bool try_hand_off(bool block);

    AsyncFlusher& flusher_;
    const size_t max_pending_;
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> pending_;
    std::atomic<size_t> recorded_{0};
    std::atomic<size_t> dropped_{0};
    bool unavailable_logged_ = false;
    bool overflow_logged_ = false;
};

} // namespace wdi
