#pragma once

#include <fstream>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace wdi {

/**
 * @brief Output collections written by the pipeline
 */
enum class RecordKind {
    Items,
    Objects,
    Literals,
    Types,
    Errors
};

std::string to_string(RecordKind kind);

/**
 * @brief The four buffered per-entity kinds (everything except Errors)
 */
const std::vector<RecordKind>& entity_record_kinds();

/**
 * @brief Failure of the persistence backend
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Record Store Interface
// ============================================================================

/**
 * @brief Destination for derived records
 *
 * Only one thread (the flusher) writes to a store during a run.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    /**
     * @brief Create collections and lookup indexes; safe to repeat
     *
     * @throws StoreError if the destination is unreachable
     */
    virtual void ensure_indexes() = 0;

    /**
     * @brief Bulk insert documents of one kind
     *
     * @throws StoreError on failure; earlier inserts are not rolled back
     */
    virtual void insert_many(RecordKind kind, const std::vector<nlohmann::json>& documents) = 0;

    /**
     * @brief False once the backend can no longer be reached
     */
    virtual bool is_available() const = 0;

    virtual std::string get_name() const = 0;
};

// ============================================================================
// JSON Lines Store
// ============================================================================

/**
 * @brief Writes each kind to <directory>/<kind>.jsonl, one document per line
 */
class JsonlRecordStore : public RecordStore {
public:
    explicit JsonlRecordStore(const std::string& directory);

    void ensure_indexes() override;
    void insert_many(RecordKind kind, const std::vector<nlohmann::json>& documents) override;
    bool is_available() const override { return true; }
    std::string get_name() const override { return "jsonl:" + directory_; }

    std::string path_for(RecordKind kind) const;

private:
    std::string directory_;
    std::mutex mutex_;
    std::map<RecordKind, std::ofstream> files_;
};

} // namespace wdi
