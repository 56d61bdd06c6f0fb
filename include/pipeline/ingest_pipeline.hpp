#pragma once

#include "dump/dump_reader.hpp"
#include "entity/entity_classifier.hpp"
#include "query/graph_client.hpp"
#include "storage/record_store.hpp"
#include "taxonomy/superclass_cache.hpp"
#include "taxonomy/taxonomy.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace wdi {

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Configuration for one ingestion run
 */
struct IngestConfig {
    // Graph query service
    std::string endpoint_url = "https://query.wikidata.org/sparql";  ///< SPARQL endpoint
    std::string user_agent = "wdingest/1.0 (knowledge-graph dump ingestion)";
    int timeout_seconds = 300;              ///< Request timeout
    int max_retries = 3;                    ///< Attempts per rate-limited query
    int retry_delay_ms = 5000;              ///< Fixed delay between attempts

    // Processing
    int workers = 16;                       ///< Classification threads
    int queue_capacity = 4096;              ///< Lines buffered between reader and workers
    int batch_size = 100;                   ///< Records per bulk insert
    int flush_queue_size = 16;              ///< Batches waiting for the flusher
    double initial_average_line_size = 800.0;  ///< Seed of the progress estimate (bytes)
    int progress_interval = 10000;          ///< Lines between progress callbacks

    // Output
    std::string backend = "postgres";       ///< "postgres" or "jsonl"
    std::string conninfo;                   ///< libpq connection string (empty: PG* variables)
    std::string schema;                     ///< Destination schema (empty: wikidata<ddmmyyyy>)
    std::string log_schema = "wikidata";    ///< Schema of the error log
    std::string output_directory = "output_jsonl";  ///< JSONL backend directory

    std::string taxonomy_file;              ///< Load the taxonomy from here instead of resolving it
    bool verbose = false;                   ///< Verbose logging

    /**
     * @brief Destination schema, defaulting to "wikidata" + today's ddmmyyyy
     */
    std::string resolved_schema() const;

    GraphQueryConfig graph_config() const;
    RetryPolicy retry_policy() const;

    /**
     * @brief Overlay the keys present in a JSON object onto this configuration
     */
    void apply_json(const nlohmann::json& j);

    /**
     * @brief Overlay a JSON configuration file onto this configuration
     */
    void load_json_file(const std::string& path);

    /**
     * @brief Load configuration from JSON file
     */
    static IngestConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;

    /**
     * @brief Load from WDI_* environment variables
     */
    static IngestConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

// ============================================================================
// Pipeline Statistics
// ============================================================================

/**
 * @brief Statistics from one ingestion run
 */
struct IngestStatistics {
    // Stream
    uint64_t lines_read = 0;
    uint64_t entities_processed = 0;        ///< Classified and handed to the writer
    uint64_t malformed_lines = 0;           ///< Not valid JSON, dropped silently
    uint64_t entities_failed = 0;           ///< Reported to the error log
    uint64_t estimated_total = 0;
    double average_line_size = 0.0;

    // Storage
    std::map<RecordKind, uint64_t> records_written;
    uint64_t batches_flushed = 0;
    uint64_t batches_failed = 0;

    // Graph queries
    uint64_t graph_queries = 0;
    uint64_t superclass_lookups = 0;        ///< Cache misses
    uint64_t superclass_cache_hits = 0;

    // Timing
    double total_time_seconds = 0.0;
    double taxonomy_time_seconds = 0.0;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

/**
 * @brief Progress callback: entities handled so far and the current total estimate
 */
using ProgressCallback = std::function<void(uint64_t processed, uint64_t estimated_total)>;

// ============================================================================
// Ingest Pipeline
// ============================================================================

/**
 * @brief End-to-end dump ingestion
 *
 * DumpReader → worker pool (EntityClassifier) → BatchWriter → AsyncFlusher → RecordStore,
 * with per-entity failures routed to the error log.
 *
 * The reader thread numbers every raw line with its 0-based stream position; that
 * number is the sequence index of all records derived from the line.
 */
class IngestPipeline {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    IngestPipeline(const IngestConfig& config, GraphQueryClient& client, RecordStore& store);

    IngestPipeline(const IngestPipeline&) = delete;
    IngestPipeline& operator=(const IngestPipeline&) = delete;

    /**
     * @brief Full run over a dump file
     *
     * Opens the dump, prepares the destination, resolves the taxonomy and
     * ingests every line.
     *
     * @throws DumpOpenError, DumpReadError or StoreError on fatal failures
     */
    IngestStatistics run(const std::string& dump_path);

    /**
     * @brief Ingest every line of an opened reader with a ready taxonomy
     */
    IngestStatistics run(DumpReader& reader, const Taxonomy& taxonomy);

    /**
     * @brief Load the taxonomy file if configured, otherwise resolve it remotely
     */
    Taxonomy prepare_taxonomy();

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    IngestStatistics get_statistics() const { return stats_; }
    const IngestConfig& get_config() const { return config_; }

    TaxonomyResolver& resolver() { return resolver_; }
    SuperclassCache& superclass_cache() { return superclass_cache_; }

    /**
     * @brief Strip trailing whitespace and one trailing comma
     *
     * @return false if nothing is left
     */
    static bool preprocess_line(std::string& line);

private:
    IngestConfig config_;
    RecordStore& store_;
    TaxonomyResolver resolver_;
    SuperclassCache superclass_cache_;
    IngestStatistics stats_;
    ProgressCallback progress_callback_;
};

// ============================================================================
// Factories
// ============================================================================

/**
 * @brief Record store selected by config.backend
 *
 * @throws StoreError if the backend cannot be reached, std::invalid_argument if unknown
 */
std::unique_ptr<RecordStore> create_record_store(const IngestConfig& config);

std::unique_ptr<GraphQueryClient> create_graph_client(const IngestConfig& config);

} // namespace wdi
