#include "pipeline/ingest_pipeline.hpp"
#include "storage/async_flusher.hpp"
#include "storage/batch_writer.hpp"
#include "storage/error_sink.hpp"
#include "storage/postgres_store.hpp"
#include "util/blocking_queue.hpp"
#include "util/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace wdi {

namespace {

int env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid integer in ") + name + ": " + value);
    }
}

void env_string(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) target = value;
}

/**
 * @brief One raw dump line and its stream position
 */
struct RawLine {
    int64_t index = 0;
    std::string text;
};

std::string failure_context(const char* stage, const char* exception_kind, int64_t index) {
    return std::string("stage=") + stage + " exception=" + exception_kind +
           " line=" + std::to_string(index);
}

} // anonymous namespace

// ============================================================================
// IngestConfig
// ============================================================================

std::string IngestConfig::resolved_schema() const {
    if (!schema.empty()) {
        return schema;
    }
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char date[16];
    std::strftime(date, sizeof(date), "%d%m%Y", &local);
    return std::string("wikidata") + date;
}

GraphQueryConfig IngestConfig::graph_config() const {
    GraphQueryConfig gc;
    gc.endpoint_url = endpoint_url;
    gc.user_agent = user_agent;
    gc.timeout_seconds = timeout_seconds;
    gc.verbose = verbose;
    return gc;
}

RetryPolicy IngestConfig::retry_policy() const {
    RetryPolicy policy;
    policy.max_attempts = max_retries;
    policy.delay = std::chrono::milliseconds(retry_delay_ms);
    return policy;
}

void IngestConfig::apply_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    if (j.contains("endpoint_url")) endpoint_url = j["endpoint_url"];
    if (j.contains("user_agent")) user_agent = j["user_agent"];
    if (j.contains("timeout_seconds")) timeout_seconds = j["timeout_seconds"];
    if (j.contains("max_retries")) max_retries = j["max_retries"];
    if (j.contains("retry_delay_ms")) retry_delay_ms = j["retry_delay_ms"];

    if (j.contains("workers")) workers = j["workers"];
    if (j.contains("queue_capacity")) queue_capacity = j["queue_capacity"];
    if (j.contains("batch_size")) batch_size = j["batch_size"];
    if (j.contains("flush_queue_size")) flush_queue_size = j["flush_queue_size"];
    if (j.contains("initial_average_line_size")) initial_average_line_size = j["initial_average_line_size"];
    if (j.contains("progress_interval")) progress_interval = j["progress_interval"];

    if (j.contains("backend")) backend = j["backend"];
    if (j.contains("conninfo")) conninfo = j["conninfo"];
    if (j.contains("schema")) schema = j["schema"];
    if (j.contains("log_schema")) log_schema = j["log_schema"];
    if (j.contains("output_directory")) output_directory = j["output_directory"];

    if (j.contains("taxonomy_file")) taxonomy_file = j["taxonomy_file"];
    if (j.contains("verbose")) verbose = j["verbose"];
}

void IngestConfig::load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    apply_json(j);
}

IngestConfig IngestConfig::from_json_file(const std::string& path) {
    IngestConfig config;
    config.load_json_file(path);
    return config;
}

json IngestConfig::to_json() const {
    json j;

    j["endpoint_url"] = endpoint_url;
    j["user_agent"] = user_agent;
    j["timeout_seconds"] = timeout_seconds;
    j["max_retries"] = max_retries;
    j["retry_delay_ms"] = retry_delay_ms;

    j["workers"] = workers;
    j["queue_capacity"] = queue_capacity;
    j["batch_size"] = batch_size;
    j["flush_queue_size"] = flush_queue_size;
    j["initial_average_line_size"] = initial_average_line_size;
    j["progress_interval"] = progress_interval;

    j["backend"] = backend;
    j["conninfo"] = conninfo;
    j["schema"] = schema;
    j["log_schema"] = log_schema;
    j["output_directory"] = output_directory;

    j["taxonomy_file"] = taxonomy_file;
    j["verbose"] = verbose;

    return j;
}

void IngestConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

IngestConfig IngestConfig::from_environment() {
    IngestConfig config;

    env_string("WDI_ENDPOINT", config.endpoint_url);
    env_string("WDI_USER_AGENT", config.user_agent);
    config.timeout_seconds = env_int("WDI_TIMEOUT", config.timeout_seconds);
    config.max_retries = env_int("WDI_MAX_RETRIES", config.max_retries);
    config.retry_delay_ms = env_int("WDI_RETRY_DELAY_MS", config.retry_delay_ms);

    config.workers = env_int("WDI_WORKERS", config.workers);
    config.batch_size = env_int("WDI_BATCH_SIZE", config.batch_size);

    env_string("WDI_BACKEND", config.backend);
    env_string("WDI_CONNINFO", config.conninfo);
    env_string("WDI_SCHEMA", config.schema);
    env_string("WDI_LOG_SCHEMA", config.log_schema);
    env_string("WDI_OUTPUT_DIR", config.output_directory);
    env_string("WDI_TAXONOMY_FILE", config.taxonomy_file);

    const char* verbose = std::getenv("WDI_VERBOSE");
    if (verbose) config.verbose = std::string(verbose) == "1" || std::string(verbose) == "true";

    return config;
}

bool IngestConfig::validate(std::string& error_message) const {
    if (endpoint_url.empty()) {
        error_message = "Graph query endpoint is required";
        return false;
    }

    if (timeout_seconds <= 0) {
        error_message = "Timeout must be positive";
        return false;
    }

    if (max_retries < 1 || retry_delay_ms < 0) {
        error_message = "Retry budget must be at least 1 with a non-negative delay";
        return false;
    }

    if (workers < 1 || queue_capacity < 1 || flush_queue_size < 1) {
        error_message = "Workers and queue sizes must be at least 1";
        return false;
    }

    if (batch_size < 1) {
        error_message = "Batch size must be at least 1";
        return false;
    }

    if (initial_average_line_size <= 0.0) {
        error_message = "Initial average line size must be positive";
        return false;
    }

    if (backend != "postgres" && backend != "jsonl") {
        error_message = "Backend must be 'postgres' or 'jsonl'";
        return false;
    }

    if (backend == "jsonl" && output_directory.empty()) {
        error_message = "JSONL backend requires an output directory";
        return false;
    }

    if (log_schema.empty()) {
        error_message = "Error log schema is required";
        return false;
    }

    return true;
}

// ============================================================================
// IngestStatistics
// ============================================================================

void IngestStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Ingestion Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Dump:\n";
    std::cout << "  Lines read: " << lines_read << "\n";
    std::cout << "  Entities processed: " << entities_processed << "\n";
    std::cout << "  Malformed lines: " << malformed_lines << "\n";
    std::cout << "  Failed entities: " << entities_failed << "\n";
    std::cout << "  Average line size: " << std::fixed << std::setprecision(1)
              << average_line_size << " bytes\n\n";

    std::cout << "Records written:\n";
    for (const auto& [kind, count] : records_written) {
        std::cout << "  " << to_string(kind) << ": " << count << "\n";
    }
    std::cout << "  Batches flushed: " << batches_flushed << "\n";
    std::cout << "  Batches failed: " << batches_failed << "\n\n";

    std::cout << "Graph queries:\n";
    std::cout << "  Remote queries: " << graph_queries << "\n";
    std::cout << "  Superclass lookups: " << superclass_lookups << "\n";
    std::cout << "  Superclass cache hits: " << superclass_cache_hits << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << std::setprecision(2) << total_time_seconds << " seconds\n";
    std::cout << "  Taxonomy: " << taxonomy_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json IngestStatistics::to_json() const {
    json j;

    j["lines_read"] = lines_read;
    j["entities_processed"] = entities_processed;
    j["malformed_lines"] = malformed_lines;
    j["entities_failed"] = entities_failed;
    j["estimated_total"] = estimated_total;
    j["average_line_size"] = average_line_size;

    json written = json::object();
    for (const auto& [kind, count] : records_written) {
        written[to_string(kind)] = count;
    }
    j["records_written"] = written;
    j["batches_flushed"] = batches_flushed;
    j["batches_failed"] = batches_failed;

    j["graph_queries"] = graph_queries;
    j["superclass_lookups"] = superclass_lookups;
    j["superclass_cache_hits"] = superclass_cache_hits;

    j["total_time_seconds"] = total_time_seconds;
    j["taxonomy_time_seconds"] = taxonomy_time_seconds;

    return j;
}

// ============================================================================
// IngestPipeline
// ============================================================================

IngestPipeline::IngestPipeline(const IngestConfig& config, GraphQueryClient& client, RecordStore& store)
    : config_(config),
      store_(store),
      resolver_(client, config.retry_policy()),
      superclass_cache_([this](const std::string& type_id) {
          return resolver_.superclasses(type_id).ids;
      }) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

bool IngestPipeline::preprocess_line(std::string& line) {
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.pop_back();
    }
    if (!line.empty() && line.back() == ',') {
        line.pop_back();
    }
    return !line.empty();
}

Taxonomy IngestPipeline::prepare_taxonomy() {
    auto start = std::chrono::steady_clock::now();

    Taxonomy taxonomy;
    if (!config_.taxonomy_file.empty()) {
        Logger::step("Loading taxonomy from " + config_.taxonomy_file);
        taxonomy = Taxonomy::load_from_json(config_.taxonomy_file);
    } else {
        Logger::step("Resolving taxonomy");
        taxonomy = resolver_.build(default_taxonomy_specs());
    }

    for (const auto& name : taxonomy.names()) {
        Logger::info(name + ": " + std::to_string(taxonomy.size(name)) + " classes");
    }

    stats_.taxonomy_time_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    return taxonomy;
}

IngestStatistics IngestPipeline::run(const std::string& dump_path) {
    Logger::step("Opening dump " + dump_path);
    DumpReader reader(dump_path, config_.initial_average_line_size);
    Logger::info("Format: " + reader.get_format() + ", " +
                 std::to_string(reader.archive_bytes()) + " bytes, ~" +
                 std::to_string(reader.estimated_total()) + " entities");

    Logger::step("Preparing " + store_.get_name());
    store_.ensure_indexes();

    Taxonomy taxonomy = prepare_taxonomy();
    double taxonomy_time = stats_.taxonomy_time_seconds;

    IngestStatistics stats = run(reader, taxonomy);
    stats.taxonomy_time_seconds = taxonomy_time;
    stats_ = stats;
    return stats;
}

IngestStatistics IngestPipeline::run(DumpReader& reader, const Taxonomy& taxonomy) {
    auto start = std::chrono::steady_clock::now();
    stats_ = IngestStatistics();

    const uint64_t hits_before = superclass_cache_.hits();
    const uint64_t misses_before = superclass_cache_.misses();
    const uint64_t queries_before = resolver_.queries_issued();

    AsyncFlusher flusher(store_, static_cast<size_t>(config_.flush_queue_size));
    BatchWriter writer(flusher, static_cast<size_t>(config_.batch_size));
    StoreErrorSink errors(flusher);
    EntityClassifier classifier(taxonomy, superclass_cache_);
    BlockingQueue<RawLine> queue(static_cast<size_t>(config_.queue_capacity));

    std::atomic<uint64_t> processed{0};
    std::atomic<uint64_t> malformed{0};
    std::atomic<uint64_t> failed{0};

    auto process = [&](RawLine& raw) {
        if (!preprocess_line(raw.text)) {
            malformed++;
            return;
        }

        json document = json::parse(raw.text, nullptr, false);
        if (document.is_discarded()) {
            malformed++;
            return;
        }

        std::string entity_id;
        if (document.is_object() && document.contains("id") && document["id"].is_string()) {
            entity_id = document["id"].get<std::string>();
        }

        try {
            EntityRecords records = classifier.classify(document, raw.index);
            writer.append(records);
            processed++;
        } catch (const EntityFormatError& e) {
            failed++;
            errors.record(entity_id, e.what(), failure_context("classify", "EntityFormatError", raw.index));
        } catch (const json::exception& e) {
            failed++;
            errors.record(entity_id, e.what(), failure_context("classify", "json::exception", raw.index));
        } catch (const std::exception& e) {
            failed++;
            errors.record(entity_id, e.what(), failure_context("classify", "std::exception", raw.index));
        }
    };

    const int worker_count = config_.workers;
    Logger::step("Ingesting with " + std::to_string(worker_count) + " workers");

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (int i = 0; i < worker_count; ++i) {
        workers.emplace_back([&]() {
            RawLine raw;
            while (queue.pop(raw)) {
                process(raw);
            }
        });
    }

    // Reader: this thread numbers lines and feeds the pool
    std::exception_ptr reader_error;
    try {
        std::string line;
        int64_t index = 0;
        while (reader.next_line(line)) {
            if (flusher.fatal()) {
                break;
            }
            RawLine raw;
            raw.index = index++;
            raw.text = std::move(line);
            line.clear();
            if (!queue.push(std::move(raw))) {
                break;
            }
            if (progress_callback_ && config_.progress_interval > 0 &&
                index % config_.progress_interval == 0) {
                progress_callback_(processed.load() + failed.load() + malformed.load(),
                                   reader.estimated_total());
            }
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Reading the dump failed: ") + e.what());
        reader_error = std::current_exception();
    }

    queue.close();
    for (auto& t : workers) {
        t.join();
    }

    if (reader_error) {
        flusher.stop();
        std::rethrow_exception(reader_error);
    }

    writer.flush_all();
    errors.close();
    flusher.wait_all();
    flusher.stop();

    if (progress_callback_) {
        progress_callback_(processed.load() + failed.load() + malformed.load(), reader.estimated_total());
    }

    stats_.lines_read = reader.lines_read();
    stats_.entities_processed = processed.load();
    stats_.malformed_lines = malformed.load();
    stats_.entities_failed = failed.load();
    stats_.estimated_total = reader.estimated_total();
    stats_.average_line_size = reader.average_line_size();

    for (RecordKind kind : entity_record_kinds()) {
        stats_.records_written[kind] = flusher.records_written(kind);
    }
    stats_.records_written[RecordKind::Errors] = flusher.records_written(RecordKind::Errors);
    stats_.batches_flushed = flusher.batches_flushed();
    stats_.batches_failed = flusher.batches_failed();

    stats_.graph_queries = resolver_.queries_issued() - queries_before;
    stats_.superclass_lookups = superclass_cache_.misses() - misses_before;
    stats_.superclass_cache_hits = superclass_cache_.hits() - hits_before;

    stats_.total_time_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (flusher.fatal()) {
        throw StoreError(flusher.fatal_message());
    }

    Logger::success("Ingested " + std::to_string(stats_.entities_processed) + " entities");
    return stats_;
}

// ============================================================================
// Factories
// ============================================================================

std::unique_ptr<RecordStore> create_record_store(const IngestConfig& config) {
    if (config.backend == "jsonl") {
        return std::make_unique<JsonlRecordStore>(config.output_directory);
    }
    if (config.backend == "postgres") {
        PostgresStoreConfig pg;
        pg.conninfo = config.conninfo;
        pg.schema = config.resolved_schema();
        pg.log_schema = config.log_schema;
        return std::make_unique<PostgresRecordStore>(pg);
    }
    throw std::invalid_argument("Unknown backend: " + config.backend);
}

std::unique_ptr<GraphQueryClient> create_graph_client(const IngestConfig& config) {
    return std::make_unique<SparqlGraphClient>(config.graph_config());
}

} // namespace wdi
