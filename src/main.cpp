#include "cli/cli.hpp"
#include "pipeline/ingest_pipeline.hpp"
#include "query/graph_client.hpp"
#include "taxonomy/taxonomy.hpp"
#include "util/logger.hpp"
#include <curl/curl.h>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace wdi;

// ============== Helper Functions ==============

// Environment, then --config file, then explicit options
IngestConfig load_config(const ParsedArgs& args) {
    IngestConfig config = IngestConfig::from_environment();

    if (args.has("config")) {
        const std::string& path = args.value("config");
        std::cout << "Loading config from: " << path << "\n";
        config.load_json_file(path);
    }

    if (args.has("endpoint")) config.endpoint_url = args.value("endpoint");
    if (args.has("backend")) config.backend = args.value("backend");
    if (args.has("output-dir")) config.output_directory = args.value("output-dir");
    if (args.has("conninfo")) config.conninfo = args.value("conninfo");
    if (args.has("schema")) config.schema = args.value("schema");
    if (args.has("workers")) config.workers = static_cast<int>(args.positive("workers"));
    if (args.has("batch-size")) config.batch_size = static_cast<int>(args.positive("batch-size"));
    if (args.has("taxonomy")) config.taxonomy_file = args.value("taxonomy");
    if (args.has("verbose")) config.verbose = true;

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }

    Logger::set_verbose(config.verbose);
    return config;
}

std::string format_count(uint64_t n) {
    std::string digits = std::to_string(n);
    std::string out;
    int group = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (group == 3) {
            out.insert(out.begin(), ',');
            group = 0;
        }
        out.insert(out.begin(), *it);
        group++;
    }
    return out;
}

// ============== wdingest ingest ==============
int cmd_ingest(const ParsedArgs& args) {
    std::string input_path = args.value("input");
    IngestConfig config = load_config(args);

    auto client = create_graph_client(config);
    auto store = create_record_store(config);

    IngestPipeline pipeline(config, *client, *store);

    auto started = std::chrono::steady_clock::now();
    pipeline.set_progress_callback([started](uint64_t processed, uint64_t estimated) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        std::ostringstream line;
        line << "\r  " << format_count(processed) << " / ~" << format_count(estimated);
        if (estimated > 0) {
            line << " (" << std::fixed << std::setprecision(1)
                 << (100.0 * static_cast<double>(processed) / static_cast<double>(estimated)) << "%)";
        }
        if (elapsed > 0.0) {
            line << "  " << std::fixed << std::setprecision(0)
                 << (static_cast<double>(processed) / elapsed) << " lines/s";
        }
        std::cout << line.str() << std::flush;
    });

    IngestStatistics stats = pipeline.run(input_path);
    std::cout << "\n";

    stats.print_summary();

    if (args.has("stats-output")) {
        const std::string& stats_path = args.value("stats-output");
        std::ofstream out(stats_path);
        if (!out.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + stats_path);
        }
        out << stats.to_json().dump(2);
        std::cout << "Statistics saved to: " << stats_path << "\n";
    }

    return 0;
}

// ============== wdingest taxonomy ==============
int cmd_taxonomy(const ParsedArgs& args) {
    std::string output_path = args.value("output");
    IngestConfig config = load_config(args);

    auto client = create_graph_client(config);
    TaxonomyResolver resolver(*client, config.retry_policy());

    Taxonomy taxonomy = resolver.build(default_taxonomy_specs());
    taxonomy.save_to_json(output_path);

    std::cout << "\nTaxonomy:\n";
    for (const auto& name : taxonomy.names()) {
        std::cout << "  " << name << ": " << taxonomy.size(name) << " classes\n";
    }
    std::cout << "Saved to: " << output_path << "\n";
    return 0;
}

// ============== wdingest superclasses ==============
int cmd_superclasses(const ParsedArgs& args) {
    std::string type_id = args.value("type");
    IngestConfig config = load_config(args);

    if (!is_entity_id(type_id)) {
        throw std::runtime_error("Not an entity identifier: " + type_id);
    }

    auto client = create_graph_client(config);
    TaxonomyResolver resolver(*client, config.retry_policy());

    SuperclassResult result = resolver.superclasses(type_id);
    if (!result.success) {
        std::cerr << "Lookup failed after " << result.attempts << " attempt(s): "
                  << result.error_message << "\n";
        return 1;
    }

    std::cout << type_id << ": " << result.ids.size() << " classes\n";
    for (const auto& id : result.ids) {
        std::cout << "  " << id << "\n";
    }
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Error: libcurl initialisation failed\n";
        return 1;
    }

    CommandLine cli("wdingest", "1.0.0", "Wikidata dump ingestion");

    cli.add_common_option({"config", 'c', "JSON configuration file"});
    cli.add_common_option({"endpoint", 'e', "SPARQL endpoint URL"});
    cli.add_common_option({"verbose", 'v', "Verbose logging", OptionKind::Flag});

    // wdingest ingest
    cli.add_command({
        "ingest",
        "Classify every entity of a Wikidata JSON dump and store the derived records",
        {
            {"input", 'i', "Dump file (.json, .json.gz or .json.bz2)", OptionKind::Value, true},
            {"backend", 'b', "Record store: postgres or jsonl"},
            {"output-dir", 'o', "Output directory for the jsonl backend"},
            {"conninfo", 'd', "PostgreSQL connection string (default: PG* variables)"},
            {"schema", 's', "Destination schema (default: wikidata<ddmmyyyy>)"},
            {"workers", 'w', "Classification threads"},
            {"batch-size", 'n', "Records per bulk insert"},
            {"taxonomy", 't', "Saved taxonomy file (skips remote resolution)"},
            {"stats-output", '\0', "Write run statistics as JSON to this file"}
        },
        cmd_ingest
    });

    // wdingest taxonomy
    cli.add_command({
        "taxonomy",
        "Resolve the organization and location taxonomies and save them",
        {
            {"output", 'o', "Output taxonomy JSON file", OptionKind::Value, true}
        },
        cmd_taxonomy
    });

    // wdingest superclasses
    cli.add_command({
        "superclasses",
        "Print the transitive superclass chain of one type",
        {
            {"type", 't', "Type identifier, e.g. Q5", OptionKind::Value, true}
        },
        cmd_superclasses
    });

    int rc = cli.dispatch(argc, argv);
    curl_global_cleanup();
    return rc;
}
