/**
 * @file postgres_store.hpp
 * @brief PostgreSQL connection and the JSONB-backed record store
 */

#pragma once

#include "storage/record_store.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>
#include <vector>

namespace wdi {

// ============================================================================
// Connection
// ============================================================================

/**
 * @brief libpq connection wrapper
 */
class PostgresConnection {
public:
    /**
     * @brief Connect using environment variables
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, wikidata, postgres, (no password)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    bool is_connected() const;

    /**
     * @brief Execute a statement (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Stream COPY data after a COPY ... FROM STDIN statement
     */
    void copy_data(const char* buffer, int nbytes);

    /**
     * @brief Finish the COPY started by execute()
     */
    void copy_end(const char* error_msg = nullptr);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        void commit();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
    };

    std::string last_error() const { return last_error_; }

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

// ============================================================================
// Record Store
// ============================================================================

/**
 * @brief Settings of the PostgreSQL destination
 */
struct PostgresStoreConfig {
    std::string conninfo;                   ///< Empty: use PG* environment variables
    std::string schema = "wikidata";        ///< Schema holding items/objects/literals/types
    std::string log_schema = "wikidata";    ///< Schema holding the error log table
};

/**
 * @brief One table per record kind, documents stored as JSONB
 *
 * items(id_entity, entity, category, popularity, doc) with unique (entity, category);
 * objects/literals/types(id_entity, entity, doc) with unique (entity);
 * log(id, entity, error, context, created_at).
 * Inserts go through COPY. Entity kinds are staged in a temp table and merged with
 * ON CONFLICT DO NOTHING, so re-running a dump into the same schema adds no duplicates.
 * The error log is append-only.
 */
class PostgresRecordStore : public RecordStore {
public:
    /**
     * @throws StoreError if the connection cannot be established
     */
    explicit PostgresRecordStore(const PostgresStoreConfig& config);

    void ensure_indexes() override;
    void insert_many(RecordKind kind, const std::vector<nlohmann::json>& documents) override;
    bool is_available() const override;
    std::string get_name() const override { return "postgres:" + config_.schema; }

    /**
     * @brief DDL issued by ensure_indexes(), all IF NOT EXISTS
     */
    static std::vector<std::string> schema_statements(const std::string& schema,
                                                      const std::string& log_schema);

    /**
     * @brief Column list COPY writes for a kind
     */
    static std::vector<std::string> columns_for(RecordKind kind);

    /**
     * @brief One COPY text-format row for a document, '\n' terminated
     */
    static std::string copy_row(RecordKind kind, const nlohmann::json& document);

    /**
     * @brief Escape a value for COPY text format
     *
     * Absent and null fields are written as \N by copy_row(); an empty
     * string stays an empty string.
     */
    static std::string escape_copy_value(const std::string& value);

    /**
     * @brief Serialize a document for a JSONB column, without U+0000
     */
    static std::string jsonb_text(const nlohmann::json& document);

    static std::string quote_identifier(const std::string& id);

private:
    PostgresStoreConfig config_;
    std::unique_ptr<PostgresConnection> conn_;

    std::string table_for(RecordKind kind) const;
};

} // namespace wdi
