/**
 * @file postgres_store.cpp
 * @brief PostgreSQL connection and record store implementation
 */

#include "storage/postgres_store.hpp"
#include "util/logger.hpp"
#include <cstdlib>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace wdi {

// ============================================================================
// PostgresConnection
// ============================================================================

PostgresConnection::PostgresConnection() {
    std::ostringstream conninfo;

    const char* host = std::getenv("PGHOST");
    const char* port = std::getenv("PGPORT");
    const char* dbname = std::getenv("PGDATABASE");
    const char* user = std::getenv("PGUSER");
    const char* password = std::getenv("PGPASSWORD");

    conninfo << "host=" << (host ? host : "localhost") << " ";
    conninfo << "port=" << (port ? port : "5432") << " ";
    conninfo << "dbname=" << (dbname ? dbname : "wikidata") << " ";
    conninfo << "user=" << (user ? user : "postgres") << " ";

    if (password) {
        conninfo << "password=" << password << " ";
    }

    connect(conninfo.str());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StoreError("PostgreSQL connection failed: " + last_error_);
    }

    // Bulk loading: trade durability for speed
    execute("SET synchronous_commit = off");
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_COPY_IN && status != PGRES_COPY_OUT) {
        last_error_ = PQerrorMessage(conn_);
        PQclear(result);
        throw StoreError("PostgreSQL query failed: " + last_error_);
    }
}

void PostgresConnection::execute(const std::string& sql) {
    if (!is_connected()) {
        throw StoreError("Not connected to database");
    }

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

void PostgresConnection::copy_data(const char* buffer, int nbytes) {
    if (!is_connected()) {
        throw StoreError("Not connected to database");
    }

    if (PQputCopyData(conn_, buffer, nbytes) == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw StoreError("COPY data failed: " + last_error_);
    }
}

void PostgresConnection::copy_end(const char* error_msg) {
    if (!is_connected()) {
        throw StoreError("Not connected to database");
    }

    if (PQputCopyEnd(conn_, error_msg) == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw StoreError("COPY end failed: " + last_error_);
    }

    // The COPY outcome arrives as one more result, followed by nullptr
    PGresult* res = PQgetResult(conn_);
    check_result(res);
    PQclear(res);
    while ((res = PQgetResult(conn_)) != nullptr) {
        PQclear(res);
    }
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_ && conn_.is_connected()) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Rollback failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

// ============================================================================
// PostgresRecordStore
// ============================================================================

PostgresRecordStore::PostgresRecordStore(const PostgresStoreConfig& config) : config_(config) {
    if (config_.conninfo.empty()) {
        conn_ = std::make_unique<PostgresConnection>();
    } else {
        conn_ = std::make_unique<PostgresConnection>(config_.conninfo);
    }
}

std::string PostgresRecordStore::quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string PostgresRecordStore::table_for(RecordKind kind) const {
    const std::string& schema = (kind == RecordKind::Errors) ? config_.log_schema : config_.schema;
    return quote_identifier(schema) + "." + quote_identifier(to_string(kind));
}

std::vector<std::string> PostgresRecordStore::schema_statements(const std::string& schema,
                                                                const std::string& log_schema) {
    const std::string s = quote_identifier(schema);
    const std::string ls = quote_identifier(log_schema);

    std::vector<std::string> sql = {
        "CREATE SCHEMA IF NOT EXISTS " + s,
        "CREATE TABLE IF NOT EXISTS " + s + ".\"items\" ("
            "\"id_entity\" BIGINT NOT NULL, \"entity\" TEXT NOT NULL, \"category\" TEXT NOT NULL, "
            "\"popularity\" INTEGER NOT NULL DEFAULT 1, \"doc\" JSONB NOT NULL)",
    };

    for (const char* table : {"objects", "literals", "types"}) {
        sql.push_back("CREATE TABLE IF NOT EXISTS " + s + "." + quote_identifier(table) + " ("
                      "\"id_entity\" BIGINT NOT NULL, \"entity\" TEXT NOT NULL, \"doc\" JSONB NOT NULL)");
    }

    sql.push_back("CREATE SCHEMA IF NOT EXISTS " + ls);
    sql.push_back("CREATE TABLE IF NOT EXISTS " + ls + ".\"log\" ("
                  "\"id\" BIGSERIAL PRIMARY KEY, \"entity\" TEXT, \"error\" TEXT NOT NULL, "
                  "\"context\" TEXT, \"created_at\" TIMESTAMPTZ NOT NULL DEFAULT now())");

    sql.push_back("CREATE UNIQUE INDEX IF NOT EXISTS \"items_entity_category_key\" ON " + s +
                  ".\"items\" (\"entity\", \"category\")");
    for (const char* column : {"id_entity", "entity", "category", "popularity"}) {
        sql.push_back("CREATE INDEX IF NOT EXISTS " + quote_identifier(std::string("items_") + column + "_idx") +
                      " ON " + s + ".\"items\" (" + quote_identifier(column) + ")");
    }
    for (const char* table : {"objects", "literals", "types"}) {
        sql.push_back("CREATE UNIQUE INDEX IF NOT EXISTS " + quote_identifier(std::string(table) + "_entity_key") +
                      " ON " + s + "." + quote_identifier(table) + " (\"entity\")");
        sql.push_back("CREATE INDEX IF NOT EXISTS " + quote_identifier(std::string(table) + "_id_entity_idx") +
                      " ON " + s + "." + quote_identifier(table) + " (\"id_entity\")");
    }

    return sql;
}

void PostgresRecordStore::ensure_indexes() {
    for (const auto& statement : schema_statements(config_.schema, config_.log_schema)) {
        conn_->execute(statement);
    }
}

std::vector<std::string> PostgresRecordStore::columns_for(RecordKind kind) {
    switch (kind) {
        case RecordKind::Items:
            return {"id_entity", "entity", "category", "popularity", "doc"};
        case RecordKind::Errors:
            return {"entity", "error", "context"};
        default:
            return {"id_entity", "entity", "doc"};
    }
}

std::string PostgresRecordStore::escape_copy_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\0') continue;
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

std::string PostgresRecordStore::jsonb_text(const json& document) {
    std::string dumped = document.dump(-1, ' ', false, json::error_handler_t::replace);
    if (dumped.find("\\u0000") == std::string::npos) {
        return dumped;
    }

    // jsonb has no representation for U+0000; drop it, leaving other escapes intact
    std::string out;
    out.reserve(dumped.size());
    for (size_t i = 0; i < dumped.size(); ++i) {
        if (dumped[i] != '\\') {
            out += dumped[i];
            continue;
        }
        if (dumped.compare(i, 6, "\\u0000") == 0) {
            i += 5;
            continue;
        }
        out += dumped[i];
        if (i + 1 < dumped.size()) {
            out += dumped[++i];
        }
    }
    return out;
}

std::string PostgresRecordStore::copy_row(RecordKind kind, const json& document) {
    auto field = [&](const char* key) -> std::optional<std::string> {
        if (!document.contains(key) || document[key].is_null()) return std::nullopt;
        const auto& v = document[key];
        return v.is_string() ? v.get<std::string>() : v.dump();
    };

    std::vector<std::optional<std::string>> values;
    switch (kind) {
        case RecordKind::Items:
            values = {field("id_entity"), field("entity"), field("category"), field("popularity"),
                      jsonb_text(document)};
            break;
        case RecordKind::Errors:
            values = {field("entity"), field("error"), field("context")};
            break;
        default:
            values = {field("id_entity"), field("entity"), jsonb_text(document)};
            break;
    }

    std::string row;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) row += '\t';
        row += values[i] ? escape_copy_value(*values[i]) : std::string("\\N");
    }
    row += '\n';
    return row;
}

void PostgresRecordStore::insert_many(RecordKind kind, const std::vector<json>& documents) {
    if (documents.empty()) return;
    if (!is_available()) {
        throw StoreError("PostgreSQL connection lost");
    }

    std::string columns;
    for (const auto& c : columns_for(kind)) {
        if (!columns.empty()) columns += ", ";
        columns += quote_identifier(c);
    }

    const std::string target = table_for(kind);
    const bool staged = (kind != RecordKind::Errors);
    const std::string staging = quote_identifier("tmp_" + to_string(kind));

    PostgresConnection::Transaction txn(*conn_);

    if (staged) {
        conn_->execute("CREATE TEMP TABLE IF NOT EXISTS " + staging + " (LIKE " + target +
                       " INCLUDING DEFAULTS) ON COMMIT DELETE ROWS");
    }

    conn_->execute("COPY " + (staged ? staging : target) + " (" + columns + ") FROM STDIN");

    std::string buffer;
    for (const auto& doc : documents) {
        buffer += copy_row(kind, doc);
        if (buffer.size() >= (1 << 20)) {
            conn_->copy_data(buffer.data(), static_cast<int>(buffer.size()));
            buffer.clear();
        }
    }
    if (!buffer.empty()) {
        conn_->copy_data(buffer.data(), static_cast<int>(buffer.size()));
    }
    conn_->copy_end(nullptr);

    if (staged) {
        conn_->execute("INSERT INTO " + target + " (" + columns + ") SELECT " + columns +
                       " FROM " + staging + " ON CONFLICT DO NOTHING");
    }

    txn.commit();
}

bool PostgresRecordStore::is_available() const {
    return conn_ && conn_->is_connected();
}

} // namespace wdi
