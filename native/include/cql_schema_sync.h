/**
 * CQL Schema Sync - Cassandra/ScyllaDB Schema Management
 *
 * This header defines the C++ interface for synchronizing declared table
 * descriptors with the schema of a live Cassandra or ScyllaDB cluster.
 * It uses the cpp-rs-driver (0.5.1) / DataStax C/C++ driver API for the cluster.
 *
 * Copyright (c) 2025 ScyllaDB
 * Licensed under Apache License 2.0
 */

#ifndef CQL_SCHEMA_SYNC_H
#define CQL_SCHEMA_SYNC_H

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

// ScyllaDB cpp-rs-driver headers
#include <cassandra.h>

namespace cql_schema_sync {

/**
 * Raised when a schema operation cannot be completed
 */
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * On-disk ordering of a clustering column
 */
enum class ClusteringOrder {
    UNSET,
    ASC,
    DESC
};

/**
 * Represents a declared column of a table descriptor
 */
struct ColumnSpec {
    std::string name;           // db-facing field name
    std::string cql_type;       // e.g., "text", "int", "map<text, int>"
    bool is_primary_key = false;
    bool is_partition_key = false;
    bool is_indexed = false;
    ClusteringOrder clustering_order = ClusteringOrder::UNSET;
};

/**
 * Column flag bits used by the JNI bridge to describe a ColumnSpec
 */
enum ColumnFlag : int32_t {
    COLUMN_PRIMARY_KEY = 1 << 0,
    COLUMN_PARTITION_KEY = 1 << 1,
    COLUMN_INDEXED = 1 << 2,
    COLUMN_CLUSTERING_ASC = 1 << 3,
    COLUMN_CLUSTERING_DESC = 1 << 4
};

/**
 * Build a ColumnSpec from a ColumnFlag bitmask
 */
ColumnSpec column_from_flags(const std::string& name, const std::string& cql_type, int32_t flags = 0);

/**
 * Represents a declared table (column family) and its owning keyspace
 */
struct TableSpec {
    std::string keyspace;
    std::string table;
    bool is_abstract = false;   // abstract descriptors have no backing table
    std::vector<ColumnSpec> columns;
    double read_repair_chance = 0.1;

    /**
     * "<keyspace>.<table>" without any quoting
     */
    std::string qualified_name() const;

    /**
     * Partition key columns in declaration order.
     * When no column is flagged as partition key, the first primary key
     * column is used.
     */
    std::vector<const ColumnSpec*> partition_keys() const;

    /**
     * Primary key columns that are not partition keys, in declaration order
     */
    std::vector<const ColumnSpec*> clustering_keys() const;

    /**
     * Check the descriptor before any DDL is built
     * @throws SchemaError on empty names, duplicate column names or a
     *         missing primary key
     */
    void validate() const;
};

/**
 * Options for creating a keyspace
 */
struct KeyspaceOptions {
    std::string name;
    std::string strategy_class = "SimpleStrategy";
    int32_t replication_factor = 3;
    bool durable_writes = true;

    // Merged into the replication map after class and replication_factor;
    // a key that is already present is overridden in place
    std::vector<std::pair<std::string, std::string>> replication_options;
};

/**
 * Layout of the system catalog tables
 */
enum class CatalogLayout {
    AUTO,       // probe system_schema, fall back to LEGACY
    LEGACY,     // system.schema_keyspaces / schema_columnfamilies / "IndexInfo"
    MODERN      // system_schema.keyspaces / tables / indexes
};

/**
 * Kind of schema object a DDL statement creates
 */
enum class SchemaObjectKind {
    KEYSPACE,
    TABLE,
    INDEX
};

/**
 * What the target cluster supports
 */
struct SchemaCapabilities {
    CatalogLayout layout = CatalogLayout::LEGACY;
    bool use_if_not_exists = false;
};

/**
 * Check whether a failed CREATE was rejected only because the object
 * already exists. Servers without IF NOT EXISTS report this as an error
 * whose text is the only way to tell it apart from a real failure.
 */
bool is_already_exists_error(SchemaObjectKind kind, const std::string& message);

/**
 * Configuration for ScyllaDB connection
 */
struct ScyllaDBConfig {
    std::vector<std::string> contact_points;
    uint16_t port = 9042;
    std::string local_dc;

    // Authentication
    std::string user;
    std::string password;

    // SSL configuration
    bool use_ssl = false;
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;

    // Performance settings
    int32_t connections_per_host = 1;
    int32_t request_timeout_ms = 12000;
    std::string consistency_level = "LOCAL_QUORUM";
};

/**
 * Minimal session interface the schema layer needs from a CQL driver
 */
class CQLSession {
public:
    virtual ~CQLSession() = default;

    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    /**
     * Execute a statement without parameters and discard its result
     */
    virtual bool execute(const std::string& statement) = 0;

    /**
     * Execute a query with positional text parameters
     * @param row_callback Called for each row with the column values as text
     */
    virtual bool query(
        const std::string& statement,
        const std::vector<std::string>& parameters,
        const std::function<void(const std::vector<std::string>&)>& row_callback
    ) = 0;

    virtual std::string get_last_error() const = 0;
};

/**
 * Scoped acquisition of a session: connects when the session is not yet
 * connected and disconnects on scope exit only in that case
 */
class ScopedSession {
public:
    /**
     * @throws SchemaError if the session cannot be connected
     */
    explicit ScopedSession(CQLSession& session);
    ~ScopedSession();

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    CQLSession& get() { return session_; }
    CQLSession* operator->() { return &session_; }

private:
    CQLSession& session_;
    bool owns_connection_ = false;
};

/**
 * Main class for ScyllaDB connection and operations
 */
class ScyllaDBConnection : public CQLSession {
public:
    explicit ScyllaDBConnection(const ScyllaDBConfig& config);
    ~ScyllaDBConnection() override;

    // Prevent copying
    ScyllaDBConnection(const ScyllaDBConnection&) = delete;
    ScyllaDBConnection& operator=(const ScyllaDBConnection&) = delete;

    /**
     * Connect to ScyllaDB cluster
     */
    bool connect() override;

    /**
     * Disconnect from ScyllaDB cluster
     */
    void disconnect() override;

    /**
     * Check if connected
     */
    bool is_connected() const override;

    /**
     * Execute a DDL statement
     */
    bool execute(const std::string& statement) override;

    /**
     * Execute a catalog query, binding parameters as text
     */
    bool query(
        const std::string& statement,
        const std::vector<std::string>& parameters,
        const std::function<void(const std::vector<std::string>&)>& row_callback
    ) override;

    /**
     * Get last error
     */
    std::string get_last_error() const override;

    /**
     * Map a consistency level name to the driver constant
     */
    static CassConsistency parse_consistency(const std::string& level);

private:
    ScyllaDBConfig config_;
    CassCluster* cluster_ = nullptr;
    CassSession* session_ = nullptr;
    std::string last_error_;

    std::string future_error(CassFuture* future) const;
};

/**
 * Reads existing schema objects from the system catalog
 */
class SchemaMetadataReader {
public:
    /**
     * @param layout LEGACY or MODERN; AUTO is resolved by detect_layout
     */
    SchemaMetadataReader(CQLSession& session, CatalogLayout layout);

    /**
     * Probe for system_schema and pick the catalog layout
     *
     * Falls back to LEGACY only when the server reports system_schema as
     * unknown; any other probe failure throws SchemaError.
     */
    static CatalogLayout detect_layout(CQLSession& session);

    /**
     * Names of all keyspaces
     */
    std::vector<std::string> list_keyspaces();

    /**
     * Names of the tables (column families) of a keyspace
     */
    std::vector<std::string> list_tables(const std::string& keyspace);

    /**
     * Index names of a keyspace, qualified as "<table>.<index>"
     */
    std::vector<std::string> list_indexes(const std::string& keyspace);

private:
    CQLSession& session_;
    CatalogLayout layout_;

    std::vector<std::vector<std::string>> read_rows(
        const std::string& statement,
        const std::vector<std::string>& parameters
    );
};

/**
 * DDL builder - turns descriptors into CQL statements
 */
class DDLBuilder {
public:
    /**
     * Quote an identifier unless it is a plain lower-case name
     */
    static std::string escape_cql_identifier(const std::string& name);

    /**
     * Single-quote a string literal
     */
    static std::string escape_cql_string(const std::string& value);

    /**
     * Render {'class': ..., 'replication_factor': ..., ...}
     */
    static std::string replication_map_literal(const KeyspaceOptions& options);

    static std::string create_keyspace(const KeyspaceOptions& options, bool if_not_exists = false);
    static std::string drop_keyspace(const std::string& name);

    /**
     * "<keyspace>.<table>" with each part quoted as needed
     */
    static std::string table_reference(const TableSpec& table);

    /**
     * PRIMARY KEY ((pk1, pk2), ck1, ck2)
     */
    static std::string primary_key_clause(const TableSpec& table);

    /**
     * Generate CREATE TABLE statement
     * @param table Validated table descriptor
     * @param if_not_exists Emit CREATE TABLE IF NOT EXISTS
     */
    static std::string create_table(const TableSpec& table, bool if_not_exists = false);
    static std::string drop_table(const TableSpec& table);

    /**
     * Deterministic index name: index_<table>_<column>
     */
    static std::string index_name(const TableSpec& table, const ColumnSpec& column);
    static std::string create_index(const TableSpec& table, const ColumnSpec& column, bool if_not_exists = false);

private:
    static std::string format_read_repair_chance(double chance);
};

/**
 * Options for SchemaManager
 */
struct SchemaManagerOptions {
    CatalogLayout catalog_layout = CatalogLayout::AUTO;
    bool use_if_not_exists = false;
    bool verbose = true;
};

/**
 * Main class that creates and drops keyspaces, tables and indexes so that
 * the cluster matches the declared descriptors
 */
class SchemaManager {
public:
    explicit SchemaManager(CQLSession& session, SchemaManagerOptions options = SchemaManagerOptions());

    /**
     * Create a keyspace unless it already exists
     * @throws SchemaError
     */
    void create_keyspace(const KeyspaceOptions& options);

    /**
     * Drop a keyspace if it exists
     * @throws SchemaError
     */
    void delete_keyspace(const std::string& name);

    /**
     * Create the table and its missing secondary indexes
     * @param table Table descriptor; must not be abstract
     * @param create_missing_keyspace Create the owning keyspace with default
     *        replication first
     * @throws SchemaError
     */
    void create_table(const TableSpec& table, bool create_missing_keyspace = true);

    /**
     * Drop the table if it exists
     * @throws SchemaError
     */
    void delete_table(const TableSpec& table);

    /**
     * Capabilities in effect; resolves CatalogLayout::AUTO on first call
     */
    SchemaCapabilities capabilities();

private:
    CQLSession& session_;
    SchemaManagerOptions options_;
    std::optional<CatalogLayout> resolved_layout_;

    CatalogLayout resolve_layout(CQLSession& session);
    void execute_create(CQLSession& session, const std::string& statement, SchemaObjectKind kind);
    void execute_drop(CQLSession& session, const std::string& statement);
};

} // namespace cql_schema_sync

#endif // CQL_SCHEMA_SYNC_H
