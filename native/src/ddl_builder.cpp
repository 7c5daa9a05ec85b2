/**
 * CQL Schema Sync - DDL Builder Implementation
 *
 * Copyright (c) 2025 ScyllaDB
 * Licensed under Apache License 2.0
 */

#include "cql_schema_sync.h"

#include <sstream>
#include <algorithm>
#include <cctype>
#include <limits>
#include <locale>

namespace cql_schema_sync {

namespace {

const char* const kDefaultStrategyClass = "SimpleStrategy";

bool is_numeric_literal(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string quote_identifier(const std::string& name) {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted += '"';
    for (char c : name) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

std::string join(const std::vector<std::string>& items) {
    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << items[i];
    }
    return out.str();
}

} // namespace

// ============================================================================
// Already-exists detection
// ============================================================================

bool is_already_exists_error(SchemaObjectKind kind, const std::string& message) {
    switch (kind) {
        case SchemaObjectKind::KEYSPACE:
            return message.find("Cannot add existing keyspace") != std::string::npos;

        case SchemaObjectKind::TABLE:
            // Cassandra 1.2 speaks of column families, later versions of tables
            return message.find("Cannot add already existing column family") != std::string::npos ||
                   message.find("Cannot add already existing table") != std::string::npos;

        case SchemaObjectKind::INDEX:
            return message.find("already exists") != std::string::npos;
    }
    return false;
}

// ============================================================================
// DDLBuilder Implementation
// ============================================================================

std::string DDLBuilder::escape_cql_identifier(const std::string& name) {
    // CQL keywords that need quoting
    static const std::vector<std::string> keywords = {
        "add", "allow", "alter", "and", "any", "apply", "asc", "authorize",
        "batch", "begin", "by", "columnfamily", "create", "default", "delete",
        "desc", "describe", "drop", "entries", "execute", "from", "full",
        "grant", "if", "in", "index", "infinity", "insert", "into", "is",
        "keyspace", "limit", "materialized", "mbean", "mbeans", "modify",
        "nan", "norecursive", "not", "null", "of", "on", "or", "order",
        "primary", "rename", "replace", "revoke", "schema", "select", "set",
        "table", "to", "token", "truncate", "unlogged", "unset", "update",
        "use", "using", "view", "where", "with"
    };

    if (name.empty()) {
        return "\"\"";
    }

    bool needs_quoting = std::find(keywords.begin(), keywords.end(), name) != keywords.end();

    // The server lower-cases unquoted identifiers
    if (!needs_quoting) {
        for (char c : name) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (!(std::islower(uc) || std::isdigit(uc) || c == '_')) {
                needs_quoting = true;
                break;
            }
        }
        if (std::isdigit(static_cast<unsigned char>(name[0]))) {
            needs_quoting = true;
        }
    }

    if (needs_quoting) {
        return quote_identifier(name);
    }
    return name;
}

std::string DDLBuilder::escape_cql_string(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped += '\'';
    for (char c : value) {
        if (c == '\'') {
            escaped += "''";
        } else {
            escaped += c;
        }
    }
    escaped += '\'';
    return escaped;
}

std::string DDLBuilder::replication_map_literal(const KeyspaceOptions& options) {
    std::vector<std::pair<std::string, std::string>> entries = {
        {"class", escape_cql_string(options.strategy_class)},
        {"replication_factor", std::to_string(options.replication_factor)}
    };

    for (const auto& option : options.replication_options) {
        std::string value = is_numeric_literal(option.second)
            ? option.second
            : escape_cql_string(option.second);

        auto it = std::find_if(entries.begin(), entries.end(),
            [&option](const std::pair<std::string, std::string>& entry) {
                return entry.first == option.first;
            });
        if (it != entries.end()) {
            it->second = value;
        } else {
            entries.emplace_back(option.first, value);
        }
    }

    std::ostringstream literal;
    literal << "{";
    bool first = true;
    for (const auto& entry : entries) {
        if (!first) {
            literal << ", ";
        }
        literal << escape_cql_string(entry.first) << ": " << entry.second;
        first = false;
    }
    literal << "}";
    return literal.str();
}

std::string DDLBuilder::create_keyspace(const KeyspaceOptions& options, bool if_not_exists) {
    std::ostringstream cql;

    cql << "CREATE KEYSPACE " << (if_not_exists ? "IF NOT EXISTS " : "")
        << escape_cql_identifier(options.name)
        << " WITH REPLICATION = " << replication_map_literal(options);

    // durable_writes is left to the server default for SimpleStrategy
    if (options.strategy_class != kDefaultStrategyClass) {
        cql << " AND DURABLE_WRITES = " << (options.durable_writes ? "true" : "false");
    }

    return cql.str();
}

std::string DDLBuilder::drop_keyspace(const std::string& name) {
    return "DROP KEYSPACE " + escape_cql_identifier(name);
}

std::string DDLBuilder::table_reference(const TableSpec& table) {
    return escape_cql_identifier(table.keyspace) + "." + escape_cql_identifier(table.table);
}

std::string DDLBuilder::primary_key_clause(const TableSpec& table) {
    std::vector<std::string> partition;
    for (const auto* col : table.partition_keys()) {
        partition.push_back(escape_cql_identifier(col->name));
    }

    std::ostringstream clause;
    clause << "PRIMARY KEY ((" << join(partition) << ")";
    for (const auto* col : table.clustering_keys()) {
        clause << ", " << escape_cql_identifier(col->name);
    }
    clause << ")";
    return clause.str();
}

std::string DDLBuilder::format_read_repair_chance(double chance) {
    // Shortest representation that reads back to the same double
    std::string text;
    for (int precision = 1; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
        std::ostringstream out;
        out.imbue(std::locale::classic());
        out.precision(precision);
        out << chance;
        text = out.str();

        std::istringstream in(text);
        in.imbue(std::locale::classic());
        double parsed = 0.0;
        if ((in >> parsed) && parsed == chance) {
            break;
        }
    }
    return text;
}

std::string DDLBuilder::create_table(const TableSpec& table, bool if_not_exists) {
    std::ostringstream cql;

    cql << "CREATE TABLE " << (if_not_exists ? "IF NOT EXISTS " : "")
        << table_reference(table) << " (";

    // Column definitions
    for (const auto& col : table.columns) {
        cql << escape_cql_identifier(col.name) << " " << col.cql_type << ", ";
    }
    cql << primary_key_clause(table) << ")";

    cql << " WITH read_repair_chance = " << format_read_repair_chance(table.read_repair_chance);

    const auto clustering = table.clustering_keys();
    bool custom_order = std::any_of(clustering.begin(), clustering.end(),
        [](const ColumnSpec* col) { return col->clustering_order == ClusteringOrder::DESC; });

    if (custom_order) {
        std::vector<std::string> order;
        for (const auto* col : clustering) {
            order.push_back(escape_cql_identifier(col->name) + " "
                            + (col->clustering_order == ClusteringOrder::DESC ? "DESC" : "ASC"));
        }
        cql << " AND clustering order by (" << join(order) << ")";
    }

    return cql.str();
}

std::string DDLBuilder::drop_table(const TableSpec& table) {
    return "DROP TABLE " + table_reference(table);
}

std::string DDLBuilder::index_name(const TableSpec& table, const ColumnSpec& column) {
    return "index_" + table.table + "_" + column.name;
}

std::string DDLBuilder::create_index(const TableSpec& table, const ColumnSpec& column, bool if_not_exists) {
    std::ostringstream cql;
    cql << "CREATE INDEX " << (if_not_exists ? "IF NOT EXISTS " : "")
        << escape_cql_identifier(index_name(table, column))
        << " ON " << table_reference(table)
        << " (" << quote_identifier(column.name) << ")";
    return cql.str();
}

} // namespace cql_schema_sync
