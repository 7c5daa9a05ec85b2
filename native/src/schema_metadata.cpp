/**
 * CQL Schema Sync - System Catalog Reader
 *
 * Copyright (c) 2025 ScyllaDB
 * Licensed under Apache License 2.0
 */

#include "cql_schema_sync.h"

namespace cql_schema_sync {

namespace {

// Cassandra 1.2 / 2.x catalog
const char* const kLegacyKeyspacesQuery =
    "SELECT keyspace_name FROM system.schema_keyspaces";
const char* const kLegacyTablesQuery =
    "SELECT columnfamily_name FROM system.schema_columnfamilies WHERE keyspace_name = ?";
// IndexInfo is keyed by keyspace in table_name and stores "<table>.<index>"
const char* const kLegacyIndexesQuery =
    "SELECT index_name FROM system.\"IndexInfo\" WHERE table_name = ?";

// Cassandra 3+ / ScyllaDB catalog
const char* const kModernKeyspacesQuery =
    "SELECT keyspace_name FROM system_schema.keyspaces";
const char* const kModernTablesQuery =
    "SELECT table_name FROM system_schema.tables WHERE keyspace_name = ?";
const char* const kModernIndexesQuery =
    "SELECT table_name, index_name FROM system_schema.indexes WHERE keyspace_name = ?";

const char* const kProbeQuery =
    "SELECT keyspace_name FROM system_schema.keyspaces LIMIT 1";

// Servers without system_schema reject the probe with one of these
bool is_missing_catalog_error(const std::string& message) {
    static const char* const markers[] = {
        "unconfigured table",
        "unconfigured columnfamily",
        "Keyspace system_schema does not exist",
        "keyspace system_schema does not exist"
    };
    for (const char* marker : markers) {
        if (message.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> first_column(const std::vector<std::vector<std::string>>& rows) {
    std::vector<std::string> values;
    values.reserve(rows.size());
    for (const auto& row : rows) {
        if (!row.empty()) {
            values.push_back(row[0]);
        }
    }
    return values;
}

} // namespace

SchemaMetadataReader::SchemaMetadataReader(CQLSession& session, CatalogLayout layout)
    : session_(session),
      layout_(layout == CatalogLayout::AUTO ? detect_layout(session) : layout) {
}

CatalogLayout SchemaMetadataReader::detect_layout(CQLSession& session) {
    if (session.query(kProbeQuery, {}, [](const std::vector<std::string>&) {})) {
        return CatalogLayout::MODERN;
    }

    const std::string error = session.get_last_error();
    if (is_missing_catalog_error(error)) {
        return CatalogLayout::LEGACY;
    }
    throw SchemaError("Failed to detect schema catalog layout: " + error);
}

std::vector<std::vector<std::string>> SchemaMetadataReader::read_rows(
    const std::string& statement,
    const std::vector<std::string>& parameters
) {
    std::vector<std::vector<std::string>> rows;
    bool ok = session_.query(statement, parameters,
        [&rows](const std::vector<std::string>& row) { rows.push_back(row); });

    if (!ok) {
        throw SchemaError("Failed to read schema catalog: " + session_.get_last_error());
    }
    return rows;
}

std::vector<std::string> SchemaMetadataReader::list_keyspaces() {
    const char* statement = layout_ == CatalogLayout::MODERN
        ? kModernKeyspacesQuery
        : kLegacyKeyspacesQuery;
    return first_column(read_rows(statement, {}));
}

std::vector<std::string> SchemaMetadataReader::list_tables(const std::string& keyspace) {
    const char* statement = layout_ == CatalogLayout::MODERN
        ? kModernTablesQuery
        : kLegacyTablesQuery;
    return first_column(read_rows(statement, {keyspace}));
}

std::vector<std::string> SchemaMetadataReader::list_indexes(const std::string& keyspace) {
    if (layout_ != CatalogLayout::MODERN) {
        return first_column(read_rows(kLegacyIndexesQuery, {keyspace}));
    }

    std::vector<std::string> names;
    for (const auto& row : read_rows(kModernIndexesQuery, {keyspace})) {
        if (row.size() >= 2) {
            names.push_back(row[0] + "." + row[1]);
        }
    }
    return names;
}

} // namespace cql_schema_sync
