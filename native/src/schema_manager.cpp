/**
 * CQL Schema Sync - Schema Manager Implementation
 *
 * Creates keyspaces, tables and secondary indexes that are missing from the
 * cluster and drops the ones that are asked for.
 *
 * Copyright (c) 2025 ScyllaDB
 * Licensed under Apache License 2.0
 */

#include "cql_schema_sync.h"

#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace cql_schema_sync {

namespace {

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

const char* layout_name(CatalogLayout layout) {
    switch (layout) {
        case CatalogLayout::AUTO: return "auto";
        case CatalogLayout::LEGACY: return "legacy";
        case CatalogLayout::MODERN: return "system_schema";
    }
    return "unknown";
}

} // namespace

SchemaManager::SchemaManager(CQLSession& session, SchemaManagerOptions options)
    : session_(session),
      options_(options) {
}

CatalogLayout SchemaManager::resolve_layout(CQLSession& session) {
    if (options_.catalog_layout != CatalogLayout::AUTO) {
        return options_.catalog_layout;
    }

    if (!resolved_layout_) {
        resolved_layout_ = SchemaMetadataReader::detect_layout(session);
        if (options_.verbose) {
            std::cout << "Using " << layout_name(*resolved_layout_) << " schema catalog" << std::endl;
        }
    }
    return *resolved_layout_;
}

SchemaCapabilities SchemaManager::capabilities() {
    SchemaCapabilities caps;
    caps.use_if_not_exists = options_.use_if_not_exists;

    if (options_.catalog_layout != CatalogLayout::AUTO) {
        caps.layout = options_.catalog_layout;
    } else if (resolved_layout_) {
        caps.layout = *resolved_layout_;
    } else {
        ScopedSession scoped(session_);
        caps.layout = resolve_layout(scoped.get());
    }
    return caps;
}

void SchemaManager::execute_create(CQLSession& session, const std::string& statement, SchemaObjectKind kind) {
    if (options_.verbose) {
        std::cout << "Executing: " << statement << std::endl;
    }

    if (session.execute(statement)) {
        return;
    }

    std::string error = session.get_last_error();

    // Another client created the object between our catalog read and the
    // CREATE; the result is the same
    if (is_already_exists_error(kind, error)) {
        if (options_.verbose) {
            std::cerr << "Warning: ignoring concurrent creation: " << error << std::endl;
        }
        return;
    }

    throw SchemaError("Failed to execute '" + statement + "': " + error);
}

void SchemaManager::execute_drop(CQLSession& session, const std::string& statement) {
    if (options_.verbose) {
        std::cout << "Executing: " << statement << std::endl;
    }

    if (!session.execute(statement)) {
        throw SchemaError("Failed to execute '" + statement + "': " + session.get_last_error());
    }
}

// ============================================================================
// Keyspaces
// ============================================================================

void SchemaManager::create_keyspace(const KeyspaceOptions& options) {
    if (options.name.empty()) {
        throw SchemaError("keyspace name must not be empty");
    }

    ScopedSession scoped(session_);
    SchemaMetadataReader reader(scoped.get(), resolve_layout(scoped.get()));

    if (contains(reader.list_keyspaces(), options.name)) {
        return;
    }

    execute_create(scoped.get(),
                   DDLBuilder::create_keyspace(options, options_.use_if_not_exists),
                   SchemaObjectKind::KEYSPACE);
}

void SchemaManager::delete_keyspace(const std::string& name) {
    ScopedSession scoped(session_);
    SchemaMetadataReader reader(scoped.get(), resolve_layout(scoped.get()));

    if (!contains(reader.list_keyspaces(), name)) {
        return;
    }

    execute_drop(scoped.get(), DDLBuilder::drop_keyspace(name));
}

// ============================================================================
// Tables
// ============================================================================

void SchemaManager::create_table(const TableSpec& table, bool create_missing_keyspace) {
    if (table.is_abstract) {
        throw SchemaError("cannot create table from abstract descriptor " + table.qualified_name());
    }

    table.validate();

    if (create_missing_keyspace) {
        KeyspaceOptions keyspace;
        keyspace.name = table.keyspace;
        create_keyspace(keyspace);
    }

    ScopedSession scoped(session_);
    SchemaMetadataReader reader(scoped.get(), resolve_layout(scoped.get()));

    if (!contains(reader.list_tables(table.keyspace), table.table)) {
        execute_create(scoped.get(),
                       DDLBuilder::create_table(table, options_.use_if_not_exists),
                       SchemaObjectKind::TABLE);
    } else if (options_.verbose) {
        std::cout << "Table " << table.qualified_name() << " already exists" << std::endl;
    }

    // Existing indexes are matched on "<table>.<index>"
    const auto existing = reader.list_indexes(table.keyspace);
    std::unordered_set<std::string> existing_indexes(existing.begin(), existing.end());

    for (const auto& column : table.columns) {
        if (!column.is_indexed) {
            continue;
        }

        std::string index = DDLBuilder::index_name(table, column);
        if (existing_indexes.count(table.table + "." + index) > 0) {
            continue;
        }

        execute_create(scoped.get(),
                       DDLBuilder::create_index(table, column, options_.use_if_not_exists),
                       SchemaObjectKind::INDEX);
    }
}

void SchemaManager::delete_table(const TableSpec& table) {
    ScopedSession scoped(session_);
    SchemaMetadataReader reader(scoped.get(), resolve_layout(scoped.get()));

    // Nothing to do for tables that were never created
    if (!contains(reader.list_tables(table.keyspace), table.table)) {
        return;
    }

    execute_drop(scoped.get(), DDLBuilder::drop_table(table));
}

} // namespace cql_schema_sync
