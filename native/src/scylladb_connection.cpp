/**
 * CQL Schema Sync - ScyllaDB Connection Implementation
 *
 * Uses cpp-rs-driver (0.5.1) for ScyllaDB operations
 *
 * Copyright (c) 2025 ScyllaDB
 * Licensed under Apache License 2.0
 */

#include "cql_schema_sync.h"

#include <algorithm>
#include <cctype>

namespace cql_schema_sync {

// ============================================================================
// ScopedSession Implementation
// ============================================================================

ScopedSession::ScopedSession(CQLSession& session)
    : session_(session) {
    if (!session_.is_connected()) {
        if (!session_.connect()) {
            throw SchemaError("Failed to connect to cluster: " + session_.get_last_error());
        }
        owns_connection_ = true;
    }
}

ScopedSession::~ScopedSession() {
    if (owns_connection_) {
        session_.disconnect();
    }
}

// ============================================================================
// ScyllaDBConnection Implementation
// ============================================================================

ScyllaDBConnection::ScyllaDBConnection(const ScyllaDBConfig& config)
    : config_(config) {
}

ScyllaDBConnection::~ScyllaDBConnection() {
    disconnect();
}

bool ScyllaDBConnection::connect() {
    if (session_) {
        disconnect();
    }

    // Create cluster configuration
    cluster_ = cass_cluster_new();
    if (!cluster_) {
        last_error_ = "Failed to create cluster object";
        return false;
    }

    // Set contact points
    std::string contact_points;
    for (size_t i = 0; i < config_.contact_points.size(); i++) {
        if (i > 0) contact_points += ",";
        contact_points += config_.contact_points[i];
    }

    CassError rc = cass_cluster_set_contact_points(cluster_, contact_points.c_str());
    if (rc != CASS_OK) {
        last_error_ = std::string("Failed to set contact points: ") + cass_error_desc(rc);
        cass_cluster_free(cluster_);
        cluster_ = nullptr;
        return false;
    }

    rc = cass_cluster_set_port(cluster_, config_.port);
    if (rc != CASS_OK) {
        last_error_ = std::string("Failed to set port: ") + cass_error_desc(rc);
        cass_cluster_free(cluster_);
        cluster_ = nullptr;
        return false;
    }

    if (!config_.local_dc.empty()) {
        rc = cass_cluster_set_load_balance_dc_aware(cluster_, config_.local_dc.c_str(), 0, cass_false);
        if (rc != CASS_OK) {
            last_error_ = std::string("Failed to set local DC: ") + cass_error_desc(rc);
            cass_cluster_free(cluster_);
            cluster_ = nullptr;
            return false;
        }
    }

    if (!config_.user.empty()) {
        cass_cluster_set_credentials(cluster_, config_.user.c_str(), config_.password.c_str());
    }

    cass_cluster_set_core_connections_per_host(cluster_, config_.connections_per_host);

    // DDL requests block until schema agreement
    cass_cluster_set_request_timeout(cluster_, static_cast<unsigned>(config_.request_timeout_ms));

    if (config_.use_ssl) {
        CassSsl* ssl = cass_ssl_new();

        if (!config_.ssl_ca.empty()) {
            cass_ssl_set_verify_flags(ssl, CASS_SSL_VERIFY_PEER_CERT);
            cass_ssl_add_trusted_cert(ssl, config_.ssl_ca.c_str());
        }

        if (!config_.ssl_cert.empty() && !config_.ssl_key.empty()) {
            cass_ssl_set_cert(ssl, config_.ssl_cert.c_str());
            cass_ssl_set_private_key(ssl, config_.ssl_key.c_str(), nullptr);
        }

        cass_cluster_set_ssl(cluster_, ssl);
        cass_ssl_free(ssl);
    }

    session_ = cass_session_new();

    CassFuture* connect_future = cass_session_connect(session_, cluster_);
    cass_future_wait(connect_future);

    rc = cass_future_error_code(connect_future);
    if (rc != CASS_OK) {
        last_error_ = "Connection failed: " + future_error(connect_future);

        cass_future_free(connect_future);
        cass_session_free(session_);
        cass_cluster_free(cluster_);
        session_ = nullptr;
        cluster_ = nullptr;
        return false;
    }

    cass_future_free(connect_future);
    return true;
}

void ScyllaDBConnection::disconnect() {
    if (session_) {
        CassFuture* close_future = cass_session_close(session_);
        cass_future_wait(close_future);
        cass_future_free(close_future);
        cass_session_free(session_);
        session_ = nullptr;
    }

    if (cluster_) {
        cass_cluster_free(cluster_);
        cluster_ = nullptr;
    }
}

bool ScyllaDBConnection::is_connected() const {
    return session_ != nullptr;
}

CassConsistency ScyllaDBConnection::parse_consistency(const std::string& level) {
    std::string upper_level = level;
    std::transform(upper_level.begin(), upper_level.end(), upper_level.begin(), ::toupper);

    if (upper_level == "ANY") return CASS_CONSISTENCY_ANY;
    if (upper_level == "ONE") return CASS_CONSISTENCY_ONE;
    if (upper_level == "TWO") return CASS_CONSISTENCY_TWO;
    if (upper_level == "THREE") return CASS_CONSISTENCY_THREE;
    if (upper_level == "QUORUM") return CASS_CONSISTENCY_QUORUM;
    if (upper_level == "ALL") return CASS_CONSISTENCY_ALL;
    if (upper_level == "LOCAL_QUORUM") return CASS_CONSISTENCY_LOCAL_QUORUM;
    if (upper_level == "EACH_QUORUM") return CASS_CONSISTENCY_EACH_QUORUM;
    if (upper_level == "LOCAL_ONE") return CASS_CONSISTENCY_LOCAL_ONE;

    return CASS_CONSISTENCY_LOCAL_QUORUM;  // Default
}

std::string ScyllaDBConnection::future_error(CassFuture* future) const {
    const char* message;
    size_t message_length;
    cass_future_error_message(future, &message, &message_length);
    return std::string(message, message_length);
}

bool ScyllaDBConnection::execute(const std::string& statement_text) {
    if (!is_connected()) {
        last_error_ = "Not connected to ScyllaDB";
        return false;
    }

    CassStatement* statement = cass_statement_new(statement_text.c_str(), 0);
    CassFuture* future = cass_session_execute(session_, statement);

    cass_future_wait(future);
    CassError rc = cass_future_error_code(future);

    if (rc != CASS_OK) {
        last_error_ = "Statement failed: " + future_error(future);

        cass_future_free(future);
        cass_statement_free(statement);
        return false;
    }

    cass_future_free(future);
    cass_statement_free(statement);
    return true;
}

bool ScyllaDBConnection::query(
    const std::string& statement_text,
    const std::vector<std::string>& parameters,
    const std::function<void(const std::vector<std::string>&)>& row_callback
) {
    if (!is_connected()) {
        last_error_ = "Not connected to ScyllaDB";
        return false;
    }

    CassStatement* statement = cass_statement_new(statement_text.c_str(), parameters.size());
    cass_statement_set_consistency(statement, parse_consistency(config_.consistency_level));

    for (size_t idx = 0; idx < parameters.size(); idx++) {
        cass_statement_bind_string(statement, idx, parameters[idx].c_str());
    }

    CassFuture* future = cass_session_execute(session_, statement);
    cass_future_wait(future);

    CassError rc = cass_future_error_code(future);
    if (rc != CASS_OK) {
        last_error_ = "Query failed: " + future_error(future);

        cass_future_free(future);
        cass_statement_free(statement);
        return false;
    }

    const CassResult* result = cass_future_get_result(future);
    const size_t column_count = cass_result_column_count(result);
    CassIterator* rows = cass_iterator_from_result(result);

    try {
        std::vector<std::string> values;
        while (cass_iterator_next(rows)) {
            const CassRow* row = cass_iterator_get_row(rows);

            values.clear();
            for (size_t i = 0; i < column_count; i++) {
                const CassValue* value = cass_row_get_column(row, i);
                const char* text;
                size_t text_length;

                if (value && !cass_value_is_null(value) &&
                    cass_value_get_string(value, &text, &text_length) == CASS_OK) {
                    values.emplace_back(text, text_length);
                } else {
                    values.emplace_back();
                }
            }
            row_callback(values);
        }
    } catch (...) {
        cass_iterator_free(rows);
        cass_result_free(result);
        cass_future_free(future);
        cass_statement_free(statement);
        throw;
    }

    cass_iterator_free(rows);
    cass_result_free(result);
    cass_future_free(future);
    cass_statement_free(statement);
    return true;
}

std::string ScyllaDBConnection::get_last_error() const {
    return last_error_;
}

} // namespace cql_schema_sync
