/**
 * CQL Schema Sync - JNI Implementation
 *
 * Implements the JNI bindings for calling native C++ code from Java/Scala.
 *
 * Copyright (c) 2025 ScyllaDB
 * Licensed under Apache License 2.0
 */

#include "cql_schema_sync_jni.h"
#include "cql_schema_sync.h"

#include <string>
#include <sstream>
#include <memory>
#include <mutex>

using namespace cql_schema_sync;

// Global state for the native library
static std::mutex g_mutex;
static bool g_initialized = false;

namespace {

/**
 * Native object behind a jlong handle
 */
struct SchemaManagerHandle {
    SchemaManagerHandle(const ScyllaDBConfig& config, const SchemaManagerOptions& options)
        : connection(config),
          manager(connection, options) {}

    ScyllaDBConnection connection;
    SchemaManager manager;
    std::string last_error;
};

// Helper to convert jstring to std::string
std::string jstring_to_string(JNIEnv* env, jstring jstr) {
    if (!jstr) return "";
    const char* chars = env->GetStringUTFChars(jstr, nullptr);
    std::string result(chars);
    env->ReleaseStringUTFChars(jstr, chars);
    return result;
}

// Helper to convert std::string to jstring
jstring string_to_jstring(JNIEnv* env, const std::string& str) {
    return env->NewStringUTF(str.c_str());
}

std::vector<std::string> jstring_array_to_vector(JNIEnv* env, jobjectArray array) {
    std::vector<std::string> result;
    if (!array) return result;

    jsize length = env->GetArrayLength(array);
    result.reserve(length);
    for (jsize i = 0; i < length; i++) {
        auto element = static_cast<jstring>(env->GetObjectArrayElement(array, i));
        result.push_back(jstring_to_string(env, element));
        env->DeleteLocalRef(element);
    }
    return result;
}

std::vector<int32_t> jint_array_to_vector(JNIEnv* env, jintArray array) {
    std::vector<int32_t> result;
    if (!array) return result;

    jsize length = env->GetArrayLength(array);
    result.resize(length);
    env->GetIntArrayRegion(array, 0, length, reinterpret_cast<jint*>(result.data()));
    return result;
}

CatalogLayout catalog_layout_from_int(jint value) {
    switch (value) {
        case 1: return CatalogLayout::LEGACY;
        case 2: return CatalogLayout::MODERN;
        default: return CatalogLayout::AUTO;
    }
}

// Exceptions must not cross into the JVM; record them as the handle's last error
template <typename Operation>
jboolean run_guarded(SchemaManagerHandle* handle, Operation operation) {
    try {
        operation();
        handle->last_error.clear();
        return JNI_TRUE;
    } catch (const SchemaError& e) {
        handle->last_error = e.what();
    } catch (const std::exception& e) {
        handle->last_error = std::string("Unexpected error: ") + e.what();
    }
    return JNI_FALSE;
}

} // namespace

// ============================================================================
// JNI Function Implementations
// ============================================================================

JNIEXPORT void JNICALL Java_com_scylladb_schemasync_NativeBridge_nativeInit
  (JNIEnv* env, jclass cls) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_initialized) {
        cass_log_set_level(CASS_LOG_WARN);
        g_initialized = true;
    }
}

JNIEXPORT void JNICALL Java_com_scylladb_schemasync_NativeBridge_nativeShutdown
  (JNIEnv* env, jclass cls) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_initialized = false;
}

JNIEXPORT jlong JNICALL Java_com_scylladb_schemasync_NativeBridge_createSchemaManager
  (JNIEnv* env, jclass cls, jstring contactPoints, jint port, jstring localDc,
   jstring user, jstring password, jint catalogLayout, jboolean useIfNotExists) {

    ScyllaDBConfig config;

    // Parse contact points
    std::string cp = jstring_to_string(env, contactPoints);
    std::stringstream ss(cp);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (!token.empty()) {
            config.contact_points.push_back(token);
        }
    }

    if (config.contact_points.empty()) {
        return 0;
    }

    config.port = static_cast<uint16_t>(port);
    if (localDc) config.local_dc = jstring_to_string(env, localDc);
    if (user) config.user = jstring_to_string(env, user);
    if (password) config.password = jstring_to_string(env, password);

    SchemaManagerOptions options;
    options.catalog_layout = catalog_layout_from_int(catalogLayout);
    options.use_if_not_exists = useIfNotExists == JNI_TRUE;
    options.verbose = false;

    auto* handle = new SchemaManagerHandle(config, options);
    return reinterpret_cast<jlong>(handle);
}

JNIEXPORT void JNICALL Java_com_scylladb_schemasync_NativeBridge_destroySchemaManager
  (JNIEnv* env, jclass cls, jlong handle) {
    auto* manager = reinterpret_cast<SchemaManagerHandle*>(handle);
    delete manager;
}

JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_connect
  (JNIEnv* env, jclass cls, jlong handle) {
    auto* manager = reinterpret_cast<SchemaManagerHandle*>(handle);
    if (!manager->connection.connect()) {
        manager->last_error = manager->connection.get_last_error();
        return JNI_FALSE;
    }
    return JNI_TRUE;
}

JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_createKeyspace
  (JNIEnv* env, jclass cls, jlong handle, jstring name, jstring strategyClass,
   jint replicationFactor, jboolean durableWrites, jobjectArray optionKeys, jobjectArray optionValues) {
    auto* manager = reinterpret_cast<SchemaManagerHandle*>(handle);

    KeyspaceOptions options;
    options.name = jstring_to_string(env, name);
    if (strategyClass) options.strategy_class = jstring_to_string(env, strategyClass);
    options.replication_factor = replicationFactor;
    options.durable_writes = durableWrites == JNI_TRUE;

    auto keys = jstring_array_to_vector(env, optionKeys);
    auto values = jstring_array_to_vector(env, optionValues);
    if (keys.size() != values.size()) {
        manager->last_error = "replication option keys and values differ in length";
        return JNI_FALSE;
    }
    for (size_t i = 0; i < keys.size(); i++) {
        options.replication_options.emplace_back(keys[i], values[i]);
    }

    return run_guarded(manager, [&]() { manager->manager.create_keyspace(options); });
}

JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_deleteKeyspace
  (JNIEnv* env, jclass cls, jlong handle, jstring name) {
    auto* manager = reinterpret_cast<SchemaManagerHandle*>(handle);
    std::string keyspace = jstring_to_string(env, name);
    return run_guarded(manager, [&]() { manager->manager.delete_keyspace(keyspace); });
}

JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_createTable
  (JNIEnv* env, jclass cls, jlong handle, jstring keyspace, jstring table,
   jobjectArray columnNames, jobjectArray columnTypes, jintArray columnFlags,
   jdouble readRepairChance, jboolean createMissingKeyspace) {
    auto* manager = reinterpret_cast<SchemaManagerHandle*>(handle);

    auto names = jstring_array_to_vector(env, columnNames);
    auto types = jstring_array_to_vector(env, columnTypes);
    auto flags = jint_array_to_vector(env, columnFlags);
    if (names.size() != types.size() || names.size() != flags.size()) {
        manager->last_error = "column names, types and flags differ in length";
        return JNI_FALSE;
    }

    TableSpec spec;
    spec.keyspace = jstring_to_string(env, keyspace);
    spec.table = jstring_to_string(env, table);
    spec.read_repair_chance = readRepairChance;
    for (size_t i = 0; i < names.size(); i++) {
        spec.columns.push_back(column_from_flags(names[i], types[i], flags[i]));
    }

    bool create_keyspace = createMissingKeyspace == JNI_TRUE;
    return run_guarded(manager, [&]() { manager->manager.create_table(spec, create_keyspace); });
}

JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_deleteTable
  (JNIEnv* env, jclass cls, jlong handle, jstring keyspace, jstring table) {
    auto* manager = reinterpret_cast<SchemaManagerHandle*>(handle);

    TableSpec spec;
    spec.keyspace = jstring_to_string(env, keyspace);
    spec.table = jstring_to_string(env, table);
    return run_guarded(manager, [&]() { manager->manager.delete_table(spec); });
}

JNIEXPORT jstring JNICALL Java_com_scylladb_schemasync_NativeBridge_getLastError
  (JNIEnv* env, jclass cls, jlong handle) {
    auto* manager = reinterpret_cast<SchemaManagerHandle*>(handle);
    return string_to_jstring(env, manager->last_error);
}
