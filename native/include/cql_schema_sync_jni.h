/**
 * CQL Schema Sync - JNI Interface for JVM Integration
 *
 * This header defines the JNI (Java Native Interface) bindings that allow
 * JVM code to call into the native C++ schema manager.
 *
 * Copyright (c) 2025 ScyllaDB
 * Licensed under Apache License 2.0
 */

#ifndef CQL_SCHEMA_SYNC_JNI_H
#define CQL_SCHEMA_SYNC_JNI_H

#include <jni.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    nativeInit
 * Signature: ()V
 *
 * Initialize the native library. Must be called once before any other methods.
 */
JNIEXPORT void JNICALL Java_com_scylladb_schemasync_NativeBridge_nativeInit
  (JNIEnv *, jclass);

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    nativeShutdown
 * Signature: ()V
 */
JNIEXPORT void JNICALL Java_com_scylladb_schemasync_NativeBridge_nativeShutdown
  (JNIEnv *, jclass);

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    createSchemaManager
 * Signature: (Ljava/lang/String;ILjava/lang/String;Ljava/lang/String;Ljava/lang/String;IZ)J
 *
 * Create a schema manager bound to a ScyllaDB connection and return a handle.
 *
 * @param contactPoints Comma separated contact points
 * @param port Native transport port
 * @param localDc Local datacenter, may be null
 * @param user Username, may be null
 * @param password Password, may be null
 * @param catalogLayout 0 = auto, 1 = legacy, 2 = system_schema
 * @param useIfNotExists Emit IF NOT EXISTS in CREATE statements
 * @return Handle to native object (0 on failure)
 */
JNIEXPORT jlong JNICALL Java_com_scylladb_schemasync_NativeBridge_createSchemaManager
  (JNIEnv *, jclass, jstring, jint, jstring, jstring, jstring, jint, jboolean);

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    destroySchemaManager
 * Signature: (J)V
 */
JNIEXPORT void JNICALL Java_com_scylladb_schemasync_NativeBridge_destroySchemaManager
  (JNIEnv *, jclass, jlong);

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    connect
 * Signature: (J)Z
 *
 * Open the connection up front; otherwise each call connects on its own.
 */
JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_connect
  (JNIEnv *, jclass, jlong);

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    createKeyspace
 * Signature: (JLjava/lang/String;Ljava/lang/String;IZ[Ljava/lang/String;[Ljava/lang/String;)Z
 *
 * @param name Keyspace name
 * @param strategyClass Replication strategy class, null for SimpleStrategy
 * @param replicationFactor Replication factor
 * @param durableWrites Durable writes flag
 * @param optionKeys Extra replication map keys, may be null
 * @param optionValues Values matching optionKeys
 * @return true on success; see getLastError otherwise
 */
JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_createKeyspace
  (JNIEnv *, jclass, jlong, jstring, jstring, jint, jboolean, jobjectArray, jobjectArray);

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    deleteKeyspace
 * Signature: (JLjava/lang/String;)Z
 */
JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_deleteKeyspace
  (JNIEnv *, jclass, jlong, jstring);

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    createTable
 * Signature: (JLjava/lang/String;Ljava/lang/String;[Ljava/lang/String;[Ljava/lang/String;[IDZ)Z
 *
 * Create a table and its missing indexes.
 *
 * @param keyspace Owning keyspace
 * @param table Table name
 * @param columnNames Column names in declaration order
 * @param columnTypes CQL types matching columnNames
 * @param columnFlags ColumnFlag bitmask per column
 * @param readRepairChance read_repair_chance table option
 * @param createMissingKeyspace Create the keyspace with defaults if missing
 */
JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_createTable
  (JNIEnv *, jclass, jlong, jstring, jstring, jobjectArray, jobjectArray, jintArray, jdouble, jboolean);

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    deleteTable
 * Signature: (JLjava/lang/String;Ljava/lang/String;)Z
 */
JNIEXPORT jboolean JNICALL Java_com_scylladb_schemasync_NativeBridge_deleteTable
  (JNIEnv *, jclass, jlong, jstring, jstring);

/*
 * Class:     com_scylladb_schemasync_NativeBridge
 * Method:    getLastError
 * Signature: (J)Ljava/lang/String;
 */
JNIEXPORT jstring JNICALL Java_com_scylladb_schemasync_NativeBridge_getLastError
  (JNIEnv *, jclass, jlong);

#ifdef __cplusplus
}
#endif

#endif // CQL_SCHEMA_SYNC_JNI_H
