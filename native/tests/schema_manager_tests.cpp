#include <catch2/catch.hpp>

#include "cql_schema_sync.h"
#include "fake_cql_session.h"

using namespace cql_schema_sync;
using cql_schema_sync::testing::FakeCQLSession;

namespace {

SchemaManagerOptions quiet(CatalogLayout layout = CatalogLayout::LEGACY) {
    SchemaManagerOptions options;
    options.catalog_layout = layout;
    options.verbose = false;
    return options;
}

TableSpec users_table() {
    TableSpec spec;
    spec.keyspace = "app";
    spec.table = "users";
    spec.columns = {
        column_from_flags("id", "uuid", COLUMN_PRIMARY_KEY | COLUMN_PARTITION_KEY),
        column_from_flags("email", "text", COLUMN_INDEXED),
        column_from_flags("name", "text", COLUMN_INDEXED),
    };
    return spec;
}

} // namespace

SCENARIO("creating a keyspace twice issues a single CREATE", "[manager][keyspace]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    KeyspaceOptions options;
    options.name = "k";

    manager.create_keyspace(options);
    REQUIRE_NOTHROW(manager.create_keyspace(options));

    REQUIRE(session.count_executed("CREATE KEYSPACE") == 1);
    REQUIRE(session.executed[0] ==
            "CREATE KEYSPACE k WITH REPLICATION = {'class': 'SimpleStrategy', 'replication_factor': 3}");
    REQUIRE(session.keyspaces.count("k") == 1);
}

SCENARIO("network topology keyspace carries datacenter factors and durable writes", "[manager][keyspace]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    KeyspaceOptions options;
    options.name = "k";
    options.strategy_class = "NetworkTopologyStrategy";
    options.replication_options = {{"dc1", "3"}, {"dc2", "2"}};
    manager.create_keyspace(options);

    REQUIRE(session.executed.size() == 1);
    const auto& statement = session.executed[0];
    REQUIRE(statement.find("'class': 'NetworkTopologyStrategy'") != std::string::npos);
    REQUIRE(statement.find("'dc1': 3") != std::string::npos);
    REQUIRE(statement.find("'dc2': 2") != std::string::npos);
    REQUIRE(statement.find("AND DURABLE_WRITES = true") != std::string::npos);
}

SCENARIO("deleting missing schema objects is a silent no-op", "[manager]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    REQUIRE_NOTHROW(manager.delete_keyspace("nope"));
    REQUIRE_NOTHROW(manager.delete_table(users_table()));
    REQUIRE(session.executed.empty());
}

SCENARIO("existing keyspaces and tables are dropped", "[manager]") {
    FakeCQLSession session;
    session.keyspaces = {"app"};
    session.tables["app"] = {"users"};
    SchemaManager manager(session, quiet());

    manager.delete_table(users_table());
    REQUIRE(session.executed.back() == "DROP TABLE app.users");
    REQUIRE(session.tables["app"].empty());

    manager.delete_keyspace("app");
    REQUIRE(session.executed.back() == "DROP KEYSPACE app");
    REQUIRE(session.keyspaces.empty());
}

SCENARIO("abstract descriptors never create tables", "[manager][table]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    auto spec = users_table();
    spec.is_abstract = true;

    REQUIRE_THROWS_AS(manager.create_table(spec), SchemaError);

    WHEN("the table already exists on the cluster") {
        session.keyspaces = {"app"};
        session.tables["app"] = {"users"};
        REQUIRE_THROWS_AS(manager.create_table(spec), SchemaError);
    }

    REQUIRE(session.executed.empty());
    REQUIRE(session.queries.empty());
}

SCENARIO("creating a table creates the keyspace, the table and its indexes", "[manager][table]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    manager.create_table(users_table());

    REQUIRE(session.executed == std::vector<std::string>{
        "CREATE KEYSPACE app WITH REPLICATION = {'class': 'SimpleStrategy', 'replication_factor': 3}",
        "CREATE TABLE app.users (id uuid, email text, name text, PRIMARY KEY ((id))) WITH read_repair_chance = 0.1",
        "CREATE INDEX index_users_email ON app.users (\"email\")",
        "CREATE INDEX index_users_name ON app.users (\"name\")",
    });
}

SCENARIO("creating a table twice converges without duplicate statements", "[manager][table]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    manager.create_table(users_table());
    const auto first_run = session.executed.size();

    manager.create_table(users_table());

    REQUIRE(session.executed.size() == first_run);
    REQUIRE(session.count_executed("CREATE TABLE") == 1);
    REQUIRE(session.count_executed("CREATE INDEX") == 2);
}

SCENARIO("only indexes missing from the catalog are created", "[manager][index]") {
    FakeCQLSession session;
    session.keyspaces = {"app"};
    session.tables["app"] = {"users"};
    session.indexes["app"] = {{"users", "index_users_email"}};
    SchemaManager manager(session, quiet());

    manager.create_table(users_table());

    REQUIRE(session.executed == std::vector<std::string>{
        "CREATE INDEX index_users_name ON app.users (\"name\")",
    });
}

SCENARIO("an index of the same name on another table does not count", "[manager][index]") {
    FakeCQLSession session;
    session.keyspaces = {"app"};
    session.tables["app"] = {"users"};
    session.indexes["app"] = {{"accounts", "index_users_email"}};
    SchemaManager manager(session, quiet());

    manager.create_table(users_table());

    REQUIRE(session.count_executed("CREATE INDEX index_users_email") == 1);
}

SCENARIO("the keyspace is left alone when asked not to create it", "[manager][table]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    manager.create_table(users_table(), false);

    REQUIRE(session.count_executed("CREATE KEYSPACE") == 0);
    REQUIRE(session.count_executed("CREATE TABLE") == 1);
}

SCENARIO("a concurrent table creation is tolerated", "[manager][table]") {
    FakeCQLSession session;
    session.keyspaces = {"app"};
    SchemaManager manager(session, quiet());

    session.execute_failures.push_back(
        "Statement failed: Cannot add already existing column family \"users\" to keyspace \"app\"");

    REQUIRE_NOTHROW(manager.create_table(users_table()));
    THEN("the index pass still runs") {
        REQUIRE(session.count_executed("CREATE INDEX") == 2);
    }
}

SCENARIO("a concurrent keyspace creation is tolerated", "[manager][keyspace]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    session.execute_failures.push_back("Statement failed: Cannot add existing keyspace \"k\"");

    KeyspaceOptions options;
    options.name = "k";
    REQUIRE_NOTHROW(manager.create_keyspace(options));
    REQUIRE(session.count_executed("CREATE KEYSPACE") == 1);
}

SCENARIO("a concurrent index creation is tolerated", "[manager][index]") {
    FakeCQLSession session;
    session.keyspaces = {"app"};
    session.tables["app"] = {"users"};
    SchemaManager manager(session, quiet());

    session.execute_failures.push_back("Statement failed: Index index_users_email already exists");

    REQUIRE_NOTHROW(manager.create_table(users_table()));
    THEN("the remaining indexes are still created") {
        REQUIRE(session.count_executed("CREATE INDEX") == 2);
        REQUIRE(session.indexes["app"].count({"users", "index_users_name"}) == 1);
    }
}

SCENARIO("any other DDL failure raises SchemaError", "[manager][table]") {
    FakeCQLSession session;
    session.keyspaces = {"app"};
    SchemaManager manager(session, quiet());

    session.execute_failures.push_back("Statement failed: Unknown type uuidd");

    REQUIRE_THROWS_AS(manager.create_table(users_table()), SchemaError);
    REQUIRE(session.count_executed("CREATE INDEX") == 0);
}

SCENARIO("a failing drop raises SchemaError", "[manager]") {
    FakeCQLSession session;
    session.keyspaces = {"app"};
    SchemaManager manager(session, quiet());

    session.execute_failures.push_back("Statement failed: Operation timed out");
    REQUIRE_THROWS_AS(manager.delete_keyspace("app"), SchemaError);
}

SCENARIO("invalid descriptors are rejected before any statement", "[manager][table]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    auto spec = users_table();
    spec.columns.push_back(column_from_flags("email", "text"));

    REQUIRE_THROWS_AS(manager.create_table(spec), SchemaError);
    REQUIRE(session.executed.empty());
}

SCENARIO("sessions are connected for the call and released afterwards", "[manager][session]") {
    FakeCQLSession session;
    SchemaManager manager(session, quiet());

    GIVEN("a disconnected session") {
        manager.delete_keyspace("app");
        REQUIRE(session.connect_count == 1);
        REQUIRE(session.disconnect_count == 1);
        REQUIRE_FALSE(session.is_connected());
    }

    GIVEN("an already connected session") {
        session.connect();
        manager.delete_keyspace("app");
        REQUIRE(session.connect_count == 1);
        REQUIRE(session.disconnect_count == 0);
        REQUIRE(session.is_connected());
    }

    GIVEN("a cluster that cannot be reached") {
        session.fail_connect = true;
        REQUIRE_THROWS_AS(manager.delete_keyspace("app"), SchemaError);
    }
}

SCENARIO("system_schema clusters are detected and use IF NOT EXISTS when enabled", "[manager][capabilities]") {
    FakeCQLSession session(CatalogLayout::MODERN);
    auto options = quiet(CatalogLayout::AUTO);
    options.use_if_not_exists = true;
    SchemaManager manager(session, options);

    auto caps = manager.capabilities();
    REQUIRE(caps.layout == CatalogLayout::MODERN);
    REQUIRE(caps.use_if_not_exists);

    manager.create_table(users_table());

    REQUIRE(session.executed[0].rfind("CREATE KEYSPACE IF NOT EXISTS app", 0) == 0);
    REQUIRE(session.executed[1].rfind("CREATE TABLE IF NOT EXISTS app.users (", 0) == 0);
    REQUIRE(session.executed[2] == "CREATE INDEX IF NOT EXISTS index_users_email ON app.users (\"email\")");

    WHEN("the table is created again") {
        manager.create_table(users_table());
        THEN("nothing new is issued") {
            REQUIRE(session.executed.size() == 4);
        }
    }
}

SCENARIO("legacy clusters fall back to the system keyspace catalog", "[manager][capabilities]") {
    FakeCQLSession session(CatalogLayout::LEGACY);
    SchemaManager manager(session, quiet(CatalogLayout::AUTO));

    REQUIRE(manager.capabilities().layout == CatalogLayout::LEGACY);
    REQUIRE_NOTHROW(manager.create_table(users_table()));
    REQUIRE(session.count_executed("CREATE TABLE") == 1);
}

SCENARIO("a failed layout probe is retried on the next call", "[manager][capabilities]") {
    FakeCQLSession session(CatalogLayout::MODERN);
    SchemaManager manager(session, quiet(CatalogLayout::AUTO));

    KeyspaceOptions options;
    options.name = "k";

    session.fail_queries = true;
    REQUIRE_THROWS_AS(manager.create_keyspace(options), SchemaError);
    REQUIRE(session.executed.empty());

    session.fail_queries = false;
    REQUIRE(manager.capabilities().layout == CatalogLayout::MODERN);

    manager.create_keyspace(options);
    REQUIRE(session.queries.back() == "SELECT keyspace_name FROM system_schema.keyspaces");
    REQUIRE(session.keyspaces.count("k") == 1);
}
