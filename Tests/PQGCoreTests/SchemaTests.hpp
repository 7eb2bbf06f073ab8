#pragma once

#include "TestSupport.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace schema_tests {

using namespace test_support;
using pqg::field_type;

inline bool has_index(pqg::database& db, const std::string& name) {
    auto rows = db.query("SELECT name FROM sqlite_master WHERE type = 'index' AND name = ?", {name});
    return !rows.empty();
}

inline void test_initialize_creates_relation() {
    std::cout << "Testing initialize creates the shared relation..." << std::endl;

    auto g = make_graph();
    assert(g->is_initialized());
    assert(g->db().table_exists("node"));
    assert(g->db().table_exists("_pqg_meta"));

    auto columns = g->db().get_table_info("node");
    for (const char* reserved : pqg::reserved_fields) {
        assert(columns.count(reserved) == 1);
    }
    assert(columns["name"] == "TEXT");
    assert(columns["age"] == "INTEGER");
    assert(columns["score"] == "REAL");
    assert(columns["active"] == "INTEGER");
    assert(columns["born"] == "REAL");
    assert(columns["nicknames"] == "TEXT");
    assert(columns["photo"] == "BLOB");
    // Reference fields become edges, never columns
    assert(columns.count("friend") == 0);
    assert(columns.count("pets") == 0);

    assert(has_index(g->db(), "idx_node_otype"));
    assert(has_index(g->db(), "idx_node_s"));
    assert(has_index(g->db(), "idx_node_p"));
    assert(has_index(g->db(), "idx_node_n"));

    std::cout << "  Initialize test passed!" << std::endl;
}

inline void test_metadata_written() {
    std::cout << "Testing metadata rows..." << std::endl;

    auto g = make_graph();
    std::map<std::string, std::string> meta;
    for (auto& row : g->db().query("SELECT key, value FROM _pqg_meta")) {
        meta[std::get<std::string>(row["key"])] = std::get<std::string>(row["value"]);
    }

    assert(meta["version"] == PQG_VERSION_STRING);
    assert(meta["primary_key"] == "pid");

    auto edge_fields = nlohmann::json::parse(meta["edge_fields"]);
    assert(edge_fields == nlohmann::json({"s", "p", "o", "n"}));

    auto node_types = nlohmann::json::parse(meta["node_types"]);
    assert(node_types.contains("Person"));
    assert(node_types["Person"]["pets"] == "reference_list");
    assert(node_types["Pet"]["owner"] == "reference");

    auto literals = nlohmann::json::parse(meta["literal_fields"]).get<std::vector<std::string>>();
    assert(std::find(literals.begin(), literals.end(), "age") != literals.end());
    assert(std::find(literals.begin(), literals.end(), "friend") == literals.end());

    std::cout << "  Metadata test passed!" << std::endl;
}

inline void test_registration_rules() {
    std::cout << "Testing type registration rules..." << std::endl;

    pqg::graph g;
    g.register_type({"Doc", {{"title", field_type::string}}});
    // Identical re-registration is a no-op
    g.register_type({"Doc", {{"title", field_type::string}}});
    assert(g.registry().type_names().size() == 1);

    assert(throws<pqg::config_error>([&] {
        g.register_type({"Doc", {{"title", field_type::integer}}});
    }));
    assert(throws<pqg::config_error>([&] {
        g.register_type({"", {{"title", field_type::string}}});
    }));
    assert(throws<pqg::config_error>([&] {
        g.register_type({pqg::edge_otype, {}});
    }));

    g.initialize();
    // Idempotent
    g.initialize();
    assert(throws<pqg::config_error>([&] {
        g.register_type({"Late", {{"x", field_type::integer}}});
    }));

    std::cout << "  Registration rules test passed!" << std::endl;
}

inline void test_reserved_field_rejected() {
    std::cout << "Testing reserved field names..." << std::endl;

    pqg::graph g;
    g.register_type({"Bad", {{"pid", field_type::string}}});
    assert(throws<pqg::config_error>([&] { g.initialize(); }));
    assert(!g.is_initialized());
    assert(!g.db().table_exists("node"));

    std::cout << "  Reserved field test passed!" << std::endl;
}

inline void test_cross_type_conflict() {
    std::cout << "Testing conflicting field types across node types..." << std::endl;

    pqg::graph g;
    g.register_type({"A", {{"size", field_type::integer}}});
    g.register_type({"B", {{"size", field_type::string}}});
    assert(throws<pqg::config_error>([&] { g.initialize(); }));
    assert(!g.db().table_exists("node"));

    // Same name and type in two node types share one column
    pqg::graph ok;
    ok.register_type({"A", {{"size", field_type::integer}}});
    ok.register_type({"B", {{"size", field_type::integer}}});
    ok.initialize();
    assert(ok.db().get_table_info("node").count("size") == 1);

    std::cout << "  Cross-type conflict test passed!" << std::endl;
}

inline void test_validation_rejects_bad_objects() {
    std::cout << "Testing node validation..." << std::endl;

    auto g = make_graph();

    pqg::node_object unknown("Robot", "r1");
    assert(throws<pqg::config_error>([&] { g->add_node(unknown); }));

    pqg::node_object undeclared("Pet", "p1");
    undeclared.set("color", "brown");
    assert(throws<pqg::config_error>([&] { g->add_node(undeclared); }));

    pqg::node_object wrong_kind("Person", "x1");
    wrong_kind.set("age", "forty");
    assert(throws<pqg::config_error>([&] { g->add_node(wrong_kind); }));

    pqg::node_object value_in_reference("Person", "x2");
    value_in_reference.set("friend", "x1");
    assert(throws<pqg::config_error>([&] { g->add_node(value_in_reference); }));

    pqg::node_object list_in_single("Person", "x3");
    list_in_single.append("friend", pqg::make_node("Person", "x4"));
    assert(throws<pqg::config_error>([&] { g->add_node(list_in_single); }));

    assert(g->object_counts().empty());

    std::cout << "  Validation test passed!" << std::endl;
}

inline void test_use_before_initialize() {
    std::cout << "Testing operations before initialize..." << std::endl;

    pqg::graph g;
    register_things(g);
    assert(throws<pqg::config_error>([&] { add_thing(g, "a"); }));
    assert(throws<pqg::config_error>([&] { g.get_node("a"); }));
    assert(throws<pqg::config_error>([&] { g.pid_to_row_id("a"); }));

    std::cout << "  Uninitialized use test passed!" << std::endl;
}

inline void test_reattach_file_database() {
    std::cout << "Testing reattaching a file database..." << std::endl;

    std::string path = temp_db_path("pqg_reattach_test.sqlite");
    {
        pqg::configuration config(path);
        auto g = make_graph(config);
        pqg::node_object alice("Person", "alice");
        alice.set("name", "Alice").set("age", 30);
        g->add_node(alice);
        add_thing(*g, "t1", "first");
        g->add_edge("alice", "likes", {"t1"});
    }
    {
        // No registration: types come back from _pqg_meta
        pqg::graph g{pqg::configuration(path)};
        assert(g.is_initialized());
        assert(g.registry().has_type("Person"));

        auto alice = g.get_node("alice");
        assert(alice.has_value());
        assert(alice->get<std::string>("name") == "Alice");
        assert(alice->get<int64_t>("age") == 30);

        auto relations = g.get_relations(std::string("alice")).to_vector();
        assert(relations.size() == 1);
        assert(relations[0].object == "t1");
    }
    remove_db(path);

    std::cout << "  Reattach test passed!" << std::endl;
}

inline void test_migration_adds_columns() {
    std::cout << "Testing migration of an existing relation..." << std::endl;

    std::string path = temp_db_path("pqg_migrate_test.sqlite");
    {
        pqg::graph g{pqg::configuration(path)};
        g.register_type({"Doc", {{"title", field_type::string}}});
        g.initialize();
        pqg::node_object doc("Doc", "d1");
        doc.set("title", "Old");
        g.add_node(doc);
    }
    {
        pqg::type_registry registry;
        registry.register_type({"Doc", {{"title", field_type::string}, {"pages", field_type::integer}}});
        pqg::graph g(pqg::configuration(path), std::move(registry));
        g.initialize();

        assert(g.db().get_table_info("node").count("pages") == 1);
        auto doc = g.get_node("d1");
        assert(doc->get<std::string>("title") == "Old");
        assert(!doc->get<int64_t>("pages").has_value());

        pqg::node_object updated("Doc", "d1");
        updated.set("title", "New").set("pages", 12);
        g.add_node(updated);
        assert(g.get_node("d1")->get<int64_t>("pages") == 12);
    }
    {
        pqg::type_registry registry;
        registry.register_type({"Doc", {{"title", field_type::integer}}});
        pqg::graph g(pqg::configuration(path), std::move(registry));
        assert(throws<pqg::config_error>([&] { g.initialize(); }));
    }
    remove_db(path);

    std::cout << "  Migration test passed!" << std::endl;
}

inline void test_reopen_and_register_again() {
    std::cout << "Testing register + initialize on a reopened database..." << std::endl;

    std::string path = temp_db_path("pqg_reregister_test.sqlite");
    auto open_and_register = [&](pqg::graph& g) {
        g.register_type({"Doc", {{"title", field_type::string}}});
        g.initialize();
    };
    {
        pqg::graph g{pqg::configuration(path)};
        open_and_register(g);
        pqg::node_object doc("Doc", "d1");
        doc.set("title", "First");
        g.add_node(doc);
    }
    {
        // Same program, second run: types are already stored
        pqg::graph g{pqg::configuration(path)};
        open_and_register(g);
        assert(g.is_initialized());
        assert(g.get_node("d1")->get<std::string>("title") == "First");

        pqg::node_object doc("Doc", "d2");
        doc.set("title", "Second");
        g.add_node(doc);
        assert(g.object_counts()["Doc"] == 2);

        // New or different types still need a fresh registry
        assert(throws<pqg::config_error>([&] {
            g.register_type({"Other", {{"x", field_type::integer}}});
        }));
        assert(throws<pqg::config_error>([&] {
            g.register_type({"Doc", {{"title", field_type::integer}}});
        }));
    }
    remove_db(path);

    std::cout << "  Re-register test passed!" << std::endl;
}

inline void test_migration_keeps_stored_types() {
    std::cout << "Testing migration keeps types it does not mention..." << std::endl;

    std::string path = temp_db_path("pqg_keep_types_test.sqlite");
    {
        pqg::graph g{pqg::configuration(path)};
        g.register_type({"Doc", {{"title", field_type::string}}});
        g.register_type({"Tag", {{"word", field_type::string}}});
        g.initialize();
        pqg::node_object tag("Tag", "t1");
        tag.set("word", "hello");
        g.add_node(tag);
    }
    {
        pqg::type_registry registry;
        registry.register_type({"Doc", {{"title", field_type::string}, {"pages", field_type::integer}}});
        pqg::graph g(pqg::configuration(path), std::move(registry));
        g.initialize();
        assert(g.registry().has_type("Tag"));
        assert(g.get_node("t1")->get<std::string>("word") == "hello");
    }
    {
        pqg::graph g{pqg::configuration(path)};
        assert(g.registry().has_type("Tag"));
        assert(g.registry().get_type("Doc")->find("pages") != nullptr);
        assert(g.get_node("t1")->get<std::string>("word") == "hello");
    }
    {
        // A new type is unified against the stored ones too
        pqg::type_registry registry;
        registry.register_type({"Note", {{"word", field_type::integer}}});
        pqg::graph g(pqg::configuration(path), std::move(registry));
        assert(throws<pqg::config_error>([&] { g.initialize(); }));
    }
    remove_db(path);

    std::cout << "  Stored types test passed!" << std::endl;
}

inline void test_read_only_graph() {
    std::cout << "Testing read-only graph..." << std::endl;

    std::string path = temp_db_path("pqg_read_only_test.sqlite");
    {
        auto g = make_graph(pqg::configuration(path));
        add_thing(*g, "a", "alpha");
    }
    {
        pqg::configuration config(path);
        config.read_only = true;
        pqg::graph g(config);
        assert(g.is_initialized());
        assert(g.get_node("a")->get<std::string>("title") == "alpha");
        assert(throws<pqg::db_error>([&] { add_thing(g, "b"); }));
        assert(!g.node_exists("b").has_value());
    }
    remove_db(path);

    std::cout << "  Read-only test passed!" << std::endl;
}

inline void run_all() {
    test_initialize_creates_relation();
    test_metadata_written();
    test_registration_rules();
    test_reserved_field_rejected();
    test_cross_type_conflict();
    test_validation_rejects_bad_objects();
    test_use_before_initialize();
    test_reattach_file_database();
    test_migration_adds_columns();
    test_reopen_and_register_again();
    test_migration_keeps_stored_types();
    test_read_only_graph();
}

} // namespace schema_tests
