#pragma once

#include "TestSupport.hpp"
#include <PQGCore.hpp>

namespace typed_edge_tests {

using namespace test_support;

inline std::unique_ptr<pqg::graph> make_sample_graph() {
    auto g = std::make_unique<pqg::graph>(ticking_config());
    for (const char* type : {"MaterialSampleRecord", "MaterialSampleCuration", "Agent",
                             "IdentifiedConcept", "SamplingEvent", "SamplingSite",
                             "GeospatialCoordLocation", "SampleRelation"}) {
        g->register_type({type, {{"name", pqg::field_type::string}}});
    }
    g->initialize();
    return g;
}

inline void add(pqg::graph& g, const std::string& type, const std::string& pid) {
    pqg::node_object node(type, pid);
    node.set("name", pid);
    g.add_node(node);
}

inline void test_catalog() {
    std::cout << "Testing the edge type catalog..." << std::endl;

    const auto& catalog = pqg::edge_type_catalog::isamples();
    assert(catalog.types().size() == 14);
    assert(catalog.by_subject("MaterialSampleRecord").size() == 8);
    assert(catalog.by_subject("SamplingEvent").size() == 4);
    assert(catalog.by_object("Agent").size() == 3);
    assert(catalog.by_object("IdentifiedConcept").size() == 5);
    assert(catalog.by_predicate("responsibility").size() == 2);
    assert(catalog.by_predicate("has_context_category").size() == 2);

    auto produced = catalog.infer("MaterialSampleRecord", "produced_by", "SamplingEvent");
    assert(produced.has_value());
    assert(!produced->multivalued);
    assert(produced->key() == "MaterialSampleRecord__produced_by__SamplingEvent");
    assert(catalog.find(produced->key()) != nullptr);
    assert(catalog.find("Nope__x__Nope") == nullptr);
    assert(!catalog.infer("Agent", "produced_by", "SamplingEvent").has_value());

    auto keywords = catalog.infer("MaterialSampleRecord", "keywords", "IdentifiedConcept");
    assert(keywords->multivalued);

    const std::string key = "SamplingSite__site_location__GeospatialCoordLocation";
    assert(!catalog.validate(key, "SamplingSite", "site_location", "GeospatialCoordLocation").has_value());
    assert(catalog.validate(key, "Agent", "site_location", "GeospatialCoordLocation") ==
           std::optional<std::string>("Subject type mismatch: expected SamplingSite, got Agent"));
    assert(catalog.validate("Bogus", "A", "b", "C") ==
           std::optional<std::string>("Unknown edge type: Bogus"));

    pqg::edge_type_catalog custom(std::vector<pqg::edge_type>{{"Thing", "next", "Thing", false, "chain"}});
    assert(custom.types().size() == 1);
    assert(custom.infer("Thing", "next", "Thing").has_value());

    std::cout << "  Catalog test passed!" << std::endl;
}

inline void test_inference_from_pids() {
    std::cout << "Testing edge type inference from stored nodes..." << std::endl;

    auto g = make_sample_graph();
    add(*g, "MaterialSampleRecord", "sample");
    add(*g, "SamplingEvent", "event");
    add(*g, "Agent", "agent");

    pqg::typed_edges typed(*g);
    auto t = typed.infer_from_pids("sample", "produced_by", "event");
    assert(t.has_value());
    assert(t->key() == "MaterialSampleRecord__produced_by__SamplingEvent");

    assert(!typed.infer_from_pids("sample", "produced_by", "agent").has_value());
    assert(!typed.infer_from_pids("missing", "produced_by", "event").has_value());
    assert(!typed.infer_from_pids("sample", "produced_by", "missing").has_value());

    std::cout << "  Inference test passed!" << std::endl;
}

inline void test_custom_catalog() {
    std::cout << "Testing typed edges over a custom catalog..." << std::endl;

    auto g = make_sample_graph();
    add(*g, "Agent", "mentor");
    add(*g, "Agent", "student");
    add(*g, "SamplingEvent", "event");

    // The catalog argument is a temporary that dies with this statement
    pqg::typed_edges typed(*g, pqg::edge_type_catalog(std::vector<pqg::edge_type>{
        {"Agent", "mentors", "Agent", true, "mentorship"}}));

    assert(typed.catalog().types().size() == 1);
    auto t = typed.infer_from_pids("mentor", "mentors", "student");
    assert(t.has_value());
    assert(t->key() == "Agent__mentors__Agent");
    assert(t->multivalued);

    auto pid = typed.add_typed_edge("mentor", "mentors", {"student"});
    assert(g->find_edge(pid).has_value());

    // Patterns from the default catalog are unknown here
    assert(!typed.infer_from_pids("event", "responsibility", "mentor").has_value());
    assert(throws<pqg::edge_type_error>([&] {
        typed.add_typed_edge("event", "responsibility", {"mentor"});
    }));

    std::cout << "  Custom catalog test passed!" << std::endl;
}

inline void test_validation_and_typed_writes() {
    std::cout << "Testing validated edge writes..." << std::endl;

    auto g = make_sample_graph();
    add(*g, "MaterialSampleRecord", "sample");
    add(*g, "SamplingEvent", "event");
    add(*g, "Agent", "agent");
    add(*g, "IdentifiedConcept", "rock");
    add(*g, "IdentifiedConcept", "soil");

    pqg::typed_edges typed(*g);
    assert(!typed.validate_edge("sample", "produced_by", "event").has_value());
    assert(typed.validate_edge("sample", "produced_by", "agent") ==
           std::optional<std::string>(
               "Edge pattern (MaterialSampleRecord, produced_by, Agent) does not match any known edge type"));
    assert(typed.validate_edge("sample", "produced_by", "missing") ==
           std::optional<std::string>(
               "Edge pattern (MaterialSampleRecord, produced_by, Unknown) does not match any known edge type"));

    auto registrant = pqg::edge_type_catalog::isamples().infer("MaterialSampleRecord", "registrant", "Agent");
    auto produced = typed.validate_edge("sample", "produced_by", "event", registrant);
    assert(produced == std::optional<std::string>(
        "Expected MaterialSampleRecord__registrant__Agent, but inferred "
        "MaterialSampleRecord__produced_by__SamplingEvent"));

    auto pid = typed.add_typed_edge("sample", "keywords", {"rock", "soil"});
    assert(g->find_edge(pid).has_value());

    assert(throws<pqg::edge_type_error>([&] {
        typed.add_typed_edge("sample", "keywords", {"rock", "agent"});
    }));
    assert(throws<pqg::edge_type_error>([&] {
        typed.add_typed_edge("sample", "produced_by", {"event"}, registrant);
    }));
    assert(g->predicate_counts().count("produced_by") == 0);

    // Validation can be skipped
    typed.add_typed_edge("sample", "mentions", {"agent"}, std::nullopt, std::nullopt, false);
    assert(g->predicate_counts()["mentions"] == 1);

    std::cout << "  Typed write test passed!" << std::endl;
}

inline void test_typed_queries_and_statistics() {
    std::cout << "Testing typed queries and statistics..." << std::endl;

    auto g = make_sample_graph();
    add(*g, "MaterialSampleRecord", "s1");
    add(*g, "MaterialSampleRecord", "s2");
    add(*g, "SamplingEvent", "e1");
    add(*g, "Agent", "a1");
    add(*g, "IdentifiedConcept", "c1");
    add(*g, "IdentifiedConcept", "c2");

    pqg::typed_edges typed(*g);
    typed.add_typed_edge("s1", "produced_by", {"e1"});
    typed.add_typed_edge("s2", "produced_by", {"e1"});
    typed.add_typed_edge("s1", "keywords", {"c1", "c2"});
    typed.add_typed_edge("e1", "responsibility", {"a1"});
    g->add_edge("a1", "likes", {"c1"});  // not a catalogued type

    const auto& catalog = typed.catalog();
    auto produced_by = *catalog.infer("MaterialSampleRecord", "produced_by", "SamplingEvent");
    auto keywords = *catalog.infer("MaterialSampleRecord", "keywords", "IdentifiedConcept");

    auto produced_edges = typed.edges_by_type(produced_by);
    assert(produced_edges.size() == 2);
    assert(produced_edges[0].subject == "s1");
    assert(produced_edges[0].type == produced_by);
    assert(typed.edges_by_type(produced_by, 1).size() == 1);

    auto keyword_edges = typed.edges_by_type(keywords);
    assert(keyword_edges.size() == 1);
    assert((keyword_edges[0].objects == std::vector<std::string>{"c1", "c2"}));

    auto from_samples = typed.edges_by_subject_type("MaterialSampleRecord");
    assert(from_samples.size() == 4);  // two produced_by, two keyword triples
    auto to_agents = typed.edges_by_object_type("Agent");
    assert(to_agents.size() == 1);
    assert(to_agents[0].subject == "e1");

    auto all = typed.typed_relations().to_vector();
    assert(all.size() == 6);
    size_t untyped = 0;
    for (const auto& r : all) {
        if (!r.type) {
            ++untyped;
            assert(r.predicate == "likes");
        }
    }
    assert(untyped == 1);

    assert(typed.typed_relations(std::nullopt, keywords).to_vector().size() == 2);
    assert(typed.typed_relations(std::string("s1"), produced_by).to_vector().size() == 1);
    assert(typed.typed_relations(std::nullopt, std::nullopt, std::nullopt, 3).to_vector().size() == 3);

    auto stats = typed.statistics();
    assert(stats.size() == 3);
    assert(stats[0].first == produced_by);
    assert(stats[0].second == 2);
    for (size_t i = 1; i < stats.size(); ++i) {
        assert(stats[i].second == 1);
    }

    std::cout << "  Typed query test passed!" << std::endl;
}

inline void run_all() {
    test_catalog();
    test_custom_catalog();
    test_inference_from_pids();
    test_validation_and_typed_writes();
    test_typed_queries_and_statistics();
}

} // namespace typed_edge_tests
