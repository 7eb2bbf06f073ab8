#pragma once

#ifdef __cplusplus

#include "graph.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pqg {

// ============================================================================
// Edge type catalog
// ============================================================================

/// One allowed (subject type, predicate, object type) pattern.
struct edge_type {
    std::string subject_type;
    std::string predicate;
    std::string object_type;
    bool multivalued = false;
    std::string description;

    /// "Subject__predicate__Object"
    std::string key() const { return subject_type + "__" + predicate + "__" + object_type; }

    bool operator==(const edge_type& other) const {
        return subject_type == other.subject_type && predicate == other.predicate &&
               object_type == other.object_type;
    }
};

class edge_type_catalog {
public:
    explicit edge_type_catalog(std::vector<edge_type> types);

    /// The 14 edge types of the iSamples material sample model.
    static const edge_type_catalog& isamples();

    const std::vector<edge_type>& types() const { return types_; }

    std::optional<edge_type> infer(const std::string& subject_type,
                                   const std::string& predicate,
                                   const std::string& object_type) const;
    const edge_type* find(const std::string& key) const;

    std::vector<edge_type> by_subject(const std::string& subject_type) const;
    std::vector<edge_type> by_object(const std::string& object_type) const;
    std::vector<edge_type> by_predicate(const std::string& predicate) const;

    /// Reason the triple does not match the type named by `key`; nullopt when it does.
    std::optional<std::string> validate(const std::string& key,
                                        const std::string& subject_type,
                                        const std::string& predicate,
                                        const std::string& object_type) const;

private:
    std::vector<edge_type> types_;
};

// ============================================================================
// typed_edges - read-time edge typing over a graph
// ============================================================================

struct typed_relation {
    std::string subject;
    std::string predicate;
    std::string object;
    std::optional<edge_type> type;
};

struct typed_edge {
    std::string pid;
    std::string subject;
    std::string predicate;
    std::vector<std::string> objects;
    std::optional<std::string> named_graph;
    edge_type type;
};

/// Infers edge categories from the otype of each endpoint. Stores nothing:
/// every answer is derived from rows the graph already holds.
class typed_edges {
public:
    /// Keeps its own copy of `catalog`.
    explicit typed_edges(graph& g, edge_type_catalog catalog = edge_type_catalog::isamples());

    const edge_type_catalog& catalog() const { return catalog_; }

    /// nullopt when either endpoint is missing or the triple is not in the catalog.
    std::optional<edge_type> infer_from_pids(const std::string& subject_pid,
                                             const std::string& predicate,
                                             const std::string& object_pid);

    /// get_relations() with the inferred type attached; `type` filters on it.
    sequence<typed_relation> typed_relations(const std::optional<std::string>& subject = std::nullopt,
                                             const std::optional<edge_type>& type = std::nullopt,
                                             const std::optional<std::string>& object = std::nullopt,
                                             size_t maxrows = 0);

    /// Edges whose subject and every object match `type`. limit 0 = all.
    std::vector<typed_edge> edges_by_type(const edge_type& type, size_t limit = 0);

    std::vector<typed_relation> edges_by_subject_type(const std::string& subject_type, size_t limit = 0);
    std::vector<typed_relation> edges_by_object_type(const std::string& object_type, size_t limit = 0);

    /// Reason the edge is not a catalogued type (or not `expected`); nullopt when valid.
    std::optional<std::string> validate_edge(const std::string& subject_pid,
                                             const std::string& predicate,
                                             const std::string& object_pid,
                                             const std::optional<edge_type>& expected = std::nullopt);

    /// Edge count per type in use, most frequent first.
    std::vector<std::pair<edge_type, int64_t>> statistics();

    /// Validate each subject/object pair, then add the edge.
    /// Throws edge_type_error when validation fails.
    std::string add_typed_edge(const std::string& subject_pid,
                               const std::string& predicate,
                               const std::vector<std::string>& object_pids,
                               const std::optional<edge_type>& expected = std::nullopt,
                               const std::optional<std::string>& named_graph = std::nullopt,
                               bool validate = true);

private:
    graph& graph_;
    edge_type_catalog catalog_;

    std::optional<std::string> otype_of(const std::string& pid);
    std::vector<typed_relation> fan_out(const std::vector<edge_type>& types, size_t limit);
};

} // namespace pqg

#endif // __cplusplus
