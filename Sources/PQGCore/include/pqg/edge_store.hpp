#pragma once

#ifdef __cplusplus

#include "context.hpp"
#include "object.hpp"
#include "sequence.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pqg {

/// Everything needed to write one edge row.
struct edge_spec {
    std::string subject;
    std::string predicate;
    std::vector<std::string> objects;
    std::optional<std::string> named_graph;

    std::optional<std::string> pid;  // derived with edge_pid() when absent
    std::optional<std::string> label;
    std::optional<std::string> description;
    string_list altids;
};

/// An edge row as stored: row ids, not pids.
struct stored_edge {
    row_id_t row_id = 0;
    std::string predicate;
    std::vector<row_id_t> objects;
};

// ============================================================================
// edge_store - row writes, lookups and pattern queries over the relation
// ============================================================================

class edge_store {
public:
    explicit edge_store(graph_context& ctx);

    // ------------------------------------------------------------------------
    // Writes
    // ------------------------------------------------------------------------

    /// Insert or update the row for one node (literal fields only).
    /// An existing pid keeps its row_id and tcreated; tmodified is bumped.
    row_id_t write_node(const node_object& object, const std::string& pid);

    /// Write an edge after resolving every pid. Throws
    /// referential_integrity_error (nothing written) if any is unknown.
    /// Returns the edge pid.
    std::string add_edge(const edge_spec& spec);

    /// Administrative delete of one row. Edges that name it are left alone.
    bool remove_node(const std::string& pid);

    // ------------------------------------------------------------------------
    // Lookups
    // ------------------------------------------------------------------------

    /// The stored row, with its outgoing neighbourhood inlined up to expand_depth.
    std::optional<node_record> get_node(const std::string& pid, int expand_depth = 0);

    /// otype of the non-edge row with this pid.
    std::optional<std::string> node_exists(const std::string& pid);

    std::optional<node_record> find_edge(const std::string& pid);
    /// pid of the edge with exactly these columns.
    std::optional<std::string> find_edge(const std::string& subject,
                                         const std::string& predicate,
                                         const std::vector<std::string>& objects,
                                         const std::optional<std::string>& named_graph = std::nullopt);

    /// Edge rows whose subject is `subject`, in insertion order.
    std::vector<stored_edge> outgoing_edges(row_id_t subject);

    // ------------------------------------------------------------------------
    // Pattern queries
    // ------------------------------------------------------------------------

    /// Fanned-out triples matching the given pattern. maxrows 0 = no limit.
    sequence<relation> get_relations(const std::optional<std::string>& subject = std::nullopt,
                                     const std::optional<std::string>& predicate = std::nullopt,
                                     const std::optional<std::string>& object = std::nullopt,
                                     size_t maxrows = 0);

    /// (pid, otype) of every row, optionally of one otype, paged by row_id.
    sequence<id_entry> get_ids(const std::optional<std::string>& otype = std::nullopt,
                               size_t maxrows = 0);

    std::map<std::string, int64_t> object_counts();
    std::map<std::string, int64_t> predicate_counts();

    /// Every subject that references `pid` directly or through a chain of
    /// edges, sorted by pid. `predicates` restricts the edges followed;
    /// `target_type` filters the result by otype.
    std::vector<std::string> get_roots_for_pid(const std::string& pid,
                                               const std::optional<std::string>& target_type = std::nullopt,
                                               const std::vector<std::string>& predicates = {});

private:
    graph_context& ctx_;

    node_record to_record(const database::row_t& row);
    void expand(node_record& record, row_id_t row_id, int depth);
    std::optional<std::pair<row_id_t, std::string>> lookup(const std::string& pid);
};

} // namespace pqg

#endif // __cplusplus
