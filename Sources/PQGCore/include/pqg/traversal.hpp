#pragma once

#ifdef __cplusplus

#include "context.hpp"
#include "edge_store.hpp"
#include "sequence.hpp"
#include <set>
#include <string>

namespace pqg {

// ============================================================================
// traversal_engine - walks outgoing edges from a start node
// ============================================================================

class traversal_engine {
public:
    traversal_engine(graph_context& ctx, edge_store& store);

    /// Breadth-first walk over outgoing edges. Each fanned-out triple is
    /// reported once, with depth 1 for edges leaving the start node.
    /// max_depth 0 means unbounded. An unknown start pid yields nothing.
    sequence<traversal_step> breadth_first(const std::string& start_pid, int max_depth = 0);

    /// `pid` plus every pid reachable from it through outgoing edges.
    /// Empty when `pid` is unknown.
    std::set<std::string> get_node_ids(const std::string& pid);

private:
    graph_context& ctx_;
    edge_store& store_;
};

} // namespace pqg

#endif // __cplusplus
