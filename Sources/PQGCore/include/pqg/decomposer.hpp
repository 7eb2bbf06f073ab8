#pragma once

#ifdef __cplusplus

#include "context.hpp"
#include "edge_store.hpp"
#include "object.hpp"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pqg {

// ============================================================================
// decomposer - flattens a node_object graph into node rows and edges
// ============================================================================

/// Walks the reference fields of an object with an explicit stack. Every
/// object gets its node row the first time it is reached; once all items of
/// a reference field are stored, one edge subject -field-> items is written.
/// Objects are tracked by address for the duration of one call, so shared
/// and cyclic references resolve to a single pid.
class decomposer {
public:
    decomposer(graph_context& ctx, edge_store& store);

    /// Store `root` and everything reachable from it atomically. Returns the root pid.
    std::string add_node(const node_object& root);

private:
    struct frame {
        const node_object* object = nullptr;
        std::string pid;
        size_t depth = 0;
        std::vector<std::pair<std::string, std::vector<const node_object*>>> fields;
        size_t field_index = 0;
        size_t item_index = 0;
        std::vector<std::string> collected;
    };

    graph_context& ctx_;
    edge_store& store_;
    std::unordered_map<const node_object*, std::string> visited_;
    std::vector<frame> stack_;

    std::string decompose(const node_object& root);
    std::string claim(const node_object& object, size_t depth);
    void open(const node_object& object, const std::string& pid, size_t depth);
};

} // namespace pqg

#endif // __cplusplus
