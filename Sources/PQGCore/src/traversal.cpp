#include "pqg/traversal.hpp"
#include "pqg/log.hpp"
#include <deque>
#include <memory>
#include <unordered_set>
#include <utility>

namespace pqg {

traversal_engine::traversal_engine(graph_context& ctx, edge_store& store)
    : ctx_(ctx), store_(store) {}

sequence<traversal_step> traversal_engine::breadth_first(const std::string& start_pid, int max_depth) {
    ctx_.require_initialized("breadth_first_traversal");
    graph_context* ctx = &ctx_;
    edge_store* store = &store_;

    struct bfs_state {
        std::deque<std::pair<row_id_t, int>> frontier;  // node, depth of the node
        std::unordered_set<row_id_t> expanded;
        std::unordered_set<row_id_t> visited_edges;
        std::deque<traversal_step> ready;
    };

    return sequence<traversal_step>([ctx, store, start_pid, max_depth]() -> sequence<traversal_step>::generator_t {
        auto state = std::make_shared<bfs_state>();
        if (auto start = ctx->ids.pid_to_row_id(start_pid)) {
            state->frontier.emplace_back(*start, 0);
            state->expanded.insert(*start);
        }

        return [ctx, store, max_depth, state]() -> std::optional<traversal_step> {
            while (state->ready.empty() && !state->frontier.empty()) {
                auto [node, depth] = state->frontier.front();
                state->frontier.pop_front();

                auto subject = ctx->ids.row_id_to_pid(node);
                if (!subject) continue;

                const int edge_depth = depth + 1;
                for (const auto& edge : store->outgoing_edges(node)) {
                    if (!state->visited_edges.insert(edge.row_id).second) continue;

                    for (row_id_t object : edge.objects) {
                        auto object_pid = ctx->ids.row_id_to_pid(object);
                        if (!object_pid) {
                            LOG_WARN("traversal", "Edge from %s names a missing row", subject->c_str());
                            continue;
                        }
                        state->ready.push_back(traversal_step{*subject, edge.predicate, *object_pid, edge_depth});

                        bool deeper = max_depth <= 0 || edge_depth < max_depth;
                        if (deeper && state->expanded.insert(object).second) {
                            state->frontier.emplace_back(object, edge_depth);
                        }
                    }
                }
            }

            if (state->ready.empty()) return std::nullopt;
            auto step = std::move(state->ready.front());
            state->ready.pop_front();
            return step;
        };
    });
}

std::set<std::string> traversal_engine::get_node_ids(const std::string& pid) {
    ctx_.require_initialized("get_node_ids");

    auto start = ctx_.ids.pid_to_row_id(pid);
    if (!start) return {};

    const auto& table = ctx_.table();
    const std::string sql =
        "WITH RECURSIVE reach(row_id) AS ("
        " SELECT ?1"
        " UNION"
        " SELECT j.value FROM reach AS r"
        " JOIN " + table + " AS e ON e.s = r.row_id AND e.otype = ?2"
        " JOIN json_each(e.o) AS j"
        ") SELECT n.pid FROM reach JOIN " + table + " AS n ON n.row_id = reach.row_id";

    std::set<std::string> ids;
    statement stmt(ctx_.db, sql, {*start, std::string(edge_otype)});
    while (stmt.step()) {
        ids.insert(stmt.column_text(0));
    }
    return ids;
}

} // namespace pqg
