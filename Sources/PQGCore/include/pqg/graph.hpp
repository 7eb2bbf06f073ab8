#pragma once

#ifdef __cplusplus

#include "context.hpp"
#include "decomposer.hpp"
#include "edge_store.hpp"
#include "traversal.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pqg {

// ============================================================================
// graph - property graph over one SQLite relation
// ============================================================================

class graph {
public:
    /// Open the database in `config`. If it already carries _pqg_meta the
    /// stored types are reattached and the graph is ready to use; otherwise
    /// register types and call initialize().
    explicit graph(configuration config = configuration());

    /// Open with a prepared (not yet initialized) registry.
    graph(configuration config, type_registry registry);

    ~graph();

    // Non-copyable and non-moveable (components hold references to the context)
    graph(const graph&) = delete;
    graph& operator=(const graph&) = delete;
    graph(graph&&) = delete;
    graph& operator=(graph&&) = delete;

    // ========================================================================
    // Schema
    // ========================================================================

    void register_type(type_descriptor descriptor);
    void initialize();
    bool is_initialized() const { return ctx_->registry.is_finalized(); }

    const type_registry& registry() const { return ctx_->registry; }
    const configuration& config() const { return ctx_->config; }
    database& db() { return ctx_->db; }

    // ========================================================================
    // Transactions
    // ========================================================================

    /// Run `block` inside one write transaction. Nested calls join the outer one.
    template<typename F>
    void write(F&& block) {
        if (ctx_->db.is_in_transaction()) {
            block();
            return;
        }
        try {
            // The guard rolls back on unwind and logs, not throws, if that fails
            transaction tx(ctx_->db);
            block();
            tx.commit();
        } catch (...) {
            ctx_->ids.clear_cache();
            throw;
        }
    }

    // ========================================================================
    // Writes
    // ========================================================================

    /// Store `object` and everything it references. Returns its pid.
    std::string add_node(const node_object& object);

    std::string add_edge(const std::string& subject,
                         const std::string& predicate,
                         const std::vector<std::string>& objects,
                         const std::optional<std::string>& named_graph = std::nullopt);
    std::string add_edge(const edge_spec& spec);

    bool remove_node(const std::string& pid);

    // ========================================================================
    // Reads
    // ========================================================================

    std::optional<node_record> get_node(const std::string& pid, int expand_depth = 0);
    std::optional<std::string> node_exists(const std::string& pid);
    std::optional<node_record> find_edge(const std::string& pid);
    std::optional<std::string> find_edge(const std::string& subject,
                                         const std::string& predicate,
                                         const std::vector<std::string>& objects,
                                         const std::optional<std::string>& named_graph = std::nullopt);

    sequence<relation> get_relations(const std::optional<std::string>& subject = std::nullopt,
                                     const std::optional<std::string>& predicate = std::nullopt,
                                     const std::optional<std::string>& object = std::nullopt,
                                     size_t maxrows = 0);
    sequence<id_entry> get_ids(const std::optional<std::string>& otype = std::nullopt,
                               size_t maxrows = 0);

    std::map<std::string, int64_t> object_counts();
    std::map<std::string, int64_t> predicate_counts();

    sequence<traversal_step> breadth_first_traversal(const std::string& start_pid, int max_depth = 0);
    std::vector<std::string> get_roots_for_pid(const std::string& pid,
                                               const std::optional<std::string>& target_type = std::nullopt,
                                               const std::vector<std::string>& predicates = {});
    std::set<std::string> get_node_ids(const std::string& pid);

    // ========================================================================
    // Identity
    // ========================================================================

    std::optional<row_id_t> pid_to_row_id(const std::string& pid);
    std::optional<std::string> row_id_to_pid(row_id_t row_id);

private:
    std::unique_ptr<graph_context> ctx_;
    std::unique_ptr<edge_store> store_;
    std::unique_ptr<decomposer> decomposer_;
    std::unique_ptr<traversal_engine> traversal_;

    void build_components();
};

} // namespace pqg

#endif // __cplusplus
