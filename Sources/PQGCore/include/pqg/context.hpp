#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "identity.hpp"
#include "schema.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace pqg {

// ============================================================================
// Configuration for a graph
// ============================================================================

struct configuration {
    /// Database file path. Use ":memory:" for an in-memory database.
    std::string path = ":memory:";

    /// Name of the shared node/edge relation.
    std::string table_name = "node";

    /// Read-only mode. When true:
    /// - Database is opened with SQLITE_OPEN_READONLY
    /// - No table creation, migration or metadata writes
    bool read_only = false;

    /// Rows fetched per page by get_ids().
    size_t page_size = 1000;

    /// Deepest nesting add_node() will follow before raising structural_error.
    size_t max_decomposition_depth = 10000;

    /// Source of tcreated/tmodified in epoch seconds. Empty = system clock.
    std::function<int64_t()> clock;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}

    int64_t now() const {
        if (clock) return clock();
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// ============================================================================
// graph_context - the state shared by the components of one graph
// ============================================================================

/// Built once by graph and handed by reference to the edge store,
/// decomposer and traversal engine.
struct graph_context {
    configuration config;
    database db;
    type_registry registry;
    identity_translator ids;

    graph_context(configuration cfg, type_registry reg)
        : config(std::move(cfg)),
          db(config.path, config.read_only ? database::open_mode::read_only
                                           : database::open_mode::read_write),
          registry(std::move(reg)),
          ids(db, config.table_name) {}

    graph_context(const graph_context&) = delete;
    graph_context& operator=(const graph_context&) = delete;

    const std::string& table() const { return config.table_name; }

    /// Throws config_error until the registry has been initialized.
    void require_initialized(const char* operation) const {
        if (!registry.is_finalized()) {
            throw config_error(std::string(operation) + " called before initialize()");
        }
    }

    /// Throws db_error on a read-only graph.
    void require_writable(const char* operation) const {
        if (config.read_only) {
            throw db_error(std::string(operation) + " on a read-only graph");
        }
    }
};

} // namespace pqg

#endif // __cplusplus
