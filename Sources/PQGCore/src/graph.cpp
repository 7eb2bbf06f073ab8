#include "pqg/graph.hpp"
#include "pqg/log.hpp"

namespace pqg {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

graph::graph(configuration config)
    : ctx_(std::make_unique<graph_context>(std::move(config), type_registry())) {
    build_components();

    if (auto stored = type_registry::load_metadata(ctx_->db)) {
        ctx_->registry = std::move(*stored);
        ctx_->registry.initialize(ctx_->db, ctx_->table());
        LOG_INFO("graph", "Reattached %zu type(s) from %s",
                 ctx_->registry.type_names().size(), ctx_->config.path.c_str());
    }
}

graph::graph(configuration config, type_registry registry)
    : ctx_(std::make_unique<graph_context>(std::move(config), std::move(registry))) {
    build_components();
}

graph::~graph() = default;

void graph::build_components() {
    store_ = std::make_unique<edge_store>(*ctx_);
    decomposer_ = std::make_unique<decomposer>(*ctx_, *store_);
    traversal_ = std::make_unique<traversal_engine>(*ctx_, *store_);
}

void graph::register_type(type_descriptor descriptor) {
    ctx_->registry.register_type(std::move(descriptor));
}

void graph::initialize() {
    ctx_->registry.initialize(ctx_->db, ctx_->table());
}

std::string graph::add_node(const node_object& object) {
    return decomposer_->add_node(object);
}

std::string graph::add_edge(const std::string& subject,
                            const std::string& predicate,
                            const std::vector<std::string>& objects,
                            const std::optional<std::string>& named_graph) {
    edge_spec spec;
    spec.subject = subject;
    spec.predicate = predicate;
    spec.objects = objects;
    spec.named_graph = named_graph;
    return add_edge(spec);
}

std::string graph::add_edge(const edge_spec& spec) {
    return store_->add_edge(spec);
}

bool graph::remove_node(const std::string& pid) {
    return store_->remove_node(pid);
}

std::optional<node_record> graph::get_node(const std::string& pid, int expand_depth) {
    return store_->get_node(pid, expand_depth);
}

std::optional<std::string> graph::node_exists(const std::string& pid) {
    return store_->node_exists(pid);
}

std::optional<node_record> graph::find_edge(const std::string& pid) {
    return store_->find_edge(pid);
}

std::optional<std::string> graph::find_edge(const std::string& subject,
                                            const std::string& predicate,
                                            const std::vector<std::string>& objects,
                                            const std::optional<std::string>& named_graph) {
    return store_->find_edge(subject, predicate, objects, named_graph);
}

sequence<relation> graph::get_relations(const std::optional<std::string>& subject,
                                        const std::optional<std::string>& predicate,
                                        const std::optional<std::string>& object,
                                        size_t maxrows) {
    return store_->get_relations(subject, predicate, object, maxrows);
}

sequence<id_entry> graph::get_ids(const std::optional<std::string>& otype, size_t maxrows) {
    return store_->get_ids(otype, maxrows);
}

std::map<std::string, int64_t> graph::object_counts() {
    return store_->object_counts();
}

std::map<std::string, int64_t> graph::predicate_counts() {
    return store_->predicate_counts();
}

sequence<traversal_step> graph::breadth_first_traversal(const std::string& start_pid, int max_depth) {
    return traversal_->breadth_first(start_pid, max_depth);
}

std::vector<std::string> graph::get_roots_for_pid(const std::string& pid,
                                                  const std::optional<std::string>& target_type,
                                                  const std::vector<std::string>& predicates) {
    return store_->get_roots_for_pid(pid, target_type, predicates);
}

std::set<std::string> graph::get_node_ids(const std::string& pid) {
    return traversal_->get_node_ids(pid);
}

std::optional<row_id_t> graph::pid_to_row_id(const std::string& pid) {
    ctx_->require_initialized("pid_to_row_id");
    return ctx_->ids.pid_to_row_id(pid);
}

std::optional<std::string> graph::row_id_to_pid(row_id_t row_id) {
    ctx_->require_initialized("row_id_to_pid");
    return ctx_->ids.row_id_to_pid(row_id);
}

} // namespace pqg
