#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pqg {

class node_object;
using node_ptr = std::shared_ptr<node_object>;

// ============================================================================
// node_object - composite input handed to graph::add_node
// ============================================================================

/// A nested object of a registered type. Literal fields live in `values`;
/// reference fields hold other node_objects and are flattened into edges.
/// The same node_ptr may appear in several places (or in a cycle): it is
/// stored once and every reference points at the same pid.
class node_object {
public:
    std::string otype;
    std::optional<std::string> pid;  // generated ("anon_...") when absent
    std::optional<std::string> label;
    std::optional<std::string> description;
    string_list altids;

    property_map values;
    std::map<std::string, node_ptr> links;
    std::map<std::string, std::vector<node_ptr>> link_lists;

    node_object() = default;
    explicit node_object(std::string type, std::optional<std::string> id = std::nullopt)
        : otype(std::move(type)), pid(std::move(id)) {}

    node_object& set(const std::string& name, field_value value) {
        values[name] = std::move(value);
        return *this;
    }

    node_object& set(const std::string& name, const char* value) {
        values[name] = std::string(value);
        return *this;
    }

    node_object& set(const std::string& name, int value) {
        values[name] = static_cast<int64_t>(value);
        return *this;
    }

    node_object& set(const std::string& name, int64_t value) {
        values[name] = value;
        return *this;
    }

    node_object& set(const std::string& name, double value) {
        values[name] = value;
        return *this;
    }

    node_object& set(const std::string& name, bool value) {
        values[name] = value;
        return *this;
    }

    node_object& set_nil(const std::string& name) {
        values[name] = nullptr;
        return *this;
    }

    /// Set a single reference (nullptr clears it: no edge is written).
    node_object& link(const std::string& name, node_ptr target) {
        links[name] = std::move(target);
        return *this;
    }

    /// Append to a reference list, creating it on first use.
    node_object& append(const std::string& name, node_ptr target) {
        link_lists[name].push_back(std::move(target));
        return *this;
    }

    bool has_value(const std::string& name) const {
        return values.find(name) != values.end();
    }
};

inline node_ptr make_node(std::string otype, std::optional<std::string> pid = std::nullopt) {
    return std::make_shared<node_object>(std::move(otype), std::move(pid));
}

// ============================================================================
// node_record - a stored row read back through graph::get_node
// ============================================================================

/// The reserved edge columns, with row ids already translated to pids.
struct edge_properties {
    std::string subject;
    std::string predicate;
    std::vector<std::string> objects;
    std::optional<std::string> named_graph;
};

struct node_record {
    std::string pid;
    std::string otype;
    std::optional<std::string> label;
    std::optional<std::string> description;
    string_list altids;
    int64_t tcreated = 0;
    int64_t tmodified = 0;

    /// Extension fields of the row's otype, or the edge columns for "_edge_" rows
    std::variant<property_map, edge_properties> extension;

    /// Records reachable through outgoing edges, keyed by predicate.
    /// Filled only when get_node is called with expand_depth > 0.
    std::map<std::string, std::vector<node_record>> related;

    bool is_edge() const { return std::holds_alternative<edge_properties>(extension); }

    const property_map* properties() const { return std::get_if<property_map>(&extension); }
    const edge_properties* edge() const { return std::get_if<edge_properties>(&extension); }

    /// Typed access to an extension field. nullopt when absent, null or of another kind.
    template<typename T>
    std::optional<T> get(const std::string& name) const {
        const auto* props = properties();
        if (!props) return std::nullopt;
        auto it = props->find(name);
        if (it == props->end()) return std::nullopt;
        if (const auto* v = std::get_if<T>(&it->second)) return *v;
        return std::nullopt;
    }
};

} // namespace pqg

#endif // __cplusplus
