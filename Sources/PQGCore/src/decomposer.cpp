#include "pqg/decomposer.hpp"
#include "pqg/edge_id.hpp"
#include "pqg/error.hpp"
#include "pqg/log.hpp"
#include <optional>

namespace pqg {

decomposer::decomposer(graph_context& ctx, edge_store& store) : ctx_(ctx), store_(store) {}

std::string decomposer::add_node(const node_object& root) {
    ctx_.require_initialized("add_node");
    ctx_.require_writable("add_node");

    std::optional<transaction> tx;
    std::optional<savepoint> sp;
    if (ctx_.db.is_in_transaction()) {
        sp.emplace(ctx_.db, "pqg_add_node");
    } else {
        tx.emplace(ctx_.db);
    }

    std::string pid;
    try {
        pid = decompose(root);
        if (tx) tx->commit();
        if (sp) sp->release();
    } catch (const std::exception& e) {
        LOG_ERROR("decompose", "add_node(%s) rolled back: %s", root.otype.c_str(), e.what());
        // The guards roll back on unwind; cached ids may name rows that are gone
        ctx_.ids.clear_cache();
        visited_.clear();
        stack_.clear();
        throw;
    }

    LOG_DEBUG("decompose", "Stored %s with %zu object(s)", pid.c_str(), visited_.size());
    visited_.clear();
    return pid;
}

std::string decomposer::claim(const node_object& object, size_t depth) {
    if (depth > ctx_.config.max_decomposition_depth) {
        throw structural_error("Nesting deeper than " +
                               std::to_string(ctx_.config.max_decomposition_depth) +
                               " levels at type '" + object.otype + "'");
    }
    ctx_.registry.validate(object);

    std::string pid = object.pid ? *object.pid : anonymous_pid();
    visited_[&object] = pid;
    return pid;
}

void decomposer::open(const node_object& object, const std::string& pid, size_t depth) {
    store_.write_node(object, pid);

    frame f;
    f.object = &object;
    f.pid = pid;
    f.depth = depth;

    // Reference fields in declaration order; empty and null ones yield no edge
    const auto* type = ctx_.registry.get_type(object.otype);
    for (const auto& field : type->fields) {
        std::vector<const node_object*> items;
        if (field.type == field_type::reference) {
            auto it = object.links.find(field.name);
            if (it != object.links.end() && it->second) {
                items.push_back(it->second.get());
            }
        } else if (field.type == field_type::reference_list) {
            auto it = object.link_lists.find(field.name);
            if (it == object.link_lists.end()) continue;
            for (const auto& item : it->second) {
                if (!item) {
                    throw structural_error("Null element in reference list '" + field.name +
                                           "' of " + pid);
                }
                items.push_back(item.get());
            }
        }
        if (!items.empty()) {
            f.fields.emplace_back(field.name, std::move(items));
        }
    }

    stack_.push_back(std::move(f));
}

std::string decomposer::decompose(const node_object& root) {
    visited_.clear();
    stack_.clear();

    const std::string root_pid = claim(root, 0);
    open(root, root_pid, 0);

    while (!stack_.empty()) {
        frame& top = stack_.back();

        if (top.field_index >= top.fields.size()) {
            stack_.pop_back();
            continue;
        }

        const auto& [predicate, items] = top.fields[top.field_index];
        if (top.item_index < items.size()) {
            const node_object* child = items[top.item_index++];

            auto seen = visited_.find(child);
            if (seen != visited_.end()) {
                top.collected.push_back(seen->second);
                continue;
            }

            const size_t depth = top.depth + 1;
            std::string child_pid = claim(*child, depth);
            top.collected.push_back(child_pid);
            // Pushes a frame; `top` is not used past this point
            open(*child, child_pid, depth);
            continue;
        }

        // Every item of this field now has a row
        edge_spec spec;
        spec.subject = top.pid;
        spec.predicate = predicate;
        spec.objects = std::move(top.collected);
        store_.add_edge(spec);

        top.collected.clear();
        top.item_index = 0;
        ++top.field_index;
    }

    return root_pid;
}

} // namespace pqg
