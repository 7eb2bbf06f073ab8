#include "pqg/typed_edges.hpp"
#include "pqg/error.hpp"
#include "pqg/log.hpp"
#include <algorithm>
#include <iterator>
#include <memory>

namespace pqg {

// ============================================================================
// edge_type_catalog
// ============================================================================

edge_type_catalog::edge_type_catalog(std::vector<edge_type> types) : types_(std::move(types)) {}

const edge_type_catalog& edge_type_catalog::isamples() {
    static const edge_type_catalog catalog({
        // MaterialSampleCuration
        {"MaterialSampleCuration", "responsibility", "Agent", true,
         "Agent responsible for sample curation"},
        // MaterialSampleRecord
        {"MaterialSampleRecord", "curation", "MaterialSampleCuration", false,
         "Curation information for the sample"},
        {"MaterialSampleRecord", "has_context_category", "IdentifiedConcept", true,
         "Context category (sampled feature type)"},
        {"MaterialSampleRecord", "has_material_category", "IdentifiedConcept", true,
         "Material type classification"},
        {"MaterialSampleRecord", "has_sample_object_type", "IdentifiedConcept", true,
         "Sample object type classification"},
        {"MaterialSampleRecord", "keywords", "IdentifiedConcept", true,
         "Keywords for sample discovery"},
        {"MaterialSampleRecord", "produced_by", "SamplingEvent", false,
         "Sampling event that produced this sample"},
        {"MaterialSampleRecord", "registrant", "Agent", false,
         "Agent who registered the sample"},
        {"MaterialSampleRecord", "related_resource", "SampleRelation", true,
         "Related resources and samples"},
        // SamplingEvent
        {"SamplingEvent", "has_context_category", "IdentifiedConcept", true,
         "Context category for sampling event"},
        {"SamplingEvent", "responsibility", "Agent", true,
         "Agent responsible for sampling event"},
        {"SamplingEvent", "sample_location", "GeospatialCoordLocation", false,
         "Geographic location where sample was collected"},
        {"SamplingEvent", "sampling_site", "SamplingSite", false,
         "Site where sampling occurred"},
        // SamplingSite
        {"SamplingSite", "site_location", "GeospatialCoordLocation", false,
         "Geographic location of the sampling site"},
    });
    return catalog;
}

std::optional<edge_type> edge_type_catalog::infer(const std::string& subject_type,
                                                  const std::string& predicate,
                                                  const std::string& object_type) const {
    for (const auto& t : types_) {
        if (t.subject_type == subject_type && t.predicate == predicate && t.object_type == object_type) {
            return t;
        }
    }
    return std::nullopt;
}

const edge_type* edge_type_catalog::find(const std::string& key) const {
    for (const auto& t : types_) {
        if (t.key() == key) return &t;
    }
    return nullptr;
}

std::vector<edge_type> edge_type_catalog::by_subject(const std::string& subject_type) const {
    std::vector<edge_type> out;
    std::copy_if(types_.begin(), types_.end(), std::back_inserter(out),
                 [&](const edge_type& t) { return t.subject_type == subject_type; });
    return out;
}

std::vector<edge_type> edge_type_catalog::by_object(const std::string& object_type) const {
    std::vector<edge_type> out;
    std::copy_if(types_.begin(), types_.end(), std::back_inserter(out),
                 [&](const edge_type& t) { return t.object_type == object_type; });
    return out;
}

std::vector<edge_type> edge_type_catalog::by_predicate(const std::string& predicate) const {
    std::vector<edge_type> out;
    std::copy_if(types_.begin(), types_.end(), std::back_inserter(out),
                 [&](const edge_type& t) { return t.predicate == predicate; });
    return out;
}

std::optional<std::string> edge_type_catalog::validate(const std::string& key,
                                                       const std::string& subject_type,
                                                       const std::string& predicate,
                                                       const std::string& object_type) const {
    const auto* t = find(key);
    if (!t) {
        return "Unknown edge type: " + key;
    }
    if (t->subject_type != subject_type) {
        return "Subject type mismatch: expected " + t->subject_type + ", got " + subject_type;
    }
    if (t->predicate != predicate) {
        return "Predicate mismatch: expected " + t->predicate + ", got " + predicate;
    }
    if (t->object_type != object_type) {
        return "Object type mismatch: expected " + t->object_type + ", got " + object_type;
    }
    return std::nullopt;
}

// ============================================================================
// typed_edges
// ============================================================================

typed_edges::typed_edges(graph& g, edge_type_catalog catalog)
    : graph_(g), catalog_(std::move(catalog)) {}

std::optional<std::string> typed_edges::otype_of(const std::string& pid) {
    return graph_.node_exists(pid);
}

std::optional<edge_type> typed_edges::infer_from_pids(const std::string& subject_pid,
                                                      const std::string& predicate,
                                                      const std::string& object_pid) {
    auto subject_type = otype_of(subject_pid);
    if (!subject_type) {
        LOG_WARN("typed_edges", "Subject node not found: %s", subject_pid.c_str());
        return std::nullopt;
    }
    auto object_type = otype_of(object_pid);
    if (!object_type) {
        LOG_WARN("typed_edges", "Object node not found: %s", object_pid.c_str());
        return std::nullopt;
    }
    return catalog_.infer(*subject_type, predicate, *object_type);
}

sequence<typed_relation> typed_edges::typed_relations(const std::optional<std::string>& subject,
                                                      const std::optional<edge_type>& type,
                                                      const std::optional<std::string>& object,
                                                      size_t maxrows) {
    std::optional<std::string> predicate;
    if (type) predicate = type->predicate;
    auto relations = graph_.get_relations(subject, predicate, object);

    return sequence<typed_relation>([this, relations, type, maxrows]() -> sequence<typed_relation>::generator_t {
        auto it = std::make_shared<sequence<relation>::iterator>(relations.begin());
        auto produced = std::make_shared<size_t>(0);
        return [this, relations, it, type, maxrows, produced]() -> std::optional<typed_relation> {
            if (maxrows > 0 && *produced >= maxrows) return std::nullopt;
            while (*it != relations.end()) {
                relation r = **it;
                ++*it;
                auto inferred = infer_from_pids(r.subject, r.predicate, r.object);
                if (type && !(inferred && *inferred == *type)) continue;
                ++*produced;
                return typed_relation{r.subject, r.predicate, r.object, inferred};
            }
            return std::nullopt;
        };
    });
}

std::vector<typed_edge> typed_edges::edges_by_type(const edge_type& type, size_t limit) {
    std::vector<typed_edge> out;
    std::unordered_map<std::string, std::optional<std::string>> otypes;
    auto cached_otype = [&](const std::string& pid) -> const std::optional<std::string>& {
        auto it = otypes.find(pid);
        if (it == otypes.end()) {
            it = otypes.emplace(pid, otype_of(pid)).first;
        }
        return it->second;
    };

    for (const auto& entry : graph_.get_ids(std::string(edge_otype))) {
        auto record = graph_.find_edge(entry.pid);
        if (!record) continue;
        const auto* edge = record->edge();
        if (edge->predicate != type.predicate || edge->objects.empty()) continue;
        if (cached_otype(edge->subject) != type.subject_type) continue;

        bool all_match = std::all_of(edge->objects.begin(), edge->objects.end(),
                                     [&](const std::string& o) { return cached_otype(o) == type.object_type; });
        if (!all_match) continue;

        out.push_back(typed_edge{entry.pid, edge->subject, edge->predicate, edge->objects,
                                 edge->named_graph, type});
        if (limit > 0 && out.size() >= limit) break;
    }
    return out;
}

std::vector<typed_relation> typed_edges::fan_out(const std::vector<edge_type>& types, size_t limit) {
    std::vector<typed_relation> out;
    for (const auto& t : types) {
        for (const auto& edge : edges_by_type(t, limit)) {
            for (const auto& object : edge.objects) {
                out.push_back(typed_relation{edge.subject, edge.predicate, object, t});
            }
        }
    }
    return out;
}

std::vector<typed_relation> typed_edges::edges_by_subject_type(const std::string& subject_type, size_t limit) {
    return fan_out(catalog_.by_subject(subject_type), limit);
}

std::vector<typed_relation> typed_edges::edges_by_object_type(const std::string& object_type, size_t limit) {
    return fan_out(catalog_.by_object(object_type), limit);
}

std::optional<std::string> typed_edges::validate_edge(const std::string& subject_pid,
                                                      const std::string& predicate,
                                                      const std::string& object_pid,
                                                      const std::optional<edge_type>& expected) {
    auto inferred = infer_from_pids(subject_pid, predicate, object_pid);
    if (!inferred) {
        return "Edge pattern (" + otype_of(subject_pid).value_or("Unknown") + ", " + predicate + ", " +
               otype_of(object_pid).value_or("Unknown") + ") does not match any known edge type";
    }
    if (expected && !(*inferred == *expected)) {
        return "Expected " + expected->key() + ", but inferred " + inferred->key();
    }
    return std::nullopt;
}

std::vector<std::pair<edge_type, int64_t>> typed_edges::statistics() {
    std::vector<std::pair<edge_type, int64_t>> stats;
    for (const auto& t : catalog_.types()) {
        auto count = static_cast<int64_t>(edges_by_type(t).size());
        if (count > 0) stats.emplace_back(t, count);
    }
    std::stable_sort(stats.begin(), stats.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return stats;
}

std::string typed_edges::add_typed_edge(const std::string& subject_pid,
                                        const std::string& predicate,
                                        const std::vector<std::string>& object_pids,
                                        const std::optional<edge_type>& expected,
                                        const std::optional<std::string>& named_graph,
                                        bool validate) {
    if (validate) {
        for (const auto& object_pid : object_pids) {
            if (auto problem = validate_edge(subject_pid, predicate, object_pid, expected)) {
                LOG_WARN("typed_edges", "Rejected %s -%s-> %s: %s", subject_pid.c_str(),
                         predicate.c_str(), object_pid.c_str(), problem->c_str());
                throw edge_type_error("Edge validation failed: " + *problem);
            }
        }
    }
    return graph_.add_edge(subject_pid, predicate, object_pids, named_graph);
}

} // namespace pqg
