#include "pqg/edge_store.hpp"
#include "pqg/edge_id.hpp"
#include "pqg/error.hpp"
#include "pqg/log.hpp"
#include <algorithm>
#include <deque>
#include <memory>
#include <sstream>

namespace pqg {

namespace {

column_value_t optional_text(const std::optional<std::string>& value) {
    if (value) return *value;
    return nullptr;
}

column_value_t altids_column(const string_list& altids) {
    if (altids.empty()) return nullptr;
    return detail::encode_string_list(altids);
}

std::optional<std::string> text_at(const database::row_t& row, const char* column) {
    auto it = row.find(column);
    if (it == row.end()) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

int64_t integer_at(const database::row_t& row, const char* column) {
    auto it = row.find(column);
    if (it == row.end()) return 0;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return *i;
    if (const auto* d = std::get_if<double>(&it->second)) return static_cast<int64_t>(*d);
    return 0;
}

} // namespace

edge_store::edge_store(graph_context& ctx) : ctx_(ctx) {}

std::optional<std::pair<row_id_t, std::string>> edge_store::lookup(const std::string& pid) {
    statement stmt(ctx_.db, "SELECT row_id, otype FROM " + ctx_.table() + " WHERE pid = ?", {pid});
    if (!stmt.step()) return std::nullopt;
    return std::make_pair(stmt.column_int64(0), stmt.column_text(1));
}

// ============================================================================
// Writes
// ============================================================================

row_id_t edge_store::write_node(const node_object& object, const std::string& pid) {
    ctx_.require_initialized("add_node");
    ctx_.require_writable("add_node");

    if (auto existing = lookup(pid); existing && existing->second == edge_otype) {
        throw error("pid '" + pid + "' already names an edge");
    }

    const int64_t now = ctx_.config.now();
    std::vector<std::pair<std::string, column_value_t>> values = {
        {"pid", pid},
        {"otype", object.otype},
        {"tcreated", now},
        {"tmodified", now},
        {"label", optional_text(object.label)},
        {"description", optional_text(object.description)},
        {"altids", altids_column(object.altids)},
        {"s", nullptr},
        {"p", nullptr},
        {"o", nullptr},
        {"n", nullptr},
    };
    // Every extension column is rewritten; fields the object lacks become NULL
    for (const auto& [name, type] : ctx_.registry.literal_fields()) {
        auto it = object.values.find(name);
        if (it == object.values.end()) {
            values.emplace_back(name, nullptr);
        } else {
            values.emplace_back(name, detail::to_column_value(it->second));
        }
    }

    row_id_t row_id = ctx_.db.insert(ctx_.table(), values, {"pid"}, {"tcreated"});
    ctx_.ids.remember(row_id, pid);
    LOG_DEBUG("store", "Wrote node %s (%s) row %lld", pid.c_str(), object.otype.c_str(),
              static_cast<long long>(row_id));
    return row_id;
}

std::string edge_store::add_edge(const edge_spec& spec) {
    ctx_.require_initialized("add_edge");
    ctx_.require_writable("add_edge");

    if (spec.objects.empty()) {
        throw error("Edge '" + spec.predicate + "' from '" + spec.subject + "' has no objects");
    }

    std::vector<std::string> endpoints;
    endpoints.reserve(spec.objects.size() + 1);
    endpoints.push_back(spec.subject);
    endpoints.insert(endpoints.end(), spec.objects.begin(), spec.objects.end());

    // Throws before anything is written
    auto row_ids = ctx_.ids.resolve(endpoints);
    const row_id_t subject = row_ids.front();
    const std::vector<row_id_t> objects(row_ids.begin() + 1, row_ids.end());

    const std::string pid = spec.pid
        ? *spec.pid
        : edge_pid(spec.subject, spec.predicate, spec.objects, spec.named_graph);

    if (auto existing = lookup(pid); existing && existing->second != edge_otype) {
        throw error("pid '" + pid + "' already names a node of type " + existing->second);
    }

    const int64_t now = ctx_.config.now();
    std::vector<std::pair<std::string, column_value_t>> values = {
        {"pid", pid},
        {"otype", std::string(edge_otype)},
        {"tcreated", now},
        {"tmodified", now},
        {"label", optional_text(spec.label)},
        {"description", optional_text(spec.description)},
        {"altids", altids_column(spec.altids)},
        {"s", subject},
        {"p", spec.predicate},
        {"o", detail::encode_row_ids(objects)},
        {"n", optional_text(spec.named_graph)},
    };

    row_id_t row_id = ctx_.db.insert(ctx_.table(), values, {"pid"}, {"tcreated"});
    ctx_.ids.remember(row_id, pid);
    LOG_DEBUG("store", "Wrote edge %s -%s-> %zu object(s)", spec.subject.c_str(),
              spec.predicate.c_str(), objects.size());
    return pid;
}

bool edge_store::remove_node(const std::string& pid) {
    ctx_.require_initialized("remove_node");
    ctx_.require_writable("remove_node");

    ctx_.db.execute("DELETE FROM " + ctx_.table() + " WHERE pid = ?", {pid});
    bool removed = ctx_.db.changes() > 0;
    ctx_.ids.forget(pid);
    if (removed) {
        LOG_INFO("store", "Removed %s; edges referencing it are kept", pid.c_str());
    }
    return removed;
}

// ============================================================================
// Lookups
// ============================================================================

node_record edge_store::to_record(const database::row_t& row) {
    node_record record;
    record.pid = text_at(row, "pid").value_or("");
    record.otype = text_at(row, "otype").value_or("");
    record.label = text_at(row, "label");
    record.description = text_at(row, "description");
    if (auto altids = text_at(row, "altids")) {
        record.altids = detail::decode_string_list(*altids);
    }
    record.tcreated = integer_at(row, "tcreated");
    record.tmodified = integer_at(row, "tmodified");

    if (record.otype == edge_otype) {
        edge_properties edge;
        auto subject = ctx_.ids.row_id_to_pid(integer_at(row, "s"));
        if (!subject) {
            LOG_WARN("store", "Edge %s has a dangling subject", record.pid.c_str());
        }
        edge.subject = subject.value_or("");
        edge.predicate = text_at(row, "p").value_or("");
        edge.objects = ctx_.ids.to_pids(detail::decode_row_ids(text_at(row, "o").value_or("")));
        edge.named_graph = text_at(row, "n");
        record.extension = std::move(edge);
        return record;
    }

    property_map properties;
    if (const auto* type = ctx_.registry.get_type(record.otype)) {
        for (const auto& field : type->fields) {
            if (is_reference(field.type)) continue;
            auto it = row.find(field.name);
            if (it == row.end() || std::holds_alternative<std::nullptr_t>(it->second)) continue;
            properties[field.name] = detail::from_column_value(field.type, it->second);
        }
    } else {
        LOG_WARN("store", "Row %s has unregistered type %s", record.pid.c_str(), record.otype.c_str());
    }
    record.extension = std::move(properties);
    return record;
}

std::optional<node_record> edge_store::get_node(const std::string& pid, int expand_depth) {
    ctx_.require_initialized("get_node");

    auto rows = ctx_.db.query("SELECT * FROM " + ctx_.table() + " WHERE pid = ?", {pid});
    if (rows.empty()) return std::nullopt;

    auto record = to_record(rows.front());
    if (expand_depth > 0 && !record.is_edge()) {
        expand(record, integer_at(rows.front(), "row_id"), expand_depth);
    }
    return record;
}

void edge_store::expand(node_record& record, row_id_t row_id, int depth) {
    for (const auto& edge : outgoing_edges(row_id)) {
        auto& related = record.related[edge.predicate];
        for (const auto& object : ctx_.ids.to_pids(edge.objects)) {
            if (auto child = get_node(object, depth - 1)) {
                related.push_back(std::move(*child));
            }
        }
    }
}

std::optional<std::string> edge_store::node_exists(const std::string& pid) {
    ctx_.require_initialized("node_exists");
    auto found = lookup(pid);
    if (!found || found->second == edge_otype) return std::nullopt;
    return found->second;
}

std::optional<node_record> edge_store::find_edge(const std::string& pid) {
    auto record = get_node(pid);
    if (!record || !record->is_edge()) return std::nullopt;
    return record;
}

std::optional<std::string> edge_store::find_edge(const std::string& subject,
                                                 const std::string& predicate,
                                                 const std::vector<std::string>& objects,
                                                 const std::optional<std::string>& named_graph) {
    ctx_.require_initialized("find_edge");

    auto s = ctx_.ids.pid_to_row_id(subject);
    if (!s) return std::nullopt;
    std::vector<row_id_t> o;
    for (const auto& object : objects) {
        auto id = ctx_.ids.pid_to_row_id(object);
        if (!id) return std::nullopt;
        o.push_back(*id);
    }

    statement stmt(ctx_.db,
                   "SELECT pid FROM " + ctx_.table() +
                   " WHERE otype = ? AND s = ? AND p = ? AND o = ? AND n IS ? ORDER BY row_id LIMIT 1",
                   {std::string(edge_otype), *s, predicate, detail::encode_row_ids(o),
                    optional_text(named_graph)});
    if (!stmt.step()) return std::nullopt;
    return stmt.column_text(0);
}

std::vector<stored_edge> edge_store::outgoing_edges(row_id_t subject) {
    statement stmt(ctx_.db,
                   "SELECT row_id, p, o FROM " + ctx_.table() +
                   " WHERE otype = ? AND s = ? ORDER BY row_id",
                   {std::string(edge_otype), subject});
    std::vector<stored_edge> edges;
    while (stmt.step()) {
        stored_edge edge;
        edge.row_id = stmt.column_int64(0);
        edge.predicate = stmt.column_text(1);
        edge.objects = detail::decode_row_ids(stmt.column_text(2));
        edges.push_back(std::move(edge));
    }
    return edges;
}

// ============================================================================
// Pattern queries
// ============================================================================

sequence<relation> edge_store::get_relations(const std::optional<std::string>& subject,
                                             const std::optional<std::string>& predicate,
                                             const std::optional<std::string>& object,
                                             size_t maxrows) {
    ctx_.require_initialized("get_relations");
    graph_context* ctx = &ctx_;

    return sequence<relation>([ctx, subject, predicate, object, maxrows]() -> sequence<relation>::generator_t {
        const auto& table = ctx->table();
        std::string sql =
            "SELECT sn.pid, e.p, obj.pid FROM " + table + " AS e"
            " JOIN json_each(e.o) AS j"
            " JOIN " + table + " AS sn ON sn.row_id = e.s"
            " JOIN " + table + " AS obj ON obj.row_id = j.value"
            " WHERE e.otype = ?";
        std::vector<column_value_t> params{std::string(edge_otype)};
        // An unknown pid matches nothing
        auto nothing = []() -> std::optional<relation> { return std::nullopt; };

        if (subject) {
            auto id = ctx->ids.pid_to_row_id(*subject);
            if (!id) return nothing;
            sql += " AND e.s = ?";
            params.emplace_back(*id);
        }
        if (predicate) {
            sql += " AND e.p = ?";
            params.emplace_back(*predicate);
        }
        if (object) {
            auto id = ctx->ids.pid_to_row_id(*object);
            if (!id) return nothing;
            sql += " AND j.value = ?";
            params.emplace_back(*id);
        }
        sql += " ORDER BY e.row_id, j.key";
        if (maxrows > 0) {
            sql += " LIMIT ?";
            params.emplace_back(static_cast<int64_t>(maxrows));
        }

        auto stmt = std::make_shared<statement>(ctx->db, sql, params);
        return [stmt]() -> std::optional<relation> {
            if (!stmt->step()) return std::nullopt;
            return relation{stmt->column_text(0), stmt->column_text(1), stmt->column_text(2)};
        };
    });
}

sequence<id_entry> edge_store::get_ids(const std::optional<std::string>& otype, size_t maxrows) {
    ctx_.require_initialized("get_ids");
    graph_context* ctx = &ctx_;

    struct page_state {
        row_id_t last_row_id = 0;
        std::deque<id_entry> buffer;
        size_t produced = 0;
        bool exhausted = false;
    };

    return sequence<id_entry>([ctx, otype, maxrows]() -> sequence<id_entry>::generator_t {
        auto state = std::make_shared<page_state>();
        return [ctx, otype, maxrows, state]() -> std::optional<id_entry> {
            if (maxrows > 0 && state->produced >= maxrows) return std::nullopt;

            if (state->buffer.empty() && !state->exhausted) {
                const size_t page_size = std::max<size_t>(ctx->config.page_size, 1);
                std::string sql = "SELECT row_id, pid, otype FROM " + ctx->table() + " WHERE row_id > ?";
                std::vector<column_value_t> params{state->last_row_id};
                if (otype) {
                    sql += " AND otype = ?";
                    params.emplace_back(*otype);
                }
                sql += " ORDER BY row_id LIMIT ?";
                params.emplace_back(static_cast<int64_t>(page_size));

                statement stmt(ctx->db, sql, params);
                size_t fetched = 0;
                while (stmt.step()) {
                    state->last_row_id = stmt.column_int64(0);
                    state->buffer.push_back(id_entry{stmt.column_text(1), stmt.column_text(2)});
                    ++fetched;
                }
                if (fetched < page_size) state->exhausted = true;
            }

            if (state->buffer.empty()) return std::nullopt;
            auto entry = std::move(state->buffer.front());
            state->buffer.pop_front();
            ++state->produced;
            return entry;
        };
    });
}

std::map<std::string, int64_t> edge_store::object_counts() {
    ctx_.require_initialized("object_counts");
    std::map<std::string, int64_t> counts;
    auto rows = ctx_.db.query("SELECT otype, COUNT(*) AS count FROM " + ctx_.table() + " GROUP BY otype");
    for (const auto& row : rows) {
        counts[text_at(row, "otype").value_or("")] = integer_at(row, "count");
    }
    return counts;
}

std::map<std::string, int64_t> edge_store::predicate_counts() {
    ctx_.require_initialized("predicate_counts");
    std::map<std::string, int64_t> counts;
    auto rows = ctx_.db.query("SELECT p, COUNT(*) AS count FROM " + ctx_.table() +
                              " WHERE otype = ? GROUP BY p", {std::string(edge_otype)});
    for (const auto& row : rows) {
        counts[text_at(row, "p").value_or("")] = integer_at(row, "count");
    }
    return counts;
}

std::vector<std::string> edge_store::get_roots_for_pid(const std::string& pid,
                                                       const std::optional<std::string>& target_type,
                                                       const std::vector<std::string>& predicates) {
    ctx_.require_initialized("get_roots_for_pid");

    auto start = ctx_.ids.pid_to_row_id(pid);
    if (!start) return {};

    const auto& table = ctx_.table();
    // ?1 edge otype, ?2 start row, ?3.. predicates, last: target type
    std::vector<column_value_t> params{std::string(edge_otype), *start};
    std::string predicate_filter;
    if (!predicates.empty()) {
        std::ostringstream in;
        in << " AND e.p IN (";
        for (size_t i = 0; i < predicates.size(); ++i) {
            if (i > 0) in << ", ";
            in << "?" << params.size() + 1;
            params.emplace_back(predicates[i]);
        }
        in << ")";
        predicate_filter = in.str();
    }

    std::ostringstream sql;
    sql << "WITH RECURSIVE roots(row_id) AS ("
        << " SELECT e.s FROM " << table << " AS e, json_each(e.o) AS j"
        << " WHERE e.otype = ?1 AND j.value = ?2" << predicate_filter
        << " UNION"
        << " SELECT e.s FROM roots AS r, " << table << " AS e, json_each(e.o) AS j"
        << " WHERE e.otype = ?1 AND j.value = r.row_id" << predicate_filter
        << ") SELECT n.pid FROM roots JOIN " << table << " AS n ON n.row_id = roots.row_id";
    if (target_type) {
        sql << " WHERE n.otype = ?" << params.size() + 1;
        params.emplace_back(*target_type);
    }
    sql << " ORDER BY n.pid";

    std::vector<std::string> roots;
    statement stmt(ctx_.db, sql.str(), params);
    while (stmt.step()) {
        roots.push_back(stmt.column_text(0));
    }
    return roots;
}

} // namespace pqg
