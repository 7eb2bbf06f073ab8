#include "pqg/schema.hpp"
#include "pqg/db.hpp"
#include "pqg/error.hpp"
#include "pqg/log.hpp"
#include "pqg/object.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <sstream>

namespace pqg {

namespace {

// Columns every relation carries, with the SQL type reported by table_info
const std::vector<std::pair<const char*, const char*>>& base_columns() {
    static const std::vector<std::pair<const char*, const char*>> columns = {
        {"row_id", "INTEGER"}, {"pid", "TEXT"}, {"tcreated", "INTEGER"},
        {"tmodified", "INTEGER"}, {"otype", "TEXT"}, {"label", "TEXT"},
        {"description", "TEXT"}, {"altids", "TEXT"}, {"s", "INTEGER"},
        {"p", "TEXT"}, {"o", "TEXT"}, {"n", "TEXT"}
    };
    return columns;
}

std::optional<std::string> read_meta(database& db, const std::string& key) {
    auto rows = db.query(std::string("SELECT value FROM ") + meta_table + " WHERE key = ?", {key});
    if (rows.empty()) return std::nullopt;
    auto it = rows[0].find("value");
    if (it == rows[0].end() || !std::holds_alternative<std::string>(it->second)) return std::nullopt;
    return std::get<std::string>(it->second);
}

} // namespace

const field_descriptor* type_descriptor::find(const std::string& field) const {
    for (const auto& f : fields) {
        if (f.name == field) return &f;
    }
    return nullptr;
}

void type_registry::register_type(type_descriptor descriptor) {
    if (descriptor.name.empty() || descriptor.name == edge_otype) {
        throw config_error("Invalid type name '" + descriptor.name + "'");
    }
    // Identical descriptors are accepted even after initialize(), so a reopened
    // graph can replay its registrations
    for (auto& existing : types_) {
        if (existing.name != descriptor.name) continue;
        if (existing.fields == descriptor.fields) {
            return;
        }
        throw config_error("Type '" + descriptor.name + "' is already registered with different fields");
    }
    if (finalized_) {
        throw config_error("Cannot register type '" + descriptor.name + "' after initialize()");
    }
    LOG_DEBUG("schema", "Registered type %s (%zu fields)", descriptor.name.c_str(), descriptor.fields.size());
    types_.push_back(std::move(descriptor));
}

bool type_registry::has_type(const std::string& name) const {
    return get_type(name) != nullptr;
}

const type_descriptor* type_registry::get_type(const std::string& name) const {
    for (const auto& t : types_) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

std::vector<std::string> type_registry::type_names() const {
    std::vector<std::string> names;
    names.reserve(types_.size());
    for (const auto& t : types_) {
        names.push_back(t.name);
    }
    return names;
}

std::map<std::string, field_type> type_registry::unify() const {
    std::map<std::string, field_type> merged;
    std::map<std::string, std::string> declared_by;
    for (const auto& t : types_) {
        for (const auto& f : t.fields) {
            if (is_reserved_field(f.name)) {
                throw config_error("Type '" + t.name + "' redeclares reserved field '" + f.name + "'");
            }
            auto it = merged.find(f.name);
            if (it == merged.end()) {
                merged[f.name] = f.type;
                declared_by[f.name] = t.name;
            } else if (it->second != f.type) {
                throw config_error("Field '" + f.name + "' is " + to_string(it->second) + " in '" +
                                   declared_by[f.name] + "' but " + to_string(f.type) +
                                   " in '" + t.name + "'");
            }
        }
    }
    return merged;
}

std::map<std::string, field_type> type_registry::literal_fields() const {
    std::map<std::string, field_type> literals;
    for (const auto& [name, type] : unify()) {
        if (!is_reference(type)) literals[name] = type;
    }
    return literals;
}

std::string type_registry::create_table_sql(const std::string& table) const {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << table << "(";
    sql << "row_id INTEGER PRIMARY KEY AUTOINCREMENT, ";
    sql << "pid TEXT UNIQUE NOT NULL, ";
    sql << "tcreated INTEGER, ";
    sql << "tmodified INTEGER, ";
    sql << "otype TEXT NOT NULL, ";
    sql << "label TEXT, ";
    sql << "description TEXT, ";
    sql << "altids TEXT, ";
    // Edge columns; s and o hold row ids, not pids
    sql << "s INTEGER, ";
    sql << "p TEXT, ";
    sql << "o TEXT, ";
    sql << "n TEXT";
    for (const auto& [name, type] : literal_fields()) {
        sql << ", " << name << " " << sql_type_for(type);
    }
    sql << ")";
    return sql.str();
}

void type_registry::create_table(database& db, const std::string& table) const {
    db.execute(create_table_sql(table));
    LOG_INFO("schema", "Created relation %s", table.c_str());
}

void type_registry::migrate_table(database& db, const std::string& table) const {
    auto existing = db.get_table_info(table);

    for (const auto& [name, type] : base_columns()) {
        auto it = existing.find(name);
        if (it == existing.end() || it->second != type) {
            throw config_error("Relation '" + table + "' is missing base column '" + name +
                               "' or declares it with another type");
        }
    }

    for (const auto& [name, type] : literal_fields()) {
        const std::string sql_type = sql_type_for(type);
        auto it = existing.find(name);
        if (it == existing.end()) {
            db.execute("ALTER TABLE " + table + " ADD COLUMN " + name + " " + sql_type);
            LOG_INFO("schema", "Added column %s.%s %s", table.c_str(), name.c_str(), sql_type.c_str());
        } else if (it->second != sql_type) {
            throw config_error("Column '" + name + "' exists as " + it->second +
                               " but is registered as " + sql_type);
        }
    }
}

void type_registry::create_indexes(database& db, const std::string& table) const {
    for (const char* col : {"otype", "s", "p", "n"}) {
        db.execute("CREATE INDEX IF NOT EXISTS idx_" + table + "_" + col +
                   " ON " + table + "(" + col + ")");
    }
}

void type_registry::initialize(database& db, const std::string& table) {
    if (finalized_) return;

    // Types persisted by earlier runs stay registered unless redeclared here
    if (auto stored = load_metadata(db)) {
        for (auto& descriptor : stored->types_) {
            if (has_type(descriptor.name)) continue;
            LOG_INFO("schema", "Keeping stored type %s", descriptor.name.c_str());
            types_.push_back(std::move(descriptor));
        }
    }

    // Conflicts surface here, before any DDL runs
    unify();

    if (db.is_read_only()) {
        if (!db.table_exists(table)) {
            throw config_error("Read-only database has no relation '" + table + "'");
        }
        finalized_ = true;
        return;
    }

    std::optional<transaction> tx;
    if (!db.is_in_transaction()) tx.emplace(db);

    db.execute(std::string("CREATE TABLE IF NOT EXISTS ") + meta_table + R"( (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL
    ))");

    if (db.table_exists(table)) {
        migrate_table(db, table);
    } else {
        create_table(db, table);
    }
    create_indexes(db, table);
    store_metadata(db);

    if (tx) tx->commit();
    finalized_ = true;
}

void type_registry::validate(const node_object& object) const {
    const auto* type = get_type(object.otype);
    if (!type) {
        throw config_error("Unregistered type '" + object.otype + "'");
    }

    auto field_for = [&](const std::string& name) -> const field_descriptor& {
        const auto* f = type->find(name);
        if (!f) {
            throw config_error("Type '" + type->name + "' has no field '" + name + "'");
        }
        return *f;
    };

    for (const auto& [name, value] : object.values) {
        const auto& f = field_for(name);
        if (is_reference(f.type)) {
            throw config_error("Field '" + name + "' of '" + type->name + "' is a reference, not a value");
        }
        if (!value_matches(f.type, value)) {
            throw config_error("Field '" + name + "' of '" + type->name + "' expects " + to_string(f.type));
        }
    }
    for (const auto& [name, _] : object.links) {
        if (field_for(name).type != field_type::reference) {
            throw config_error("Field '" + name + "' of '" + type->name + "' is not a single reference");
        }
    }
    for (const auto& [name, _] : object.link_lists) {
        if (field_for(name).type != field_type::reference_list) {
            throw config_error("Field '" + name + "' of '" + type->name + "' is not a reference list");
        }
    }
}

void type_registry::store_metadata(database& db) const {
    nlohmann::ordered_json node_types = nlohmann::ordered_json::object();
    for (const auto& t : types_) {
        nlohmann::ordered_json fields = nlohmann::ordered_json::object();
        for (const auto& f : t.fields) {
            fields[f.name] = to_string(f.type);
        }
        node_types[t.name] = std::move(fields);
    }

    nlohmann::json literals = nlohmann::json::array();
    for (const auto& [name, _] : literal_fields()) {
        literals.push_back(name);
    }

    const std::vector<std::pair<std::string, std::string>> entries = {
        {"version", PQG_VERSION_STRING},
        {"primary_key", "pid"},
        {"node_types", node_types.dump()},
        {"edge_fields", nlohmann::json(std::vector<std::string>(edge_fields.begin(), edge_fields.end())).dump()},
        {"literal_fields", literals.dump()},
    };
    for (const auto& [key, value] : entries) {
        db.execute(std::string("INSERT OR REPLACE INTO ") + meta_table + "(key, value) VALUES(?, ?)",
                   {key, value});
    }
}

std::optional<type_registry> type_registry::load_metadata(database& db) {
    if (!db.table_exists(meta_table)) return std::nullopt;

    auto node_types = read_meta(db, "node_types");
    if (!node_types) return std::nullopt;

    if (auto version = read_meta(db, "version"); version && *version != PQG_VERSION_STRING) {
        LOG_WARN("schema", "Metadata written by version %s, reading with %s",
                 version->c_str(), PQG_VERSION_STRING);
    }

    auto parsed = nlohmann::ordered_json::parse(*node_types, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw config_error("Malformed node_types metadata");
    }

    type_registry registry;
    for (const auto& [type_name, fields] : parsed.items()) {
        if (!fields.is_object()) {
            throw config_error("Malformed field map for type '" + type_name + "'");
        }
        type_descriptor descriptor{type_name, {}};
        for (const auto& [field_name, type_value] : fields.items()) {
            auto type = type_value.is_string()
                ? field_type_from_string(type_value.get<std::string>())
                : std::nullopt;
            if (!type) {
                throw config_error("Unknown field type for '" + type_name + "." + field_name + "'");
            }
            descriptor.fields.push_back({field_name, *type});
        }
        registry.register_type(std::move(descriptor));
    }
    LOG_DEBUG("schema", "Loaded %zu types from metadata", registry.types_.size());
    return registry;
}

} // namespace pqg
