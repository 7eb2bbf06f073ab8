#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

#define PQG_VERSION_STRING "0.3.0"

namespace pqg {

class database;
class node_object;

// Field descriptor (runtime info about one field of a registered type)
struct field_descriptor {
    std::string name;
    field_type type = field_type::string;

    bool operator==(const field_descriptor& other) const {
        return name == other.name && type == other.type;
    }
};

// Schema info for one otype
struct type_descriptor {
    std::string name;
    std::vector<field_descriptor> fields;

    const field_descriptor* find(const std::string& field) const;
};

/// Name of the side-channel metadata table
inline constexpr const char* meta_table = "_pqg_meta";

// ============================================================================
// type_registry - per-graph type catalog and schema builder
// ============================================================================

/// Collects type descriptors, unifies them into the columns of the shared
/// relation and persists the result in _pqg_meta. Owned by one graph.
class type_registry {
public:
    /// Add a type. Re-registering an identical descriptor is a no-op, also
    /// after initialize(). Throws config_error for a new type after
    /// initialize() or on a conflicting re-registration.
    void register_type(type_descriptor descriptor);

    /// Unify all types, create or migrate the relation and store metadata.
    /// Types already stored in _pqg_meta but not registered here are kept;
    /// a registered type replaces the stored one of the same name.
    /// A second call is a no-op. Throws config_error on reserved-name or
    /// cross-type conflicts; nothing is committed in that case.
    void initialize(database& db, const std::string& table);

    bool is_finalized() const { return finalized_; }

    bool has_type(const std::string& name) const;
    const type_descriptor* get_type(const std::string& name) const;
    std::vector<std::string> type_names() const;

    /// Every literal (column-backed) field across all types.
    std::map<std::string, field_type> literal_fields() const;

    /// Check an object against its registered type. Throws config_error.
    void validate(const node_object& object) const;

    /// Write version, primary_key, node_types, edge_fields, literal_fields.
    void store_metadata(database& db) const;

    /// Rebuild a registry from _pqg_meta; nullopt when the database has none.
    /// The returned registry is not finalized.
    static std::optional<type_registry> load_metadata(database& db);

    std::string create_table_sql(const std::string& table) const;

private:
    std::vector<type_descriptor> types_;
    bool finalized_ = false;

    std::map<std::string, field_type> unify() const;
    void create_table(database& db, const std::string& table) const;
    void migrate_table(database& db, const std::string& table) const;
    void create_indexes(database& db, const std::string& table) const;
};

} // namespace pqg

#endif // __cplusplus
