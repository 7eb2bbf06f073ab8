#pragma once

#ifdef __cplusplus

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pqg {

// Internal row identifier, never exposed through node_record or relation.
using row_id_t = int64_t;

// Timestamp type for `timestamp` extension fields. Stored as REAL seconds with
// millisecond precision; finer ticks are truncated on write.
using timestamp_t = std::chrono::system_clock::time_point;

using string_list = std::vector<std::string>;
using integer_list = std::vector<int64_t>;
using double_list = std::vector<double>;
using blob_t = std::vector<uint8_t>;

// Values exchanged with SQLite
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// Semantic type of a registered field
enum class field_type {
    string,
    integer,
    double_,
    boolean,
    timestamp,
    string_list,
    integer_list,
    double_list,
    blob,
    reference,       // single nested object, stored as an edge
    reference_list   // list of nested objects, stored as one edge
};

// Value of a literal field on a node_object or node_record
using field_value = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    timestamp_t,
    string_list,
    integer_list,
    double_list,
    blob_t
>;

using property_map = std::map<std::string, field_value>;

// The otype that marks a row as an edge
inline constexpr const char* edge_otype = "_edge_";

// Column names owned by the shared relation; types may not redeclare them.
inline constexpr std::array<const char*, 12> reserved_fields = {
    "row_id", "pid", "tcreated", "tmodified", "otype", "label",
    "description", "altids", "s", "p", "o", "n"
};

// Edge-only reserved columns, persisted in metadata
inline constexpr std::array<const char*, 4> edge_fields = {"s", "p", "o", "n"};

bool is_reserved_field(const std::string& name);

/// True for reference and reference_list (fields that produce edges, not columns).
inline bool is_reference(field_type type) {
    return type == field_type::reference || type == field_type::reference_list;
}

const char* to_string(field_type type);
std::optional<field_type> field_type_from_string(const std::string& name);

/// SQL column type for a literal field type ("TEXT", "INTEGER", "REAL", "BLOB").
const char* sql_type_for(field_type type);

/// True if `value` can be stored in a field of `type`. Null matches every type.
bool value_matches(field_type type, const field_value& value);

// ============================================================================
// Query results
// ============================================================================

/// One subject-predicate-object triple produced by fanning out an edge row.
struct relation {
    std::string subject;
    std::string predicate;
    std::string object;

    bool operator==(const relation& other) const {
        return subject == other.subject && predicate == other.predicate && object == other.object;
    }
};

/// One fanned-out triple reported by a breadth-first traversal.
struct traversal_step {
    std::string subject;
    std::string predicate;
    std::string object;
    int depth = 0;
};

struct id_entry {
    std::string pid;
    std::string otype;
};

namespace detail {
    // field_value <-> SQLite column conversion (lists are JSON-encoded TEXT)
    column_value_t to_column_value(const field_value& value);
    field_value from_column_value(field_type type, const column_value_t& value);

    std::string encode_string_list(const string_list& values);
    string_list decode_string_list(const std::string& json);
    std::string encode_row_ids(const std::vector<row_id_t>& ids);
    std::vector<row_id_t> decode_row_ids(const std::string& json);
} // namespace detail

} // namespace pqg

#endif // __cplusplus
