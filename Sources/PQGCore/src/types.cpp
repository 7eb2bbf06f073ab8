#include "pqg/types.hpp"
#include "pqg/error.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstring>

namespace pqg {

bool is_reserved_field(const std::string& name) {
    return std::any_of(reserved_fields.begin(), reserved_fields.end(),
                       [&](const char* r) { return name == r; });
}

const char* to_string(field_type type) {
    switch (type) {
        case field_type::string: return "string";
        case field_type::integer: return "integer";
        case field_type::double_: return "double";
        case field_type::boolean: return "boolean";
        case field_type::timestamp: return "timestamp";
        case field_type::string_list: return "string_list";
        case field_type::integer_list: return "integer_list";
        case field_type::double_list: return "double_list";
        case field_type::blob: return "blob";
        case field_type::reference: return "reference";
        case field_type::reference_list: return "reference_list";
    }
    return "string";
}

std::optional<field_type> field_type_from_string(const std::string& name) {
    static const std::array<field_type, 11> all = {
        field_type::string, field_type::integer, field_type::double_,
        field_type::boolean, field_type::timestamp, field_type::string_list,
        field_type::integer_list, field_type::double_list, field_type::blob,
        field_type::reference, field_type::reference_list
    };
    for (auto type : all) {
        if (name == to_string(type)) return type;
    }
    return std::nullopt;
}

const char* sql_type_for(field_type type) {
    switch (type) {
        case field_type::integer:
        case field_type::boolean:
            return "INTEGER";
        case field_type::double_:
        case field_type::timestamp:
            return "REAL";
        case field_type::blob:
            return "BLOB";
        default:
            // strings and JSON-encoded lists
            return "TEXT";
    }
}

bool value_matches(field_type type, const field_value& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) return true;
    switch (type) {
        case field_type::string: return std::holds_alternative<std::string>(value);
        case field_type::integer: return std::holds_alternative<int64_t>(value);
        // integers widen into double fields
        case field_type::double_:
            return std::holds_alternative<double>(value) || std::holds_alternative<int64_t>(value);
        case field_type::boolean: return std::holds_alternative<bool>(value);
        case field_type::timestamp: return std::holds_alternative<timestamp_t>(value);
        case field_type::string_list: return std::holds_alternative<string_list>(value);
        case field_type::integer_list: return std::holds_alternative<integer_list>(value);
        case field_type::double_list: return std::holds_alternative<double_list>(value);
        case field_type::blob: return std::holds_alternative<blob_t>(value);
        case field_type::reference:
        case field_type::reference_list:
            return false;
    }
    return false;
}

namespace detail {

column_value_t to_column_value(const field_value& value) {
    return std::visit([](auto&& v) -> column_value_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, bool>) {
            return static_cast<int64_t>(v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double> ||
                             std::is_same_v<T, std::string> || std::is_same_v<T, blob_t>) {
            return v;
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            // Seconds since epoch as double, truncated to whole milliseconds
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(v.time_since_epoch()).count();
            return static_cast<double>(millis) / 1000.0;
        } else {
            // Primitive lists are stored as JSON TEXT
            return nlohmann::json(v).dump();
        }
    }, value);
}

field_value from_column_value(field_type type, const column_value_t& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) return nullptr;

    switch (type) {
        case field_type::string:
            if (auto* s = std::get_if<std::string>(&value)) return *s;
            break;
        case field_type::integer:
            if (auto* i = std::get_if<int64_t>(&value)) return *i;
            break;
        case field_type::double_:
            if (auto* d = std::get_if<double>(&value)) return *d;
            if (auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
            break;
        case field_type::boolean:
            if (auto* i = std::get_if<int64_t>(&value)) return *i != 0;
            break;
        case field_type::timestamp: {
            double seconds = 0.0;
            if (auto* d = std::get_if<double>(&value)) {
                seconds = *d;
            } else if (auto* i = std::get_if<int64_t>(&value)) {
                seconds = static_cast<double>(*i);
            } else {
                break;
            }
            auto millis = static_cast<int64_t>(seconds * 1000.0 + (seconds < 0 ? -0.5 : 0.5));
            return timestamp_t(std::chrono::milliseconds(millis));
        }
        case field_type::string_list:
        case field_type::integer_list:
        case field_type::double_list:
            if (auto* s = std::get_if<std::string>(&value)) {
                auto j = nlohmann::json::parse(*s, nullptr, false);
                if (j.is_discarded() || !j.is_array()) break;
                try {
                    if (type == field_type::string_list) return j.get<string_list>();
                    if (type == field_type::integer_list) return j.get<integer_list>();
                    return j.get<double_list>();
                } catch (const nlohmann::json::exception&) {
                    break;
                }
            }
            break;
        case field_type::blob:
            if (auto* b = std::get_if<std::vector<uint8_t>>(&value)) return *b;
            break;
        case field_type::reference:
        case field_type::reference_list:
            break;
    }
    throw db_error(std::string("Stored value does not match field type ") + to_string(type));
}

std::string encode_string_list(const string_list& values) {
    return nlohmann::json(values).dump();
}

string_list decode_string_list(const std::string& json) {
    if (json.empty()) return {};
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        throw db_error("Malformed string list: " + json);
    }
    return j.get<string_list>();
}

std::string encode_row_ids(const std::vector<row_id_t>& ids) {
    return nlohmann::json(ids).dump();
}

std::vector<row_id_t> decode_row_ids(const std::string& json) {
    if (json.empty()) return {};
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        throw db_error("Malformed object list: " + json);
    }
    return j.get<std::vector<row_id_t>>();
}

} // namespace detail

} // namespace pqg
