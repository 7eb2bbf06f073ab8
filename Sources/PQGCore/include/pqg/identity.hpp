#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pqg {

class database;

// ============================================================================
// identity_translator - pid <-> row_id
// ============================================================================

/// Translates external pids to internal row ids and back. Results are cached
/// for the lifetime of the graph; writers keep the cache in step through
/// remember() and forget(), and a rollback clears it.
class identity_translator {
public:
    identity_translator(database& db, std::string table);

    std::optional<row_id_t> pid_to_row_id(const std::string& pid);
    std::optional<std::string> row_id_to_pid(row_id_t row_id);

    /// Resolve every pid, in order. Throws referential_integrity_error naming
    /// all pids that have no row.
    std::vector<row_id_t> resolve(const std::vector<std::string>& pids);

    /// Translate a batch of row ids; ids without a row are skipped.
    std::vector<std::string> to_pids(const std::vector<row_id_t>& row_ids);

    void remember(row_id_t row_id, const std::string& pid);
    void forget(const std::string& pid);
    void clear_cache();

private:
    database& db_;
    std::string table_;
    std::unordered_map<std::string, row_id_t> by_pid_;
    std::unordered_map<row_id_t, std::string> by_row_id_;
};

} // namespace pqg

#endif // __cplusplus
