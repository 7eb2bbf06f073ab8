#include "pqg/identity.hpp"
#include "pqg/db.hpp"
#include "pqg/error.hpp"
#include "pqg/log.hpp"

namespace pqg {

identity_translator::identity_translator(database& db, std::string table)
    : db_(db), table_(std::move(table)) {}

std::optional<row_id_t> identity_translator::pid_to_row_id(const std::string& pid) {
    auto it = by_pid_.find(pid);
    if (it != by_pid_.end()) return it->second;

    statement stmt(db_, "SELECT row_id FROM " + table_ + " WHERE pid = ?", {pid});
    if (!stmt.step()) return std::nullopt;

    row_id_t row_id = stmt.column_int64(0);
    remember(row_id, pid);
    return row_id;
}

std::optional<std::string> identity_translator::row_id_to_pid(row_id_t row_id) {
    auto it = by_row_id_.find(row_id);
    if (it != by_row_id_.end()) return it->second;

    statement stmt(db_, "SELECT pid FROM " + table_ + " WHERE row_id = ?", {row_id});
    if (!stmt.step()) return std::nullopt;

    auto pid = stmt.column_text(0);
    remember(row_id, pid);
    return pid;
}

std::vector<row_id_t> identity_translator::resolve(const std::vector<std::string>& pids) {
    std::vector<row_id_t> row_ids;
    std::vector<std::string> missing;
    row_ids.reserve(pids.size());

    for (const auto& pid : pids) {
        if (auto row_id = pid_to_row_id(pid)) {
            row_ids.push_back(*row_id);
        } else {
            missing.push_back(pid);
        }
    }

    if (!missing.empty()) {
        LOG_WARN("identity", "%zu unresolved pid(s), first: %s", missing.size(), missing.front().c_str());
        throw referential_integrity_error(std::move(missing));
    }
    return row_ids;
}

std::vector<std::string> identity_translator::to_pids(const std::vector<row_id_t>& row_ids) {
    std::vector<std::string> pids;
    pids.reserve(row_ids.size());
    for (auto row_id : row_ids) {
        if (auto pid = row_id_to_pid(row_id)) {
            pids.push_back(std::move(*pid));
        } else {
            LOG_WARN("identity", "Dangling row id %lld", static_cast<long long>(row_id));
        }
    }
    return pids;
}

void identity_translator::remember(row_id_t row_id, const std::string& pid) {
    by_pid_[pid] = row_id;
    by_row_id_[row_id] = pid;
}

void identity_translator::forget(const std::string& pid) {
    auto it = by_pid_.find(pid);
    if (it == by_pid_.end()) return;
    by_row_id_.erase(it->second);
    by_pid_.erase(it);
}

void identity_translator::clear_cache() {
    by_pid_.clear();
    by_row_id_.clear();
}

} // namespace pqg
