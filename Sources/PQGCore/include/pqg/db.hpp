#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "error.hpp"
#include <sqlite3.h>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pqg {

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access; writes fail with db_error
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable and non-moveable (statements and guards hold references)
    database(const database&) = delete;
    database& operator=(const database&) = delete;
    database(database&&) = delete;
    database& operator=(database&&) = delete;

    bool table_exists(const std::string& name) const;

    // Existing column names and types from a table (for migration)
    // Returns map of column_name -> SQL_TYPE (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // conflict_columns: if non-empty, generates ON CONFLICT (...) DO UPDATE SET for upsert.
    // Columns listed in keep_on_conflict are written on insert but left alone on update.
    row_id_t insert(const std::string& table,
                    const std::vector<std::pair<std::string, column_value_t>>& values,
                    const std::vector<std::string>& conflict_columns = {},
                    const std::vector<std::string>& keep_on_conflict = {});

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows changed by the most recent INSERT/UPDATE/DELETE.
    int64_t changes() const;

    bool is_read_only() const { return mode_ == open_mode::read_only; }
    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    static column_value_t extract_column(sqlite3_stmt* stmt, int index);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
};

/// Prepared statement stepped one row at a time. Backs the lazy result
/// sequences; the database must outlive every open statement.
class statement {
public:
    statement(database& db, const std::string& sql,
              const std::vector<column_value_t>& params = {});
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    /// Advance to the next row. Returns false once the result set is exhausted.
    bool step();

    int64_t column_int64(int index) const;
    std::string column_text(int index) const;

private:
    database& db_;
    sqlite3_stmt* stmt_ = nullptr;
    bool done_ = false;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

/// RAII SAVEPOINT: a nested unit of work inside an open transaction.
/// Rolls back to (and releases) the savepoint unless released.
class savepoint {
public:
    savepoint(database& db, std::string name);
    ~savepoint();

    void release();

private:
    database& db_;
    std::string name_;
    bool completed_ = false;
};

} // namespace pqg

#endif // __cplusplus
