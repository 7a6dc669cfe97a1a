#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <optional>
#include <string>
#include <vector>

namespace silo {

/// Conflict clause used when inserting records.
enum class on_conflict {
    abort,    ///< Plain INSERT
    ignore,   ///< INSERT OR IGNORE
    replace   ///< INSERT OR REPLACE
};

/// Quote an identifier for direct inclusion in SQL ("name", with embedded quotes doubled).
std::string quote_identifier(const std::string& name);

class database {
public:
    struct open_options {
        /// Value for PRAGMA journal_mode. Empty keeps SQLite's default.
        std::string journal_mode = "WAL";
        int busy_timeout_ms = 5000;
        bool foreign_keys = true;
    };

    explicit database(const std::string& path);
    database(const std::string& path, const open_options& options);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    /// Roll back any open transaction, checkpoint the WAL and release the handle.
    /// Safe to call more than once.
    void close();
    bool is_open() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }

    // Schema introspection
    bool table_exists(const std::string& name) const;
    std::vector<std::string> table_names() const;

    // Ordered column names of a table (empty if the table does not exist)
    std::vector<std::string> column_names(const std::string& table) const;

    // Execute SQL with optional params (for statements whose rows are not needed).
    // Returns the number of rows changed by the statement.
    int execute(const std::string& sql, const params_t& params = {});
    int execute(const std::string& sql, const named_params_t& params);

    // Prepare once, then bind and step for every parameter set.
    // Returns the total number of rows changed.
    int execute_many(const std::string& sql, const std::vector<params_t>& rows);

    // Insert records sharing one column set. Columns are taken from the first
    // record; later records are bound by column name.
    int insert(const std::string& table,
               const std::vector<record_t>& records,
               on_conflict conflict = on_conflict::abort);

    // Query - returns rows as vector of column maps
    std::vector<row_t> query(const std::string& sql, const params_t& params = {});
    std::vector<row_t> query(const std::string& sql, const named_params_t& params);

    // Runs the statement to completion and returns its first row, if any.
    std::optional<row_t> query_first(const std::string& sql, const params_t& params = {});
    std::optional<row_t> query_first(const std::string& sql, const named_params_t& params);

    // Transaction support
    void begin_transaction(bool immediate = false);
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

    // Bind a value to a prepared statement
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    void ensure_open() const;
    sqlite3_stmt* prepare(const std::string& sql) const;
    void bind_all(sqlite3_stmt* stmt, const params_t& params);
    void bind_all(sqlite3_stmt* stmt, const named_params_t& params);
    std::vector<row_t> collect(sqlite3_stmt* stmt, bool first_only, const std::string& sql);
    row_t extract_row(sqlite3_stmt* stmt);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    [[noreturn]] void fail(const std::string& what, int rc) const;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db, bool immediate = false);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace silo

#endif // __cplusplus
