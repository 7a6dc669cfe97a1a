#include "silo/db.hpp"
#include "silo/log.hpp"
#include <algorithm>
#include <sstream>

namespace silo {

namespace {

// Finalizes a prepared statement when leaving scope.
struct statement_guard {
    sqlite3_stmt* stmt = nullptr;
    ~statement_guard() { sqlite3_finalize(stmt); }
};

} // namespace

std::string quote_identifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

database::database(const std::string& path) : database(path, open_options{}) {}

database::database(const std::string& path, const open_options& options) : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database " + path + ": " + error, rc);
    }

    // Set busy timeout to handle lock contention.
    // Must be set before any statement that might contend with other connections.
    sqlite3_busy_timeout(db_, options.busy_timeout_ms);

    try {
        if (options.foreign_keys) {
            execute("PRAGMA foreign_keys = ON");
        }
        if (!options.journal_mode.empty()) {
            execute("PRAGMA journal_mode = " + options.journal_mode);
        }
    } catch (const db_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    close();
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

void database::close() {
    if (!db_) return;

    if (sqlite3_get_autocommit(db_) == 0) {
        LOG_WARN("db", "Discarding uncommitted changes on close: %s", path_.c_str());
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &errmsg) != SQLITE_OK) {
            LOG_ERROR("db", "Rollback on close failed: %s", errmsg ? errmsg : "unknown error");
        }
        sqlite3_free(errmsg);
    }

    int rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LOG_WARN("db", "WAL checkpoint failed for %s: %s", path_.c_str(), sqlite3_errmsg(db_));
    }

    rc = sqlite3_close_v2(db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to close %s: %s", path_.c_str(), sqlite3_errstr(rc));
    }
    db_ = nullptr;
    LOG_DEBUG("db", "Closed %s", path_.c_str());
}

void database::ensure_open() const {
    if (!db_) {
        throw db_error("Database is closed: " + path_, SQLITE_MISUSE);
    }
}

void database::fail(const std::string& what, int rc) const {
    std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    LOG_ERROR("db", "%s: %s", what.c_str(), error.c_str());
    throw db_error(what + ": " + error, rc);
}

sqlite3_stmt* database::prepare(const std::string& sql) const {
    ensure_open();
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        fail("Failed to prepare statement (SQL: " + sql + ")", rc);
    }
    return stmt;
}

int database::execute(const std::string& sql, const params_t& params) {
    ensure_open();
    const int before = sqlite3_total_changes(db_);

    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")", rc);
        }
    } else {
        statement_guard guard{prepare(sql)};
        bind_all(guard.stmt, params);
        collect(guard.stmt, true, sql);
    }
    return sqlite3_total_changes(db_) - before;
}

int database::execute(const std::string& sql, const named_params_t& params) {
    ensure_open();
    const int before = sqlite3_total_changes(db_);
    statement_guard guard{prepare(sql)};
    bind_all(guard.stmt, params);
    collect(guard.stmt, true, sql);
    return sqlite3_total_changes(db_) - before;
}

int database::execute_many(const std::string& sql, const std::vector<params_t>& rows) {
    ensure_open();
    const int before = sqlite3_total_changes(db_);
    statement_guard guard{prepare(sql)};

    for (const auto& params : rows) {
        sqlite3_reset(guard.stmt);
        sqlite3_clear_bindings(guard.stmt);
        bind_all(guard.stmt, params);

        int rc;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {}
        if (rc != SQLITE_DONE) {
            fail("Execution failed (SQL: " + sql + ")", rc);
        }
    }
    return sqlite3_total_changes(db_) - before;
}

int database::insert(const std::string& table,
                     const std::vector<record_t>& records,
                     on_conflict conflict) {
    if (records.empty()) return 0;
    ensure_open();

    std::vector<std::string> columns;
    for (const auto& [col, _] : records.front()) {
        columns.push_back(col);
    }

    std::ostringstream sql;
    sql << "INSERT ";
    switch (conflict) {
        case on_conflict::abort: break;
        case on_conflict::ignore: sql << "OR IGNORE "; break;
        case on_conflict::replace: sql << "OR REPLACE "; break;
    }
    sql << "INTO " << quote_identifier(table) << " (";

    bool first = true;
    for (const auto& col : columns) {
        if (!first) sql << ", ";
        sql << quote_identifier(col);
        first = false;
    }

    sql << ") VALUES (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << "?";
    }
    sql << ")";

    const int before = sqlite3_total_changes(db_);
    statement_guard guard{prepare(sql.str())};

    for (const auto& record : records) {
        sqlite3_reset(guard.stmt);
        sqlite3_clear_bindings(guard.stmt);

        int index = 1;
        for (const auto& col : columns) {
            auto it = std::find_if(record.begin(), record.end(),
                                   [&](const auto& field) { return field.first == col; });
            if (it == record.end()) {
                throw contract_error("Record for table '" + table + "' is missing column '" + col + "'");
            }
            bind_value(guard.stmt, index++, it->second);
        }

        int rc = sqlite3_step(guard.stmt);
        if (rc != SQLITE_DONE) {
            fail("Insert into " + table + " failed", rc);
        }
    }
    return sqlite3_total_changes(db_) - before;
}

bool database::table_exists(const std::string& name) const {
    statement_guard guard{prepare("SELECT name FROM sqlite_master WHERE type='table' AND name=?")};
    sqlite3_bind_text(guard.stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(guard.stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        fail("Failed to look up table " + name, rc);
    }
    return rc == SQLITE_ROW;
}

std::vector<std::string> database::table_names() const {
    // sqlite_sequence and sqlite_stat* are engine bookkeeping, not user tables
    statement_guard guard{prepare(
        "SELECT name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\'")};

    std::vector<std::string> names;
    int rc;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(guard.stmt, 0));
        if (name) names.emplace_back(name);
    }
    if (rc != SQLITE_DONE) {
        fail("Failed to list tables", rc);
    }
    return names;
}

std::vector<std::string> database::column_names(const std::string& table) const {
    statement_guard guard{prepare("PRAGMA table_info(" + quote_identifier(table) + ")")};

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    std::vector<std::string> columns;
    int rc;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(guard.stmt, 1));
        if (name) columns.emplace_back(name);
    }
    if (rc != SQLITE_DONE) {
        fail("Failed to read table_info for " + table, rc);
    }
    return columns;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    int rc = std::visit([&](auto&& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, blob_t>) {
            if (v.empty()) {
                return sqlite3_bind_zeroblob(stmt, index, 0);
            }
            return sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);

    if (rc != SQLITE_OK) {
        fail("Failed to bind parameter " + std::to_string(index), rc);
    }
}

void database::bind_all(sqlite3_stmt* stmt, const params_t& params) {
    const int expected = sqlite3_bind_parameter_count(stmt);
    if (static_cast<int>(params.size()) != expected) {
        throw db_error("Incorrect number of bindings supplied: statement uses " +
                       std::to_string(expected) + ", " + std::to_string(params.size()) + " supplied",
                       SQLITE_RANGE);
    }
    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }
}

void database::bind_all(sqlite3_stmt* stmt, const named_params_t& params) {
    const int count = sqlite3_bind_parameter_count(stmt);
    for (int index = 1; index <= count; ++index) {
        const char* placeholder = sqlite3_bind_parameter_name(stmt, index);
        if (!placeholder) {
            throw db_error("Positional placeholder " + std::to_string(index) +
                           " cannot be bound from named parameters", SQLITE_RANGE);
        }
        // Strip the :, @ or $ sigil
        std::string name(placeholder + 1);
        auto it = std::find_if(params.begin(), params.end(),
                               [&](const auto& p) { return p.first == name; });
        if (it == params.end()) {
            throw db_error("No value supplied for parameter '" + name + "'", SQLITE_RANGE);
        }
        bind_value(stmt, index, it->second);
    }
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return bytes ? blob_t(bytes, bytes + size) : blob_t();
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

row_t database::extract_row(sqlite3_stmt* stmt) {
    row_t row;
    int col_count = sqlite3_column_count(stmt);
    for (int i = 0; i < col_count; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        row[name ? name : std::to_string(i)] = extract_column(stmt, i);
    }
    return row;
}

// Steps the statement to completion. With first_only, only the first row is kept.
std::vector<row_t> database::collect(sqlite3_stmt* stmt, bool first_only, const std::string& sql) {
    std::vector<row_t> results;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        if (!first_only || results.empty()) {
            results.push_back(extract_row(stmt));
        }
    }
    if (rc != SQLITE_DONE) {
        fail("Query failed (SQL: " + sql + ")", rc);
    }
    return results;
}

std::vector<row_t> database::query(const std::string& sql, const params_t& params) {
    statement_guard guard{prepare(sql)};
    bind_all(guard.stmt, params);
    return collect(guard.stmt, false, sql);
}

std::vector<row_t> database::query(const std::string& sql, const named_params_t& params) {
    statement_guard guard{prepare(sql)};
    bind_all(guard.stmt, params);
    return collect(guard.stmt, false, sql);
}

std::optional<row_t> database::query_first(const std::string& sql, const params_t& params) {
    statement_guard guard{prepare(sql)};
    bind_all(guard.stmt, params);
    auto rows = collect(guard.stmt, true, sql);
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::optional<row_t> database::query_first(const std::string& sql, const named_params_t& params) {
    statement_guard guard{prepare(sql)};
    bind_all(guard.stmt, params);
    auto rows = collect(guard.stmt, true, sql);
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

void database::begin_transaction(bool immediate) {
    // IMMEDIATE takes the write lock up front so bootstrap cannot interleave
    // with another writer on the same file.
    execute(immediate ? "BEGIN IMMEDIATE" : "BEGIN");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    ensure_open();
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction RAII guard
transaction::transaction(database& db, bool immediate) : db_(db) {
    db_.begin_transaction(immediate);
}

transaction::~transaction() {
    if (!completed_ && db_.is_open() && db_.is_in_transaction()) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback during unwind failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace silo
