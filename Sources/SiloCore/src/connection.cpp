#include "silo/connection.hpp"
#include "silo/log.hpp"
#include <algorithm>
#include <cctype>

namespace silo {

namespace {

// Upper-cased first keyword of a statement, skipping whitespace and -- comments.
std::string leading_keyword(const std::string& sql) {
    size_t pos = 0;
    while (pos < sql.size()) {
        if (std::isspace(static_cast<unsigned char>(sql[pos]))) {
            ++pos;
        } else if (sql.compare(pos, 2, "--") == 0) {
            pos = sql.find('\n', pos);
            if (pos == std::string::npos) return {};
        } else {
            break;
        }
    }
    std::string keyword;
    while (pos < sql.size() && std::isalpha(static_cast<unsigned char>(sql[pos]))) {
        keyword += static_cast<char>(std::toupper(static_cast<unsigned char>(sql[pos++])));
    }
    return keyword;
}

// Statements that open an implicit transaction, so that commit=false writes
// stay pending until commit().
bool is_data_modifying(const std::string& keyword) {
    return keyword == "INSERT" || keyword == "UPDATE" || keyword == "DELETE" || keyword == "REPLACE";
}

bool changes_shape(const std::string& keyword) {
    return keyword == "DROP" || keyword == "ALTER";
}

} // namespace

scope_connection::scope_connection(scope s,
                                   const std::string& path,
                                   std::vector<table_schema> schemas,
                                   const database::open_options& options)
    : scope_(std::move(s))
    , schemas_(std::move(schemas))
    , db_(path, options) {
    bootstrap();
}

std::optional<std::string> scope_connection::recorded_owner(database& db) {
    if (!db.table_exists(owner_table)) return std::nullopt;
    auto row = db.query_first("SELECT value FROM " + quote_identifier(owner_table) + " WHERE key = 'identity'");
    if (!row) return std::nullopt;
    return detail::column_as_text(row->at("value"));
}

// Records this scope as the file's owner, or checks an existing record.
// Returns true if the record was written.
bool scope_connection::claim_owner() {
    const auto identity = scope_identity(scope_);
    if (auto owner = recorded_owner(db_)) {
        if (*owner != identity) {
            throw contract_error("Storage file " + db_.path() + " belongs to " + *owner +
                                 ", cannot open it as " + describe(scope_));
        }
        return false;
    }

    db_.execute("CREATE TABLE IF NOT EXISTS " + quote_identifier(owner_table) +
                " (key TEXT PRIMARY KEY, value TEXT)");
    db_.execute("INSERT INTO " + quote_identifier(owner_table) + " (key, value) VALUES ('identity', ?)",
                params_t{identity});
    return true;
}

void scope_connection::bootstrap() {
    transaction tx(db_, true);

    bool dirty = claim_owner();

    for (const auto& name : db_.table_names()) {
        known_tables_.insert(to_lower(name));
    }

    for (const auto& schema : schemas_) {
        const auto& table = schema.table_name();
        bool created = false;

        if (!known_tables_.count(to_lower(table))) {
            LOG_INFO("connection", "Initializing table %s:%s", describe(scope_).c_str(), table.c_str());
            db_.execute(schema.creation_statement());
            db_.insert(table, schema.default_rows(), on_conflict::ignore);
            known_tables_.insert(to_lower(table));
            created = true;
            dirty = true;
        }

        // Rows just seeded above need no second pass.
        if (!created && schema.policy() == reseed_policy::always && !schema.default_rows().empty()) {
            int added = db_.insert(table, schema.default_rows(), on_conflict::ignore);
            if (added > 0) {
                LOG_INFO("connection", "Reseeded %d default row(s) into %s:%s",
                         added, describe(scope_).c_str(), table.c_str());
                dirty = true;
            }
        }
    }

    if (dirty) {
        tx.commit();
    } else {
        tx.rollback();
    }

    for (const auto& schema : schemas_) {
        if (schema.is_key_value() && is_key_value_shape(schema.table_name())) {
            key_value_tables_.insert(to_lower(schema.table_name()));
        } else if (schema.is_key_value()) {
            LOG_WARN("connection", "Table %s:%s exists but is not shaped (key, value)",
                     describe(scope_).c_str(), schema.table_name().c_str());
        }
    }
}

// --- Generic access ---

void scope_connection::begin_if_writing(const std::string& sql) {
    if (is_data_modifying(leading_keyword(sql)) && !db_.is_in_transaction()) {
        db_.begin_transaction();
    }
}

void scope_connection::after_statement(const std::string& sql, bool commit) {
    if (changes_shape(leading_keyword(sql))) {
        key_value_tables_.clear();
    }
    if (commit && db_.is_in_transaction()) {
        db_.commit();
    }
}

void scope_connection::execute(const std::string& sql, const params_t& params, bool commit) {
    begin_if_writing(sql);
    db_.execute(sql, params);
    after_statement(sql, commit);
}

void scope_connection::execute(const std::string& sql, const named_params_t& params, bool commit) {
    begin_if_writing(sql);
    db_.execute(sql, params);
    after_statement(sql, commit);
}

void scope_connection::executemany(const std::string& sql, const std::vector<params_t>& rows, bool commit) {
    begin_if_writing(sql);
    db_.execute_many(sql, rows);
    after_statement(sql, commit);
}

std::optional<row_t> scope_connection::fetch(const std::string& sql, const params_t& params) {
    return db_.query_first(sql, params);
}

std::optional<row_t> scope_connection::fetch(const std::string& sql, const named_params_t& params) {
    return db_.query_first(sql, params);
}

std::vector<row_t> scope_connection::fetchall(const std::string& sql, const params_t& params) {
    return db_.query(sql, params);
}

std::vector<row_t> scope_connection::fetchall(const std::string& sql, const named_params_t& params) {
    return db_.query(sql, params);
}

std::optional<row_t> scope_connection::evaluate(const std::string& sql,
                                                const params_t& params,
                                                bool fetchback,
                                                bool commit) {
    begin_if_writing(sql);
    std::optional<row_t> result;
    if (fetchback) {
        result = db_.query_first(sql, params);
    } else {
        db_.execute(sql, params);
    }
    after_statement(sql, commit);
    return result;
}

void scope_connection::commit() {
    if (db_.is_in_transaction()) {
        db_.commit();
    }
}

void scope_connection::close() {
    db_.close();
}

std::vector<std::string> scope_connection::tables() {
    auto names = db_.table_names();
    names.erase(std::remove(names.begin(), names.end(), owner_table), names.end());
    return names;
}

std::vector<std::string> scope_connection::column_names(const std::string& table) {
    auto columns = db_.column_names(table);
    if (columns.empty()) {
        throw contract_error("Table '" + table + "' does not exist in " + describe(scope_));
    }
    return columns;
}

// --- Key-value tables ---

bool scope_connection::is_key_value_shape(const std::string& table) {
    auto columns = db_.column_names(table);
    if (columns.size() != 2) return false;
    auto a = to_lower(columns[0]);
    auto b = to_lower(columns[1]);
    return (a == "key" && b == "value") || (a == "value" && b == "key");
}

void scope_connection::require_key_value(const std::string& table) {
    if (key_value_tables_.count(to_lower(table))) {
        // Still reject use after close
        if (!db_.is_open()) {
            throw db_error("Database is closed: " + db_.path(), SQLITE_MISUSE);
        }
        return;
    }

    // Table not created as a key-value schema here: check it live once.
    if (db_.column_names(table).empty()) {
        throw contract_error("Table '" + table + "' does not exist in " + describe(scope_));
    }
    if (!is_key_value_shape(table)) {
        throw contract_error("Table '" + table + "' is not a key-value table (expected columns key, value)");
    }
    key_value_tables_.insert(to_lower(table));
}

std::optional<std::string> scope_connection::get_text(const std::string& table, const std::string& key) {
    require_key_value(table);
    auto row = db_.query_first("SELECT value FROM " + quote_identifier(table) + " WHERE key = ?", params_t{key});
    if (!row) return std::nullopt;
    return detail::column_as_text(row->at("value"));
}

std::map<std::string, std::string> scope_connection::get_all_values(const std::string& table) {
    require_key_value(table);
    std::map<std::string, std::string> values;
    for (const auto& row : db_.query("SELECT key, value FROM " + quote_identifier(table))) {
        values[detail::column_as_text(row.at("key"))] = detail::column_as_text(row.at("value"));
    }
    return values;
}

void scope_connection::set_text(const std::string& table, const std::string& key, const std::string& value) {
    require_key_value(table);
    execute("INSERT OR REPLACE INTO " + quote_identifier(table) + " (key, value) VALUES (?, ?)",
            params_t{key, value});
}

void scope_connection::delete_value(const std::string& table, const std::string& key) {
    require_key_value(table);
    execute("DELETE FROM " + quote_identifier(table) + " WHERE key = ?", params_t{key});
}

} // namespace silo
