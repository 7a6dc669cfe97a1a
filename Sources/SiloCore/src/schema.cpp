#include "silo/schema.hpp"
#include "silo/db.hpp"
#include <cctype>
#include <set>

namespace silo {

namespace {

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

void skip_space(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
}

// Case-insensitive keyword match at pos; advances past it on success.
bool match_keyword(const std::string& s, size_t& pos, const char* keyword) {
    size_t i = pos;
    for (const char* k = keyword; *k; ++k, ++i) {
        if (i >= s.size() ||
            std::toupper(static_cast<unsigned char>(s[i])) != static_cast<unsigned char>(*k)) {
            return false;
        }
    }
    if (i < s.size() && is_identifier_char(s[i])) return false;
    pos = i;
    return true;
}

// Reads one identifier, quoted ("x", `x`, [x]) or bare.
std::string read_identifier(const std::string& s, size_t& pos) {
    if (pos >= s.size()) return {};

    char open = s[pos];
    char close = 0;
    if (open == '"' || open == '`') close = open;
    else if (open == '[') close = ']';

    std::string name;
    if (close) {
        ++pos;
        while (pos < s.size()) {
            if (s[pos] == close) {
                // Doubled closing quote is an escaped quote
                if (close != ']' && pos + 1 < s.size() && s[pos + 1] == close) {
                    name += close;
                    pos += 2;
                    continue;
                }
                ++pos;
                return name;
            }
            name += s[pos++];
        }
        throw schema_error("Unterminated quoted table name in: " + s);
    }

    while (pos < s.size() && is_identifier_char(s[pos])) {
        name += s[pos++];
    }
    return name;
}

} // namespace

std::string table_schema::parse_table_name(const std::string& creation_statement) {
    size_t pos = 0;
    skip_space(creation_statement, pos);
    if (!match_keyword(creation_statement, pos, "CREATE")) {
        throw schema_error("Statement must start with CREATE TABLE: " + creation_statement);
    }
    skip_space(creation_statement, pos);
    if (!match_keyword(creation_statement, pos, "TABLE")) {
        throw schema_error("Statement must start with CREATE TABLE: " + creation_statement);
    }
    skip_space(creation_statement, pos);

    size_t checkpoint = pos;
    if (match_keyword(creation_statement, pos, "IF")) {
        skip_space(creation_statement, pos);
        if (!match_keyword(creation_statement, pos, "NOT")) {
            throw schema_error("Malformed IF NOT EXISTS clause: " + creation_statement);
        }
        skip_space(creation_statement, pos);
        if (!match_keyword(creation_statement, pos, "EXISTS")) {
            throw schema_error("Malformed IF NOT EXISTS clause: " + creation_statement);
        }
        skip_space(creation_statement, pos);
    } else {
        pos = checkpoint;
    }

    std::string name = read_identifier(creation_statement, pos);
    // schema-qualified: main.table
    skip_space(creation_statement, pos);
    if (pos < creation_statement.size() && creation_statement[pos] == '.') {
        ++pos;
        skip_space(creation_statement, pos);
        name = read_identifier(creation_statement, pos);
    }

    if (name.empty()) {
        throw schema_error("Cannot find the table name in: " + creation_statement);
    }
    return name;
}

table_schema::table_schema(std::string creation_statement,
                           std::vector<record_t> default_rows,
                           reseed_policy policy)
    : table_schema(std::move(creation_statement), std::move(default_rows), policy, schema_kind::general) {}

table_schema::table_schema(std::string creation_statement,
                           std::vector<record_t> default_rows,
                           reseed_policy policy,
                           schema_kind kind)
    : creation_statement_(std::move(creation_statement))
    , default_rows_(std::move(default_rows))
    , policy_(policy)
    , kind_(kind) {
    table_name_ = parse_table_name(creation_statement_);

    if (default_rows_.empty()) return;

    auto columns_of = [this](const record_t& row) {
        std::set<std::string> columns;
        for (const auto& [col, _] : row) {
            if (!columns.insert(col).second) {
                throw schema_error("Default row for " + table_name_ + " repeats column '" + col + "'");
            }
        }
        return columns;
    };

    const auto expected = columns_of(default_rows_.front());
    if (expected.empty()) {
        throw schema_error("Default rows for " + table_name_ + " must name at least one column");
    }
    for (const auto& row : default_rows_) {
        if (columns_of(row) != expected) {
            throw schema_error("Default rows for " + table_name_ + " must all have the same columns");
        }
    }
}

namespace {

std::vector<record_t> key_value_rows(const std::string& name, const key_value_defaults_t& defaults) {
    std::set<std::string> seen;
    std::vector<record_t> rows;
    rows.reserve(defaults.size());
    for (const auto& [key, value] : defaults) {
        if (!seen.insert(key).second) {
            throw schema_error("Duplicate default key '" + key + "' for " + name);
        }
        rows.push_back({{"key", key}, {"value", value}});
    }
    return rows;
}

std::string key_value_statement(const std::string& name) {
    if (name.empty()) {
        throw schema_error("Key-value table name must not be empty");
    }
    return "CREATE TABLE IF NOT EXISTS " + quote_identifier(name) + " (key TEXT PRIMARY KEY, value TEXT)";
}

} // namespace

key_value_schema::key_value_schema(const std::string& name,
                                   const key_value_defaults_t& defaults,
                                   reseed_policy policy)
    : table_schema(key_value_statement(name), key_value_rows(name, defaults), policy, schema_kind::key_value) {}

} // namespace silo
