#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace silo {

/// When a schema's default rows are written.
enum class reseed_policy {
    once,    ///< Only when the table is created
    always   ///< Also on every open, inserting rows whose key is absent
};

enum class schema_kind {
    general,
    key_value
};

/// Ordered (key, text value) defaults of a key-value table.
using key_value_defaults_t = std::vector<std::pair<std::string, std::string>>;

/// Immutable description of one table: its CREATE TABLE statement, the rows
/// seeded into it, and when those rows are (re)applied.
///
/// Construction validates eagerly and throws schema_error, so a bad definition
/// fails at registration time rather than on first open.
class table_schema {
public:
    explicit table_schema(std::string creation_statement,
                          std::vector<record_t> default_rows = {},
                          reseed_policy policy = reseed_policy::once);

    const std::string& creation_statement() const { return creation_statement_; }
    const std::string& table_name() const { return table_name_; }
    const std::vector<record_t>& default_rows() const { return default_rows_; }
    reseed_policy policy() const { return policy_; }
    schema_kind kind() const { return kind_; }
    bool is_key_value() const { return kind_ == schema_kind::key_value; }

    /// Extracts the table name from a CREATE TABLE statement.
    /// Throws schema_error if the statement does not start with CREATE TABLE.
    static std::string parse_table_name(const std::string& creation_statement);

protected:
    table_schema(std::string creation_statement,
                 std::vector<record_t> default_rows,
                 reseed_policy policy,
                 schema_kind kind);

private:
    std::string creation_statement_;
    std::string table_name_;
    std::vector<record_t> default_rows_;
    reseed_policy policy_;
    schema_kind kind_;
};

/// Two-column (key TEXT PRIMARY KEY, value TEXT) table, typically a module's
/// settings. Defaults are re-applied on every open unless told otherwise, so
/// keys added by a newer build appear in existing scopes.
class key_value_schema : public table_schema {
public:
    explicit key_value_schema(const std::string& name,
                              const key_value_defaults_t& defaults = {},
                              reseed_policy policy = reseed_policy::always);
};

} // namespace silo

#endif // __cplusplus
