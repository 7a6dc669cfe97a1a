#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "schema.hpp"
#include "scope.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace silo {

/// Owns the database of one (domain, scope) pair.
///
/// Opening runs the bootstrap: missing tables are created and seeded, and
/// schemas with reseed_policy::always get their absent default rows back.
/// The first open records the scope's identity in the file (owner_table);
/// opening the file as any other scope throws contract_error.
/// Instances are created and cached by domain_data; do not share one across
/// threads without external locking.
class scope_connection {
public:
    /// Broker-owned table holding the identity of the scope owning the file.
    static constexpr const char* owner_table = "_silo_owner";

    scope_connection(scope s,
                     const std::string& path,
                     std::vector<table_schema> schemas,
                     const database::open_options& options = {});

    scope_connection(const scope_connection&) = delete;
    scope_connection& operator=(const scope_connection&) = delete;

    const scope& owner() const { return scope_; }
    const std::string& path() const { return db_.path(); }
    bool is_open() const { return db_.is_open(); }
    const std::vector<table_schema>& schemas() const { return schemas_; }

    // --- Generic access ---

    void execute(const std::string& sql, const params_t& params = {}, bool commit = true);
    void execute(const std::string& sql, const named_params_t& params, bool commit = true);
    void executemany(const std::string& sql, const std::vector<params_t>& rows, bool commit = true);

    std::optional<row_t> fetch(const std::string& sql, const params_t& params = {});
    std::optional<row_t> fetch(const std::string& sql, const named_params_t& params);
    std::optional<row_t> fetchone(const std::string& sql, const params_t& params = {}) {
        return fetch(sql, params);
    }

    std::vector<row_t> fetchall(const std::string& sql, const params_t& params = {});
    std::vector<row_t> fetchall(const std::string& sql, const named_params_t& params);

    /// Runs a statement to completion and optionally returns its first row
    /// (INSERT ... RETURNING *).
    std::optional<row_t> evaluate(const std::string& sql,
                                  const params_t& params = {},
                                  bool fetchback = true,
                                  bool commit = true);

    void commit();

    /// Pending (uncommitted) writes are discarded. Further calls throw db_error.
    void close();

    /// User tables; owner_table is not listed.
    std::vector<std::string> tables();
    std::vector<std::string> column_names(const std::string& table);

    // --- Key-value tables ---

    template<typename T = std::string>
    std::optional<T> get_value(const std::string& table, const std::string& key) {
        auto text = get_text(table, key);
        if (!text) return std::nullopt;
        return detail::from_text<T>(*text);
    }

    std::map<std::string, std::string> get_all_values(const std::string& table);

    template<typename T>
    void set_value(const std::string& table, const std::string& key, const T& value) {
        set_text(table, key, detail::to_text(value));
    }

    void delete_value(const std::string& table, const std::string& key);

    /// Stored text for key, or nullopt if the key is absent.
    std::optional<std::string> get_text(const std::string& table, const std::string& key);
    void set_text(const std::string& table, const std::string& key, const std::string& value);

    /// Identity recorded in an open database, or nullopt for files that
    /// predate owner records (or are not scope databases).
    static std::optional<std::string> recorded_owner(database& db);

private:
    scope scope_;
    std::vector<table_schema> schemas_;
    database db_;
    std::unordered_set<std::string> known_tables_;
    std::unordered_set<std::string> key_value_tables_;

    void bootstrap();
    bool claim_owner();
    bool is_key_value_shape(const std::string& table);
    void require_key_value(const std::string& table);
    void begin_if_writing(const std::string& sql);
    void after_statement(const std::string& sql, bool commit);
};

} // namespace silo

#endif // __cplusplus
