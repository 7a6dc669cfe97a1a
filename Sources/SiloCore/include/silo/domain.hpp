#pragma once

#ifdef __cplusplus

#include "configuration.hpp"
#include "connection.hpp"
#include "schema.hpp"
#include "scope.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace silo {

/// Storage namespace of one module.
///
/// Owns <root>/<name>/, the schemas registered per scope-type, and one cached
/// scope_connection per open scope. Connections handed out by get() outlive
/// close() and remove(); once closed, every operation on them throws db_error.
class domain_data {
public:
    domain_data(std::string name, const configuration& config);
    ~domain_data();

    domain_data(const domain_data&) = delete;
    domain_data& operator=(const domain_data&) = delete;

    const std::string& name() const { return name_; }
    const std::filesystem::path& folder() const { return folder_; }

    // --- Schemas ---

    /// Replaces the schemas applied to scopes of this type. Scopes that are
    /// already open keep the schemas they were opened with.
    void register_schemas(const std::string& scope_type, std::vector<table_schema> schemas);

    template<typename... Schemas>
    void register_schemas(const std::string& scope_type, const table_schema& first, const Schemas&... rest) {
        register_schemas(scope_type, std::vector<table_schema>{first, rest...});
    }

    std::vector<table_schema> registered_schemas(const std::string& scope_type) const;

    // --- Connections ---

    /// Cached connection for the scope, opened and bootstrapped on first use.
    /// A cached connection closed directly is replaced by a fresh one.
    /// Throws contract_error if the file belongs to another scope.
    std::shared_ptr<scope_connection> get(const scope& s);
    std::vector<std::shared_ptr<scope_connection>> get_all();
    bool is_open(const scope& s) const;

    void close(const scope& s);
    void close_all();

    /// Close the scope (if open) and delete its database file. Throws
    /// contract_error if the file belongs to another scope.
    void remove(const scope& s);

    /// Close every scope and delete every database file of this domain.
    void remove_all();

    /// File the scope's database lives in.
    std::filesystem::path storage_path(const scope& s) const;

    // --- Folders ---

    std::filesystem::path subfolder(const std::string& name, bool create = false) const;
    std::filesystem::path assets_path() const { return subfolder("assets"); }

private:
    struct entry {
        std::string identity;
        std::shared_ptr<scope_connection> connection;
    };

    std::string name_;
    std::filesystem::path folder_;
    std::string extension_;
    database::open_options options_;
    std::map<std::string, std::vector<table_schema>> schemas_;
    std::map<std::string, entry> connections_;

    std::filesystem::path data_folder() const { return folder_ / "data"; }
    void remove_files(const std::filesystem::path& db_path);
    void check_owner(const scope& s, const std::filesystem::path& db_path) const;
};

} // namespace silo

#endif // __cplusplus
