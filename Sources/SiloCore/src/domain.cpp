#include "silo/domain.hpp"
#include "silo/log.hpp"

namespace silo {

namespace {

// SQLite side files that belong to a database file.
constexpr const char* side_suffixes[] = {"-wal", "-shm", "-journal"};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

domain_data::domain_data(std::string name, const configuration& config)
    : name_(to_lower(std::move(name)))
    , folder_(config.root / name_)
    , extension_(config.extension)
    , options_(config.open_options()) {
    if (name_.empty()) {
        throw error("Domain name must not be empty");
    }
    std::filesystem::create_directories(folder_);
}

domain_data::~domain_data() {
    close_all();
}

// --- Schemas ---

void domain_data::register_schemas(const std::string& scope_type, std::vector<table_schema> schemas) {
    auto type = to_lower(scope_type);
    LOG_DEBUG("domain", "%s: %zu schema(s) registered for '%s'", name_.c_str(), schemas.size(), type.c_str());
    schemas_.insert_or_assign(type, std::move(schemas));
}

std::vector<table_schema> domain_data::registered_schemas(const std::string& scope_type) const {
    auto it = schemas_.find(to_lower(scope_type));
    if (it == schemas_.end()) return {};
    return it->second;
}

// --- Connections ---

std::shared_ptr<scope_connection> domain_data::get(const scope& s) {
    auto key = scope_key(s);
    auto identity = scope_identity(s);

    auto it = connections_.find(key);
    if (it != connections_.end()) {
        if (it->second.identity != identity) {
            throw contract_error("Scope " + describe(s) + " resolves to storage key '" + key +
                                 "' already used by another scope in domain " + name_);
        }
        if (it->second.connection->is_open()) {
            return it->second.connection;
        }
        LOG_DEBUG("domain", "%s: reopening %s after close", name_.c_str(), describe(s).c_str());
        connections_.erase(it);
    }

    std::filesystem::create_directories(data_folder());
    auto path = storage_path(s);
    auto connection = std::make_shared<scope_connection>(
        s, path.string(), registered_schemas(scope_type(s)), options_);

    LOG_DEBUG("domain", "%s: opened %s (%s)", name_.c_str(), describe(s).c_str(), path.string().c_str());
    connections_.emplace(key, entry{std::move(identity), connection});
    return connection;
}

std::vector<std::shared_ptr<scope_connection>> domain_data::get_all() {
    std::vector<std::shared_ptr<scope_connection>> result;
    result.reserve(connections_.size());
    for (auto& [_, e] : connections_) {
        if (e.connection->is_open()) result.push_back(e.connection);
    }
    return result;
}

bool domain_data::is_open(const scope& s) const {
    auto it = connections_.find(scope_key(s));
    return it != connections_.end() &&
           it->second.identity == scope_identity(s) &&
           it->second.connection->is_open();
}

void domain_data::close(const scope& s) {
    auto it = connections_.find(scope_key(s));
    if (it == connections_.end() || it->second.identity != scope_identity(s)) {
        return;
    }
    it->second.connection->close();
    connections_.erase(it);
}

void domain_data::close_all() {
    for (auto& [_, e] : connections_) {
        e.connection->close();
    }
    connections_.clear();
}

void domain_data::remove(const scope& s) {
    auto key = scope_key(s);
    auto it = connections_.find(key);
    if (it != connections_.end()) {
        if (it->second.identity != scope_identity(s)) {
            throw contract_error("Refusing to delete storage key '" + key +
                                 "' held open by another scope in domain " + name_);
        }
        it->second.connection->close();
        connections_.erase(it);
    }

    auto path = storage_path(s);
    check_owner(s, path);
    remove_files(path);
}

void domain_data::remove_all() {
    close_all();

    auto folder = data_folder();
    if (!std::filesystem::exists(folder)) return;

    const std::string ext = "." + extension_;
    std::vector<std::filesystem::path> doomed;
    for (const auto& file : std::filesystem::directory_iterator(folder)) {
        if (!file.is_regular_file()) continue;
        auto filename = file.path().filename().string();
        bool matches = ends_with(filename, ext);
        for (const char* suffix : side_suffixes) {
            matches = matches || ends_with(filename, ext + suffix);
        }
        if (matches) doomed.push_back(file.path());
    }
    for (const auto& path : doomed) {
        std::filesystem::remove(path);
    }
    LOG_DEBUG("domain", "%s: removed %zu file(s)", name_.c_str(), doomed.size());
}

void domain_data::remove_files(const std::filesystem::path& db_path) {
    std::filesystem::remove(db_path);
    for (const char* suffix : side_suffixes) {
        std::filesystem::remove(db_path.string() + suffix);
    }
}

void domain_data::check_owner(const scope& s, const std::filesystem::path& db_path) const {
    if (!std::filesystem::exists(db_path)) return;

    database db(db_path.string(), options_);
    auto owner = scope_connection::recorded_owner(db);
    if (owner && *owner != scope_identity(s)) {
        throw contract_error("Refusing to delete " + db_path.string() + ": it belongs to " + *owner +
                             ", not " + describe(s));
    }
}

std::filesystem::path domain_data::storage_path(const scope& s) const {
    return data_folder() / (scope_key(s) + "." + extension_);
}

// --- Folders ---

std::filesystem::path domain_data::subfolder(const std::string& name, bool create) const {
    auto folder = folder_ / name;
    if (create) {
        std::filesystem::create_directories(folder);
    }
    return folder;
}

} // namespace silo
