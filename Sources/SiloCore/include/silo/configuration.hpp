#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "log.hpp"
#include <filesystem>
#include <string>

namespace silo {

// ============================================================================
// Configuration for a store
// ============================================================================

struct configuration {
    /// Directory holding one folder per domain: <root>/<domain>/data/<scope>.<extension>
    std::filesystem::path root = ".";

    /// Directory of resources shared by every domain (fonts, images, ...).
    std::filesystem::path resources_path = "common/resources";

    /// File extension of scope databases, without the dot.
    std::string extension = "db";

    /// PRAGMA journal_mode applied to every scope database. Empty = SQLite default.
    std::string journal_mode = "WAL";

    /// How long a statement waits on a locked database before failing.
    int busy_timeout_ms = 5000;

    /// Enforce FOREIGN KEY clauses (needed for ON DELETE CASCADE).
    bool foreign_keys = true;

    /// Applied to the global log level when a store is constructed.
    log_level level = log_level::warn;

    configuration() = default;

    // Root only
    explicit configuration(std::filesystem::path r) : root(std::move(r)) {}

    /// Options passed to every database opened under this configuration.
    database::open_options open_options() const {
        database::open_options options;
        options.journal_mode = journal_mode;
        options.busy_timeout_ms = busy_timeout_ms;
        options.foreign_keys = foreign_keys;
        return options;
    }

    /// Parse a JSON object with the same keys as the members above
    /// ("root", "resources_path", "extension", "journal_mode",
    /// "busy_timeout_ms", "foreign_keys", "log_level"). Missing keys keep
    /// their defaults, unknown keys are ignored. Throws silo::error.
    static configuration from_json(const std::string& json_text);
    static configuration from_file(const std::filesystem::path& path);
};

} // namespace silo

#endif // __cplusplus
