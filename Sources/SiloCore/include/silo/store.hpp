#pragma once

#ifdef __cplusplus

#include "configuration.hpp"
#include "domain.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace silo {

// ============================================================================
// Domain registry - one store per application, owned by its composition root
// ============================================================================

class store {
public:
    store() : store(configuration{}) {}
    explicit store(const configuration& config);
    ~store();

    store(const store&) = delete;
    store& operator=(const store&) = delete;

    /// The registry for a domain, created on first reference. The same name
    /// (case-insensitive) always yields the same object until reset().
    domain_data& domain(const std::string& name);
    bool has_domain(const std::string& name) const;
    std::vector<std::string> domain_names() const;

    /// Close every open scope of every domain. Registries stay in place.
    void close_all();

    /// Close everything and forget every domain (schemas included).
    void reset();

    /// Path of a resource shared by all domains.
    std::filesystem::path resource_path(const std::filesystem::path& relative) const {
        return config_.resources_path / relative;
    }

    const configuration& config() const { return config_; }

private:
    configuration config_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<domain_data>> domains_;
};

} // namespace silo

#endif // __cplusplus
