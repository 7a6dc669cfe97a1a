#include "silo/store.hpp"
#include "silo/log.hpp"

namespace silo {

std::atomic<log_level> g_log_level{log_level::warn};

store::store(const configuration& config) : config_(config) {
    set_log_level(config_.level);
    std::filesystem::create_directories(config_.root);
    LOG_DEBUG("store", "Store rooted at %s", config_.root.string().c_str());
}

store::~store() {
    close_all();
}

domain_data& store::domain(const std::string& name) {
    auto key = to_lower(name);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = domains_.find(key);
    if (it == domains_.end()) {
        it = domains_.emplace(key, std::make_unique<domain_data>(key, config_)).first;
    }
    return *it->second;
}

bool store::has_domain(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return domains_.count(to_lower(name)) > 0;
}

std::vector<std::string> store::domain_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(domains_.size());
    for (const auto& [name, _] : domains_) {
        names.push_back(name);
    }
    return names;
}

void store::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, domain] : domains_) {
        domain->close_all();
    }
}

void store::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, domain] : domains_) {
        domain->close_all();
    }
    domains_.clear();
}

} // namespace silo
