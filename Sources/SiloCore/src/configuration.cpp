#include "silo/configuration.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

namespace silo {

log_level parse_log_level(const std::string& name) {
    auto lowered = name;
    for (char& c : lowered) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lowered == "off") return log_level::off;
    if (lowered == "error") return log_level::error;
    if (lowered == "warn" || lowered == "warning") return log_level::warn;
    if (lowered == "info") return log_level::info;
    if (lowered == "debug") return log_level::debug;
    throw error("Unknown log level: " + name);
}

configuration configuration::from_json(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw error(std::string("Invalid configuration JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw error("Configuration must be a JSON object");
    }

    configuration config;
    try {
        if (doc.contains("root")) config.root = doc.at("root").get<std::string>();
        if (doc.contains("resources_path")) config.resources_path = doc.at("resources_path").get<std::string>();
        if (doc.contains("extension")) config.extension = doc.at("extension").get<std::string>();
        if (doc.contains("journal_mode")) config.journal_mode = doc.at("journal_mode").get<std::string>();
        if (doc.contains("busy_timeout_ms")) config.busy_timeout_ms = doc.at("busy_timeout_ms").get<int>();
        if (doc.contains("foreign_keys")) config.foreign_keys = doc.at("foreign_keys").get<bool>();
        if (doc.contains("log_level")) config.level = parse_log_level(doc.at("log_level").get<std::string>());
    } catch (const nlohmann::json::type_error& e) {
        throw error(std::string("Invalid configuration value: ") + e.what());
    }

    if (!config.extension.empty() && config.extension.front() == '.') {
        config.extension.erase(0, 1);
    }
    if (config.extension.empty()) {
        throw error("Configuration extension must not be empty");
    }
    return config;
}

configuration configuration::from_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw error("Cannot read configuration file: " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str());
}

} // namespace silo
