#undef NDEBUG
#include <silo.h>
#include <nlohmann/json.hpp>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using nlohmann::json;

// ============================================================================
// Helpers
// ============================================================================

static fs::path test_root(const std::string& name) {
    auto root = fs::temp_directory_path() / "silo_capi_tests" / name;
    fs::remove_all(root);
    fs::create_directories(root);
    return root;
}

// Takes ownership of a string returned by the API.
static std::string take(char* str) {
    assert(str != nullptr);
    std::string result(str);
    silo_string_free(str);
    return result;
}

static silo_scope_t guild(uint64_t id) {
    return silo_scope_t{SILO_SCOPE_TYPED, "guild", id};
}

static silo_scope_t named(const char* name) {
    return silo_scope_t{SILO_SCOPE_NAMED, name, 0};
}

// ============================================================================
// Test: Key-Value Round Trip
// ============================================================================

void test_key_values() {
    std::cout << "Testing C API key-value tables..." << std::endl;

    auto root = test_root("key_values");
    silo_store_t* store = silo_store_create(root.c_str());
    assert(store != nullptr);

    silo_key_value_schema_t settings{"settings", R"({"auto_fix": false, "prefix": "!", "limit": 5})", SILO_RESEED_ALWAYS};
    assert(silo_register_schemas(store, "refix", "guild", nullptr, 0, &settings, 1) == SILO_OK);

    char* value = nullptr;
    assert(silo_get_value(store, "refix", guild(1), "settings", "auto_fix", &value) == SILO_OK);
    assert(std::strcmp(value, "0") == 0);
    silo_string_free(value);

    assert(silo_set_bool(store, "refix", guild(1), "settings", "auto_fix", true) == SILO_OK);
    assert(silo_get_value(store, "refix", guild(1), "settings", "auto_fix", &value) == SILO_OK);
    assert(std::strcmp(value, "1") == 0);
    silo_string_free(value);

    // Another scope keeps its defaults
    assert(silo_get_value(store, "refix", guild(2), "settings", "auto_fix", &value) == SILO_OK);
    assert(std::strcmp(value, "0") == 0);
    silo_string_free(value);

    assert(silo_set_value(store, "refix", guild(1), "settings", "prefix", "?") == SILO_OK);
    auto all = json::parse(take(silo_get_all_values(store, "refix", guild(1), "settings")));
    assert(all.size() == 3);
    assert(all["prefix"] == "?");
    assert(all["limit"] == "5");

    // Absent keys are reported, not returned as empty strings
    assert(silo_get_value(store, "refix", guild(1), "settings", "missing_key", &value) == SILO_ERROR_NOT_FOUND);
    assert(value == nullptr);

    assert(silo_delete_value(store, "refix", guild(1), "settings", "prefix") == SILO_OK);
    assert(silo_get_value(store, "refix", guild(1), "settings", "prefix", &value) == SILO_ERROR_NOT_FOUND);

    assert(silo_get_value(store, "refix", guild(1), "nowhere", "k", &value) == SILO_ERROR_CONTRACT);
    assert(silo_last_error() != nullptr);

    silo_store_release(store);
    fs::remove_all(root);
    std::cout << "  C API key-value test passed!" << std::endl;
}

// ============================================================================
// Test: Statements
// ============================================================================

void test_statements() {
    std::cout << "Testing C API statements..." << std::endl;

    auto root = test_root("statements");
    silo_store_t* store = silo_store_create(root.c_str());
    assert(store != nullptr);

    silo_schema_t presets{
        "CREATE TABLE IF NOT EXISTS presets (id INTEGER PRIMARY KEY, name TEXT, temperature REAL)",
        R"([{"id": 1, "name": "Default", "temperature": 0.8},
            {"id": 2, "name": "Creative", "temperature": 1.2}])",
        SILO_RESEED_ONCE};
    assert(silo_register_schemas(store, "robot", "guild", &presets, 1, nullptr, 0) == SILO_OK);

    auto rows = json::parse(take(silo_fetchall(store, "robot", guild(7), "SELECT * FROM presets ORDER BY id", nullptr)));
    assert(rows.size() == 2);
    assert(rows[1]["name"] == "Creative");
    assert(rows[0]["temperature"] == 0.8);

    auto row = json::parse(take(silo_fetch(store, "robot", guild(7), "SELECT name FROM presets WHERE id = ?", "[1]")));
    assert(row["name"] == "Default");

    auto none = json::parse(take(silo_fetch(store, "robot", guild(7), "SELECT name FROM presets WHERE id = ?", "[99]")));
    assert(none.is_null());

    assert(silo_execute(store, "robot", guild(7), "UPDATE presets SET name = :name WHERE id = :id",
                        R"({"name": "Calm", "id": 1})", true) == SILO_OK);
    row = json::parse(take(silo_fetch(store, "robot", guild(7), "SELECT name FROM presets WHERE id = :id", R"({"id": 1})")));
    assert(row["name"] == "Calm");

    auto created = json::parse(take(silo_evaluate(store, "robot", guild(7),
        "INSERT INTO presets (name, temperature) VALUES (?, ?) RETURNING id", R"(["Wild", 1.9])", true)));
    assert(created["id"] == 3);

    // Uncommitted write disappears when the scope closes
    assert(silo_execute(store, "robot", guild(7), "DELETE FROM presets", nullptr, false) == SILO_OK);
    assert(silo_scope_close(store, "robot", guild(7)) == SILO_OK);
    rows = json::parse(take(silo_fetchall(store, "robot", guild(7), "SELECT id FROM presets", nullptr)));
    assert(rows.size() == 3);

    assert(silo_execute(store, "robot", guild(7), "DELETE FROM presets WHERE id = 3", nullptr, false) == SILO_OK);
    assert(silo_commit(store, "robot", guild(7)) == SILO_OK);
    assert(silo_scope_close(store, "robot", guild(7)) == SILO_OK);
    rows = json::parse(take(silo_fetchall(store, "robot", guild(7), "SELECT id FROM presets", nullptr)));
    assert(rows.size() == 2);

    assert(silo_execute(store, "robot", guild(7), "INSERT INTO nowhere VALUES (1)", nullptr, true) == SILO_ERROR_DATABASE);
    assert(silo_execute(store, "robot", guild(7), "SELECT ?", "{not json", true) == SILO_ERROR_INVALID_ARGUMENT);
    assert(silo_execute(store, "robot", guild(7), "SELECT ?", "42", true) == SILO_ERROR_TYPE);
    assert(silo_fetch(store, "robot", guild(7), "SELEKT", nullptr) == nullptr);

    // Integers beyond the signed 64-bit range are rejected, not wrapped
    assert(silo_execute(store, "robot", guild(7), "UPDATE presets SET temperature = ? WHERE id = 2",
                        "[18446744073709551615]", true) == SILO_ERROR_TYPE);
    assert(silo_last_error() != nullptr);
    assert(silo_fetch(store, "robot", guild(7), "SELECT ?", "[9223372036854775808]") == nullptr);
    row = json::parse(take(silo_fetch(store, "robot", guild(7), "SELECT ? AS n", "[9223372036854775807]")));
    assert(row["n"] == INT64_MAX);

    silo_store_release(store);
    fs::remove_all(root);
    std::cout << "  C API statements test passed!" << std::endl;
}

// ============================================================================
// Test: Scope Lifecycle
// ============================================================================

void test_scope_lifecycle() {
    std::cout << "Testing C API scope lifecycle..." << std::endl;

    auto root = test_root("lifecycle");
    silo_store_t* store = silo_store_create(root.c_str());
    assert(store != nullptr);

    silo_key_value_schema_t settings{"settings", R"({"enabled": true})", SILO_RESEED_ALWAYS};
    assert(silo_register_schemas(store, "misc", "global", nullptr, 0, &settings, 1) == SILO_OK);

    assert(silo_scope_open(store, "misc", named("Global")) == SILO_OK);
    auto path = take(silo_scope_path(store, "misc", named("global")));
    assert(path == (root / "misc" / "data" / "global.db").string());
    assert(fs::exists(path));

    char* value = nullptr;
    assert(silo_get_value(store, "misc", named("global"), "settings", "enabled", &value) == SILO_OK);
    assert(std::strcmp(value, "1") == 0);
    silo_string_free(value);

    assert(silo_scope_remove(store, "misc", named("global")) == SILO_OK);
    assert(!fs::exists(path));

    // Collisions between a typed and a named scope are rejected
    assert(silo_scope_open(store, "misc", guild(1)) == SILO_OK);
    assert(silo_scope_open(store, "misc", named("guild_1")) == SILO_ERROR_CONTRACT);

    silo_scope_t invalid{SILO_SCOPE_TYPED, "bad kind", 1};
    assert(silo_scope_open(store, "misc", invalid) == SILO_ERROR_TYPE);

    assert(silo_domain_remove_all(store, "misc") == SILO_OK);
    assert(!fs::exists(root / "misc" / "data" / "guild_1.db"));
    assert(silo_store_close_all(store) == SILO_OK);

    // Invalid schemas fail at registration
    silo_schema_t bad{"DROP TABLE presets", nullptr, SILO_RESEED_ONCE};
    assert(silo_register_schemas(store, "misc", "guild", &bad, 1, nullptr, 0) == SILO_ERROR_SCHEMA);

    assert(silo_scope_open(nullptr, "misc", guild(1)) == SILO_ERROR_NULL_POINTER);

    silo_store_release(store);
    fs::remove_all(root);
    std::cout << "  C API scope lifecycle test passed!" << std::endl;
}

// ============================================================================
// Test: Configuration File
// ============================================================================

void test_config_file() {
    std::cout << "Testing C API configuration file..." << std::endl;

    auto root = test_root("config");
    auto config = root / "silo.json";
    {
        std::ofstream out(config);
        out << json{{"root", (root / "var").string()}, {"extension", "sqlite"}, {"log_level", "error"}}.dump();
    }

    silo_store_t* store = silo_store_create_from_config(config.c_str());
    assert(store != nullptr);
    assert(silo_scope_open(store, "quotes", guild(3)) == SILO_OK);
    assert(fs::exists(root / "var" / "quotes" / "data" / "guild_3.sqlite"));
    silo_store_release(store);

    assert(silo_store_create_from_config((root / "missing.json").c_str()) == nullptr);
    assert(silo_last_error() != nullptr);

    fs::remove_all(root);
    std::cout << "  C API configuration file test passed!" << std::endl;
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== SiloCAPI Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_key_values();
        test_statements();
        test_scope_lifecycle();
        test_config_file();

        std::cout << std::endl;
        std::cout << "All tests passed! (4 test suites)" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
