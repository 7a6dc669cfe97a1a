#include "silo.h"
#include <SiloCore.hpp>
#include <nlohmann/json.hpp>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <cstring>
#include <cstdlib>

// Thread-local error message storage
static thread_local std::string g_last_error;

static void set_error(const std::string& msg) {
    g_last_error = msg;
}

// =============================================================================
// Opaque Type Definitions (internal)
// =============================================================================

struct silo_store {
    explicit silo_store(const silo::configuration& config) : impl(config) {}
    silo::store impl;
};

// =============================================================================
// Helpers
// =============================================================================

namespace {

using nlohmann::json;

char* dup_string(const std::string& s) {
    char* ret = static_cast<char*>(malloc(s.size() + 1));
    if (ret) {
        std::memcpy(ret, s.c_str(), s.size() + 1);
    }
    return ret;
}

// Runs fn, translating exceptions into a status code and silo_last_error().
template<typename F>
silo_status_t guarded(F&& fn) {
    try {
        fn();
        g_last_error.clear();
        return SILO_OK;
    } catch (const silo::schema_error& e) {
        set_error(e.what());
        return SILO_ERROR_SCHEMA;
    } catch (const silo::contract_error& e) {
        set_error(e.what());
        return SILO_ERROR_CONTRACT;
    } catch (const silo::type_error& e) {
        set_error(e.what());
        return SILO_ERROR_TYPE;
    } catch (const silo::db_error& e) {
        set_error(e.what());
        return SILO_ERROR_DATABASE;
    } catch (const json::exception& e) {
        set_error(e.what());
        return SILO_ERROR_INVALID_ARGUMENT;
    } catch (const silo::error& e) {
        set_error(e.what());
        return SILO_ERROR_INVALID_ARGUMENT;
    } catch (const std::exception& e) {
        set_error(e.what());
        return SILO_ERROR_DATABASE;
    }
}

// Same as guarded() for calls that hand back a string; NULL on error.
template<typename F>
char* guarded_string(F&& fn) {
    std::string result;
    if (guarded([&] { result = fn(); }) != SILO_OK) {
        return nullptr;
    }
    return dup_string(result);
}

silo::scope to_scope(const silo_scope_t& s) {
    if (!s.name) {
        throw silo::type_error("scope name is null");
    }
    switch (s.kind) {
        case SILO_SCOPE_TYPED: return silo::typed_scope{s.name, s.id};
        case SILO_SCOPE_NAMED: return silo::named_scope{s.name};
    }
    throw silo::type_error("unknown scope kind " + std::to_string(static_cast<int>(s.kind)));
}

silo::reseed_policy to_policy(silo_reseed_policy_t p) {
    return p == SILO_RESEED_ALWAYS ? silo::reseed_policy::always : silo::reseed_policy::once;
}

silo::column_value_t to_value(const json& j) {
    switch (j.type()) {
        case json::value_t::null: return nullptr;
        case json::value_t::boolean: return static_cast<int64_t>(j.get<bool>() ? 1 : 0);
        case json::value_t::number_integer: return j.get<int64_t>();
        case json::value_t::number_unsigned: {
            auto value = j.get<uint64_t>();
            if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw silo::type_error("integer " + j.dump() + " does not fit in a signed 64-bit column");
            }
            return static_cast<int64_t>(value);
        }
        case json::value_t::number_float: return j.get<double>();
        case json::value_t::string: return j.get<std::string>();
        case json::value_t::binary: {
            const auto& bin = j.get_binary();
            return silo::blob_t(bin.begin(), bin.end());
        }
        default:
            throw silo::type_error("unsupported JSON value: " + j.dump());
    }
}

json to_json(const silo::column_value_t& v) {
    return std::visit([](auto&& x) -> json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, silo::blob_t>) {
            // Blobs are exposed as arrays of byte values
            return json(std::vector<int>(x.begin(), x.end()));
        } else {
            return x;
        }
    }, v);
}

json to_json(const silo::row_t& row) {
    json obj = json::object();
    for (const auto& [column, value] : row) {
        obj[column] = to_json(value);
    }
    return obj;
}

std::string json_to_text(const json& j) {
    if (j.is_boolean()) return silo::detail::to_text(j.get<bool>());
    return silo::detail::to_text(to_value(j));
}

// Executes with positional (array) or named (object) parameters.
template<typename Positional, typename Named>
auto with_params(const char* params_json, Positional&& positional, Named&& named) {
    if (!params_json) {
        return positional(silo::params_t{});
    }
    json doc = json::parse(params_json);
    if (doc.is_null()) {
        return positional(silo::params_t{});
    }
    if (doc.is_array()) {
        silo::params_t params;
        for (const auto& item : doc) params.push_back(to_value(item));
        return positional(params);
    }
    if (doc.is_object()) {
        silo::named_params_t params;
        for (const auto& [name, item] : doc.items()) params.emplace_back(name, to_value(item));
        return named(params);
    }
    throw silo::type_error("parameters must be a JSON array or object");
}

std::shared_ptr<silo::scope_connection> connection(silo_store_t* store, const char* domain, const silo_scope_t& scope) {
    return store->impl.domain(domain).get(to_scope(scope));
}

bool missing(const void* a, const void* b = "", const void* c = "") {
    if (!a || !b || !c) {
        set_error("null argument");
        return true;
    }
    return false;
}

} // namespace

// =============================================================================
// Error Handling
// =============================================================================

extern "C" const char* silo_last_error(void) {
    return g_last_error.empty() ? nullptr : g_last_error.c_str();
}

extern "C" void silo_string_free(char* str) {
    free(str);
}

// =============================================================================
// Store Lifecycle
// =============================================================================

extern "C" silo_store_t* silo_store_create(const char* root_path) {
    silo_store_t* created = nullptr;
    guarded([&] {
        silo::configuration config(root_path ? root_path : ".");
        created = new silo_store(config);
    });
    return created;
}

extern "C" silo_store_t* silo_store_create_from_config(const char* config_path) {
    if (missing(config_path)) return nullptr;
    silo_store_t* created = nullptr;
    guarded([&] {
        created = new silo_store(silo::configuration::from_file(config_path));
    });
    return created;
}

extern "C" void silo_store_release(silo_store_t* store) {
    delete store;
}

extern "C" silo_status_t silo_store_close_all(silo_store_t* store) {
    if (missing(store)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { store->impl.close_all(); });
}

// =============================================================================
// Schema Registration
// =============================================================================

extern "C" silo_status_t silo_register_schemas(silo_store_t* store,
                                               const char* domain,
                                               const char* scope_type,
                                               const silo_schema_t* schemas,
                                               size_t schema_count,
                                               const silo_key_value_schema_t* kv_schemas,
                                               size_t kv_schema_count) {
    if (missing(store, domain, scope_type)) return SILO_ERROR_NULL_POINTER;
    if ((schema_count && !schemas) || (kv_schema_count && !kv_schemas)) {
        set_error("schema array is null");
        return SILO_ERROR_NULL_POINTER;
    }

    return guarded([&] {
        std::vector<silo::table_schema> built;
        built.reserve(schema_count + kv_schema_count);

        for (size_t i = 0; i < schema_count; i++) {
            const silo_schema_t& s = schemas[i];
            if (!s.creation_statement) {
                throw silo::schema_error("schema " + std::to_string(i) + " has no creation statement");
            }
            std::vector<silo::record_t> rows;
            if (s.default_rows_json) {
                json doc = json::parse(s.default_rows_json);
                if (!doc.is_array()) {
                    throw silo::schema_error("default rows must be a JSON array of objects");
                }
                for (const auto& item : doc) {
                    if (!item.is_object()) {
                        throw silo::schema_error("default rows must be a JSON array of objects");
                    }
                    silo::record_t record;
                    for (const auto& [column, value] : item.items()) {
                        record.emplace_back(column, to_value(value));
                    }
                    rows.push_back(std::move(record));
                }
            }
            built.emplace_back(s.creation_statement, std::move(rows), to_policy(s.reseed));
        }

        for (size_t i = 0; i < kv_schema_count; i++) {
            const silo_key_value_schema_t& s = kv_schemas[i];
            if (!s.table_name) {
                throw silo::schema_error("key-value schema " + std::to_string(i) + " has no table name");
            }
            silo::key_value_defaults_t defaults;
            if (s.defaults_json) {
                json doc = json::parse(s.defaults_json);
                if (!doc.is_object()) {
                    throw silo::schema_error("key-value defaults must be a JSON object");
                }
                for (const auto& [key, value] : doc.items()) {
                    defaults.emplace_back(key, json_to_text(value));
                }
            }
            built.push_back(silo::key_value_schema(s.table_name, defaults, to_policy(s.reseed)));
        }

        store->impl.domain(domain).register_schemas(scope_type, std::move(built));
    });
}

// =============================================================================
// Scope Lifecycle
// =============================================================================

extern "C" silo_status_t silo_scope_open(silo_store_t* store, const char* domain, silo_scope_t scope) {
    if (missing(store, domain)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { connection(store, domain, scope); });
}

extern "C" silo_status_t silo_scope_close(silo_store_t* store, const char* domain, silo_scope_t scope) {
    if (missing(store, domain)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { store->impl.domain(domain).close(to_scope(scope)); });
}

extern "C" silo_status_t silo_scope_remove(silo_store_t* store, const char* domain, silo_scope_t scope) {
    if (missing(store, domain)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { store->impl.domain(domain).remove(to_scope(scope)); });
}

extern "C" silo_status_t silo_domain_close_all(silo_store_t* store, const char* domain) {
    if (missing(store, domain)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { store->impl.domain(domain).close_all(); });
}

extern "C" silo_status_t silo_domain_remove_all(silo_store_t* store, const char* domain) {
    if (missing(store, domain)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { store->impl.domain(domain).remove_all(); });
}

extern "C" char* silo_scope_path(silo_store_t* store, const char* domain, silo_scope_t scope) {
    if (missing(store, domain)) return nullptr;
    return guarded_string([&] {
        return store->impl.domain(domain).storage_path(to_scope(scope)).string();
    });
}

// =============================================================================
// Statements
// =============================================================================

extern "C" silo_status_t silo_execute(silo_store_t* store, const char* domain, silo_scope_t scope,
                                      const char* sql, const char* params_json, bool commit) {
    if (missing(store, domain, sql)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] {
        auto conn = connection(store, domain, scope);
        with_params(params_json,
            [&](const silo::params_t& p) { conn->execute(sql, p, commit); return 0; },
            [&](const silo::named_params_t& p) { conn->execute(sql, p, commit); return 0; });
    });
}

extern "C" silo_status_t silo_commit(silo_store_t* store, const char* domain, silo_scope_t scope) {
    if (missing(store, domain)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { connection(store, domain, scope)->commit(); });
}

extern "C" char* silo_fetch(silo_store_t* store, const char* domain, silo_scope_t scope,
                            const char* sql, const char* params_json) {
    if (missing(store, domain, sql)) return nullptr;
    return guarded_string([&] {
        auto conn = connection(store, domain, scope);
        auto row = with_params(params_json,
            [&](const silo::params_t& p) { return conn->fetch(sql, p); },
            [&](const silo::named_params_t& p) { return conn->fetch(sql, p); });
        return row ? to_json(*row).dump() : json(nullptr).dump();
    });
}

extern "C" char* silo_fetchall(silo_store_t* store, const char* domain, silo_scope_t scope,
                               const char* sql, const char* params_json) {
    if (missing(store, domain, sql)) return nullptr;
    return guarded_string([&] {
        auto conn = connection(store, domain, scope);
        auto rows = with_params(params_json,
            [&](const silo::params_t& p) { return conn->fetchall(sql, p); },
            [&](const silo::named_params_t& p) { return conn->fetchall(sql, p); });

        json result = json::array();
        for (const auto& row : rows) {
            result.push_back(to_json(row));
        }
        return result.dump();
    });
}

extern "C" char* silo_evaluate(silo_store_t* store, const char* domain, silo_scope_t scope,
                               const char* sql, const char* params_json, bool commit) {
    if (missing(store, domain, sql)) return nullptr;
    return guarded_string([&] {
        auto conn = connection(store, domain, scope);
        auto row = with_params(params_json,
            [&](const silo::params_t& p) { return conn->evaluate(sql, p, true, commit); },
            [&](const silo::named_params_t&) -> std::optional<silo::row_t> {
                throw silo::type_error("evaluate takes positional parameters only");
            });
        return row ? to_json(*row).dump() : json(nullptr).dump();
    });
}

// =============================================================================
// Key-Value Tables
// =============================================================================

extern "C" silo_status_t silo_get_value(silo_store_t* store, const char* domain, silo_scope_t scope,
                                        const char* table, const char* key, char** out_value) {
    if (missing(store, domain, table) || missing(key, out_value)) return SILO_ERROR_NULL_POINTER;
    *out_value = nullptr;

    std::optional<std::string> value;
    auto status = guarded([&] { value = connection(store, domain, scope)->get_text(table, key); });
    if (status != SILO_OK) return status;
    if (!value) {
        set_error(std::string("no value for key ") + key);
        return SILO_ERROR_NOT_FOUND;
    }
    *out_value = dup_string(*value);
    return SILO_OK;
}

extern "C" char* silo_get_all_values(silo_store_t* store, const char* domain, silo_scope_t scope,
                                     const char* table) {
    if (missing(store, domain, table)) return nullptr;
    return guarded_string([&] {
        json result = json::object();
        for (const auto& [key, value] : connection(store, domain, scope)->get_all_values(table)) {
            result[key] = value;
        }
        return result.dump();
    });
}

extern "C" silo_status_t silo_set_value(silo_store_t* store, const char* domain, silo_scope_t scope,
                                        const char* table, const char* key, const char* value) {
    if (missing(store, domain, table) || missing(key, value)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { connection(store, domain, scope)->set_value(table, key, std::string(value)); });
}

extern "C" silo_status_t silo_set_bool(silo_store_t* store, const char* domain, silo_scope_t scope,
                                       const char* table, const char* key, bool value) {
    if (missing(store, domain, table) || missing(key)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { connection(store, domain, scope)->set_value(table, key, value); });
}

extern "C" silo_status_t silo_delete_value(silo_store_t* store, const char* domain, silo_scope_t scope,
                                           const char* table, const char* key) {
    if (missing(store, domain, table) || missing(key)) return SILO_ERROR_NULL_POINTER;
    return guarded([&] { connection(store, domain, scope)->delete_value(table, key); });
}
