#ifndef SILO_C_API_H
#define SILO_C_API_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Opaque Types
// =============================================================================

typedef struct silo_store silo_store_t;

// =============================================================================
// Error Handling
// =============================================================================

typedef enum {
    SILO_OK = 0,
    SILO_ERROR_NULL_POINTER = -1,
    SILO_ERROR_INVALID_ARGUMENT = -2,
    SILO_ERROR_NOT_FOUND = -3,
    SILO_ERROR_DATABASE = -4,
    SILO_ERROR_SCHEMA = -5,
    SILO_ERROR_CONTRACT = -6,
    SILO_ERROR_TYPE = -7,
} silo_status_t;

// Get the last error message (thread-local)
const char* silo_last_error(void);

// =============================================================================
// Scopes and Schemas
// =============================================================================

typedef enum {
    SILO_SCOPE_TYPED = 0,
    SILO_SCOPE_NAMED = 1,
} silo_scope_kind_t;

typedef struct {
    silo_scope_kind_t kind;
    const char* name;   // entity kind for typed scopes, scope name for named scopes
    uint64_t id;        // ignored for named scopes
} silo_scope_t;

typedef enum {
    SILO_RESEED_ONCE = 0,
    SILO_RESEED_ALWAYS = 1,
} silo_reseed_policy_t;

typedef struct {
    const char* creation_statement;
    const char* default_rows_json;   // JSON array of objects, or NULL
    silo_reseed_policy_t reseed;
} silo_schema_t;

typedef struct {
    const char* table_name;
    const char* defaults_json;       // JSON object of key -> value, or NULL
    silo_reseed_policy_t reseed;
} silo_key_value_schema_t;

// =============================================================================
// Store Lifecycle
// =============================================================================

// Create a store rooted at the given directory (NULL = current directory)
silo_store_t* silo_store_create(const char* root_path);

// Create a store from a JSON configuration file
silo_store_t* silo_store_create_from_config(const char* config_path);

// Close every connection and free the store
void silo_store_release(silo_store_t* store);

// Close every connection of every domain
silo_status_t silo_store_close_all(silo_store_t* store);

// =============================================================================
// Schema Registration (replaces previous registrations for the scope type)
// =============================================================================

silo_status_t silo_register_schemas(silo_store_t* store,
                                    const char* domain,
                                    const char* scope_type,
                                    const silo_schema_t* schemas,
                                    size_t schema_count,
                                    const silo_key_value_schema_t* kv_schemas,
                                    size_t kv_schema_count);

// =============================================================================
// Scope Lifecycle
// =============================================================================

silo_status_t silo_scope_open(silo_store_t* store, const char* domain, silo_scope_t scope);
silo_status_t silo_scope_close(silo_store_t* store, const char* domain, silo_scope_t scope);
silo_status_t silo_scope_remove(silo_store_t* store, const char* domain, silo_scope_t scope);
silo_status_t silo_domain_close_all(silo_store_t* store, const char* domain);
silo_status_t silo_domain_remove_all(silo_store_t* store, const char* domain);

// Path of the scope's database file. Caller frees with silo_string_free.
char* silo_scope_path(silo_store_t* store, const char* domain, silo_scope_t scope);

// =============================================================================
// Statements
// params_json: JSON array (positional) or object (named), or NULL.
// Returned strings are JSON and must be freed with silo_string_free.
// =============================================================================

silo_status_t silo_execute(silo_store_t* store, const char* domain, silo_scope_t scope,
                           const char* sql, const char* params_json, bool commit);

silo_status_t silo_commit(silo_store_t* store, const char* domain, silo_scope_t scope);

// First row as a JSON object, or "null" when there is none. NULL on error.
char* silo_fetch(silo_store_t* store, const char* domain, silo_scope_t scope,
                 const char* sql, const char* params_json);

// All rows as a JSON array. NULL on error.
char* silo_fetchall(silo_store_t* store, const char* domain, silo_scope_t scope,
                    const char* sql, const char* params_json);

// Runs the statement; returns its first row as JSON (or "null"). NULL on error.
char* silo_evaluate(silo_store_t* store, const char* domain, silo_scope_t scope,
                    const char* sql, const char* params_json, bool commit);

// =============================================================================
// Key-Value Tables
// =============================================================================

// *out_value receives the stored text (free with silo_string_free).
// Returns SILO_ERROR_NOT_FOUND, leaving *out_value NULL, when the key is absent.
silo_status_t silo_get_value(silo_store_t* store, const char* domain, silo_scope_t scope,
                             const char* table, const char* key, char** out_value);

// JSON object of every key -> value. NULL on error.
char* silo_get_all_values(silo_store_t* store, const char* domain, silo_scope_t scope,
                          const char* table);

silo_status_t silo_set_value(silo_store_t* store, const char* domain, silo_scope_t scope,
                             const char* table, const char* key, const char* value);

silo_status_t silo_set_bool(silo_store_t* store, const char* domain, silo_scope_t scope,
                            const char* table, const char* key, bool value);

silo_status_t silo_delete_value(silo_store_t* store, const char* domain, silo_scope_t scope,
                                const char* table, const char* key);

// Free a string returned by this API
void silo_string_free(char* str);

#ifdef __cplusplus
}
#endif

#endif // SILO_C_API_H
