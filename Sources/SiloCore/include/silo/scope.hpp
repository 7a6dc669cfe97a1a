#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <variant>

namespace silo {

/// Scope-type name used when none is given.
inline constexpr const char* global_scope_type = "global";

/// A tenant identified by entity kind and numeric id, e.g. {"guild", 123}.
struct typed_scope {
    std::string kind;
    uint64_t id = 0;
};

/// A scope identified by an arbitrary name, e.g. "global".
struct named_scope {
    std::string name;
};

using scope = std::variant<typed_scope, named_scope>;

/// Filesystem-safe storage key: "{kind}_{id}" lower-cased for typed scopes;
/// the lower-cased name with every character outside [a-z0-9_] replaced by '_'
/// for named scopes (one '_' per UTF-8 code point). Throws type_error for an empty name or an invalid kind.
std::string scope_key(const scope& s);

/// Key under which schemas are registered for the scope: the lower-cased kind
/// or the lower-cased name.
std::string scope_type(const scope& s);

/// Identity used to tell scopes apart when their keys collide.
std::string scope_identity(const scope& s);

/// Human readable form for logs and error messages.
std::string describe(const scope& s);

std::string to_lower(std::string s);

} // namespace silo

#endif // __cplusplus
