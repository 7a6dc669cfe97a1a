#include "silo/scope.hpp"
#include "silo/errors.hpp"
#include <cctype>

namespace silo {

namespace {

const typed_scope& validated(const typed_scope& s) {
    if (s.kind.empty()) {
        throw type_error("Typed scope has an empty kind");
    }
    for (char c : s.kind) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            throw type_error("Typed scope kind '" + s.kind + "' may only contain letters, digits and '_'");
        }
    }
    return s;
}

const named_scope& validated(const named_scope& s) {
    if (s.name.empty()) {
        throw type_error("Named scope has an empty name");
    }
    return s;
}

} // namespace

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string scope_key(const scope& s) {
    if (auto* typed = std::get_if<typed_scope>(&s)) {
        const auto& t = validated(*typed);
        return to_lower(t.kind) + "_" + std::to_string(t.id);
    }
    const std::string lowered = to_lower(validated(std::get<named_scope>(s)).name);
    std::string key;
    key.reserve(lowered.size());
    for (char c : lowered) {
        // UTF-8 continuation bytes belong to the code point already replaced
        if ((static_cast<unsigned char>(c) & 0xC0) == 0x80) continue;
        bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        key += allowed ? c : '_';
    }
    return key;
}

std::string scope_type(const scope& s) {
    if (auto* typed = std::get_if<typed_scope>(&s)) {
        return to_lower(validated(*typed).kind);
    }
    return to_lower(validated(std::get<named_scope>(s)).name);
}

std::string scope_identity(const scope& s) {
    if (auto* typed = std::get_if<typed_scope>(&s)) {
        return "typed:" + to_lower(typed->kind) + "#" + std::to_string(typed->id);
    }
    return "named:" + to_lower(std::get<named_scope>(s).name);
}

std::string describe(const scope& s) {
    if (auto* typed = std::get_if<typed_scope>(&s)) {
        return typed->kind + "#" + std::to_string(typed->id);
    }
    return std::get<named_scope>(s).name;
}

} // namespace silo
