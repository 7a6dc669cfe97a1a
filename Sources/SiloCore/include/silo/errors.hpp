#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace silo {

/// Base for every error raised by Silo.
class error : public std::runtime_error {
public:
    explicit error(const std::string& msg) : std::runtime_error(msg) {}
};

/// A table schema could not be built from its definition.
class schema_error : public error {
public:
    explicit schema_error(const std::string& msg) : error(msg) {}
};

/// A key-value helper targeted a table that is missing or not shaped (key, value),
/// or two distinct scopes resolved to the same storage key.
class contract_error : public error {
public:
    explicit contract_error(const std::string& msg) : error(msg) {}
};

/// A scope or value could not be interpreted as the requested type.
class type_error : public error {
public:
    explicit type_error(const std::string& msg) : error(msg) {}
};

/// Failure reported by SQLite. `code()` is the SQLite result code.
class db_error : public error {
public:
    explicit db_error(const std::string& msg, int code = 1) : error(msg), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

} // namespace silo

#endif // __cplusplus
