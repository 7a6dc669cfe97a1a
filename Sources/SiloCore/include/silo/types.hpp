#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include <charconv>
#include <cstdint>
#include <string>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace silo {

using blob_t = std::vector<uint8_t>;

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    blob_t
>;

/// Positional statement parameters, bound to ?1..?N in order.
using params_t = std::vector<column_value_t>;

/// Named statement parameters. Names are given without the sigil and bound to
/// the matching :name, @name or $name placeholder.
using named_params_t = std::vector<std::pair<std::string, column_value_t>>;

/// One record to insert: ordered (column, value) pairs.
using record_t = std::vector<std::pair<std::string, column_value_t>>;

/// One result row, keyed by result column name.
using row_t = std::unordered_map<std::string, column_value_t>;

// ============================================================================
// Text conversions used by key-value tables
// ============================================================================

namespace detail {

    inline std::string to_text(const std::string& v) { return v; }
    inline std::string to_text(const char* v) { return std::string(v); }
    inline std::string to_text(bool v) { return v ? "1" : "0"; }

    template<typename T>
    std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, std::string>
    to_text(T v) {
        return std::to_string(v);
    }

    // Shortest representation that round-trips (0.8 -> "0.8").
    template<typename T>
    std::enable_if_t<std::is_floating_point_v<T>, std::string>
    to_text(T v) {
        char buf[64];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), static_cast<double>(v));
        if (ec != std::errc()) {
            throw type_error("Cannot render floating point value as text");
        }
        return std::string(buf, end);
    }

    inline std::string to_text(const column_value_t& v) {
        return std::visit([](auto&& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                throw type_error("Cannot render NULL as text");
            } else if constexpr (std::is_same_v<T, blob_t>) {
                throw type_error("Cannot render a blob as text");
            } else {
                return to_text(x);
            }
        }, v);
    }

    template<typename T>
    T from_text(const std::string& text);

    template<> inline std::string from_text<std::string>(const std::string& text) {
        return text;
    }

    template<> inline int64_t from_text<int64_t>(const std::string& text) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
            throw type_error("Cannot convert '" + text + "' to an integer");
        }
        return value;
    }

    template<> inline uint64_t from_text<uint64_t>(const std::string& text) {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
            throw type_error("Cannot convert '" + text + "' to an unsigned integer");
        }
        return value;
    }

    template<> inline int from_text<int>(const std::string& text) {
        int value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
            throw type_error("Cannot convert '" + text + "' to an integer");
        }
        return value;
    }

    // Stored by set_value as "1"/"0"; any other integer is truthy if non-zero.
    template<> inline bool from_text<bool>(const std::string& text) {
        return from_text<int64_t>(text) != 0;
    }

    // Inverse of to_text: locale-independent, no surrounding whitespace.
    template<> inline double from_text<double>(const std::string& text) {
        double value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
            throw type_error("Cannot convert '" + text + "' to a number");
        }
        return value;
    }

    // Text form of a column read back from SQLite (TEXT affinity may still
    // hold integers or reals written by raw statements).
    inline std::string column_as_text(const column_value_t& v) {
        return std::visit([](auto&& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return std::string();
            } else if constexpr (std::is_same_v<T, blob_t>) {
                return std::string(x.begin(), x.end());
            } else {
                return to_text(x);
            }
        }, v);
    }

} // namespace detail

} // namespace silo

#endif // __cplusplus
