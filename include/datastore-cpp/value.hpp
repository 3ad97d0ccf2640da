/// @file value.hpp
/// @brief The document tree node: Value, List, Map, Null and ValueKind.

#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace datastore_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

class Value;

/// An ordered sequence of values.
using List = std::vector<Value>;

/// A mapping from key to value. Keys iterate in ascending byte order, which
/// fixes the order of every depth-first walk of the document.
using Map = std::map<std::string, Value, std::less<>>;

/// The alternatives a Value can hold.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    integer,
    floating,
    string,
    list,
    map,
};

/// Convert a ValueKind to the type name used in reports.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:     return "null";
        case ValueKind::boolean:  return "bool";
        case ValueKind::integer:  return "int";
        case ValueKind::floating: return "float";
        case ValueKind::string:   return "string";
        case ValueKind::list:     return "list";
        case ValueKind::map:      return "map";
    }
    return "unknown";
}

/// A node of the document tree: a scalar, a list or a map.
///
/// Values have plain value semantics: copying a Value deep-copies the
/// subtree beneath it.
///
/// @code
/// auto post = Value{Map{
///     {"title", "Hello"},
///     {"tags", List{"cpp", "json"}},
///     {"views", 42},
/// }};
/// @endcode
class Value {
public:
    using Storage = std::variant<Null, bool, std::int64_t, double, std::string, List, Map>;

    /// Construct a null value.
    Value() = default;
    Value(Null) {}
    Value(std::nullptr_t) {}

    Value(bool b) : data_{b} {}

    /// Integers are stored as int64. Unsigned values above the int64 range
    /// become doubles rather than wrapping.
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T i) : data_{from_integer(i)} {}

    template <std::floating_point T>
    Value(T d) : data_{static_cast<double>(d)} {}

    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(std::string_view s) : data_{std::string{s}} {}

    Value(List list) : data_{std::move(list)} {}
    Value(Map map) : data_{std::move(map)} {}

    auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(data_.index());
    }

    auto is_null() const noexcept -> bool { return kind() == ValueKind::null; }
    auto is_bool() const noexcept -> bool { return kind() == ValueKind::boolean; }
    auto is_int() const noexcept -> bool { return kind() == ValueKind::integer; }
    auto is_float() const noexcept -> bool { return kind() == ValueKind::floating; }
    auto is_number() const noexcept -> bool { return is_int() || is_float(); }
    auto is_string() const noexcept -> bool { return kind() == ValueKind::string; }
    auto is_list() const noexcept -> bool { return kind() == ValueKind::list; }
    auto is_map() const noexcept -> bool { return kind() == ValueKind::map; }
    auto is_container() const noexcept -> bool { return is_list() || is_map(); }
    auto is_scalar() const noexcept -> bool { return !is_container(); }

    /// Pointer to the held alternative, or nullptr on type mismatch.
    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data_); }

    /// Reference to the held alternative.
    /// @throws std::bad_variant_access on type mismatch.
    template <typename T>
    auto get() -> T& { return std::get<T>(data_); }

    template <typename T>
    auto get() const -> const T& { return std::get<T>(data_); }

    auto as_list() -> List& { return get<List>(); }
    auto as_list() const -> const List& { return get<List>(); }
    auto as_map() -> Map& { return get<Map>(); }
    auto as_map() const -> const Map& { return get<Map>(); }

    /// The numeric value as a double, or nullopt if not a number.
    auto as_number() const noexcept -> std::optional<double>;

    /// Number of children for lists and maps, 0 for scalars.
    auto size() const noexcept -> std::size_t;

    auto storage() const noexcept -> const Storage& { return data_; }
    auto storage() noexcept -> Storage& { return data_; }

    /// Structural equality. Maps compare order-insensitively, lists
    /// element-wise, and integers equal doubles of the same magnitude.
    friend auto operator==(const Value& a, const Value& b) -> bool;

    /// Total order: null < bool < number < string < list < map, then by
    /// content within a category.
    friend auto operator<=>(const Value& a, const Value& b) -> std::weak_ordering;

private:
    template <std::integral T>
    static auto from_integer(T i) -> Storage {
        if constexpr (std::is_unsigned_v<T>) {
            constexpr auto int64_max =
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            if (static_cast<std::uint64_t>(i) > int64_max) return static_cast<double>(i);
        }
        return static_cast<std::int64_t>(i);
    }

    Storage data_{};
};

/// The type name of a value, as used by describe().
inline auto type_name(const Value& v) noexcept -> std::string_view {
    return to_string_view(v.kind());
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](std::int64_t i) { std::printf("%lld\n", static_cast<long long>(i)); },
///     [](const auto&) { std::printf("other\n"); },
/// }, value.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed alternative from a Value, or nullopt on type mismatch.
/// @code
/// auto name = get_scalar<std::string>(value);
/// @endcode
template <typename T>
auto get_scalar(const Value& v) -> std::optional<T> {
    if (const auto* t = v.get_if<T>()) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed alternative from an optional<Value>.
template <typename T>
auto get_scalar(const std::optional<Value>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

}  // namespace datastore_cpp
