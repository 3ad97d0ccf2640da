#include <datastore-cpp/value.hpp>

#include <algorithm>
#include <compare>

namespace datastore_cpp {

namespace {

// Category rank used to order values of different kinds. Integers and
// doubles share a rank so they compare numerically.
auto rank(ValueKind kind) -> int {
    switch (kind) {
        case ValueKind::null:     return 0;
        case ValueKind::boolean:  return 1;
        case ValueKind::integer:
        case ValueKind::floating: return 2;
        case ValueKind::string:   return 3;
        case ValueKind::list:     return 4;
        case ValueKind::map:      return 5;
    }
    return 6;
}

auto compare_numbers(const Value& a, const Value& b) -> std::weak_ordering {
    if (a.is_int() && b.is_int()) {
        return a.get<std::int64_t>() <=> b.get<std::int64_t>();
    }
    // std::weak_order gives NaN a place in the order instead of leaving
    // it unordered.
    return std::weak_order(*a.as_number(), *b.as_number());
}

}  // anonymous namespace

auto Value::as_number() const noexcept -> std::optional<double> {
    if (const auto* i = get_if<std::int64_t>()) return static_cast<double>(*i);
    if (const auto* d = get_if<double>()) return *d;
    return std::nullopt;
}

auto Value::size() const noexcept -> std::size_t {
    if (const auto* l = get_if<List>()) return l->size();
    if (const auto* m = get_if<Map>()) return m->size();
    return 0;
}

auto operator<=>(const Value& a, const Value& b) -> std::weak_ordering {
    const auto ra = rank(a.kind());
    const auto rb = rank(b.kind());
    if (ra != rb) return ra <=> rb;

    switch (a.kind()) {
        case ValueKind::null:
            return std::weak_ordering::equivalent;
        case ValueKind::boolean:
            return a.get<bool>() <=> b.get<bool>();
        case ValueKind::integer:
        case ValueKind::floating:
            return compare_numbers(a, b);
        case ValueKind::string:
            return a.get<std::string>() <=> b.get<std::string>();
        case ValueKind::list: {
            const auto& la = a.as_list();
            const auto& lb = b.as_list();
            return std::lexicographical_compare_three_way(
                la.begin(), la.end(), lb.begin(), lb.end(),
                [](const Value& x, const Value& y) { return x <=> y; });
        }
        case ValueKind::map: {
            const auto& ma = a.as_map();
            const auto& mb = b.as_map();
            return std::lexicographical_compare_three_way(
                ma.begin(), ma.end(), mb.begin(), mb.end(),
                [](const auto& x, const auto& y) -> std::weak_ordering {
                    if (auto c = x.first <=> y.first; c != 0) return c;
                    return x.second <=> y.second;
                });
        }
    }
    return std::weak_ordering::equivalent;
}

auto operator==(const Value& a, const Value& b) -> bool {
    if (a.is_number() && b.is_number()) {
        return compare_numbers(a, b) == 0;
    }
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
        case ValueKind::null:
            return true;
        case ValueKind::boolean:
            return a.get<bool>() == b.get<bool>();
        case ValueKind::string:
            return a.get<std::string>() == b.get<std::string>();
        case ValueKind::list:
            return a.as_list() == b.as_list();
        case ValueKind::map:
            return a.as_map() == b.as_map();
        default:
            break;
    }
    return false;
}

}  // namespace datastore_cpp
