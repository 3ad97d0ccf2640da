#include <datastore-cpp/json.hpp>

#include <datastore-cpp/error.hpp>

#include <cstdint>
#include <string>
#include <variant>

namespace datastore_cpp {

// =============================================================================
// Values
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const List& list) {
            j = nlohmann::json::array();
            for (const auto& item : list) {
                auto element = nlohmann::json{};
                to_json(element, item);
                j.push_back(std::move(element));
            }
        },
        [&](const Map& map) {
            j = nlohmann::json::object();
            for (const auto& [key, item] : map) {
                to_json(j[key], item);
            }
        },
    }, v.storage());
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            v = Null{};
            return;
        case nlohmann::json::value_t::boolean:
            v = j.get<bool>();
            return;
        case nlohmann::json::value_t::number_unsigned:
            // Values past the int64 range become doubles
            v = j.get<std::uint64_t>();
            return;
        case nlohmann::json::value_t::number_integer:
            v = j.get<std::int64_t>();
            return;
        case nlohmann::json::value_t::number_float:
            v = j.get<double>();
            return;
        case nlohmann::json::value_t::string:
            v = j.get<std::string>();
            return;
        case nlohmann::json::value_t::array: {
            auto list = List{};
            list.reserve(j.size());
            for (const auto& item : j) {
                auto element = Value{};
                from_json(item, element);
                list.push_back(std::move(element));
            }
            v = std::move(list);
            return;
        }
        case nlohmann::json::value_t::object: {
            auto map = Map{};
            for (auto it = j.begin(); it != j.end(); ++it) {
                auto element = Value{};
                from_json(it.value(), element);
                map.insert_or_assign(it.key(), std::move(element));
            }
            v = std::move(map);
            return;
        }
        case nlohmann::json::value_t::binary:
            break;
    }
    throw LoadError{ErrorKind::parse_error, "cannot convert JSON binary to Value"};
}

// =============================================================================
// Documents
// =============================================================================

void to_json(nlohmann::json& j, const Document& doc) {
    j = nlohmann::json::object();
    for (const auto& [key, item] : doc.root()) {
        to_json(j[key], item);
    }
}

void from_json(const nlohmann::json& j, Document& doc) {
    if (!j.is_object()) {
        throw PathError{ErrorKind::type_conflict, "document root must be a JSON object"};
    }
    auto root = Value{};
    from_json(j, root);
    doc = Document{std::move(root.as_map())};
}

// =============================================================================
// Result records
// =============================================================================

void to_json(nlohmann::json& j, const FlatEntry& e) {
    j = nlohmann::json{{"path", e.path}, {"value", e.value}};
}

void to_json(nlohmann::json& j, const Change& c) {
    j = nlohmann::json{{"old", c.old_value}, {"new", c.new_value}};
}

void to_json(nlohmann::json& j, const Diff& d) {
    j = nlohmann::json{
        {"added", d.added},
        {"removed", d.removed},
        {"changed", d.changed},
    };
}

void to_json(nlohmann::json& j, const Stats& s) {
    j = nlohmann::json{
        {"total_keys", s.total_keys},
        {"max_depth", s.max_depth},
        {"total_maps", s.total_maps},
        {"total_lists", s.total_lists},
        {"total_values", s.total_values},
    };
}

void to_json(nlohmann::json& j, const Group& g) {
    j = nlohmann::json{{"key", g.key}, {"items", g.items}};
}

}  // namespace datastore_cpp
