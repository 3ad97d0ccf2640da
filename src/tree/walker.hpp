#pragma once

// Internal header — not installed. Depth-first enumeration of a Value tree.

#include <datastore-cpp/types.hpp>
#include <datastore-cpp/value.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace datastore_cpp::detail {

inline void push_segment(std::string& prefix, std::string_view token, std::string_view separator) {
    if (!prefix.empty()) prefix.append(separator);
    prefix.append(token);
}

// Call fn(path, leaf) for every scalar under `node`, maps in key order and
// lists in index order. Empty containers produce nothing.
template <typename Fn>
void for_each_leaf(const Value& node, std::string& prefix,
                   std::string_view separator, Fn& fn) {
    if (const auto* map = node.get_if<Map>()) {
        for (const auto& [key, child] : *map) {
            const auto mark = prefix.size();
            push_segment(prefix, key, separator);
            for_each_leaf(child, prefix, separator, fn);
            prefix.resize(mark);
        }
    } else if (const auto* list = node.get_if<List>()) {
        for (std::size_t i = 0; i < list->size(); ++i) {
            const auto mark = prefix.size();
            push_segment(prefix, std::to_string(i), separator);
            for_each_leaf((*list)[i], prefix, separator, fn);
            prefix.resize(mark);
        }
    } else {
        fn(std::as_const(prefix), node);
    }
}

inline auto flatten(const Value& root, std::string_view separator) -> std::vector<FlatEntry> {
    auto entries = std::vector<FlatEntry>{};
    auto prefix = std::string{};
    auto collect = [&](const std::string& path, const Value& leaf) {
        entries.push_back(FlatEntry{path, leaf});
    };
    for_each_leaf(root, prefix, separator, collect);
    return entries;
}

// Accumulate shape counts; returns the depth of `node`.
inline auto collect_stats(const Value& node, Stats& stats) -> std::size_t {
    auto deepest = std::size_t{0};
    if (const auto* map = node.get_if<Map>()) {
        ++stats.total_maps;
        stats.total_keys += map->size();
        for (const auto& [key, child] : *map) {
            deepest = std::max(deepest, collect_stats(child, stats));
        }
        return deepest + 1;
    }
    if (const auto* list = node.get_if<List>()) {
        ++stats.total_lists;
        for (const auto& child : *list) {
            deepest = std::max(deepest, collect_stats(child, stats));
        }
        return deepest + 1;
    }
    ++stats.total_values;
    return 0;
}

inline auto describe_map(const Map& map) -> Value;

inline auto describe_value(const Value& node) -> Value {
    auto report = Map{{"type", type_name(node)}};
    if (const auto* map = node.get_if<Map>()) {
        auto keys = List{};
        keys.reserve(map->size());
        for (const auto& [key, child] : *map) keys.emplace_back(key);
        report.emplace("length", map->size());
        report.emplace("keys", std::move(keys));
        report.emplace("structure", describe_map(*map));
    } else if (node.is_list()) {
        report.emplace("length", node.size());
    } else {
        report.emplace("value", node);
    }
    return report;
}

inline auto describe_map(const Map& map) -> Value {
    auto result = Map{};
    for (const auto& [key, child] : map) {
        result.emplace(key, describe_value(child));
    }
    return result;
}

}  // namespace datastore_cpp::detail
