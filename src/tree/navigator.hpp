#pragma once

// Internal header — not installed. Multi-segment walks over a Value tree.

#include "node.hpp"

#include <datastore-cpp/path.hpp>
#include <datastore-cpp/value.hpp>

#include <utility>

namespace datastore_cpp::detail {

// Node at `path`, or nullptr as soon as a step is missing or mismatched.
inline auto find(const Value& root, const Path& path) -> const Value* {
    const auto* current = &root;
    for (const auto& seg : path) {
        current = get1(*current, seg);
        if (!current) return nullptr;
    }
    return current;
}

inline auto find(Value& root, const Path& path) -> Value* {
    return const_cast<Value*>(find(std::as_const(root), path));
}

// Write `value` at `path`, creating intermediate maps as needed.
inline void assign(Value& root, const Path& path, Value value) {
    auto* current = &root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        current = &vivify1(*current, path[i]);
    }
    set1(*current, path.back(), std::move(value));
}

// Remove the binding at `path`. False when any step is absent.
inline auto erase(Value& root, const Path& path) -> bool {
    auto* current = &root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        current = get1(*current, path[i]);
        if (!current) return false;
    }
    return erase1(*current, path.back());
}

// Deep merge `src` into `dst`: map-vs-map recurses, anything else
// (lists included) is replaced by the incoming value.
inline void deep_merge(Map& dst, const Map& src) {
    for (const auto& [key, incoming] : src) {
        auto it = dst.find(key);
        if (it != dst.end() && it->second.is_map() && incoming.is_map()) {
            deep_merge(it->second.as_map(), incoming.as_map());
        } else {
            dst.insert_or_assign(key, incoming);
        }
    }
}

inline void deep_merge(Map& dst, Map&& src) {
    for (auto& [key, incoming] : src) {
        auto it = dst.find(key);
        if (it != dst.end() && it->second.is_map() && incoming.is_map()) {
            deep_merge(it->second.as_map(), std::move(incoming.as_map()));
        } else {
            dst.insert_or_assign(key, std::move(incoming));
        }
    }
}

}  // namespace datastore_cpp::detail
