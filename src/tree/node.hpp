#pragma once

// Internal header — not installed. Single-segment primitives on a Value.

#include <datastore-cpp/error.hpp>
#include <datastore-cpp/path.hpp>
#include <datastore-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace datastore_cpp::detail {

// Child of `node` at `seg`, or nullptr. Never throws: a key against a list
// or any segment against a scalar is simply absent.
inline auto get1(const Value& node, const PathSegment& seg) -> const Value* {
    if (const auto* map = node.get_if<Map>()) {
        auto it = map->find(seg.key);
        return it != map->end() ? &it->second : nullptr;
    }
    if (const auto* list = node.get_if<List>()) {
        if (!seg.index || *seg.index >= list->size()) return nullptr;
        return &(*list)[*seg.index];
    }
    return nullptr;
}

inline auto get1(Value& node, const PathSegment& seg) -> Value* {
    return const_cast<Value*>(get1(std::as_const(node), seg));
}

inline auto has1(const Value& node, const PathSegment& seg) -> bool {
    return get1(node, seg) != nullptr;
}

[[noreturn]] inline void throw_type_conflict(const Value& node, const PathSegment& seg,
                                             std::string_view what) {
    throw PathError{ErrorKind::type_conflict,
                    std::string{what} + " '" + seg.key + "' on a " +
                        std::string{type_name(node)} + " value"};
}

// Insert or overwrite the child at `seg`. Lists are never extended.
inline void set1(Value& node, const PathSegment& seg, Value value) {
    if (auto* map = node.get_if<Map>()) {
        map->insert_or_assign(seg.key, std::move(value));
        return;
    }
    if (auto* list = node.get_if<List>()) {
        if (!seg.index) throw_type_conflict(node, seg, "cannot set key");
        if (*seg.index >= list->size()) throw_type_conflict(node, seg, "list index out of range");
        (*list)[*seg.index] = std::move(value);
        return;
    }
    throw_type_conflict(node, seg, "cannot set");
}

// Remove the child at `seg`; list elements after it shift down.
inline auto erase1(Value& node, const PathSegment& seg) -> bool {
    if (auto* map = node.get_if<Map>()) {
        return map->erase(seg.key) > 0;
    }
    if (auto* list = node.get_if<List>()) {
        if (!seg.index || *seg.index >= list->size()) return false;
        list->erase(list->begin() + static_cast<std::ptrdiff_t>(*seg.index));
        return true;
    }
    return false;
}

// Child at `seg` for a write that continues below it. Creates an empty map
// when a map has no such key; everything else that cannot hold the next
// segment is a type conflict.
inline auto vivify1(Value& node, const PathSegment& seg) -> Value& {
    if (auto* map = node.get_if<Map>()) {
        auto [it, inserted] = map->try_emplace(seg.key, Map{});
        return it->second;
    }
    if (auto* list = node.get_if<List>()) {
        if (!seg.index) throw_type_conflict(node, seg, "cannot descend into key");
        if (*seg.index >= list->size()) throw_type_conflict(node, seg, "list index out of range");
        return (*list)[*seg.index];
    }
    throw_type_conflict(node, seg, "cannot descend into");
}

}  // namespace datastore_cpp::detail
