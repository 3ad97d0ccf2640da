/// @file types.hpp
/// @brief Result records: FlatEntry, Change, Diff, Stats and Group.

#pragma once

#include <datastore-cpp/value.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace datastore_cpp {

/// A leaf of the document: its dot-joined path and scalar value.
struct FlatEntry {
    std::string path;
    Value value;

    auto operator==(const FlatEntry&) const -> bool = default;
};

/// A leaf present in both documents of a diff with different values.
struct Change {
    Value old_value;
    Value new_value;

    auto operator==(const Change&) const -> bool = default;
};

/// Leaf-level difference between two documents, keyed by leaf path.
struct Diff {
    std::map<std::string, Value> added;    ///< Only in the second document.
    std::map<std::string, Value> removed;  ///< Only in the first document.
    std::map<std::string, Change> changed; ///< In both, with unequal values.

    /// True when the two documents have identical leaves.
    auto empty() const noexcept -> bool {
        return added.empty() && removed.empty() && changed.empty();
    }

    auto operator==(const Diff&) const -> bool = default;
};

/// Shape statistics of a document, gathered in one depth-first walk.
struct Stats {
    std::size_t total_keys = 0;    ///< Map entries across all maps.
    std::size_t max_depth = 0;     ///< Scalars are depth 0, containers 1 + deepest child.
    std::size_t total_maps = 0;    ///< Maps, the root included.
    std::size_t total_lists = 0;
    std::size_t total_values = 0;  ///< Scalar leaves.

    auto operator==(const Stats&) const -> bool = default;
};

/// One bucket produced by Query::group_by().
struct Group {
    Value key;
    std::vector<Value> items;

    auto operator==(const Group&) const -> bool = default;
};

}  // namespace datastore_cpp
