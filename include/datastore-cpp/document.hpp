/// @file document.hpp
/// @brief The Document class -- the primary API for datastore-cpp.

#pragma once

#include <datastore-cpp/query.hpp>
#include <datastore-cpp/storage.hpp>
#include <datastore-cpp/types.hpp>
#include <datastore-cpp/value.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace datastore_cpp {

/// A mutable nested document addressed by dot-separated paths.
///
/// Document owns a root map and a cache of its leaf paths. Path strings
/// such as "posts.0.title" name map keys and list indices; see
/// parse_path() for the exact rules. Reads return std::nullopt (or false)
/// when data is missing and throw PathError only for malformed paths.
/// Writes create intermediate maps on demand and throw PathError with
/// kind type_conflict when they would pass through an incompatible node.
///
/// Document is not synchronized. A host sharing one across threads must
/// serialize every call, reads included, because reads fill the cache.
///
/// @code
/// auto doc = Document{};
/// doc.set("site.name", "My Site");
/// doc.set("config.cache.ttl", 3600);
/// auto name = doc.get<std::string>("site.name");
/// @endcode
class Document {
public:
    using LeafPredicate = std::function<bool(const Value&)>;
    using PathPredicate = std::function<bool(const std::string&, const Value&)>;
    using ValueTransform = std::function<Value(const Value&)>;
    using PathTransform = std::function<Value(const std::string&, const Value&)>;
    using KeyTransform = std::function<std::string(const std::string&)>;

    /// Construct an empty document.
    Document() = default;

    /// Construct from a map of top-level entries.
    explicit Document(Map root);

    /// Construct from a value, which must be a map.
    /// @throws PathError with kind type_conflict if `root` is not a map.
    explicit Document(Value root);

    Document(const Document&) = default;
    auto operator=(const Document&) -> Document& = default;
    Document(Document&&) noexcept = default;
    auto operator=(Document&&) noexcept -> Document& = default;

    // -- Loading and saving ---------------------------------------------------

    /// Load a document from a JSON file. See load_file().
    static auto from_file(const std::filesystem::path& path,
                          const LoadOptions& options = {}) -> Document;

    /// Load and deep-merge every matching file in a directory.
    /// See load_directory().
    static auto from_directory(const std::filesystem::path& dir,
                               std::string_view pattern = "*.json",
                               const LoadOptions& options = {}) -> Document;

    /// Write the document as JSON. See save_file().
    void save(const std::filesystem::path& path, const SaveOptions& options = {}) const;

    /// Serialize to a JSON string. A negative indent gives compact output.
    auto dump(int indent = 2) const -> std::string;

    // -- Path access ----------------------------------------------------------

    /// Get the value at a path.
    /// @return The value, or nullopt if any step is missing or mismatched.
    /// @throws PathError if the path is malformed.
    auto get(std::string_view path) const -> std::optional<Value>;

    /// Get the value at a path, or `fallback` when it is missing.
    auto get_or(std::string_view path, Value fallback) const -> Value;

    /// Get a typed scalar at a path.
    /// @code
    /// auto ttl = doc.get<std::int64_t>("config.cache.ttl");
    /// @endcode
    template <typename T>
    auto get(std::string_view path) const -> std::optional<T> {
        return get_scalar<T>(get(path));
    }

    /// Set the value at a path, creating intermediate maps as needed.
    /// @throws PathError if the path is malformed, or with kind
    ///   type_conflict if a step runs through a scalar, a list is addressed
    ///   by key, or a list index is out of range.
    void set(std::string_view path, Value value);

    /// Remove the value at a path.
    /// @return true if something was removed, false if it was not there.
    /// @throws PathError if the path is malformed.
    auto erase(std::string_view path) -> bool;

    /// Check whether a path resolves to a value.
    /// @throws PathError if the path is malformed.
    auto has(std::string_view path) const -> bool;

    /// A copy of the map at `path` wrapped in a new Document.
    ///
    /// The view is a snapshot: writes to it never reach this document.
    /// @return nullopt if the path is missing or does not hold a map.
    auto view(std::string_view path) const -> std::optional<Document>;

    /// Get several paths at once.
    ///
    /// Unlike get(), this never throws: missing and malformed paths alike
    /// map to Null.
    auto get_many(const std::vector<std::string>& paths) const
        -> std::map<std::string, Value>;

    // -- Top-level access (no path parsing) -----------------------------------

    /// Get a top-level entry by its exact key, dots included.
    auto get_key(std::string_view key) const -> std::optional<Value>;

    /// Set a top-level entry by its exact key, dots included.
    void set_key(std::string_view key, Value value);

    /// Remove a top-level entry by its exact key.
    auto erase_key(std::string_view key) -> bool;

    /// Check for a top-level key.
    auto contains(std::string_view key) const -> bool;

    /// Top-level keys in ascending order.
    auto keys() const -> std::vector<std::string>;

    /// Number of top-level entries.
    auto size() const noexcept -> std::size_t { return root_.size(); }

    auto empty() const noexcept -> bool { return root_.size() == 0; }

    /// Remove every entry.
    void clear();

    /// Read-only access to the root map.
    auto root() const -> const Map& { return root_.as_map(); }

    /// Deep copy of the root map, independent of the cache.
    auto to_copy() const -> Map { return root_.as_map(); }

    // -- Enumeration ----------------------------------------------------------

    /// Every leaf as a (path, value) pair in depth-first order.
    auto flatten(std::string_view separator = ".") const -> std::vector<FlatEntry>;

    /// Leaf paths under `prefix` (all of them when the prefix is empty).
    /// Served from the cache.
    auto list_paths(std::string_view prefix = "") const -> std::vector<std::string>;

    /// Leaf paths matching a glob pattern (`*` one segment, `**` any number).
    /// @throws PathError if the pattern is malformed.
    auto find_paths(std::string_view pattern) const -> std::vector<std::string>;

    /// Leaves whose final path segment equals `key`.
    ///
    /// Paths are split on the separator, so a key containing a dot (see
    /// set_key()) never matches.
    auto find_all_keys(std::string_view key) const -> std::vector<FlatEntry>;

    /// Leaves whose value satisfies `pred`.
    auto find_values(const LeafPredicate& pred) const -> std::vector<FlatEntry>;

    // -- Queries --------------------------------------------------------------

    /// Start a query over a snapshot of the list at `path`.
    /// A missing or non-list node gives an empty query.
    /// @throws PathError if the path is malformed.
    auto query(std::string_view path) const -> Query;

    /// Elements of the list at `path` that satisfy `pred`, in list order.
    /// Shorthand for `query(path).where(pred).execute()`.
    /// @throws PathError if the path is malformed.
    auto filter_list(std::string_view path, const Query::Predicate& pred) const -> List;

    // -- Merge and comparison -------------------------------------------------

    /// Deep merge `other` into this document; see deep-merge rules on
    /// merge(const Map&).
    void merge(const Document& other);

    /// Deep merge: where both sides hold a map the merge recurses, anywhere
    /// else (lists included) the incoming value wins.
    void merge(const Map& other);

    /// Leaf-level changes that turn this document into `other`.
    auto diff(const Document& other) const -> Diff;

    /// True when both documents have the same leaves with equal values.
    auto equals(const Document& other) const -> bool;

    // -- Bulk updates ---------------------------------------------------------

    /// Replace every leaf for which `condition(path, value)` holds with
    /// `transform(value)`.
    /// @return The number of leaves rewritten.
    auto update_where(const PathPredicate& condition, const ValueTransform& transform)
        -> std::size_t;

    /// Remove null values from maps and lists at every depth.
    /// @return The number of nulls removed.
    auto remove_nulls() -> std::size_t;

    /// Remove empty maps and lists, bottom-up, so containers left empty by
    /// the removal go too. The root itself is never removed.
    /// @return The number of containers removed.
    auto remove_empty() -> std::size_t;

    /// A new document with every leaf replaced by `fn(path, value)`.
    auto transform_all(const PathTransform& fn) const -> Document;

    /// A new document with every map key at every depth replaced by
    /// `fn(key)`. When renamed keys collide, the one later in the original
    /// key order wins.
    auto transform_keys(const KeyTransform& fn) const -> Document;

    // -- Introspection --------------------------------------------------------

    /// Per top-level key: type and length (plus keys and nested structure
    /// for maps) for containers, type and value for scalars.
    auto describe() const -> Map;

    /// Counts of keys, maps, lists and leaves, and the maximum depth.
    auto stats() const -> Stats;

    friend auto operator==(const Document& a, const Document& b) -> bool {
        return a.root_ == b.root_;
    }

private:
    auto cached_leaves() const -> const std::vector<FlatEntry>&;
    void invalidate() noexcept { leaf_cache_.reset(); }

    Value root_{Map{}};  // always holds a Map
    mutable std::optional<std::vector<FlatEntry>> leaf_cache_;
};

}  // namespace datastore_cpp
