/// @file query.hpp
/// @brief Chainable filter/sort/offset/limit queries over a list snapshot.

#pragma once

#include <datastore-cpp/types.hpp>
#include <datastore-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace datastore_cpp {

/// The value of `key` in a list element, or Null when the element is not a
/// container or has no such child.
auto field(const Value& item, std::string_view key) -> Value;

/// A query over a snapshot of a list.
///
/// Stages always run in the same order no matter how the calls were
/// chained: every where() predicate (AND-combined), then sort, then
/// offset, then limit. Executing never touches the document the list
/// was taken from.
///
/// @code
/// auto top = doc.query("posts")
///     .where([](const Value& p) { return field(p, "published") == true; })
///     .sort_by("views", true)
///     .limit(3)
///     .execute();
/// @endcode
class Query {
public:
    using Predicate = std::function<bool(const Value&)>;
    using KeyFn = std::function<Value(const Value&)>;

    /// An empty query.
    Query() = default;

    /// A query over a copy of `source`.
    explicit Query(List source);

    // -- Chaining -------------------------------------------------------------

    /// Keep only elements satisfying `pred` (combined with earlier calls).
    auto where(Predicate pred) -> Query&;

    /// Stable sort by `key(element)`, or by the element itself when `key`
    /// is empty. Ascending unless `reverse`.
    auto sort(KeyFn key = {}, bool reverse = false) -> Query&;

    /// Stable sort by field(element, key).
    auto sort_by(std::string key, bool reverse = false) -> Query&;

    /// Skip the first `n` results.
    auto offset(std::size_t n) -> Query&;

    /// Return at most `n` results.
    auto limit(std::size_t n) -> Query&;

    // -- Execution ------------------------------------------------------------

    /// Run the full pipeline.
    auto execute() const -> List;

    /// Number of elements passing the filters. Sort, offset and limit are
    /// not applied.
    auto count() const -> std::size_t;

    /// First element after filtering and sorting, or nullopt.
    auto first() const -> std::optional<Value>;

    /// Run the pipeline and project field(element, key) from each result.
    auto pluck(std::string_view key) const -> List;

    /// Run the pipeline and bucket results by field(element, key), in order
    /// of first appearance. Elements without the key land in the Null bucket.
    auto group_by(std::string_view key) const -> std::vector<Group>;

    /// The snapshot the query runs over.
    auto source() const noexcept -> const List& { return source_; }

private:
    auto filtered() const -> List;
    void sort_items(List& items) const;

    List source_;
    std::vector<Predicate> predicates_;
    bool sorted_ = false;
    KeyFn sort_key_;
    bool reverse_ = false;
    std::optional<std::size_t> offset_;
    std::optional<std::size_t> limit_;
};

}  // namespace datastore_cpp
