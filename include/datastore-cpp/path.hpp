/// @file path.hpp
/// @brief Dot-separated path parsing, joining and glob pattern matching.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace datastore_cpp {

/// The separator between segments in a path string.
inline constexpr char path_separator = '.';

/// One step of a path.
///
/// Every segment keeps its source token in `key`. `index` is engaged only
/// when the token is "0" or a run of decimal digits without a leading zero,
/// so "01" stays a map key. Against a map an index segment is looked up by
/// its token; against a list only index segments resolve.
struct PathSegment {
    std::string key;
    std::optional<std::size_t> index;

    auto is_index() const noexcept -> bool { return index.has_value(); }

    auto operator==(const PathSegment&) const -> bool = default;
};

/// A parsed path: an ordered, non-empty sequence of segments.
using Path = std::vector<PathSegment>;

/// Create a segment from a single token (no validation, no splitting).
auto make_segment(std::string_view token) -> PathSegment;

/// Parse a dot-separated path string into segments.
///
/// @code
/// auto p = parse_path("posts.0.title");  // key, index 0, key
/// @endcode
/// @throws PathError with kind empty_path when the string is empty or
///   whitespace-only, or empty_segment when any segment is empty
///   (".a", "a.", "a..b", ".").
auto parse_path(std::string_view path) -> Path;

/// Check whether parse_path() would accept the string.
auto is_valid_path(std::string_view path) noexcept -> bool;

/// Join a parent path and a child token. An empty parent yields the token.
auto join_path(std::string_view parent, std::string_view token,
               std::string_view separator = ".") -> std::string;

/// Split a path string on the separator without validating it.
auto split_path(std::string_view path, char separator = path_separator)
    -> std::vector<std::string_view>;

/// Match a leaf path against a glob path pattern, segment by segment.
///
/// `*` matches exactly one segment, `**` matches zero or more segments and
/// any other segment must match literally. Resolution backtracks, so
/// patterns such as "a.**.z" or "**.x.**.y" work anywhere in the pattern.
auto match_path_pattern(const std::vector<std::string_view>& pattern,
                        const std::vector<std::string_view>& path) -> bool;

/// Match a file name against a shell-style wildcard (`*` and `?`).
auto match_wildcard(std::string_view pattern, std::string_view name) -> bool;

}  // namespace datastore_cpp
