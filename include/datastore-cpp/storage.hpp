/// @file storage.hpp
/// @brief Loading documents from JSON files and writing them back out.

#pragma once

#include <datastore-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace datastore_cpp {

/// Restrictions applied while loading.
struct LoadOptions {
    /// When set, every file must resolve (symlinks and ".." included) to a
    /// location inside this directory.
    std::optional<std::filesystem::path> base_dir;

    /// When set, files larger than this many bytes are rejected.
    std::optional<std::uintmax_t> max_size;

    /// Deepest allowed nesting of objects and arrays; the top-level object
    /// counts as one.
    std::size_t max_depth = 512;
};

/// Formatting applied while saving.
struct SaveOptions {
    /// Spaces per indentation level; negative gives compact output.
    int indent = 2;
};

/// Parse JSON text whose top level is an object. Only `options.max_depth`
/// applies.
/// @throws LoadError with kind parse_error for invalid JSON, nesting deeper
///   than `options.max_depth` or a non-object top level.
auto parse_json(std::string_view text, const LoadOptions& options = {}) -> Map;

/// Load one JSON file whose top level is an object.
///
/// @throws LoadError with kind not_found, access_denied (outside
///   `options.base_dir`), too_large (over `options.max_size`) or
///   parse_error (invalid JSON, nesting deeper than `options.max_depth` or
///   a non-object top level).
auto load_file(const std::filesystem::path& path, const LoadOptions& options = {}) -> Map;

/// Load every regular file in `dir` whose name matches `pattern` and
/// deep-merge them in ascending file name order, so later files win.
///
/// Files that fail to parse are skipped with a warning; access_denied and
/// too_large failures propagate.
/// @throws LoadError with kind not_found if `dir` is not a directory.
auto load_directory(const std::filesystem::path& dir,
                    std::string_view pattern = "*.json",
                    const LoadOptions& options = {}) -> Map;

/// Write `root` as JSON, creating parent directories as needed.
/// @throws SaveError with kind write_error on any I/O failure.
void save_file(const Map& root, const std::filesystem::path& path,
               const SaveOptions& options = {});

}  // namespace datastore_cpp
