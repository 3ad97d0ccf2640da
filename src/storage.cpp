#include <datastore-cpp/storage.hpp>

#include <datastore-cpp/error.hpp>
#include <datastore-cpp/json.hpp>
#include <datastore-cpp/path.hpp>

#include "tree/navigator.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace datastore_cpp {

namespace fs = std::filesystem;

namespace {

auto resolve(const fs::path& p) -> fs::path {
    auto ec = std::error_code{};
    auto absolute = fs::absolute(p, ec);
    if (ec) return p.lexically_normal();
    auto canonical = fs::weakly_canonical(absolute, ec);
    return ec ? absolute.lexically_normal() : canonical;
}

// True when `target` lies inside `base` once both are fully resolved.
auto is_within(const fs::path& base, const fs::path& target) -> bool {
    auto rel = resolve(target).lexically_relative(resolve(base));
    if (rel.empty()) return false;
    auto first = *rel.begin();
    return first != "..";
}

void check_access(const fs::path& path, const LoadOptions& options) {
    if (options.base_dir && !is_within(*options.base_dir, path)) {
        throw LoadError{ErrorKind::access_denied,
                        "path '" + path.string() + "' is outside of '" +
                            options.base_dir->string() + "'"};
    }
}

// Parse with the nesting depth capped, so that converting and walking the
// result never recurses deeper than `options.max_depth`.
template <typename Input>
auto parse_object(Input&& input, const LoadOptions& options, const std::string& source) -> Map {
    const auto limit = options.max_depth;
    auto guard = [&](int depth, nlohmann::json::parse_event_t event, nlohmann::json&) {
        const auto opens = event == nlohmann::json::parse_event_t::object_start ||
                           event == nlohmann::json::parse_event_t::array_start;
        if (opens && static_cast<std::size_t>(depth) >= limit) {
            throw LoadError{ErrorKind::parse_error,
                            "'" + source + "' nests deeper than " + std::to_string(limit) +
                                " levels"};
        }
        return true;
    };

    auto j = nlohmann::json{};
    try {
        j = nlohmann::json::parse(std::forward<Input>(input), guard);
    } catch (const nlohmann::json::parse_error& e) {
        throw LoadError{ErrorKind::parse_error, "invalid JSON in '" + source + "': " + e.what()};
    }
    if (!j.is_object()) {
        throw LoadError{ErrorKind::parse_error, "top level of '" + source + "' is not an object"};
    }
    return std::move(j.get<Value>().as_map());
}

}  // anonymous namespace

auto parse_json(std::string_view text, const LoadOptions& options) -> Map {
    return parse_object(text, options, "<string>");
}

auto load_file(const fs::path& path, const LoadOptions& options) -> Map {
    check_access(path, options);

    auto ec = std::error_code{};
    if (!fs::is_regular_file(path, ec)) {
        throw LoadError{ErrorKind::not_found, "file not found: " + path.string()};
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw LoadError{ErrorKind::not_found,
                        "cannot stat '" + path.string() + "': " + ec.message()};
    }
    if (options.max_size && size > *options.max_size) {
        throw LoadError{ErrorKind::too_large,
                        "file '" + path.string() + "' is " + std::to_string(size) +
                            " bytes, limit is " + std::to_string(*options.max_size)};
    }

    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw LoadError{ErrorKind::not_found, "cannot open '" + path.string() + "'"};
    }

    auto root = parse_object(in, options, path.string());
    spdlog::debug("datastore: loaded {} ({} bytes)", path.string(), size);
    return root;
}

auto load_directory(const fs::path& dir, std::string_view pattern,
                    const LoadOptions& options) -> Map {
    auto ec = std::error_code{};
    if (!fs::is_directory(dir, ec)) {
        throw LoadError{ErrorKind::not_found, "directory not found: " + dir.string()};
    }

    auto files = std::vector<fs::path>{};
    for (auto it = fs::directory_iterator{dir, ec}; !ec && it != fs::directory_iterator{};
         it.increment(ec)) {
        const auto& entry = *it;
        auto entry_ec = std::error_code{};
        if (!entry.is_regular_file(entry_ec)) continue;
        if (match_wildcard(pattern, entry.path().filename().string())) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw LoadError{ErrorKind::not_found,
                        "cannot read directory '" + dir.string() + "': " + ec.message()};
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    auto merged = Map{};
    auto loaded = std::size_t{0};
    for (const auto& file : files) {
        try {
            detail::deep_merge(merged, load_file(file, options));
            ++loaded;
        } catch (const LoadError& e) {
            if (e.kind() != ErrorKind::parse_error) throw;
            spdlog::warn("datastore: skipping {}: {}", file.string(), e.what());
        }
    }
    spdlog::debug("datastore: merged {} of {} files from {}", loaded, files.size(), dir.string());
    return merged;
}

void save_file(const Map& root, const fs::path& path, const SaveOptions& options) {
    auto ec = std::error_code{};
    if (const auto parent = path.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw SaveError{ErrorKind::write_error,
                            "cannot create '" + parent.string() + "': " + ec.message()};
        }
    }

    auto text = std::string{};
    try {
        auto j = nlohmann::json::object();
        for (const auto& [key, item] : root) {
            j[key] = item;
        }
        text = j.dump(options.indent);
    } catch (const nlohmann::json::type_error& e) {
        throw SaveError{ErrorKind::write_error,
                        "cannot serialize document: " + std::string{e.what()}};
    }

    auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
    if (!out) {
        throw SaveError{ErrorKind::write_error, "cannot open '" + path.string() + "' for writing"};
    }
    out << text << '\n';
    out.flush();
    if (!out) {
        throw SaveError{ErrorKind::write_error, "failed writing '" + path.string() + "'"};
    }
    spdlog::debug("datastore: saved {} ({} bytes)", path.string(), text.size());
}

}  // namespace datastore_cpp
