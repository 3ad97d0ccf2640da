#include <datastore-cpp/path.hpp>

#include <datastore-cpp/error.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <vector>

namespace datastore_cpp {

namespace {

/// Try to parse a token as a list index.
auto try_parse_index(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty()) return std::nullopt;
    // "01" and friends are keys, only "0" may start with a zero
    if (token.size() > 1 && token[0] == '0') return std::nullopt;
    if (!std::all_of(token.begin(), token.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc{} && ptr == token.data() + token.size()) return result;
    return std::nullopt;
}

auto is_blank(std::string_view s) -> bool {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // anonymous namespace

auto make_segment(std::string_view token) -> PathSegment {
    return PathSegment{std::string{token}, try_parse_index(token)};
}

auto split_path(std::string_view path, char separator) -> std::vector<std::string_view> {
    auto parts = std::vector<std::string_view>{};
    auto pos = std::size_t{0};
    while (true) {
        auto next = path.find(separator, pos);
        parts.push_back(path.substr(pos, next - pos));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return parts;
}

auto parse_path(std::string_view path) -> Path {
    if (is_blank(path)) {
        throw PathError{ErrorKind::empty_path, "path must not be empty"};
    }
    auto segments = Path{};
    for (auto token : split_path(path)) {
        if (token.empty()) {
            throw PathError{ErrorKind::empty_segment,
                            "path contains an empty segment: '" + std::string{path} + "'"};
        }
        segments.push_back(make_segment(token));
    }
    return segments;
}

auto is_valid_path(std::string_view path) noexcept -> bool {
    if (is_blank(path)) return false;
    auto pos = std::size_t{0};
    while (true) {
        auto next = path.find(path_separator, pos);
        auto len = (next == std::string_view::npos ? path.size() : next) - pos;
        if (len == 0) return false;
        if (next == std::string_view::npos) return true;
        pos = next + 1;
    }
}

auto join_path(std::string_view parent, std::string_view token,
               std::string_view separator) -> std::string {
    auto result = std::string{};
    if (parent.empty()) {
        result.assign(token);
        return result;
    }
    result.reserve(parent.size() + separator.size() + token.size());
    result.append(parent).append(separator).append(token);
    return result;
}

auto match_path_pattern(const std::vector<std::string_view>& pattern,
                        const std::vector<std::string_view>& path) -> bool {
    const auto np = pattern.size();
    const auto ns = path.size();
    // matches[i][j]: pattern[i..] matches path[j..]. Filled back to front so
    // every "**" can try each possible span without exponential retries.
    auto matches = std::vector<std::vector<char>>(np + 1, std::vector<char>(ns + 1, 0));
    matches[np][ns] = 1;

    for (auto i = np; i-- > 0;) {
        const auto seg = pattern[i];
        for (auto j = ns + 1; j-- > 0;) {
            if (seg == "**") {
                // skip the wildcard, or let it swallow path[j]
                matches[i][j] = matches[i + 1][j] || (j < ns && matches[i][j + 1]);
            } else if (j < ns && (seg == "*" || seg == path[j])) {
                matches[i][j] = matches[i + 1][j + 1];
            }
        }
    }
    return matches[0][0] != 0;
}

auto match_wildcard(std::string_view pattern, std::string_view name) -> bool {
    auto p = std::size_t{0};
    auto n = std::size_t{0};
    auto star = std::string_view::npos;
    auto resume = std::size_t{0};

    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

}  // namespace datastore_cpp
