#include <datastore-cpp/document.hpp>

#include <datastore-cpp/error.hpp>
#include <datastore-cpp/json.hpp>
#include <datastore-cpp/path.hpp>

#include "tree/navigator.hpp"
#include "tree/node.hpp"
#include "tree/walker.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace datastore_cpp {

namespace {

auto take_map(Value root) -> Map {
    if (auto* map = root.get_if<Map>()) {
        return std::move(*map);
    }
    throw PathError{ErrorKind::type_conflict,
                    "document root must be a map, got " + std::string{type_name(root)}};
}

// -- Bulk mutation helpers ----------------------------------------------------

auto update_leaves(Value& node, std::string& prefix,
                   const Document::PathPredicate& condition,
                   const Document::ValueTransform& transform) -> std::size_t {
    auto count = std::size_t{0};
    auto visit_child = [&](Value& child, std::string_view token) {
        const auto mark = prefix.size();
        detail::push_segment(prefix, token, ".");
        count += update_leaves(child, prefix, condition, transform);
        prefix.resize(mark);
    };
    if (auto* map = node.get_if<Map>()) {
        for (auto& [key, child] : *map) visit_child(child, key);
    } else if (auto* list = node.get_if<List>()) {
        for (std::size_t i = 0; i < list->size(); ++i) visit_child((*list)[i], std::to_string(i));
    } else if (condition(std::as_const(prefix), std::as_const(node))) {
        node = transform(std::as_const(node));
        ++count;
    }
    return count;
}

auto strip_nulls(Value& node) -> std::size_t {
    auto count = std::size_t{0};
    if (auto* map = node.get_if<Map>()) {
        count += std::erase_if(*map, [](const auto& entry) { return entry.second.is_null(); });
        for (auto& [key, child] : *map) count += strip_nulls(child);
    } else if (auto* list = node.get_if<List>()) {
        count += std::erase_if(*list, [](const Value& item) { return item.is_null(); });
        for (auto& child : *list) count += strip_nulls(child);
    }
    return count;
}

// Children are pruned before their parent is inspected, so a container
// emptied by the pruning is removed as well.
auto strip_empty(Value& node) -> std::size_t {
    auto count = std::size_t{0};
    auto is_empty_container = [](const Value& v) { return v.is_container() && v.size() == 0; };
    if (auto* map = node.get_if<Map>()) {
        for (auto& [key, child] : *map) count += strip_empty(child);
        count += std::erase_if(*map, [&](const auto& entry) { return is_empty_container(entry.second); });
    } else if (auto* list = node.get_if<List>()) {
        for (auto& child : *list) count += strip_empty(child);
        count += std::erase_if(*list, is_empty_container);
    }
    return count;
}

auto rebuild_leaves(const Value& node, std::string& prefix,
                    const Document::PathTransform& fn) -> Value {
    if (const auto* map = node.get_if<Map>()) {
        auto out = Map{};
        for (const auto& [key, child] : *map) {
            const auto mark = prefix.size();
            detail::push_segment(prefix, key, ".");
            out.emplace(key, rebuild_leaves(child, prefix, fn));
            prefix.resize(mark);
        }
        return out;
    }
    if (const auto* list = node.get_if<List>()) {
        auto out = List{};
        out.reserve(list->size());
        for (std::size_t i = 0; i < list->size(); ++i) {
            const auto mark = prefix.size();
            detail::push_segment(prefix, std::to_string(i), ".");
            out.push_back(rebuild_leaves((*list)[i], prefix, fn));
            prefix.resize(mark);
        }
        return out;
    }
    return fn(std::as_const(prefix), node);
}

auto rename_keys(const Value& node, const Document::KeyTransform& fn) -> Value {
    if (const auto* map = node.get_if<Map>()) {
        auto out = Map{};
        for (const auto& [key, child] : *map) {
            out.insert_or_assign(fn(key), rename_keys(child, fn));
        }
        return out;
    }
    if (const auto* list = node.get_if<List>()) {
        auto out = List{};
        out.reserve(list->size());
        for (const auto& child : *list) out.push_back(rename_keys(child, fn));
        return out;
    }
    return node;
}

// Final segment of a leaf path. Keys are joined without escaping, so this
// is the text after the last separator.
auto last_segment(std::string_view path) -> std::string_view {
    auto pos = path.rfind(path_separator);
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

}  // anonymous namespace

Document::Document(Map root) : root_{std::move(root)} {}

Document::Document(Value root) : root_{take_map(std::move(root))} {}

// -- Loading and saving -------------------------------------------------------

auto Document::from_file(const std::filesystem::path& path,
                         const LoadOptions& options) -> Document {
    return Document{load_file(path, options)};
}

auto Document::from_directory(const std::filesystem::path& dir, std::string_view pattern,
                              const LoadOptions& options) -> Document {
    return Document{load_directory(dir, pattern, options)};
}

void Document::save(const std::filesystem::path& path, const SaveOptions& options) const {
    save_file(root_.as_map(), path, options);
}

auto Document::dump(int indent) const -> std::string {
    auto j = nlohmann::json{};
    to_json(j, *this);
    return j.dump(indent);
}

// -- Path access --------------------------------------------------------------

auto Document::get(std::string_view path) const -> std::optional<Value> {
    if (const auto* node = detail::find(root_, parse_path(path))) {
        return *node;
    }
    return std::nullopt;
}

auto Document::get_or(std::string_view path, Value fallback) const -> Value {
    if (auto v = get(path)) return std::move(*v);
    return fallback;
}

void Document::set(std::string_view path, Value value) {
    detail::assign(root_, parse_path(path), std::move(value));
    invalidate();
}

auto Document::erase(std::string_view path) -> bool {
    const auto removed = detail::erase(root_, parse_path(path));
    if (removed) invalidate();
    return removed;
}

auto Document::has(std::string_view path) const -> bool {
    return get(path).has_value();
}

auto Document::view(std::string_view path) const -> std::optional<Document> {
    auto v = get(path);
    if (!v || !v->is_map()) return std::nullopt;
    return Document{std::move(v->as_map())};
}

auto Document::get_many(const std::vector<std::string>& paths) const
    -> std::map<std::string, Value> {
    auto result = std::map<std::string, Value>{};
    for (const auto& path : paths) {
        auto value = Value{};
        if (is_valid_path(path)) {
            value = get_or(path, Null{});
        }
        result.insert_or_assign(path, std::move(value));
    }
    return result;
}

// -- Top-level access ---------------------------------------------------------

auto Document::get_key(std::string_view key) const -> std::optional<Value> {
    const auto& map = root_.as_map();
    auto it = map.find(key);
    if (it == map.end()) return std::nullopt;
    return it->second;
}

void Document::set_key(std::string_view key, Value value) {
    root_.as_map().insert_or_assign(std::string{key}, std::move(value));
    invalidate();
}

auto Document::erase_key(std::string_view key) -> bool {
    auto& map = root_.as_map();
    auto it = map.find(key);
    if (it == map.end()) return false;
    map.erase(it);
    invalidate();
    return true;
}

auto Document::contains(std::string_view key) const -> bool {
    return root_.as_map().contains(key);
}

auto Document::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(root_.size());
    for (const auto& [key, value] : root_.as_map()) result.push_back(key);
    return result;
}

void Document::clear() {
    root_.as_map().clear();
    invalidate();
}

// -- Enumeration --------------------------------------------------------------

auto Document::cached_leaves() const -> const std::vector<FlatEntry>& {
    if (!leaf_cache_) {
        leaf_cache_ = detail::flatten(root_, ".");
    }
    return *leaf_cache_;
}

auto Document::flatten(std::string_view separator) const -> std::vector<FlatEntry> {
    if (separator == ".") return cached_leaves();
    return detail::flatten(root_, separator);
}

auto Document::list_paths(std::string_view prefix) const -> std::vector<std::string> {
    const auto& leaves = cached_leaves();
    auto result = std::vector<std::string>{};
    const auto scope = prefix.empty() ? std::string{} : std::string{prefix} + path_separator;
    for (const auto& entry : leaves) {
        if (scope.empty() || entry.path.starts_with(scope)) {
            result.push_back(entry.path);
        }
    }
    return result;
}

auto Document::find_paths(std::string_view pattern) const -> std::vector<std::string> {
    parse_path(pattern);
    const auto pattern_segments = split_path(pattern);
    auto result = std::vector<std::string>{};
    for (const auto& entry : cached_leaves()) {
        if (match_path_pattern(pattern_segments, split_path(entry.path))) {
            result.push_back(entry.path);
        }
    }
    return result;
}

auto Document::find_all_keys(std::string_view key) const -> std::vector<FlatEntry> {
    auto result = std::vector<FlatEntry>{};
    const auto& leaves = cached_leaves();
    std::copy_if(leaves.begin(), leaves.end(), std::back_inserter(result),
                 [&](const FlatEntry& e) { return last_segment(e.path) == key; });
    return result;
}

auto Document::find_values(const LeafPredicate& pred) const -> std::vector<FlatEntry> {
    auto result = std::vector<FlatEntry>{};
    const auto& leaves = cached_leaves();
    std::copy_if(leaves.begin(), leaves.end(), std::back_inserter(result),
                 [&](const FlatEntry& e) { return pred(e.value); });
    return result;
}

// -- Queries ------------------------------------------------------------------

auto Document::query(std::string_view path) const -> Query {
    auto v = get(path);
    if (!v || !v->is_list()) return Query{};
    return Query{std::move(v->as_list())};
}

auto Document::filter_list(std::string_view path, const Query::Predicate& pred) const -> List {
    auto q = query(path);
    q.where(pred);
    return q.execute();
}

// -- Merge and comparison -----------------------------------------------------

void Document::merge(const Document& other) {
    merge(other.root());
}

void Document::merge(const Map& other) {
    if (other.empty()) return;
    detail::deep_merge(root_.as_map(), other);
    invalidate();
}

auto Document::diff(const Document& other) const -> Diff {
    auto result = Diff{};
    const auto& before = cached_leaves();
    const auto& after = other.cached_leaves();

    auto old_values = std::map<std::string_view, const Value*>{};
    for (const auto& e : before) old_values.emplace(e.path, &e.value);

    auto new_paths = std::set<std::string_view>{};
    for (const auto& e : after) {
        new_paths.insert(e.path);
        auto it = old_values.find(e.path);
        if (it == old_values.end()) {
            result.added.insert_or_assign(e.path, e.value);
        } else if (!(*it->second == e.value)) {
            result.changed.insert_or_assign(e.path, Change{*it->second, e.value});
        }
    }
    for (const auto& e : before) {
        if (!new_paths.contains(e.path)) {
            result.removed.insert_or_assign(e.path, e.value);
        }
    }
    return result;
}

auto Document::equals(const Document& other) const -> bool {
    return cached_leaves() == other.cached_leaves();
}

// -- Bulk updates -------------------------------------------------------------

auto Document::update_where(const PathPredicate& condition, const ValueTransform& transform)
    -> std::size_t {
    auto count = std::size_t{0};
    auto prefix = std::string{};
    count = update_leaves(root_, prefix, condition, transform);
    if (count > 0) invalidate();
    return count;
}

auto Document::remove_nulls() -> std::size_t {
    const auto count = strip_nulls(root_);
    if (count > 0) invalidate();
    return count;
}

auto Document::remove_empty() -> std::size_t {
    const auto count = strip_empty(root_);
    if (count > 0) invalidate();
    return count;
}

auto Document::transform_all(const PathTransform& fn) const -> Document {
    auto prefix = std::string{};
    return Document{rebuild_leaves(root_, prefix, fn)};
}

auto Document::transform_keys(const KeyTransform& fn) const -> Document {
    return Document{rename_keys(root_, fn)};
}

// -- Introspection ------------------------------------------------------------

auto Document::describe() const -> Map {
    return std::move(detail::describe_map(root_.as_map()).as_map());
}

auto Document::stats() const -> Stats {
    auto result = Stats{};
    result.max_depth = detail::collect_stats(root_, result);
    return result;
}

}  // namespace datastore_cpp
