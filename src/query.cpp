#include <datastore-cpp/query.hpp>

#include "tree/node.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace datastore_cpp {

auto field(const Value& item, std::string_view key) -> Value {
    if (const auto* child = detail::get1(item, make_segment(key))) {
        return *child;
    }
    return Null{};
}

Query::Query(List source) : source_{std::move(source)} {}

auto Query::where(Predicate pred) -> Query& {
    predicates_.push_back(std::move(pred));
    return *this;
}

auto Query::sort(KeyFn key, bool reverse) -> Query& {
    sorted_ = true;
    sort_key_ = std::move(key);
    reverse_ = reverse;
    return *this;
}

auto Query::sort_by(std::string key, bool reverse) -> Query& {
    return sort([key = std::move(key)](const Value& item) { return field(item, key); },
                reverse);
}

auto Query::offset(std::size_t n) -> Query& {
    offset_ = n;
    return *this;
}

auto Query::limit(std::size_t n) -> Query& {
    limit_ = n;
    return *this;
}

auto Query::filtered() const -> List {
    auto items = List{};
    std::copy_if(source_.begin(), source_.end(), std::back_inserter(items),
                 [this](const Value& item) {
                     return std::all_of(predicates_.begin(), predicates_.end(),
                                        [&](const Predicate& pred) { return pred(item); });
                 });
    return items;
}

void Query::sort_items(List& items) const {
    if (!sorted_) return;

    if (!sort_key_) {
        std::stable_sort(items.begin(), items.end(), [this](const Value& a, const Value& b) {
            return reverse_ ? (b < a) : (a < b);
        });
        return;
    }

    // Extract each key once; the key function may be expensive.
    auto keyed = std::vector<std::pair<Value, Value>>{};
    keyed.reserve(items.size());
    for (auto& item : items) {
        auto key = sort_key_(item);
        keyed.emplace_back(std::move(key), std::move(item));
    }
    std::stable_sort(keyed.begin(), keyed.end(), [this](const auto& a, const auto& b) {
        return reverse_ ? (b.first < a.first) : (a.first < b.first);
    });
    for (std::size_t i = 0; i < keyed.size(); ++i) {
        items[i] = std::move(keyed[i].second);
    }
}

auto Query::execute() const -> List {
    auto items = filtered();
    sort_items(items);

    const auto skip = std::min(offset_.value_or(0), items.size());
    auto begin = items.begin() + static_cast<std::ptrdiff_t>(skip);
    auto end = items.end();
    if (limit_ && *limit_ < static_cast<std::size_t>(end - begin)) {
        end = begin + static_cast<std::ptrdiff_t>(*limit_);
    }
    return List(std::make_move_iterator(begin), std::make_move_iterator(end));
}

auto Query::count() const -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(source_.begin(), source_.end(), [this](const Value& item) {
            return std::all_of(predicates_.begin(), predicates_.end(),
                               [&](const Predicate& pred) { return pred(item); });
        }));
}

auto Query::first() const -> std::optional<Value> {
    auto items = filtered();
    if (items.empty()) return std::nullopt;
    sort_items(items);
    return std::move(items.front());
}

auto Query::pluck(std::string_view key) const -> List {
    auto result = List{};
    for (const auto& item : execute()) {
        result.push_back(field(item, key));
    }
    return result;
}

auto Query::group_by(std::string_view key) const -> std::vector<Group> {
    auto groups = std::vector<Group>{};
    for (auto& item : execute()) {
        auto bucket = field(item, key);
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const Group& g) { return g.key == bucket; });
        if (it == groups.end()) {
            groups.push_back(Group{std::move(bucket), {}});
            it = std::prev(groups.end());
        }
        it->items.push_back(std::move(item));
    }
    return groups;
}

}  // namespace datastore_cpp
