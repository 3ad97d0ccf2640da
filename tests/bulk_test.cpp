#include <datastore-cpp/document.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

using namespace datastore_cpp;

namespace {

auto messy() -> Document {
    return Document{Map{
        {"keep", 1},
        {"gone", nullptr},
        {"nested", Map{{"x", nullptr}, {"y", 2}}},
        {"list", List{1, nullptr, Map{{"z", nullptr}}}},
        {"hollow", Map{{"inner", Map{}}, {"items", List{}}}},
    }};
}

auto upper(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

}  // namespace

// =============================================================================
// update_where
// =============================================================================

TEST(UpdateWhere, rewrites_matching_leaves) {
    auto doc = Document{};
    doc.set("posts.a.title", "hello");
    doc.set("posts.b.title", "world");
    doc.set("posts.b.body", "text");

    const auto n = doc.update_where(
        [](const std::string& path, const Value&) { return path.ends_with(".title"); },
        [](const Value& v) { return Value{upper(v.get<std::string>())}; });

    EXPECT_EQ(n, 2u);
    EXPECT_EQ(doc.get<std::string>("posts.a.title"), "HELLO");
    EXPECT_EQ(doc.get<std::string>("posts.b.body"), "text");
}

TEST(UpdateWhere, sees_list_index_paths) {
    auto doc = Document{Map{{"nums", List{1, 2, 3}}}};
    const auto n = doc.update_where(
        [](const std::string& path, const Value&) { return path == "nums.1"; },
        [](const Value&) { return Value{20}; });
    EXPECT_EQ(n, 1u);
    EXPECT_EQ(doc.get("nums"), (Value{List{1, 20, 3}}));
}

TEST(UpdateWhere, no_match_changes_nothing) {
    auto doc = messy();
    const auto before = doc;
    EXPECT_EQ(doc.update_where([](const std::string&, const Value&) { return false; },
                               [](const Value& v) { return v; }),
              0u);
    EXPECT_EQ(doc, before);
}

TEST(UpdateWhere, result_is_visible_in_list_paths) {
    auto doc = Document{};
    doc.set("a", 1);
    (void)doc.list_paths();
    doc.update_where([](const std::string&, const Value&) { return true; },
                     [](const Value&) { return Value{Map{{"b", 2}}}; });
    EXPECT_EQ(doc.list_paths(), (std::vector<std::string>{"a.b"}));
}

// =============================================================================
// remove_nulls / remove_empty
// =============================================================================

TEST(RemoveNulls, strips_every_depth) {
    auto doc = messy();
    EXPECT_EQ(doc.remove_nulls(), 4u);
    EXPECT_FALSE(doc.has("gone"));
    EXPECT_FALSE(doc.has("nested.x"));
    EXPECT_EQ(doc.get("list"), (Value{List{1, Map{}}}));
    EXPECT_EQ(doc.get("nested.y"), Value{2});
}

TEST(RemoveNulls, is_idempotent) {
    auto doc = messy();
    EXPECT_GT(doc.remove_nulls(), 0u);
    EXPECT_EQ(doc.remove_nulls(), 0u);
}

TEST(RemoveEmpty, cascades_bottom_up) {
    auto doc = messy();
    // hollow.inner, hollow.items, then hollow itself
    EXPECT_EQ(doc.remove_empty(), 3u);
    EXPECT_FALSE(doc.has("hollow"));
    EXPECT_TRUE(doc.has("gone"));
}

TEST(RemoveEmpty, after_remove_nulls) {
    auto doc = messy();
    doc.remove_nulls();
    // list.1 (emptied map) and the hollow subtree
    EXPECT_EQ(doc.remove_empty(), 4u);
    EXPECT_EQ(doc.get("list"), Value{List{1}});
}

TEST(RemoveEmpty, is_idempotent_and_keeps_root) {
    auto doc = Document{Map{{"a", Map{{"b", Map{}}}}}};
    EXPECT_EQ(doc.remove_empty(), 2u);
    EXPECT_TRUE(doc.empty());
    EXPECT_EQ(doc.remove_empty(), 0u);
}

// =============================================================================
// transform_all / transform_keys
// =============================================================================

TEST(TransformAll, returns_new_document) {
    auto doc = Document{};
    doc.set("a.name", "x");
    doc.set("a.n", 2);

    const auto out = doc.transform_all([](const std::string& path, const Value& v) -> Value {
        if (v.is_int()) return v.get<std::int64_t>() * 10;
        return path + "=" + v.get<std::string>();
    });

    EXPECT_EQ(out.get("a.n"), Value{20});
    EXPECT_EQ(out.get("a.name"), Value{"a.name=x"});
    EXPECT_EQ(doc.get("a.n"), Value{2});
}

TEST(TransformAll, keeps_empty_containers) {
    const auto doc = Document{Map{{"e", Map{}}, {"l", List{}}}};
    const auto out = doc.transform_all([](const std::string&, const Value& v) { return v; });
    EXPECT_EQ(out, doc);
}

TEST(TransformKeys, renames_at_every_depth) {
    const auto doc = Document{Map{
        {"outer", Map{{"inner", 1}}},
        {"list", List{Map{{"k", 2}}}},
    }};
    const auto out = doc.transform_keys(upper);

    EXPECT_EQ(out.get("OUTER.INNER"), Value{1});
    EXPECT_EQ(out.get("LIST.0.K"), Value{2});
    EXPECT_TRUE(doc.has("outer.inner"));
}

TEST(TransformKeys, later_key_wins_on_collision) {
    const auto doc = Document{Map{{"A", 1}, {"a", 2}}};
    const auto out = doc.transform_keys(upper);
    EXPECT_EQ(out.size(), 1u);
    EXPECT_EQ(out.get("A"), Value{2});
}
