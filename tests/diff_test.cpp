#include <datastore-cpp/document.hpp>

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

using namespace datastore_cpp;

TEST(Diff, added_removed_and_changed) {
    const auto before = Document{Map{{"a", 1}, {"b", 2}}};
    const auto after = Document{Map{{"b", 3}, {"c", 4}}};

    const auto d = before.diff(after);
    EXPECT_EQ(d.added, (std::map<std::string, Value>{{"c", 4}}));
    EXPECT_EQ(d.removed, (std::map<std::string, Value>{{"a", 1}}));
    ASSERT_EQ(d.changed.size(), 1u);
    EXPECT_EQ(d.changed.at("b"), (Change{2, 3}));
}

TEST(Diff, identical_documents_have_empty_diff) {
    const auto doc = Document{Map{{"x", Map{{"y", List{1, 2}}}}}};
    EXPECT_TRUE(doc.diff(doc).empty());
    EXPECT_TRUE(doc.equals(doc));
}

TEST(Diff, works_on_nested_leaves) {
    auto before = Document{};
    before.set("cfg.cache.ttl", 60);
    before.set("cfg.cache.on", true);
    auto after = before;
    after.set("cfg.cache.ttl", 120);
    after.erase("cfg.cache.on");
    after.set("cfg.name", "n");

    const auto d = before.diff(after);
    EXPECT_EQ(d.added.size(), 1u);
    EXPECT_TRUE(d.added.contains("cfg.name"));
    EXPECT_TRUE(d.removed.contains("cfg.cache.on"));
    EXPECT_EQ(d.changed.at("cfg.cache.ttl").new_value, Value{120});
}

TEST(Diff, integer_and_double_of_same_value_are_unchanged) {
    const auto a = Document{Map{{"n", 1}}};
    const auto b = Document{Map{{"n", 1.0}}};
    EXPECT_TRUE(a.diff(b).empty());
}

TEST(Diff, list_growth_shows_as_added_indices) {
    const auto a = Document{Map{{"l", List{1}}}};
    const auto b = Document{Map{{"l", List{1, 2}}}};
    const auto d = a.diff(b);
    EXPECT_EQ(d.added, (std::map<std::string, Value>{{"l.1", 2}}));
}

TEST(Diff, is_antisymmetric) {
    const auto a = Document{Map{{"a", 1}, {"b", 2}}};
    const auto b = Document{Map{{"b", 3}, {"c", 4}}};
    const auto forward = a.diff(b);
    const auto backward = b.diff(a);
    EXPECT_EQ(forward.added, backward.removed);
    EXPECT_EQ(forward.removed, backward.added);
    EXPECT_EQ(backward.changed.at("b"), (Change{3, 2}));
}

TEST(Equals, compares_leaves_only) {
    const auto a = Document{Map{{"a", 1}, {"empty", Map{}}}};
    const auto b = Document{Map{{"a", 1}}};
    EXPECT_TRUE(a.equals(b));
    EXPECT_FALSE(a == b);
}

TEST(Equals, differing_value_is_unequal) {
    const auto a = Document{Map{{"a", 1}}};
    const auto b = Document{Map{{"a", "1"}}};
    EXPECT_FALSE(a.equals(b));
}

TEST(RoundTrip, flatten_then_set_rebuilds_the_document) {
    auto original = Document{};
    original.set("site.name", "S");
    original.set("site.meta.tags", "x");
    original.set("config.cache.ttl", 3600);
    original.set("config.debug", false);
    original.set("n", nullptr);

    auto rebuilt = Document{};
    for (const auto& [path, value] : original.flatten()) {
        rebuilt.set(path, value);
    }
    EXPECT_EQ(rebuilt, original);
    EXPECT_TRUE(rebuilt.equals(original));
}
