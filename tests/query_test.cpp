#include <datastore-cpp/document.hpp>
#include <datastore-cpp/error.hpp>
#include <datastore-cpp/query.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace datastore_cpp;

namespace {

auto v_items() -> List {
    return List{Map{{"v", 1}}, Map{{"v", 3}}, Map{{"v", 2}}};
}

auto v_above(int n) -> Query::Predicate {
    return [n](const Value& item) { return field(item, "v") > Value{n}; };
}

auto posts() -> Document {
    return Document{Map{{"posts", List{
        Map{{"title", "A"}, {"views", 50}, {"cat", "tech"}, {"published", true}},
        Map{{"title", "B"}, {"views", 150}, {"cat", "life"}, {"published", true}},
        Map{{"title", "C"}, {"views", 300}, {"cat", "tech"}, {"published", false}},
        Map{{"title", "D"}, {"views", 120}, {"cat", "tech"}, {"published", true}},
        Map{{"title", "E"}, {"views", 80}},
    }}}};
}

}  // namespace

// =============================================================================
// field()
// =============================================================================

TEST(Field, reads_map_key_or_null) {
    const auto item = Value{Map{{"a", 1}}};
    EXPECT_EQ(field(item, "a"), Value{1});
    EXPECT_TRUE(field(item, "b").is_null());
    EXPECT_TRUE(field(Value{5}, "a").is_null());
}

TEST(Field, reads_list_index) {
    EXPECT_EQ(field(Value{List{"x", "y"}}, "1"), Value{"y"});
}

// =============================================================================
// Pipeline
// =============================================================================

TEST(Query, filter_then_sort) {
    auto q = Query{v_items()};
    q.where(v_above(1)).sort_by("v");
    EXPECT_EQ(q.execute(), (List{Map{{"v", 2}}, Map{{"v", 3}}}));

    q.limit(1);
    EXPECT_EQ(q.execute(), (List{Map{{"v", 2}}}));
}

TEST(Query, stage_order_ignores_call_order) {
    auto a = Query{v_items()};
    a.limit(1).sort_by("v").where(v_above(1));
    auto b = Query{v_items()};
    b.where(v_above(1)).sort_by("v").limit(1);
    EXPECT_EQ(a.execute(), b.execute());
}

TEST(Query, where_predicates_are_anded) {
    auto q = posts().query("posts");
    q.where([](const Value& p) { return field(p, "cat") == Value{"tech"}; })
     .where([](const Value& p) { return field(p, "published") == Value{true}; });
    EXPECT_EQ(q.pluck("title"), (List{"A", "D"}));
}

TEST(Query, sort_descending_and_paging) {
    auto q = posts().query("posts");
    q.sort_by("views", true).offset(1).limit(2);
    EXPECT_EQ(q.pluck("title"), (List{"B", "D"}));
}

TEST(Query, sort_is_stable) {
    auto q = posts().query("posts");
    q.sort_by("cat");
    // Missing cat sorts first as Null, then life, then tech in source order.
    EXPECT_EQ(q.pluck("title"), (List{"E", "B", "A", "C", "D"}));
}

TEST(Query, sort_with_key_function) {
    auto q = Query{List{"ccc", "a", "bb"}};
    q.sort([](const Value& s) { return Value{s.get<std::string>().size()}; });
    EXPECT_EQ(q.execute(), (List{"a", "bb", "ccc"}));
}

TEST(Query, sort_without_key_uses_value_order) {
    auto q = Query{List{3, "x", 1.5, nullptr, true}};
    q.sort();
    EXPECT_EQ(q.execute(), (List{nullptr, true, 1.5, 3, "x"}));
}

TEST(Query, offset_past_end_is_empty) {
    auto q = Query{v_items()};
    q.offset(10);
    EXPECT_TRUE(q.execute().empty());
}

TEST(Query, limit_zero_is_empty) {
    auto q = Query{v_items()};
    q.limit(0);
    EXPECT_TRUE(q.execute().empty());
    EXPECT_EQ(q.count(), 3u);
}

TEST(Query, count_ignores_paging) {
    auto q = posts().query("posts");
    q.where([](const Value& p) { return field(p, "views") > Value{100}; }).limit(1);
    EXPECT_EQ(q.count(), 3u);
    EXPECT_EQ(q.execute().size(), 1u);
}

TEST(Query, first_after_sort) {
    auto q = posts().query("posts");
    q.sort_by("views", true);
    EXPECT_EQ(field(*q.first(), "title"), Value{"C"});

    auto none = Query{v_items()};
    none.where(v_above(10));
    EXPECT_FALSE(none.first().has_value());
}

TEST(Query, group_by_first_appearance) {
    auto q = posts().query("posts");
    const auto groups = q.group_by("cat");
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].key, Value{"tech"});
    EXPECT_EQ(groups[0].items.size(), 3u);
    EXPECT_EQ(groups[1].key, Value{"life"});
    EXPECT_TRUE(groups[2].key.is_null());
    EXPECT_EQ(field(groups[2].items[0], "title"), Value{"E"});
}

TEST(Query, pluck_missing_field_is_null) {
    auto q = posts().query("posts");
    const auto published = q.pluck("published");
    ASSERT_EQ(published.size(), 5u);
    EXPECT_TRUE(published[4].is_null());
}

// =============================================================================
// Document::query()
// =============================================================================

TEST(DocumentQuery, missing_or_non_list_is_empty) {
    const auto doc = posts();
    EXPECT_TRUE(doc.query("missing").execute().empty());
    EXPECT_TRUE(doc.query("posts.0").execute().empty());
}

TEST(DocumentQuery, results_are_snapshots) {
    auto doc = posts();
    auto q = doc.query("posts");
    doc.set("posts.0.title", "Changed");
    EXPECT_EQ(field(q.execute()[0], "title"), Value{"A"});

    auto results = q.execute();
    results[1].as_map()["title"] = "Local";
    EXPECT_EQ(doc.get<std::string>("posts.1.title"), "B");
}

TEST(DocumentQuery, bad_path_throws) {
    const auto doc = posts();
    EXPECT_THROW((void)doc.query("posts..x"), PathError);
}
