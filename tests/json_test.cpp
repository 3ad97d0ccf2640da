// json_test.cpp — Tests for nlohmann/json interoperability

#include <datastore-cpp/datastore.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace ds = datastore_cpp;
using json = nlohmann::json;

// =============================================================================
// Values
// =============================================================================

TEST(JsonAdl, null_to_json) {
    json j = ds::Null{};
    EXPECT_TRUE(j.is_null());
}

TEST(JsonAdl, scalars_to_json) {
    EXPECT_EQ(json(ds::Value{true}), true);
    EXPECT_EQ(json(ds::Value{-5}), -5);
    EXPECT_EQ(json(ds::Value{2.5}), 2.5);
    EXPECT_EQ(json(ds::Value{"hi"}), "hi");
}

TEST(JsonAdl, containers_to_json) {
    const auto v = ds::Value{ds::Map{
        {"list", ds::List{1, "two", nullptr}},
        {"map", ds::Map{{"k", false}}},
    }};
    EXPECT_EQ(json(v), json::parse(R"({"list":[1,"two",null],"map":{"k":false}})"));
}

TEST(JsonAdl, from_json_preserves_kinds) {
    const auto j = json::parse(R"({"i":1,"f":1.5,"b":true,"n":null,"s":"x","l":[],"m":{}})");
    const auto v = j.get<ds::Value>();
    const auto& m = v.as_map();
    EXPECT_TRUE(m.at("i").is_int());
    EXPECT_TRUE(m.at("f").is_float());
    EXPECT_TRUE(m.at("b").is_bool());
    EXPECT_TRUE(m.at("n").is_null());
    EXPECT_TRUE(m.at("s").is_string());
    EXPECT_TRUE(m.at("l").is_list());
    EXPECT_TRUE(m.at("m").is_map());
}

TEST(JsonAdl, huge_unsigned_becomes_double) {
    const auto j = json(std::numeric_limits<std::uint64_t>::max());
    const auto v = j.get<ds::Value>();
    EXPECT_TRUE(v.is_float());
}

TEST(JsonAdl, binary_is_a_load_error) {
    auto j = json::object();
    j["blob"] = json::binary(std::vector<std::uint8_t>{0x01, 0x02});
    try {
        (void)j.get<ds::Value>();
        FAIL() << "expected LoadError";
    } catch (const ds::LoadError& e) {
        EXPECT_EQ(e.kind(), ds::ErrorKind::parse_error);
    }
}

TEST(JsonAdl, value_round_trip) {
    const auto v = ds::Value{ds::Map{{"a", ds::List{1, 2.5, "s", true, nullptr}}}};
    const auto back = json(v).get<ds::Value>();
    EXPECT_EQ(back, v);
}

// =============================================================================
// Documents
// =============================================================================

TEST(JsonDocument, document_to_json) {
    auto doc = ds::Document{};
    doc.set("site.name", "S");
    doc.set("n", 3);
    EXPECT_EQ(json(doc), json::parse(R"({"n":3,"site":{"name":"S"}})"));
}

TEST(JsonDocument, document_from_json) {
    const auto doc = json::parse(R"({"posts":[{"title":"A"}]})").get<ds::Document>();
    EXPECT_EQ(doc.get<std::string>("posts.0.title"), "A");
}

TEST(JsonDocument, non_object_is_rejected) {
    EXPECT_THROW((void)json::parse("[1,2]").get<ds::Document>(), ds::PathError);
}

TEST(JsonDocument, dump_indents) {
    auto doc = ds::Document{};
    doc.set("a", 1);
    EXPECT_EQ(doc.dump(), "{\n  \"a\": 1\n}");
    EXPECT_EQ(doc.dump(4), "{\n    \"a\": 1\n}");
}

// =============================================================================
// Result records
// =============================================================================

TEST(JsonRecords, diff_to_json) {
    const auto a = ds::Document{ds::Map{{"a", 1}, {"b", 2}}};
    const auto b = ds::Document{ds::Map{{"b", 3}, {"c", 4}}};
    EXPECT_EQ(json(a.diff(b)), json::parse(R"({
        "added": {"c": 4},
        "removed": {"a": 1},
        "changed": {"b": {"old": 2, "new": 3}}
    })"));
}

TEST(JsonRecords, stats_to_json) {
    const auto s = ds::Stats{3, 2, 2, 0, 2};
    EXPECT_EQ(json(s), json::parse(R"({
        "total_keys": 3, "max_depth": 2, "total_maps": 2,
        "total_lists": 0, "total_values": 2
    })"));
}

TEST(JsonRecords, flat_entry_and_group) {
    EXPECT_EQ(json(ds::FlatEntry{"a.b", 1}), json::parse(R"({"path":"a.b","value":1})"));
    const auto g = ds::Group{"tech", {ds::Value{1}}};
    EXPECT_EQ(json(g), json::parse(R"({"key":"tech","items":[1]})"));
}
