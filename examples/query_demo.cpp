// query_demo — filtering, sorting and grouping list data with Query
//
// Build: cmake --build build
// Run:   ./build/query_demo

#include <datastore-cpp/datastore.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace ds = datastore_cpp;

static auto text(const ds::Value& v) -> std::string {
    if (const auto* s = v.get_if<std::string>()) return *s;
    if (v.is_null()) return "(none)";
    return nlohmann::json(v).dump();
}

int main() {
    auto doc = ds::Document{ds::Map{{"posts", ds::List{
        ds::Map{{"title", "Intro to C++"}, {"category", "tech"}, {"views", 320}, {"published", true}},
        ds::Map{{"title", "Gardening"}, {"category", "life"}, {"views", 90}, {"published", true}},
        ds::Map{{"title", "Draft"}, {"category", "tech"}, {"views", 0}, {"published", false}},
        ds::Map{{"title", "Templates"}, {"category", "tech"}, {"views", 150}, {"published", true}},
    }}}};

    // -- Filter, sort, page ---------------------------------------------------
    auto popular = doc.query("posts");
    popular.where([](const ds::Value& p) { return ds::field(p, "published") == ds::Value{true}; })
        .sort_by("views", true)
        .limit(2);

    std::printf("top published posts:\n");
    for (const auto& post : popular.execute()) {
        std::printf("  %-14s %s views\n", text(ds::field(post, "title")).c_str(),
                    text(ds::field(post, "views")).c_str());
    }
    std::printf("matching before limit: %zu\n", popular.count());

    // -- Pluck ----------------------------------------------------------------
    auto titles = doc.query("posts");
    titles.sort_by("title");
    std::printf("\ntitles:");
    for (const auto& t : titles.pluck("title")) std::printf(" [%s]", text(t).c_str());
    std::printf("\n");

    // -- Group ----------------------------------------------------------------
    std::printf("\nby category:\n");
    for (const auto& group : doc.query("posts").group_by("category")) {
        std::printf("  %s: %zu\n", text(group.key).c_str(), group.items.size());
    }

    // -- Bulk update ----------------------------------------------------------
    auto bumped = doc.update_where(
        [](const std::string& path, const ds::Value&) { return path.ends_with(".views"); },
        [](const ds::Value& v) { return ds::Value{v.get<std::int64_t>() + 1}; });
    std::printf("\nbumped %zu view counters\n", bumped);
    return 0;
}
