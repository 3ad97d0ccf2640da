// basic_usage — demonstrates core datastore-cpp API
//
// Shows path reads and writes, auto-created intermediate maps, list
// indices, top-level keys containing dots, typed get<T>(), pattern search,
// merge and diff.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <datastore-cpp/datastore.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace ds = datastore_cpp;

int main() {
    auto doc = ds::Document{};

    // -- Writes create intermediate maps --------------------------------------
    doc.set("site.name", "My Site");
    doc.set("site.url", "https://example.com");
    doc.set("config.cache.ttl", 3600);
    doc.set("config.cache.enabled", true);

    // -- Map{} / List{} wrappers ----------------------------------------------
    doc.set("posts", ds::List{
        ds::Map{{"title", "Hello"}, {"tags", ds::List{"intro", "cpp"}}},
        ds::Map{{"title", "Second"}, {"tags", ds::List{"cpp"}}},
    });

    // -- Typed reads ----------------------------------------------------------
    auto name = doc.get<std::string>("site.name");
    auto ttl = doc.get<std::int64_t>("config.cache.ttl");
    std::printf("name: %s\n", name ? name->c_str() : "(none)");
    std::printf("ttl:  %lld\n", static_cast<long long>(ttl.value_or(0)));

    // -- List indices ---------------------------------------------------------
    doc.set("posts.1.title", "Second, edited");
    if (auto title = doc.get<std::string>("posts.1.title")) {
        std::printf("posts.1.title: %s\n", title->c_str());
    }

    // -- Writes never grow lists ----------------------------------------------
    try {
        doc.set("posts.5.title", "nope");
    } catch (const ds::PathError& e) {
        std::printf("rejected: %s (%s)\n", e.what(),
                    std::string{ds::to_string_view(e.kind())}.c_str());
    }

    // -- Keys containing the separator live at the top level ------------------
    doc.set_key("example.com", "literal key");
    std::printf("contains 'example.com': %s\n", doc.contains("example.com") ? "yes" : "no");

    // -- Enumeration ----------------------------------------------------------
    std::printf("\nall leaf paths:\n");
    for (const auto& path : doc.list_paths()) {
        std::printf("  %s\n", path.c_str());
    }

    std::printf("\nposts.*.title:\n");
    for (const auto& path : doc.find_paths("posts.*.title")) {
        std::printf("  %s\n", path.c_str());
    }

    // -- Merge and diff -------------------------------------------------------
    auto before = doc;
    doc.merge(ds::Map{{"config", ds::Map{{"cache", ds::Map{{"ttl", 60}}}}}});
    auto changes = before.diff(doc);
    for (const auto& [path, change] : changes.changed) {
        std::printf("\nchanged %s\n", path.c_str());
    }

    auto stats = doc.stats();
    std::printf("\n%zu leaves, depth %zu\n", stats.total_values, stats.max_depth);
    return 0;
}
