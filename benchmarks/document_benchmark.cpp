// datastore-cpp benchmarks — measures throughput of core operations.

#include <datastore-cpp/datastore.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace datastore_cpp;

// A document with `n` sections of ten leaves each plus one list of posts.
static auto make_doc(std::int64_t n) -> Document {
    auto doc = Document{};
    auto posts = List{};
    for (std::int64_t i = 0; i < n; ++i) {
        const auto section = "section" + std::to_string(i);
        for (int k = 0; k < 10; ++k) {
            doc.set(section + ".key" + std::to_string(k), i * 10 + k);
        }
        posts.push_back(Map{{"id", i}, {"views", (i * 7919) % 1000}, {"title", section}});
    }
    doc.set("posts", std::move(posts));
    return doc;
}

// =============================================================================
// Path access
// =============================================================================

static void bm_set_nested(benchmark::State& state) {
    auto doc = Document{};
    std::int64_t i = 0;
    for (auto _ : state) {
        doc.set("a.b.c.d", i++);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_set_nested);

static void bm_get_nested(benchmark::State& state) {
    auto doc = make_doc(100);
    for (auto _ : state) {
        benchmark::DoNotOptimize(doc.get("section42.key7"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_get_nested);

static void bm_parse_path(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(parse_path("config.cache.layers.12.ttl"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_path);

// =============================================================================
// Enumeration
// =============================================================================

static void bm_list_paths_cached(benchmark::State& state) {
    auto doc = make_doc(state.range(0));
    (void)doc.list_paths();
    for (auto _ : state) {
        benchmark::DoNotOptimize(doc.list_paths());
    }
}
BENCHMARK(bm_list_paths_cached)->Range(10, 1000);

static void bm_list_paths_after_write(benchmark::State& state) {
    auto doc = make_doc(state.range(0));
    std::int64_t i = 0;
    for (auto _ : state) {
        doc.set("section0.key0", i++);
        benchmark::DoNotOptimize(doc.list_paths());
    }
}
BENCHMARK(bm_list_paths_after_write)->Range(10, 1000);

static void bm_find_paths_double_star(benchmark::State& state) {
    auto doc = make_doc(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(doc.find_paths("**.key3"));
    }
}
BENCHMARK(bm_find_paths_double_star)->Range(10, 1000);

// =============================================================================
// Query
// =============================================================================

static void bm_query_filter_sort_limit(benchmark::State& state) {
    auto doc = make_doc(state.range(0));
    for (auto _ : state) {
        auto q = doc.query("posts");
        q.where([](const Value& p) { return field(p, "views") > Value{500}; })
            .sort_by("views", true)
            .limit(10);
        benchmark::DoNotOptimize(q.execute());
    }
}
BENCHMARK(bm_query_filter_sort_limit)->Range(10, 1000);

// =============================================================================
// Merge, diff and bulk operations
// =============================================================================

static void bm_merge(benchmark::State& state) {
    const auto base = make_doc(state.range(0));
    const auto overlay = make_doc(state.range(0) / 2);
    for (auto _ : state) {
        auto doc = base;
        doc.merge(overlay);
        benchmark::DoNotOptimize(doc);
    }
}
BENCHMARK(bm_merge)->Range(10, 1000);

static void bm_diff(benchmark::State& state) {
    const auto a = make_doc(state.range(0));
    auto b = a;
    b.set("section1.key1", "changed");
    for (auto _ : state) {
        benchmark::DoNotOptimize(a.diff(b));
    }
}
BENCHMARK(bm_diff)->Range(10, 1000);

static void bm_transform_keys(benchmark::State& state) {
    const auto doc = make_doc(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(doc.transform_keys([](const std::string& k) { return "x_" + k; }));
    }
}
BENCHMARK(bm_transform_keys)->Range(10, 1000);

// =============================================================================
// Serialization
// =============================================================================

static void bm_dump(benchmark::State& state) {
    const auto doc = make_doc(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(doc.dump(-1));
    }
}
BENCHMARK(bm_dump)->Range(10, 1000);

static void bm_parse(benchmark::State& state) {
    const auto text = make_doc(state.range(0)).dump(-1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(nlohmann::json::parse(text).get<Document>());
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse)->Range(10, 1000);
