// json_interop_demo — datastore-cpp + nlohmann/json interoperability
//
// Demonstrates:
//   - Converting nlohmann::json into a Document and back
//   - Saving to and loading from disk, including directory merges
//   - Reporting diffs and stats as JSON
//
// Build: cmake --build build -DDATASTORE_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/json_interop_demo

#include <datastore-cpp/datastore.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <string>

namespace ds = datastore_cpp;
namespace fs = std::filesystem;
using json = nlohmann::json;

int main() {
    // -- JSON in --------------------------------------------------------------
    auto input = json::parse(R"({
        "site": {"name": "Demo", "theme": null},
        "navigation": [{"label": "Home"}, {"label": "About"}],
        "empty": {}
    })");
    auto doc = input.get<ds::Document>();
    std::printf("loaded %zu top-level keys\n", doc.size());

    // -- Clean up -------------------------------------------------------------
    auto nulls = doc.remove_nulls();
    auto empties = doc.remove_empty();
    std::printf("removed %zu nulls and %zu empty containers\n", nulls, empties);

    // -- Persist --------------------------------------------------------------
    const auto dir = fs::temp_directory_path() / "datastore_cpp_demo";
    doc.save(dir / "10-site.json");

    auto overlay = ds::Document{};
    overlay.set("site.name", "Demo (staging)");
    overlay.save(dir / "20-staging.json");

    auto merged = ds::Document::from_directory(dir);
    std::printf("\nmerged:\n%s\n", merged.dump().c_str());

    // -- Reports as JSON ------------------------------------------------------
    std::printf("\ndiff:\n%s\n", json(doc.diff(merged)).dump(2).c_str());
    std::printf("\nstats:\n%s\n", json(merged.stats()).dump(2).c_str());
    std::printf("\ndescribe:\n%s\n", json(ds::Value{merged.describe()}).dump(2).c_str());

    auto ec = std::error_code{};
    fs::remove_all(dir, ec);
    return 0;
}
