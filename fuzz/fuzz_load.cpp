// Fuzz target for parse_json() and the read-only Document API.
// Any object that parses is dumped and re-parsed to verify consistency.

#include <datastore-cpp/datastore.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ds = datastore_cpp;

    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    auto doc = ds::Document{};
    try {
        doc = ds::Document{ds::parse_json(text)};
    } catch (const ds::LoadError&) {
        return 0;
    }

    auto stats = doc.stats();
    if (stats.total_values != doc.list_paths().size()) __builtin_trap();
    if (stats.max_depth > ds::LoadOptions{}.max_depth) __builtin_trap();
    (void)doc.describe();

    auto reparsed = ds::Document{ds::parse_json(doc.dump(-1))};
    if (!reparsed.equals(doc)) __builtin_trap();

    doc.remove_nulls();
    doc.remove_empty();
    if (doc.remove_nulls() != 0 || doc.remove_empty() != 0) __builtin_trap();
    return 0;
}
