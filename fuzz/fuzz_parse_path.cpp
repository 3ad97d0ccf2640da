// Fuzz target for parse_path() and the path-taking Document entry points.
// A path either parses and is accepted by set/get, or fails with PathError.

#include <datastore-cpp/datastore.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto path = std::string_view{reinterpret_cast<const char*>(data), size};
    namespace ds = datastore_cpp;

    const auto valid = ds::is_valid_path(path);
    try {
        (void)ds::parse_path(path);
        if (!valid) __builtin_trap();
    } catch (const ds::PathError&) {
        if (valid) __builtin_trap();
        return 0;
    }

    auto doc = ds::Document{};
    doc.set(path, 1);
    if (doc.get(path) != ds::Value{1}) __builtin_trap();
    (void)doc.find_paths(path);
    if (!doc.erase(path)) __builtin_trap();
    return 0;
}
