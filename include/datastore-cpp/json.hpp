/// @file json.hpp
/// @brief nlohmann/json interoperability for datastore-cpp.
///
/// Provides ADL serialization (to_json/from_json) for values, documents and
/// result records, so they work with nlohmann::json's implicit conversions.

#pragma once

#include <datastore-cpp/document.hpp>
#include <datastore-cpp/types.hpp>
#include <datastore-cpp/value.hpp>

#include <nlohmann/json.hpp>

namespace datastore_cpp {

// -- Values -------------------------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Value& v);

/// Objects become maps, arrays lists. Unsigned integers above the int64
/// range and all floats become doubles.
/// Conversion recurses once per nesting level; untrusted text should go
/// through parse_json(), which caps the depth.
/// @throws LoadError with kind parse_error for binary values.
void from_json(const nlohmann::json& j, Value& v);

// -- Documents ----------------------------------------------------------------

void to_json(nlohmann::json& j, const Document& doc);

/// @throws PathError with kind type_conflict if `j` is not an object.
void from_json(const nlohmann::json& j, Document& doc);

// -- Result records -----------------------------------------------------------

void to_json(nlohmann::json& j, const FlatEntry& e);
void to_json(nlohmann::json& j, const Change& c);
void to_json(nlohmann::json& j, const Diff& d);
void to_json(nlohmann::json& j, const Stats& s);
void to_json(nlohmann::json& j, const Group& g);

}  // namespace datastore_cpp
