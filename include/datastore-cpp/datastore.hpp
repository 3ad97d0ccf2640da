/// @file datastore.hpp
/// @brief Umbrella header for the datastore-cpp library.
///
/// Include this single header for access to all public types:
/// Document, Value, Query, Path, Diff, Stats, the loader and persister,
/// and the error types.

#pragma once

#include <datastore-cpp/document.hpp>
#include <datastore-cpp/error.hpp>
#include <datastore-cpp/json.hpp>
#include <datastore-cpp/path.hpp>
#include <datastore-cpp/query.hpp>
#include <datastore-cpp/storage.hpp>
#include <datastore-cpp/types.hpp>
#include <datastore-cpp/value.hpp>
