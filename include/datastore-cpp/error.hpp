/// @file error.hpp
/// @brief Error types for the datastore-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace datastore_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    empty_path,     ///< The path string is empty or whitespace-only.
    empty_segment,  ///< The path contains an empty segment ("a..b", ".a", "a.").
    type_conflict,  ///< A write went through a node of an incompatible type.
    not_found,      ///< A file or directory to load does not exist.
    access_denied,  ///< A file to load resolves outside the allowed root.
    too_large,      ///< A file to load exceeds the configured size ceiling.
    parse_error,    ///< A file to load is not a valid JSON object.
    write_error,    ///< A document could not be written out.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::empty_path:    return "empty_path";
        case ErrorKind::empty_segment: return "empty_segment";
        case ErrorKind::type_conflict: return "type_conflict";
        case ErrorKind::not_found:     return "not_found";
        case ErrorKind::access_denied: return "access_denied";
        case ErrorKind::too_large:     return "too_large";
        case ErrorKind::parse_error:   return "parse_error";
        case ErrorKind::write_error:   return "write_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Base exception for everything the library throws.
///
/// what() carries the message; error() keeps the structured form so
/// callers can branch on the kind.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// Malformed path syntax or a write through an incompatible node.
class PathError : public Exception {
public:
    using Exception::Exception;
};

/// Failure of the loader: missing file, escaped root, oversize or bad JSON.
class LoadError : public Exception {
public:
    using Exception::Exception;
};

/// Failure of the persister.
class SaveError : public Exception {
public:
    using Exception::Exception;
};

}  // namespace datastore_cpp
