#pragma once

/// @file error.hpp
/// @brief Exception type of the desim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace desim::io {

/// @brief Exception for I/O errors (reading, parsing, validation).
///
/// Thrown by the config loader when JSON input is malformed, a field has
/// the wrong type, or a value is out of range (e.g. a negative dt).
///
/// @ingroup io
/// @see load_clock_config
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace desim::io
