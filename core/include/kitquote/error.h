#pragma once

/// \file error.h
/// \brief Typed error hierarchy for KitQuote.
///
/// Library functions throw subclasses of KitQuote::Error instead of plain
/// std::runtime_error, so callers can catch specific categories. The checkout
/// boundary converts the expected categories into a CheckoutOutcome.

#include "export.h"

#include <stdexcept>
#include <string>

namespace KitQuote {

/// Error categories returned by Error::code().
enum class ErrorCode : int {
    Ok = 0,
    InvalidInput,  ///< Caller supplied invalid arguments or data.
    IOError,       ///< File or stream I/O failure.
    FormatError,   ///< Data format / parsing error (catalog JSON, platform responses).
    ConfigError,   ///< Missing or unusable operator configuration.
    PlatformError, ///< Commerce platform rejected a request.
    InternalError, ///< Logic error inside the library.
};

/// Stable string name of an ErrorCode ("invalid_input", "config_error", ...).
KITQUOTE_API const char* ToErrorCodeString(ErrorCode code);

/// Base exception for all KitQuote errors.
class KITQUOTE_API Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// File / stream I/O failure.
class KITQUOTE_API IOError : public Error {
public:
    explicit IOError(const std::string& msg)
        : Error(ErrorCode::IOError, msg) {}
};

/// Invalid input arguments or data.
class KITQUOTE_API InputError : public Error {
public:
    explicit InputError(const std::string& msg)
        : Error(ErrorCode::InvalidInput, msg) {}
};

/// Data format / parsing failure, including malformed collaborator responses.
class KITQUOTE_API FormatError : public Error {
public:
    explicit FormatError(const std::string& msg)
        : Error(ErrorCode::FormatError, msg) {}
};

/// Operator configuration is missing (no platform credential, empty catalog, ...).
class KITQUOTE_API ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg)
        : Error(ErrorCode::ConfigError, msg) {}
};

/// Commerce platform rejected a request and no retry applies.
class KITQUOTE_API PlatformError : public Error {
public:
    explicit PlatformError(const std::string& msg)
        : Error(ErrorCode::PlatformError, msg) {}
};

} // namespace KitQuote
