/**
 * @file error.hpp
 * @brief BitUInt error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for builds with -fno-exceptions.
 */

#ifndef BITUINT_ERROR_HPP
#define BITUINT_ERROR_HPP

#include "config.hpp"

#if !BITUINT_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace bituint {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,          ///< Success
    InvalidArg = -1, ///< Invalid argument (malformed binary literal)
    Overflow = -2    ///< Value does not fit the native integer type
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Value exceeds native integer width";
    default:
        return "Unknown error";
    }
}

#if !BITUINT_NO_EXCEPTIONS

/**
 * @brief Base exception for BitUInt errors.
 */
class BitUIntException : public std::runtime_error {
public:
    explicit BitUIntException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public BitUIntException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : BitUIntException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for values too wide for the native integer type.
 */
class OverflowException : public BitUIntException {
public:
    explicit OverflowException(const std::string& message)
        : BitUIntException(message, Error::Overflow) {}
};

#endif // !BITUINT_NO_EXCEPTIONS

} // namespace bituint

#endif // BITUINT_ERROR_HPP
