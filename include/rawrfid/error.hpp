/**
 * @file error.hpp
 * @brief rawrfid error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef RAWRFID_ERROR_HPP
#define RAWRFID_ERROR_HPP

#include "config.hpp"

#if !RAWRFID_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace rawrfid {

/**
 * @brief Error codes for error-code-based error handling.
 *
 * Every core function reports through these codes. The exception layer
 * below maps them onto exception types.
 */
enum class Error {
    Ok = 0,                  ///< Success
    InvalidArg = -1,         ///< Invalid argument
    Overflow = -2,           ///< Result exceeds a configured limit
    TruncatedInput = -3,     ///< Fewer bytes than the header or a frame requires
    BadMagic = -4,           ///< Header identifier is not "RIFL"
    UnsupportedVersion = -5, ///< File version other than 1
    MisalignedPairData = -6, ///< Pair data does not end on a pair boundary
    MalformedPair = -7,      ///< Pair violates a structural invariant
    BufferTooLarge = -8,     ///< Frame larger than the header's max buffer size
    InvalidHeader = -9,      ///< Header field out of range
    Io = -10                 ///< File or stream failure
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
        return "Size limit exceeded";
    case Error::TruncatedInput:
        return "Truncated input";
    case Error::BadMagic:
        return "Not a RIFL file";
    case Error::UnsupportedVersion:
        return "Unsupported RIFL version";
    case Error::MisalignedPairData:
        return "Misaligned pair data";
    case Error::MalformedPair:
        return "Malformed pulse/duration pair";
    case Error::BufferTooLarge:
        return "Buffer size exceeds header maximum";
    case Error::InvalidHeader:
        return "Invalid header field";
    case Error::Io:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Check whether an error describes malformed input bytes.
 */
constexpr bool is_format_error(Error error) noexcept {
    switch (error) {
    case Error::TruncatedInput:
    case Error::BadMagic:
    case Error::UnsupportedVersion:
    case Error::MisalignedPairData:
    case Error::MalformedPair:
    case Error::BufferTooLarge:
    case Error::InvalidHeader:
        return true;
    default:
        return false;
    }
}

#if !RAWRFID_NO_EXCEPTIONS

/**
 * @brief Base exception for rawrfid errors.
 */
class RawRfidException : public std::runtime_error {
public:
    explicit RawRfidException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for malformed capture data.
 *
 * code() tells which structural check failed.
 */
class FormatException : public RawRfidException {
public:
    FormatException(const std::string& message, Error code)
        : RawRfidException(message, code) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public RawRfidException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : RawRfidException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for exceeded size limits.
 */
class OverflowException : public RawRfidException {
public:
    explicit OverflowException(const std::string& message)
        : RawRfidException(message, Error::Overflow) {}
};

/**
 * @brief Exception for file and stream failures.
 */
class IoException : public RawRfidException {
public:
    explicit IoException(const std::string& message)
        : RawRfidException(message, Error::Io) {}
};

/**
 * @brief Throw the exception type matching an error code.
 *
 * @param error Error code, must not be Error::Ok
 * @param context Text appended to the error message
 */
[[noreturn]] inline void throw_error(Error error, const std::string& context = {}) {
    std::string message = error_string(error);
    if (!context.empty()) {
        message += ": ";
        message += context;
    }

    if (is_format_error(error)) {
        throw FormatException(message, error);
    }
    switch (error) {
    case Error::Overflow:
        throw OverflowException(message);
    case Error::Io:
        throw IoException(message);
    default:
        throw InvalidArgumentException(message);
    }
}

#endif // !RAWRFID_NO_EXCEPTIONS

} // namespace rawrfid

#endif // RAWRFID_ERROR_HPP
