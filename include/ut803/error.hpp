/**
 * @file error.hpp
 * @brief UT803 error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * The decoding core returns codes; exceptions cover constructors and
 * convenience overloads.
 */

#ifndef UT803_ERROR_HPP
#define UT803_ERROR_HPP

#include "config.hpp"

#if !UT803_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace ut803 {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                      ///< Success
    InvalidArg = -1,             ///< Invalid argument
    BadLength = -2,              ///< Frame is not FRAME_LENGTH characters
    InvalidDigit = -3,           ///< Character outside the digit or nibble range
    UnknownMeasurementKind = -4, ///< Kind code not assigned by the meter
    Timeout = -5,                ///< No complete record before the deadline
    Interrupted = -6,            ///< Read interrupted by a signal
    Io = -7                      ///< Device or stream failure
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
    case Error::BadLength:
        return "Bad frame length";
    case Error::InvalidDigit:
        return "Invalid digit";
    case Error::UnknownMeasurementKind:
        return "Unknown measurement kind";
    case Error::Timeout:
        return "Timed out";
    case Error::Interrupted:
        return "Interrupted";
    case Error::Io:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

#if !UT803_NO_EXCEPTIONS

/**
 * @brief Base exception for UT803 errors.
 */
class Ut803Exception : public std::runtime_error {
public:
    explicit Ut803Exception(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for a malformed frame.
 *
 * Carries the offending position for InvalidDigit and the raw code for
 * UnknownMeasurementKind.
 */
class DecodeException : public Ut803Exception {
public:
    DecodeException(const std::string& message, Error code, std::size_t position,
                    std::uint8_t kind_code)
        : Ut803Exception(message, code), position_(position), kind_code_(kind_code) {}

    std::size_t position() const noexcept {
        return position_;
    }

    std::uint8_t kind_code() const noexcept {
        return kind_code_;
    }

private:
    std::size_t position_;
    std::uint8_t kind_code_;
};

/**
 * @brief Exception for serial port setup failures.
 */
class SerialException : public Ut803Exception {
public:
    explicit SerialException(const std::string& message)
        : Ut803Exception(message, Error::Io) {}
};

#endif // !UT803_NO_EXCEPTIONS

} // namespace ut803

#endif // UT803_ERROR_HPP
