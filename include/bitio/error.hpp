/**
 * @file error.hpp
 * @brief bitio error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef BITIO_ERROR_HPP
#define BITIO_ERROR_HPP

#include "config.hpp"

#if !BITIO_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace bitio {

/**
 * @brief Error codes returned by readers, writers and stream adapters.
 */
enum class Error {
    Ok = 0,          ///< Success
    InvalidArg = -1, ///< Invalid argument (e.g. bit width outside 1-64)
    EndOfData = -2,  ///< Source exhausted
    Overflow = -3,   ///< Fixed-capacity sink is full
    IoError = -4,    ///< Underlying stream failure
    Closed = -5      ///< Writer already finalized
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
    case Error::EndOfData:
        return "End of data";
    case Error::Overflow:
        return "Buffer overflow";
    case Error::IoError:
        return "I/O error";
    case Error::Closed:
        return "Writer closed";
    default:
        return "Unknown error";
    }
}

#if !BITIO_NO_EXCEPTIONS

/**
 * @brief Base exception for bitio errors.
 */
class BitioException : public std::runtime_error {
public:
    explicit BitioException(const std::string& message, Error code = Error::InvalidArg)
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
class InvalidArgumentException : public BitioException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : BitioException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for an exhausted source.
 */
class EndOfDataException : public BitioException {
public:
    explicit EndOfDataException(const std::string& message)
        : BitioException(message, Error::EndOfData) {}
};

/**
 * @brief Exception for a full fixed-capacity sink.
 */
class OverflowException : public BitioException {
public:
    explicit OverflowException(const std::string& message)
        : BitioException(message, Error::Overflow) {}
};

/**
 * @brief Exception for underlying stream failures.
 */
class IoException : public BitioException {
public:
    explicit IoException(const std::string& message)
        : BitioException(message, Error::IoError) {}
};

/**
 * @brief Exception for operations on a finalized writer.
 */
class ClosedException : public BitioException {
public:
    explicit ClosedException(const std::string& message)
        : BitioException(message, Error::Closed) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code to check
 */
inline void throw_if_error(Error error) {
    switch (error) {
    case Error::Ok:
        return;
    case Error::InvalidArg:
        throw InvalidArgumentException(error_string(error));
    case Error::EndOfData:
        throw EndOfDataException(error_string(error));
    case Error::Overflow:
        throw OverflowException(error_string(error));
    case Error::IoError:
        throw IoException(error_string(error));
    case Error::Closed:
        throw ClosedException(error_string(error));
    default:
        throw BitioException(error_string(error), error);
    }
}

#endif // !BITIO_NO_EXCEPTIONS

} // namespace bitio

#endif // BITIO_ERROR_HPP
