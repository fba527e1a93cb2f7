/**
 * @file config.hpp
 * @brief bitio compile-time configuration.
 *
 * All configuration is resolved at compile time. There are no runtime
 * settings, configuration files or environment variables.
 */

#ifndef BITIO_CONFIG_HPP
#define BITIO_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace bitio {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Widest field accepted by read_bits() / write_bits()
inline constexpr std::size_t MAX_BIT_WIDTH = 64U;

/// Bits held by the reader/writer cache byte
inline constexpr std::size_t BITS_PER_BYTE = 8U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define BITIO_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * The error-code API is always available.
 * @{
 */
#ifndef BITIO_NO_EXCEPTIONS
#define BITIO_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace bitio

#endif // BITIO_CONFIG_HPP
