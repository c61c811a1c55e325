/**
 * @file config.hpp
 * @brief BitUInt compile-time configuration.
 *
 * Arbitrary-length unsigned integers stored as an explicit MSB-first bit
 * sequence, one storage slot per bit.
 */

#ifndef BITUINT_CONFIG_HPP
#define BITUINT_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace bituint {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Native integer type used for conversion in and out of UInt
using native_t = std::uint64_t;
inline constexpr std::size_t NATIVE_BITS = 64U;

/// Storage type of a single bit slot (0 or 1)
using bit_t = std::uint8_t;

/// Radix marker written in front of the binary digits
inline constexpr const char* BINARY_PREFIX = "0b";
inline constexpr std::size_t BINARY_PREFIX_LENGTH = 2U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define BITUINT_NO_EXCEPTIONS=1 to build without exceptions. Fallible
 * operations stay available through their Error-returning forms.
 * @{
 */
#ifndef BITUINT_NO_EXCEPTIONS
#define BITUINT_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace bituint

#endif // BITUINT_CONFIG_HPP
