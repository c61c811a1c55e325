/**
 * @file bituint.hpp
 * @brief BitUInt umbrella header.
 *
 * Includes the complete public interface: the UInt value type, the
 * BitVector representation and the arithmetic engine underneath it.
 */

#ifndef BITUINT_HPP
#define BITUINT_HPP

#include "arithmetic.hpp"
#include "bitvector.hpp"
#include "config.hpp"
#include "error.hpp"
#include "uint.hpp"

namespace bituint {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace bituint

#endif // BITUINT_HPP
