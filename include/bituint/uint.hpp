/**
 * @file uint.hpp
 * @brief Arbitrary-length unsigned integer value type.
 *
 * UInt wraps a BitVector and exposes the unsigned interface. Every binary
 * operation comes in two explicit forms:
 * - in place: and_with(), add_with(), ... and the compound operators
 *   (&=, +=, ...) replace the receiver's bits
 * - pure: and_of(), add_of(), ... and the binary operators (&, +, ...)
 *   work on a copy of the left operand and leave both inputs untouched
 *
 * @par Zero
 * The canonical zero is 0b0 (one bit). UInt(0) and a subtraction whose
 * result would be negative both produce it.
 */

#ifndef BITUINT_UINT_HPP
#define BITUINT_UINT_HPP

#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

#include "arithmetic.hpp"
#include "bitvector.hpp"
#include "config.hpp"
#include "error.hpp"

namespace bituint {

/**
 * @brief Unsigned integer of arbitrary width.
 */
class UInt {
public:
    /**
     * @brief Construct the canonical zero.
     */
    UInt() = default;

    /**
     * @brief Construct from a native integer.
     *
     * Uses the minimum width plus one leading zero bit.
     *
     * @param value Native value
     */
    explicit UInt(native_t value) : bits_(BitVector::from_native(value)) {}

    /**
     * @brief Take ownership of a raw bit sequence.
     * @param bits Bits, MSB first
     */
    explicit UInt(BitVector bits) noexcept : bits_(std::move(bits)) {}

#if !BITUINT_NO_EXCEPTIONS
    /**
     * @brief Construct from a binary literal such as "0b0101".
     *
     * @param text Binary literal
     * @throws InvalidArgumentException if text is not a binary literal
     */
    explicit UInt(std::string_view text);
#endif

    /**
     * @brief Parse a binary literal.
     *
     * Accepts "0b" followed by at least one '0' or '1'. Bits are kept
     * exactly as written, including leading zeroes or their absence.
     *
     * @param text Binary literal
     * @param[out] out Parsed value, written only on success
     * @return Error::Ok or Error::InvalidArg
     */
    static Error parse(std::string_view text, UInt& out);

    /**
     * @brief Convert to a native integer, wrapping when too wide.
     * @return Native value
     */
    [[nodiscard]] native_t to_native() const noexcept {
        return bits_.to_native();
    }

    /**
     * @brief Checked conversion to a native integer.
     *
     * @param[out] out Native value, written only on success
     * @return Error::Ok or Error::Overflow
     */
    Error to_native(native_t& out) const noexcept {
        return bits_.to_native(out);
    }

#if !BITUINT_NO_EXCEPTIONS
    /**
     * @brief Checked conversion to a native integer.
     * @throws OverflowException if the value does not fit native_t
     */
    [[nodiscard]] native_t checked_native() const;
#endif

    /**
     * @brief Render as "0b" followed by the bits in storage order.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Get the number of bits.
     */
    [[nodiscard]] std::size_t length() const noexcept {
        return bits_.length();
    }

    /**
     * @brief Get bit value at position (0 = MSB).
     */
    [[nodiscard]] int get_bit(std::size_t pos) const noexcept {
        return bits_.get_bit(pos);
    }

    /**
     * @brief Underlying bit sequence.
     */
    [[nodiscard]] const BitVector& bits() const noexcept {
        return bits_;
    }

    /** @name In-place operations
     *  Each replaces this value's bits and returns *this.
     *  @{
     */
    UInt& and_with(const UInt& other) noexcept;
    UInt& or_with(const UInt& other) noexcept;
    UInt& xor_with(const UInt& other) noexcept;
    UInt& add_with(const UInt& other);
    UInt& sub_with(const UInt& other);
    UInt& mul_with(const UInt& other);

    UInt& operator&=(const UInt& other) noexcept {
        return and_with(other);
    }
    UInt& operator|=(const UInt& other) noexcept {
        return or_with(other);
    }
    UInt& operator^=(const UInt& other) noexcept {
        return xor_with(other);
    }
    UInt& operator+=(const UInt& other) {
        return add_with(other);
    }
    UInt& operator-=(const UInt& other) {
        return sub_with(other);
    }
    UInt& operator*=(const UInt& other) {
        return mul_with(other);
    }
    /** @} */

private:
    BitVector bits_;
};

/** @name Pure operations
 *  Each returns a new value computed from a copy of the left operand.
 *  @{
 */
[[nodiscard]] UInt and_of(const UInt& a, const UInt& b);
[[nodiscard]] UInt or_of(const UInt& a, const UInt& b);
[[nodiscard]] UInt xor_of(const UInt& a, const UInt& b);
[[nodiscard]] UInt add_of(const UInt& a, const UInt& b);
[[nodiscard]] UInt sub_of(const UInt& a, const UInt& b);
[[nodiscard]] UInt mul_of(const UInt& a, const UInt& b);

inline UInt operator&(const UInt& a, const UInt& b) {
    return and_of(a, b);
}
inline UInt operator|(const UInt& a, const UInt& b) {
    return or_of(a, b);
}
inline UInt operator^(const UInt& a, const UInt& b) {
    return xor_of(a, b);
}
inline UInt operator+(const UInt& a, const UInt& b) {
    return add_of(a, b);
}
inline UInt operator-(const UInt& a, const UInt& b) {
    return sub_of(a, b);
}
inline UInt operator*(const UInt& a, const UInt& b) {
    return mul_of(a, b);
}
/** @} */

/** @name Numeric comparison
 *  Compares values, not representations: UInt(3) == UInt("0b00011").
 *  @{
 */
[[nodiscard]] inline int compare(const UInt& a, const UInt& b) noexcept {
    return compare(a.bits(), b.bits());
}
[[nodiscard]] inline bool operator==(const UInt& a, const UInt& b) noexcept {
    return compare(a, b) == 0;
}
[[nodiscard]] inline bool operator!=(const UInt& a, const UInt& b) noexcept {
    return compare(a, b) != 0;
}
[[nodiscard]] inline bool operator<(const UInt& a, const UInt& b) noexcept {
    return compare(a, b) < 0;
}
[[nodiscard]] inline bool operator<=(const UInt& a, const UInt& b) noexcept {
    return compare(a, b) <= 0;
}
[[nodiscard]] inline bool operator>(const UInt& a, const UInt& b) noexcept {
    return compare(a, b) > 0;
}
[[nodiscard]] inline bool operator>=(const UInt& a, const UInt& b) noexcept {
    return compare(a, b) >= 0;
}
/** @} */

/**
 * @brief Write to_string() to a stream.
 */
std::ostream& operator<<(std::ostream& os, const UInt& value);

} // namespace bituint

#endif // BITUINT_UINT_HPP
