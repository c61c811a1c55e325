/**
 * @file bitvector.hpp
 * @brief Variable-length bit vector, one storage slot per bit.
 *
 * This module provides the representation underneath UInt: an owned,
 * resizable sequence of bits together with width equalization (padding)
 * and the bitwise operators.
 *
 * @par Bit Numbering Convention
 * - Bit 0 = MSB
 * - Bit length()-1 = LSB
 *
 * @par Alignment
 * Operands of different length are combined from the least significant
 * end: bit length()-1-k of one operand meets bit length()-1-k of the other.
 * Positions counted this way are called LSB offsets below.
 */

#ifndef BITUINT_BITVECTOR_HPP
#define BITUINT_BITVECTOR_HPP

#include <cstddef>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace bituint {

/**
 * @brief Variable-length bit vector.
 *
 * Each instance owns its storage exclusively. Every resize replaces the
 * whole sequence; length() always equals the number of stored bits.
 */
class BitVector {
public:
    /**
     * @brief Default constructor - a single zero bit.
     */
    BitVector() : bits_(1, 0) {}

    /**
     * @brief Construct a vector of the given length with all bits zero.
     * @param length Number of bits
     */
    explicit BitVector(std::size_t length) : bits_(length, 0) {}

    /**
     * @brief Binary expansion of a native integer.
     *
     * The width is floor(log2(value)) + 2, so the result always starts
     * with a zero bit. Zero yields the single-bit vector 0b0.
     *
     * @param value Native integer
     * @return New vector holding value
     */
    [[nodiscard]] static BitVector from_native(native_t value);

    /**
     * @brief Get the number of bits.
     * @return Number of bits in the vector
     */
    [[nodiscard]] std::size_t length() const noexcept {
        return bits_.size();
    }

    /**
     * @brief Get bit value at position.
     *
     * @param pos Bit position (0 = MSB, length()-1 = LSB)
     * @return Bit value (0 or 1), 0 when pos is out of range
     */
    [[nodiscard]] inline int get_bit(std::size_t pos) const noexcept {
        if (pos >= bits_.size()) [[unlikely]]
            return 0;
        return get_bit_unchecked(pos);
    }

    /**
     * @brief Get bit value at position without bounds checking.
     *
     * @warning Caller must ensure pos < length().
     * @param pos Bit position (0 = MSB, length()-1 = LSB)
     * @return Bit value (0 or 1)
     */
    [[nodiscard]] inline int get_bit_unchecked(std::size_t pos) const noexcept {
        return static_cast<int>(bits_[pos]);
    }

    /**
     * @brief Set bit value at position.
     *
     * @param pos Bit position (0 = MSB, length()-1 = LSB)
     * @param value Bit value (0 or 1)
     */
    inline void set_bit(std::size_t pos, int value) noexcept {
        if (pos >= bits_.size()) [[unlikely]]
            return;
        set_bit_unchecked(pos, value);
    }

    /**
     * @brief Set bit value at position without bounds checking.
     *
     * @warning Caller must ensure pos < length().
     * @param pos Bit position (0 = MSB, length()-1 = LSB)
     * @param value Bit value (0 or 1)
     */
    inline void set_bit_unchecked(std::size_t pos, int value) noexcept {
        bits_[pos] = value ? 1U : 0U;
    }

    /**
     * @brief Get bit value by LSB offset.
     *
     * Offsets past the MSB read as zero, which is how a shorter operand
     * is implicitly padded.
     *
     * @param offset Distance from the LSB (0 = LSB)
     * @return Bit value (0 or 1)
     */
    [[nodiscard]] inline int bit_from_lsb(std::size_t offset) const noexcept {
        if (offset >= bits_.size()) {
            return 0;
        }
        return get_bit_unchecked(bits_.size() - 1 - offset);
    }

    /**
     * @brief Value of the most significant bit.
     * @return Bit 0, or 0 for an empty vector
     */
    [[nodiscard]] int msb() const noexcept {
        return get_bit(0);
    }

    /**
     * @brief Set all bits to zero.
     */
    void zero() noexcept;

    /**
     * @brief Invert all bits in-place.
     */
    void invert() noexcept;

    /**
     * @brief Grow the vector with zero bits at the MSB end.
     *
     * Existing bits keep their order and value and move num_zeroes
     * positions towards the LSB in index space.
     *
     * @param num_zeroes Number of bits to insert
     */
    void pad_with_leading_zeroes(std::size_t num_zeroes);

    /**
     * @brief Remove bits from the MSB end.
     * @param count Number of bits to remove (clamped to length())
     */
    void drop_leading_bits(std::size_t count);

    /**
     * @brief AND in-place with another vector, aligned at the LSB.
     *
     * Bits of this vector above the width of other are cleared, as if
     * other were padded with zeroes. The length does not change.
     *
     * @param other Operand
     */
    void and_with(const BitVector& other) noexcept;

    /**
     * @brief OR in-place with another vector, aligned at the LSB.
     *
     * Bits of this vector above the width of other are left untouched.
     * The length does not change.
     *
     * @param other Operand
     */
    void or_with(const BitVector& other) noexcept;

    /**
     * @brief XOR in-place with another vector, aligned at the LSB.
     * @param other Operand
     */
    void xor_with(const BitVector& other) noexcept;

    /**
     * @brief Fold the bits MSB-first into a native integer.
     *
     * Exact while the value fits native_t, wraps otherwise.
     *
     * @return Native value
     */
    [[nodiscard]] native_t to_native() const noexcept;

    /**
     * @brief Checked conversion to a native integer.
     *
     * @param[out] out Native value, written only on success
     * @return Error::Ok, or Error::Overflow if a set bit lies above
     *         NATIVE_BITS
     */
    Error to_native(native_t& out) const noexcept;

    /**
     * @brief Count number of set bits.
     * @return Number of bits set to 1
     */
    [[nodiscard]] std::size_t hamming_weight() const noexcept;

    /**
     * @brief Compare representation (length and every bit).
     * @param other Other vector
     * @return true if equal
     */
    [[nodiscard]] bool operator==(const BitVector& other) const noexcept {
        return bits_ == other.bits_;
    }

    /**
     * @brief Compare representation for inequality.
     * @param other Other vector
     * @return true if not equal
     */
    [[nodiscard]] bool operator!=(const BitVector& other) const noexcept {
        return bits_ != other.bits_;
    }

private:
    std::vector<bit_t> bits_;
};

} // namespace bituint

#endif // BITUINT_BITVECTOR_HPP
