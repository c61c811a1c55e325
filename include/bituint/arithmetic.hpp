/**
 * @file arithmetic.hpp
 * @brief Bit-level arithmetic engine.
 *
 * All operations work on BitVector receivers in place and are computed
 * bit by bit:
 * - add()                    - ripple-carry addition, width grows by one
 * - add_ignore_final_carry() - ripple-carry addition at fixed width
 * - subtract()               - two's-complement subtraction, floored at zero
 * - multiply()               - Booth's multiplication
 * - compare()                - magnitude comparison at any width
 *
 * Negation and the arithmetic shift are two's-complement devices used by
 * subtract() and multiply(); they live in namespace detail and are not
 * part of the unsigned interface.
 */

#ifndef BITUINT_ARITHMETIC_HPP
#define BITUINT_ARITHMETIC_HPP

#include "bitvector.hpp"

namespace bituint {

/**
 * @brief Pad the shorter operand so both have the same length.
 * @param a First operand
 * @param b Second operand
 */
void equalize_widths(BitVector& a, BitVector& b);

/**
 * @brief Ripple-carry addition keeping the final carry.
 *
 * Both operands are brought to max(len_a, len_b) bits. The result has
 * max(len_a, len_b) + 1 bits, the new MSB holding the carry out.
 *
 * @param acc Left operand, receives the sum
 * @param addend Right operand
 */
void add(BitVector& acc, const BitVector& addend);

/**
 * @brief Ripple-carry addition at fixed width.
 *
 * Same as add() but the result stays max(len_a, len_b) bits wide and the
 * carry out of the MSB is discarded (addition modulo 2^width).
 *
 * @param acc Left operand, receives the sum
 * @param addend Right operand
 */
void add_ignore_final_carry(BitVector& acc, const BitVector& addend);

/**
 * @brief Compare two vectors by unsigned magnitude.
 *
 * Leading zeroes do not matter: 0b0011 compares equal to 0b11.
 *
 * @return -1 if a < b, 0 if equal, 1 if a > b
 */
[[nodiscard]] int compare(const BitVector& a, const BitVector& b) noexcept;

/**
 * @brief Saturating subtraction.
 *
 * Computes minuend + (-subtrahend) at the equalized width. When the
 * subtrahend is the larger magnitude the result is the canonical zero
 * 0b0 (one bit) instead of the wrapped value.
 *
 * @param minuend Left operand, receives the difference
 * @param subtrahend Right operand
 */
void subtract(BitVector& minuend, const BitVector& subtrahend);

/**
 * @brief Booth's multiplication.
 *
 * Operands are equalized to n bits and the product is returned in
 * 2n + 1 bits with a zero MSB. Operands whose MSB is set are accepted:
 * they receive one extra zero bit for the signed cycles and the surplus
 * zero bits are dropped from the product, so the width bound holds.
 *
 * @param multiplicand Left operand, receives the product
 * @param multiplier Right operand
 */
void multiply(BitVector& multiplicand, const BitVector& multiplier);

namespace detail {

/**
 * @brief Two's-complement negation at the current width.
 *
 * Inverts every bit, then adds one ignoring the final carry.
 */
void negate(BitVector& value);

/**
 * @brief Arithmetic shift right by one bit.
 *
 * Every bit moves one position towards the LSB; the MSB keeps its value.
 */
void arithmetic_shift_right(BitVector& value) noexcept;

} // namespace detail

} // namespace bituint

#endif // BITUINT_ARITHMETIC_HPP
