/**
 * @file arithmetic.cpp
 * @brief Ripple-carry addition, subtraction and Booth's multiplication.
 *
 * @see include/bituint/arithmetic.hpp for the interface
 */

#include <bituint/arithmetic.hpp>

#include <algorithm>
#include <utility>

namespace bituint {

namespace {

/**
 * @brief Ripple-carry pass over two equal-width vectors, LSB to MSB.
 * @return Carry out of the MSB (0 or 1)
 */
int ripple_carry(BitVector& acc, const BitVector& addend) noexcept {
    int carry = 0;
    for (std::size_t pos = acc.length(); pos-- > 0;) {
        const int a = acc.get_bit_unchecked(pos);
        const int b = addend.get_bit_unchecked(pos);
        acc.set_bit_unchecked(pos, a ^ b ^ carry);
        carry = (a + b + carry) > 1 ? 1 : 0;
    }
    return carry;
}

} // namespace

void equalize_widths(BitVector& a, BitVector& b) {
    if (a.length() > b.length()) {
        b.pad_with_leading_zeroes(a.length() - b.length());
    } else if (b.length() > a.length()) {
        a.pad_with_leading_zeroes(b.length() - a.length());
    }
}

void add(BitVector& acc, const BitVector& addend) {
    BitVector rhs(addend);
    equalize_widths(acc, rhs);

    const int carry = ripple_carry(acc, rhs);

    acc.pad_with_leading_zeroes(1);
    acc.set_bit_unchecked(0, carry);
}

void add_ignore_final_carry(BitVector& acc, const BitVector& addend) {
    BitVector rhs(addend);
    equalize_widths(acc, rhs);

    static_cast<void>(ripple_carry(acc, rhs));
}

int compare(const BitVector& a, const BitVector& b) noexcept {
    // Walk from the widest MSB down; missing positions read as zero
    for (std::size_t offset = std::max(a.length(), b.length()); offset-- > 0;) {
        const int x = a.bit_from_lsb(offset);
        const int y = b.bit_from_lsb(offset);
        if (x != y) {
            return x < y ? -1 : 1;
        }
    }
    return 0;
}

void subtract(BitVector& minuend, const BitVector& subtrahend) {
    // Decided on the original magnitudes, before any bit is touched
    if (compare(minuend, subtrahend) < 0) {
        minuend = BitVector();
        return;
    }

    BitVector rhs(subtrahend);
    equalize_widths(minuend, rhs);
    detail::negate(rhs);

    add_ignore_final_carry(minuend, rhs);
}

void multiply(BitVector& multiplicand, const BitVector& multiplier) {
    BitVector m(multiplicand);
    BitVector r(multiplier);
    equalize_widths(m, r);

    // Booth's treats both operands as signed; keep them non-negative
    std::size_t surplus = 0;
    if (m.msb() || r.msb()) {
        m.pad_with_leading_zeroes(1);
        r.pad_with_leading_zeroes(1);
        surplus = 2;
    }

    const std::size_t num_cycles = m.length();
    const std::size_t asp_length = 2 * num_cycles + 1;

    BitVector m_negated(m);
    detail::negate(m_negated);

    // A and S hold +m and -m in the upper half; P holds r above the extra bit
    BitVector a(asp_length);
    BitVector s(asp_length);
    BitVector p(asp_length);
    for (std::size_t i = 0; i < num_cycles; ++i) {
        a.set_bit_unchecked(i, m.get_bit_unchecked(i));
        s.set_bit_unchecked(i, m_negated.get_bit_unchecked(i));
        p.set_bit_unchecked(num_cycles + i, r.get_bit_unchecked(i));
    }

    const std::size_t last_bit = asp_length - 1;
    const std::size_t second_to_last_bit = asp_length - 2;

    for (std::size_t cycle = 0; cycle < num_cycles; ++cycle) {
        const int second_to_last = p.get_bit_unchecked(second_to_last_bit);
        const int last = p.get_bit_unchecked(last_bit);

        if (second_to_last == 1 && last == 0) {
            add_ignore_final_carry(p, s);
        } else if (second_to_last == 0 && last == 1) {
            add_ignore_final_carry(p, a);
        }

        detail::arithmetic_shift_right(p);
    }

    // Drop the extra bit; the product sits under a leading zero
    BitVector product(asp_length);
    for (std::size_t i = 0; i + 1 < asp_length; ++i) {
        product.set_bit_unchecked(i + 1, p.get_bit_unchecked(i));
    }
    product.drop_leading_bits(surplus);

    multiplicand = std::move(product);
}

namespace detail {

void negate(BitVector& value) {
    if (value.length() == 0) {
        return;
    }

    value.invert();

    BitVector one(value.length());
    one.set_bit_unchecked(value.length() - 1, 1);
    add_ignore_final_carry(value, one);
}

void arithmetic_shift_right(BitVector& value) noexcept {
    const std::size_t len = value.length();
    if (len < 2) {
        return;
    }

    for (std::size_t i = len - 1; i > 0; --i) {
        value.set_bit_unchecked(i, value.get_bit_unchecked(i - 1));
    }
    // Index 0 already holds the sign bit, which is replicated into index 1
}

} // namespace detail

} // namespace bituint
