/**
 * @file bitvector.cpp
 * @brief BitVector construction, padding and bitwise operators.
 *
 * @see include/bituint/bitvector.hpp for the interface
 */

#include <bituint/bitvector.hpp>

#include <algorithm>
#include <utility>

namespace bituint {

BitVector BitVector::from_native(native_t value) {
    if (value == 0) {
        return BitVector();
    }

    // floor(log2(value)) + 1 significant bits, plus the leading zero
    const auto significant = static_cast<std::size_t>(
        NATIVE_BITS - static_cast<std::size_t>(__builtin_clzll(value)));
    BitVector result(significant + 1);

    // Extract LSB first, store MSB first
    for (std::size_t b = result.length(); b-- > 0;) {
        result.set_bit_unchecked(b, static_cast<int>(value % 2U));
        value >>= 1U;
    }

    if (result.msb()) {
        result.pad_with_leading_zeroes(1);
    }
    return result;
}

void BitVector::zero() noexcept {
    std::fill(bits_.begin(), bits_.end(), 0U);
}

void BitVector::invert() noexcept {
    for (auto& bit : bits_) {
        bit = bit ? 0U : 1U;
    }
}

void BitVector::pad_with_leading_zeroes(std::size_t num_zeroes) {
    if (num_zeroes == 0) {
        return;
    }
    std::vector<bit_t> padded(bits_.size() + num_zeroes, 0U);
    std::copy(bits_.begin(), bits_.end(), padded.begin() + static_cast<std::ptrdiff_t>(num_zeroes));
    bits_ = std::move(padded);
}

void BitVector::drop_leading_bits(std::size_t count) {
    count = std::min(count, bits_.size());
    bits_.erase(bits_.begin(), bits_.begin() + static_cast<std::ptrdiff_t>(count));
}

void BitVector::and_with(const BitVector& other) noexcept {
    const std::size_t len = bits_.size();
    const std::size_t common = std::min(len, other.length());

    for (std::size_t k = 0; k < common; ++k) {
        bits_[len - 1 - k] &= static_cast<bit_t>(other.bit_from_lsb(k));
    }

    // Nothing to AND against above other's width: implicit zero pad
    for (std::size_t k = common; k < len; ++k) {
        bits_[len - 1 - k] = 0U;
    }
}

void BitVector::or_with(const BitVector& other) noexcept {
    const std::size_t len = bits_.size();
    const std::size_t common = std::min(len, other.length());

    for (std::size_t k = 0; k < common; ++k) {
        bits_[len - 1 - k] |= static_cast<bit_t>(other.bit_from_lsb(k));
    }
}

void BitVector::xor_with(const BitVector& other) noexcept {
    const std::size_t len = bits_.size();
    const std::size_t common = std::min(len, other.length());

    for (std::size_t k = 0; k < common; ++k) {
        bits_[len - 1 - k] ^= static_cast<bit_t>(other.bit_from_lsb(k));
    }
}

native_t BitVector::to_native() const noexcept {
    native_t acc = 0;
    for (const auto bit : bits_) {
        acc = (acc << 1U) | static_cast<native_t>(bit);
    }
    return acc;
}

Error BitVector::to_native(native_t& out) const noexcept {
    if (bits_.size() > NATIVE_BITS) {
        const std::size_t excess = bits_.size() - NATIVE_BITS;
        for (std::size_t i = 0; i < excess; ++i) {
            if (bits_[i]) {
                return Error::Overflow;
            }
        }
    }
    out = to_native();
    return Error::Ok;
}

std::size_t BitVector::hamming_weight() const noexcept {
    return static_cast<std::size_t>(std::count(bits_.begin(), bits_.end(), bit_t{1}));
}

} // namespace bituint
