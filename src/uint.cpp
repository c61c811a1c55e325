/**
 * @file uint.cpp
 * @brief UInt conversion, formatting and operator forwarding.
 *
 * @see include/bituint/uint.hpp for the interface
 */

#include <bituint/uint.hpp>

#include <ostream>

namespace bituint {

#if !BITUINT_NO_EXCEPTIONS
UInt::UInt(std::string_view text) {
    if (parse(text, *this) != Error::Ok) {
        throw InvalidArgumentException("Not a binary literal: " + std::string(text));
    }
}

native_t UInt::checked_native() const {
    native_t value = 0;
    if (to_native(value) != Error::Ok) {
        throw OverflowException("Value too wide for native integer: " + to_string());
    }
    return value;
}
#endif

Error UInt::parse(std::string_view text, UInt& out) {
    if (text.size() <= BINARY_PREFIX_LENGTH ||
        text.substr(0, BINARY_PREFIX_LENGTH) != BINARY_PREFIX) {
        return Error::InvalidArg;
    }

    const std::string_view digits = text.substr(BINARY_PREFIX_LENGTH);
    BitVector bits(digits.size());
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (digits[i] == '1') {
            bits.set_bit_unchecked(i, 1);
        } else if (digits[i] != '0') {
            return Error::InvalidArg;
        }
    }

    out = UInt(std::move(bits));
    return Error::Ok;
}

std::string UInt::to_string() const {
    std::string s(BINARY_PREFIX);
    s.reserve(BINARY_PREFIX_LENGTH + bits_.length());
    for (std::size_t i = 0; i < bits_.length(); ++i) {
        s.push_back(bits_.get_bit_unchecked(i) ? '1' : '0');
    }
    return s;
}

UInt& UInt::and_with(const UInt& other) noexcept {
    bits_.and_with(other.bits_);
    return *this;
}

UInt& UInt::or_with(const UInt& other) noexcept {
    bits_.or_with(other.bits_);
    return *this;
}

UInt& UInt::xor_with(const UInt& other) noexcept {
    bits_.xor_with(other.bits_);
    return *this;
}

UInt& UInt::add_with(const UInt& other) {
    add(bits_, other.bits_);
    return *this;
}

UInt& UInt::sub_with(const UInt& other) {
    subtract(bits_, other.bits_);
    return *this;
}

UInt& UInt::mul_with(const UInt& other) {
    multiply(bits_, other.bits_);
    return *this;
}

UInt and_of(const UInt& a, const UInt& b) {
    UInt result(a);
    result.and_with(b);
    return result;
}

UInt or_of(const UInt& a, const UInt& b) {
    UInt result(a);
    result.or_with(b);
    return result;
}

UInt xor_of(const UInt& a, const UInt& b) {
    UInt result(a);
    result.xor_with(b);
    return result;
}

UInt add_of(const UInt& a, const UInt& b) {
    UInt result(a);
    result.add_with(b);
    return result;
}

UInt sub_of(const UInt& a, const UInt& b) {
    UInt result(a);
    result.sub_with(b);
    return result;
}

UInt mul_of(const UInt& a, const UInt& b) {
    UInt result(a);
    result.mul_with(b);
    return result;
}

std::ostream& operator<<(std::ostream& os, const UInt& value) {
    return os << value.to_string();
}

} // namespace bituint
