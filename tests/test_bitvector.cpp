/**
 * @file test_bitvector.cpp
 * @brief Unit tests for BitVector class.
 */

#include <bituint/bitvector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace bituint;

namespace {

BitVector from_digits(const std::string& digits) {
    BitVector bv(digits.size());
    for (std::size_t i = 0; i < digits.size(); ++i) {
        bv.set_bit(i, digits[i] == '1' ? 1 : 0);
    }
    return bv;
}

std::string digits_of(const BitVector& bv) {
    std::string s;
    for (std::size_t i = 0; i < bv.length(); ++i) {
        s.push_back(bv.get_bit(i) ? '1' : '0');
    }
    return s;
}

} // namespace

TEST_CASE("BitVector construction", "[bitvector]") {
    SECTION("default construction is a single zero bit") {
        BitVector bv;
        REQUIRE(bv.length() == 1);
        REQUIRE(bv.get_bit(0) == 0);
    }

    SECTION("construction with length") {
        BitVector bv(40);
        REQUIRE(bv.length() == 40);
        REQUIRE(bv.hamming_weight() == 0);
    }
}

TEST_CASE("BitVector from_native", "[bitvector]") {
    SECTION("width is floor(log2) + 2") {
        REQUIRE(BitVector::from_native(1).length() == 2);
        REQUIRE(BitVector::from_native(2).length() == 3);
        REQUIRE(BitVector::from_native(3).length() == 3);
        REQUIRE(BitVector::from_native(4).length() == 4);
        REQUIRE(BitVector::from_native(255).length() == 9);
        REQUIRE(BitVector::from_native(256).length() == 10);
    }

    SECTION("bits are stored MSB first") {
        REQUIRE(digits_of(BitVector::from_native(5)) == "0101");
        REQUIRE(digits_of(BitVector::from_native(200)) == "011001000");
    }

    SECTION("largest native value keeps its leading zero") {
        BitVector bv = BitVector::from_native(~native_t{0});
        REQUIRE(bv.length() == NATIVE_BITS + 1);
        REQUIRE(bv.msb() == 0);
        REQUIRE(bv.hamming_weight() == NATIVE_BITS);
    }

    SECTION("zero is a single zero bit") {
        BitVector bv = BitVector::from_native(0);
        REQUIRE(bv.length() == 1);
        REQUIRE(bv.get_bit(0) == 0);
    }
}

TEST_CASE("BitVector bit access", "[bitvector]") {
    BitVector bv(8);

    SECTION("set and get individual bits") {
        bv.set_bit(0, 1);
        bv.set_bit(7, 1);
        REQUIRE(bv.get_bit(0) == 1);
        REQUIRE(bv.get_bit(7) == 1);
        REQUIRE(bv.get_bit(3) == 0);
    }

    SECTION("out of range access is ignored") {
        bv.set_bit(8, 1);
        REQUIRE(bv.get_bit(8) == 0);
        REQUIRE(bv.hamming_weight() == 0);
    }

    SECTION("bit_from_lsb counts from the least significant end") {
        bv.set_bit(7, 1);
        bv.set_bit(5, 1);
        REQUIRE(bv.bit_from_lsb(0) == 1);
        REQUIRE(bv.bit_from_lsb(1) == 0);
        REQUIRE(bv.bit_from_lsb(2) == 1);
        REQUIRE(bv.bit_from_lsb(100) == 0); // implicit zero pad
    }
}

TEST_CASE("BitVector padding", "[bitvector]") {
    BitVector bv = from_digits("101");

    SECTION("pad inserts zeroes at the MSB end") {
        bv.pad_with_leading_zeroes(3);
        REQUIRE(bv.length() == 6);
        REQUIRE(digits_of(bv) == "000101");
    }

    SECTION("pad by zero is a no-op") {
        bv.pad_with_leading_zeroes(0);
        REQUIRE(digits_of(bv) == "101");
    }

    SECTION("drop removes bits from the MSB end") {
        bv.drop_leading_bits(1);
        REQUIRE(digits_of(bv) == "01");
        bv.drop_leading_bits(10);
        REQUIRE(bv.length() == 0);
    }
}

TEST_CASE("BitVector AND", "[bitvector]") {
    SECTION("equal widths") {
        BitVector a = from_digits("0101");
        a.and_with(from_digits("0011"));
        REQUIRE(digits_of(a) == "0001");
    }

    SECTION("longer left operand clears bits above the right width") {
        BitVector a = from_digits("111111");
        a.and_with(from_digits("011"));
        REQUIRE(a.length() == 6);
        REQUIRE(digits_of(a) == "000011");
    }

    SECTION("shorter left operand keeps its length") {
        BitVector a = from_digits("011");
        a.and_with(from_digits("111110"));
        REQUIRE(digits_of(a) == "010");
    }
}

TEST_CASE("BitVector OR", "[bitvector]") {
    SECTION("equal widths") {
        BitVector a = from_digits("0101");
        a.or_with(from_digits("0011"));
        REQUIRE(digits_of(a) == "0111");
    }

    SECTION("longer left operand keeps its upper bits") {
        BitVector a = from_digits("110000");
        a.or_with(from_digits("011"));
        REQUIRE(digits_of(a) == "110011");
    }

    SECTION("bits of a longer right operand are not added") {
        BitVector a = from_digits("001");
        a.or_with(from_digits("110110"));
        REQUIRE(digits_of(a) == "111");
    }
}

TEST_CASE("BitVector XOR", "[bitvector]") {
    SECTION("equal widths") {
        BitVector a = from_digits("0101");
        a.xor_with(from_digits("0011"));
        REQUIRE(digits_of(a) == "0110");
    }

    SECTION("longer left operand keeps its upper bits") {
        BitVector a = from_digits("1010");
        a.xor_with(from_digits("11"));
        REQUIRE(digits_of(a) == "1001");
    }

    SECTION("XOR with self gives zero") {
        BitVector a = from_digits("1011001");
        a.xor_with(a);
        REQUIRE(a.hamming_weight() == 0);
        REQUIRE(a.length() == 7);
    }
}

TEST_CASE("BitVector invert and zero", "[bitvector]") {
    BitVector a = from_digits("0110");
    a.invert();
    REQUIRE(digits_of(a) == "1001");

    a.zero();
    REQUIRE(digits_of(a) == "0000");
}

TEST_CASE("BitVector native conversion", "[bitvector]") {
    SECTION("fold MSB first") {
        REQUIRE(from_digits("0101").to_native() == 5);
        REQUIRE(from_digits("000000011").to_native() == 3);
    }

    SECTION("checked conversion within range") {
        BitVector bv = BitVector::from_native(~native_t{0});
        native_t out = 0;
        REQUIRE(bv.to_native(out) == Error::Ok);
        REQUIRE(out == ~native_t{0});
    }

    SECTION("leading zeroes beyond native width are accepted") {
        BitVector bv = BitVector::from_native(7);
        bv.pad_with_leading_zeroes(100);
        native_t out = 0;
        REQUIRE(bv.to_native(out) == Error::Ok);
        REQUIRE(out == 7);
    }

    SECTION("set bit above native width overflows") {
        BitVector bv(NATIVE_BITS + 1);
        bv.set_bit(0, 1);
        native_t out = 42;
        REQUIRE(bv.to_native(out) == Error::Overflow);
        REQUIRE(out == 42);
    }
}

TEST_CASE("BitVector equality", "[bitvector]") {
    SECTION("same bits are equal") {
        REQUIRE(from_digits("0101") == BitVector::from_native(5));
    }

    SECTION("representation matters") {
        REQUIRE(from_digits("00101") != from_digits("0101"));
    }
}
